// Unit tests for network/DccOffer.cpp - DCC SEND payload decoding and policy

#include <catch2/catch.hpp>
#include "core/Errors.hpp"
#include "network/DccOffer.hpp"
#include "utils/NetworkUtils.hpp"

TEST_CASE("DccOffer - Decodes a well-formed offer", "[network][dcc][unit]") {
    OfferPolicy policy;

    SECTION("Address, port and size") {
        TransferOffer offer = DccOffer::parse("DCC SEND book.epub 3232235521 5000 1024", "Bot", policy);
        REQUIRE(offer.filename == "book.epub");
        REQUIRE(offer.host == "192.168.0.1");
        REQUIRE(offer.port == 5000);
        REQUIRE(offer.size == std::optional<uint64_t>(1024));
        REQUIRE(offer.sender == "Bot");
        REQUIRE(offer.endpoint() == "192.168.0.1:5000");
    }

    SECTION("Address zero decodes to 0.0.0.0") {
        TransferOffer offer = DccOffer::parse("DCC SEND a.txt 0 4000 10", "Bot", policy);
        REQUIRE(offer.host == "0.0.0.0");
    }

    SECTION("Size is optional") {
        TransferOffer offer = DccOffer::parse("DCC SEND a.txt 2130706433 4000", "Bot", policy);
        REQUIRE(offer.host == "127.0.0.1");
        REQUIRE_FALSE(offer.size.has_value());
    }

    SECTION("Quoted filename keeps its spaces") {
        TransferOffer offer = DccOffer::parse("DCC SEND \"My Book (2020).epub\" 2130706433 4000 77", "Bot", policy);
        REQUIRE(offer.filename == "My Book (2020).epub");
        REQUIRE(offer.port == 4000);
        REQUIRE(offer.size == std::optional<uint64_t>(77));
    }

    SECTION("Extra trailing tokens are ignored") {
        TransferOffer offer = DccOffer::parse("DCC SEND a.txt 2130706433 4000 10 T123", "Bot", policy);
        REQUIRE(offer.size == std::optional<uint64_t>(10));
    }
}

TEST_CASE("DccOffer - Rejects malformed payloads", "[network][dcc][unit]") {
    OfferPolicy policy;

    SECTION("Too few tokens") {
        REQUIRE_THROWS_AS(DccOffer::parse("DCC SEND a.txt 2130706433", "Bot", policy), ProtocolError);
        REQUIRE_THROWS_AS(DccOffer::parse("DCC SEND", "Bot", policy), ProtocolError);
    }

    SECTION("Address that is not a number or exceeds 32 bits") {
        REQUIRE_THROWS_AS(DccOffer::parse("DCC SEND a.txt localhost 4000 10", "Bot", policy), ProtocolError);
        REQUIRE_THROWS_AS(DccOffer::parse("DCC SEND a.txt 4294967296 4000 10", "Bot", policy), ProtocolError);
    }

    SECTION("Port out of range") {
        REQUIRE_THROWS_AS(DccOffer::parse("DCC SEND a.txt 2130706433 65536 10", "Bot", policy), ProtocolError);
        REQUIRE_THROWS_AS(DccOffer::parse("DCC SEND a.txt 2130706433 -1 10", "Bot", policy), ProtocolError);
    }

    SECTION("Passive offers with port 0") {
        REQUIRE_THROWS_AS(DccOffer::parse("DCC SEND a.txt 2130706433 0 10", "Bot", policy), ProtocolError);
    }

    SECTION("Size that is not a number") {
        REQUIRE_THROWS_AS(DccOffer::parse("DCC SEND a.txt 2130706433 4000 big", "Bot", policy), ProtocolError);
    }
}

TEST_CASE("DccOffer - Policy checks", "[network][dcc][policy][unit]") {
    SECTION("Disallowed sender is rejected before anything else") {
        OfferPolicy policy;
        policy.allowed_senders = {"searchook"};
        REQUIRE_THROWS_AS(DccOffer::parse("garbage", "Stranger", policy), PolicyError);
    }

    SECTION("Allow-list matching ignores case") {
        Settings settings;
        settings.allowed_bots = {"SearchOok"};
        OfferPolicy policy = OfferPolicy::from_settings(settings);
        REQUIRE(policy.allows_sender("searchook"));
        REQUIRE(policy.allows_sender("SEARCHOOK"));
        REQUIRE_FALSE(policy.allows_sender("other"));
        REQUIRE_NOTHROW(DccOffer::parse("DCC SEND a.txt 2130706433 4000 10", "searchOOK", policy));
    }

    SECTION("Empty allow-list admits everyone") {
        OfferPolicy policy;
        REQUIRE(policy.allows_sender("anybody"));
    }

    SECTION("Size above the ceiling") {
        OfferPolicy policy;
        policy.max_size = 100;
        REQUIRE_THROWS_AS(DccOffer::parse("DCC SEND a.txt 2130706433 4000 101", "Bot", policy), PolicyError);
        REQUIRE_NOTHROW(DccOffer::parse("DCC SEND a.txt 2130706433 4000 100", "Bot", policy));
        // Unknown size cannot be checked against the ceiling
        REQUIRE_NOTHROW(DccOffer::parse("DCC SEND a.txt 2130706433 4000", "Bot", policy));
    }
}

TEST_CASE("DccOffer - Recognizes DCC SEND payloads", "[network][dcc][unit]") {
    REQUIRE(DccOffer::is_dcc_send("DCC SEND a 1 2 3"));
    REQUIRE(DccOffer::is_dcc_send("dcc send a 1 2 3"));
    REQUIRE_FALSE(DccOffer::is_dcc_send("DCC CHAT chat 1 2"));
    REQUIRE_FALSE(DccOffer::is_dcc_send("VERSION"));
}

TEST_CASE("DccOffer - Tokenizer", "[network][dcc][unit]") {
    auto tokens = DccOffer::tokenize("  DCC   SEND \"a b\"  1 2 ");
    REQUIRE(tokens == std::vector<std::string>{"DCC", "SEND", "a b", "1", "2"});

    auto unterminated = DccOffer::tokenize("DCC SEND \"a b 1 2");
    REQUIRE(unterminated.back() == "a b 1 2");
}

TEST_CASE("NetworkUtils - Address and ack encoding", "[network][utils][unit]") {
    REQUIRE(NetworkUtils::ipv4_from_uint32(0) == "0.0.0.0");
    REQUIRE(NetworkUtils::ipv4_from_uint32(3232235521u) == "192.168.0.1");
    REQUIRE(NetworkUtils::ipv4_from_uint32(4294967295u) == "255.255.255.255");

    auto bytes = NetworkUtils::encode_be32(0x01020304);
    REQUIRE(bytes[0] == 0x01);
    REQUIRE(bytes[3] == 0x04);
    REQUIRE(NetworkUtils::decode_be32(bytes.data()) == 0x01020304u);

    REQUIRE(NetworkUtils::parse_decimal("65535", 65535) == 65535);
    REQUIRE_THROWS_AS(NetworkUtils::parse_decimal("", 10), std::invalid_argument);
    REQUIRE_THROWS_AS(NetworkUtils::parse_decimal("99999999999999999999999", UINT64_MAX), std::invalid_argument);
}
