#pragma once
#include "../core/Settings.hpp"
#include "../core/TransferOffer.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Which senders may push files, and how large those files may be.
struct OfferPolicy {
    std::vector<std::string> allowed_senders;
    std::optional<uint64_t> max_size;

    static OfferPolicy from_settings(const Settings& settings);
    // Empty allow-list admits everyone; matching ignores case.
    bool allows_sender(const std::string& nick) const;
};

// Codec for "DCC SEND <filename> <ip-uint32> <port> [<size>]" CTCP payloads.
class DccOffer {
public:
    static bool is_dcc_send(const std::string& payload);

    // Whitespace separated; a token starting with '"' runs to the next '"'.
    static std::vector<std::string> tokenize(const std::string& payload);

    // Throws PolicyError for a disallowed sender or an oversized file and
    // ProtocolError for anything malformed.
    static TransferOffer parse(const std::string& payload, const std::string& sender,
                               const OfferPolicy& policy);
};
