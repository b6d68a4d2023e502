// Unit tests for utils/ResultParser.cpp - search result line and payload parsing

#include <catch2/catch.hpp>
#include "utils/ResultParser.hpp"
#include "support/TestHelpers.hpp"
#include "support/ZipWriter.hpp"

TEST_CASE("ResultParser - Single lines", "[parser][unit]") {
    SECTION("Id, title and description") {
        auto result = ResultParser::parse_line("12345 Some Title | extra", std::string("Bot"));
        REQUIRE(result.has_value());
        REQUIRE(result->id == "12345");
        REQUIRE(result->title == "Some Title ");
        REQUIRE(result->description == std::optional<std::string>("12345 Some Title | extra"));
        REQUIRE(result->bot == std::optional<std::string>("Bot"));
        REQUIRE_FALSE(result->author.has_value());
        REQUIRE_FALSE(result->size_bytes.has_value());
    }

    SECTION("Title runs to the end without a bar") {
        auto result = ResultParser::parse_line("7\tJust a title");
        REQUIRE(result.has_value());
        REQUIRE(result->id == "7");
        REQUIRE(result->title == "Just a title");
        REQUIRE_FALSE(result->bot.has_value());
    }

    SECTION("Trailing carriage return is dropped") {
        auto result = ResultParser::parse_line("42 Title\r");
        REQUIRE(result.has_value());
        REQUIRE(result->description == std::optional<std::string>("42 Title"));
    }

    SECTION("Lines not starting with a digit are ignored") {
        REQUIRE_FALSE(ResultParser::parse_line("no id here").has_value());
        REQUIRE_FALSE(ResultParser::parse_line(" 12 leading space").has_value());
        REQUIRE_FALSE(ResultParser::parse_line("").has_value());
        REQUIRE_FALSE(ResultParser::parse_line("!Bot 123 file.epub").has_value());
    }
}

TEST_CASE("ResultParser - Text blocks", "[parser][unit]") {
    std::string text = "Search results for dune\r\n1 Dune | Herbert\n\n2 Dune Messiah | Herbert\nend\n";
    auto results = ResultParser::parse_text(text, std::string("Bot"));
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].id == "1");
    REQUIRE(results[1].id == "2");
    REQUIRE(results[1].title == "Dune Messiah ");

    // Parsing is a pure function of its input
    REQUIRE(ResultParser::parse_text(text, std::string("Bot")) == results);
}

TEST_CASE("ResultParser - Payloads", "[parser][zip][unit]") {
    SECTION("Plain text payload is read as Latin-1") {
        auto results = ResultParser::parse_payload("5 Caf\xE9 | x\n");
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].title == "Caf\xC3\xA9 ");
    }

    SECTION("Zipped payload contributes .txt members in archive order") {
        std::string zip = ZipWriter()
            .add("b.txt", "2 Second\n", true)
            .add("notes.nfo", "9 Ignored\n")
            .add_directory("dir")
            .add("a.TXT", "3 Third\n4 Fourth\n")
            .build();
        auto results = ResultParser::parse_payload(zip, std::string("Bot"));
        REQUIRE(results.size() == 3);
        REQUIRE(results[0].id == "2");
        REQUIRE(results[1].id == "3");
        REQUIRE(results[2].id == "4");
        REQUIRE(results[2].bot == std::optional<std::string>("Bot"));
    }

    SECTION("Payload read from a file") {
        TempDir dir;
        write_text(dir / "results.txt", "10 A\n11 B\n");
        auto results = ResultParser::parse_file((dir / "results.txt").string(), std::string("Bot"));
        REQUIRE(results.size() == 2);
        REQUIRE(results[0].bot == std::optional<std::string>("Bot"));
    }
}
