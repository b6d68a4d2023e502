#pragma once
#include "../core/SearchResult.hpp"
#include <optional>
#include <string>
#include <vector>

// Turns bot reply text into SearchResults. A line is a result when its first
// character is a digit: the digit run is the id, the text up to the first '|'
// is the title and the whole line is kept as the description.
class ResultParser {
public:
    static std::optional<SearchResult> parse_line(const std::string& line,
                                                  const std::optional<std::string>& bot = std::nullopt);
    static std::vector<SearchResult> parse_text(const std::string& text,
                                                const std::optional<std::string>& bot = std::nullopt);
    // Zipped payloads contribute their .txt members in archive order.
    static std::vector<SearchResult> parse_payload(const std::string& bytes,
                                                   const std::optional<std::string>& bot = std::nullopt);
    static std::vector<SearchResult> parse_file(const std::string& path,
                                                const std::optional<std::string>& bot = std::nullopt);
};
