#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <optional>
#include <cstdint>

using json = nlohmann::json;

struct SearchResult {
    std::string id;
    std::string title;
    std::optional<std::string> author;
    std::optional<std::string> description;
    std::optional<std::string> bot;
    std::optional<uint64_t> size_bytes;

    std::string to_string() const;
};

bool operator==(const SearchResult& a, const SearchResult& b);
void to_json(json& j, const SearchResult& result);
