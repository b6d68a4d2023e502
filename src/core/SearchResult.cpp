#include "SearchResult.hpp"

std::string SearchResult::to_string() const {
    std::string out = id + " | " + title;
    if (bot) {
        out += " | " + *bot;
    }
    return out;
}

bool operator==(const SearchResult& a, const SearchResult& b) {
    return a.id == b.id && a.title == b.title && a.author == b.author &&
           a.description == b.description && a.bot == b.bot && a.size_bytes == b.size_bytes;
}

template <typename T>
static json optional_value(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

void to_json(json& j, const SearchResult& result) {
    j = json{
        {"id", result.id},
        {"title", result.title},
        {"author", optional_value(result.author)},
        {"description", optional_value(result.description)},
        {"bot", optional_value(result.bot)},
        {"size_bytes", optional_value(result.size_bytes)},
    };
}
