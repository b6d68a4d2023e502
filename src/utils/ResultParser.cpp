#include "ResultParser.hpp"
#include "FileUtils.hpp"
#include "StringUtils.hpp"
#include "ZipArchive.hpp"
#include <spdlog/spdlog.h>
#include <cctype>

std::optional<SearchResult> ResultParser::parse_line(const std::string& line,
                                                     const std::optional<std::string>& bot) {
    std::string text = line;
    while (!text.empty() && text.back() == '\r') {
        text.pop_back();
    }
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        return std::nullopt;
    }

    size_t pos = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    std::string id = text.substr(0, pos);

    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    size_t bar = text.find('|', pos);
    std::string title = text.substr(pos, bar == std::string::npos ? std::string::npos : bar - pos);

    SearchResult result;
    result.id = id;
    result.title = title;
    result.description = text;
    result.bot = bot;
    return result;
}

std::vector<SearchResult> ResultParser::parse_text(const std::string& text,
                                                   const std::optional<std::string>& bot) {
    std::vector<SearchResult> results;
    for (const auto& line : StringUtils::split_lines(text)) {
        if (auto result = parse_line(line, bot)) {
            results.push_back(std::move(*result));
        }
    }
    return results;
}

std::vector<SearchResult> ResultParser::parse_payload(const std::string& bytes,
                                                      const std::optional<std::string>& bot) {
    if (!ZipArchive::has_signature(bytes)) {
        return parse_text(StringUtils::latin1_to_utf8(bytes), bot);
    }

    ZipArchive archive(bytes);
    std::vector<SearchResult> results;
    for (const auto& entry : archive.entries()) {
        if (entry.is_directory() || !StringUtils::iends_with(entry.name, ".txt")) {
            continue;
        }
        auto parsed = parse_text(StringUtils::latin1_to_utf8(archive.read(entry)), bot);
        spdlog::debug("Parsed {} results from {}", parsed.size(), entry.name);
        results.insert(results.end(), parsed.begin(), parsed.end());
    }
    return results;
}

std::vector<SearchResult> ResultParser::parse_file(const std::string& path,
                                                   const std::optional<std::string>& bot) {
    return parse_payload(FileUtils::read_file(path), bot);
}
