#pragma once
#include <string>
#include <vector>

class StringUtils {
public:
    static std::string to_lower(const std::string& value);
    static std::string to_upper(const std::string& value);
    static bool iequals(const std::string& a, const std::string& b);
    static bool icontains(const std::string& haystack, const std::string& needle);
    static bool istarts_with(const std::string& value, const std::string& prefix);
    static bool iends_with(const std::string& value, const std::string& suffix);
    static std::string trim(const std::string& value);
    static std::vector<std::string> split(const std::string& value, char delimiter);

    // Splits on '\n' and drops a trailing '\r' from every line.
    static std::vector<std::string> split_lines(const std::string& text);

    // Text decoding: one byte per character (Latin-1) re-encoded as UTF-8.
    static bool is_valid_utf8(const std::string& bytes);
    static std::string latin1_to_utf8(const std::string& bytes);
    // Keeps valid UTF-8 as is, otherwise decodes as Latin-1.
    static std::string decode_lenient(const std::string& bytes);
};
