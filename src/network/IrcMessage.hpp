#pragma once
#include <string>
#include <vector>

// One parsed IRC protocol line: [:prefix] COMMAND params... [:trailing]
struct IrcMessage {
    std::string prefix;
    std::string command;
    std::vector<std::string> params;

    static IrcMessage parse(const std::string& line);

    // Nick part of the prefix ("nick!user@host" -> "nick").
    std::string nick() const;
    std::string param(size_t index) const;
    // Last parameter, or "" when there is none.
    std::string trailing() const;

    static bool is_ctcp(const std::string& text);
    // Text between the \x01 delimiters.
    static std::string ctcp_payload(const std::string& text);
    // Valid UTF-8 is kept; anything else is read as Latin-1.
    static std::string decode_line(const std::string& raw);
};
