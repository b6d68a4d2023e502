#include "IrcMessage.hpp"
#include "../utils/StringUtils.hpp"

IrcMessage IrcMessage::parse(const std::string& line) {
    IrcMessage msg;
    std::string rest = line;
    while (!rest.empty() && (rest.back() == '\r' || rest.back() == '\n')) {
        rest.pop_back();
    }

    size_t pos = 0;
    auto skip_spaces = [&] {
        while (pos < rest.size() && rest[pos] == ' ') ++pos;
    };
    auto next_word = [&] {
        size_t end = rest.find(' ', pos);
        std::string word = rest.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
        pos = end == std::string::npos ? rest.size() : end;
        return word;
    };

    // IRCv3 message tags are ignored
    if (pos < rest.size() && rest[pos] == '@') {
        next_word();
        skip_spaces();
    }
    if (pos < rest.size() && rest[pos] == ':') {
        ++pos;
        msg.prefix = next_word();
        skip_spaces();
    }
    msg.command = StringUtils::to_upper(next_word());

    while (true) {
        skip_spaces();
        if (pos >= rest.size()) break;
        if (rest[pos] == ':') {
            msg.params.push_back(rest.substr(pos + 1));
            break;
        }
        msg.params.push_back(next_word());
    }
    return msg;
}

std::string IrcMessage::nick() const {
    size_t bang = prefix.find('!');
    return bang == std::string::npos ? prefix : prefix.substr(0, bang);
}

std::string IrcMessage::param(size_t index) const {
    return index < params.size() ? params[index] : std::string();
}

std::string IrcMessage::trailing() const {
    return params.empty() ? std::string() : params.back();
}

bool IrcMessage::is_ctcp(const std::string& text) {
    return !text.empty() && text[0] == '\x01';
}

std::string IrcMessage::ctcp_payload(const std::string& text) {
    if (!is_ctcp(text)) return text;
    std::string payload = text.substr(1);
    size_t end = payload.find('\x01');
    if (end != std::string::npos) {
        payload.erase(end);
    }
    return payload;
}

std::string IrcMessage::decode_line(const std::string& raw) {
    return StringUtils::decode_lenient(raw);
}
