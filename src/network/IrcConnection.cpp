#include "IrcConnection.hpp"
#include "../core/Errors.hpp"
#include "../utils/StringUtils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>
#include <cerrno>
#include <vector>

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Registered: return "Registered";
        case ConnectionState::Joined: return "Joined";
        case ConnectionState::Failed: return "Failed";
    }
    return "Unknown";
}

std::string RetryPolicy::nickname_for(const std::string& base, int attempt) const {
    return attempt == 0 ? base : base + "_" + std::to_string(attempt);
}

static bool is_join_failure(const std::string& command) {
    return command == "471" || command == "473" || command == "474" ||
           command == "475" || command == "477";
}

IrcConnection::IrcConnection(const Settings& settings, RetryPolicy policy)
    : settings(settings), policy(policy), nick(settings.irc_nick) {}

IrcConnection::~IrcConnection() {
    if (transport.is_open()) {
        disconnect("Goodbye");
    }
}

ConnectionState IrcConnection::state() const {
    return current;
}

const std::string& IrcConnection::nickname() const {
    return nick;
}

const std::string& IrcConnection::channel() const {
    return settings.irc_channel;
}

void IrcConnection::set_state(ConnectionState next) {
    if (next == current) return;
    spdlog::info("IRC state {} -> {}", to_string(current), to_string(next));
    current = next;
}

void IrcConnection::fail(const std::string& reason) {
    spdlog::error("IRC connection failed: {}", reason);
    transport.close();
    buffer.clear();
    set_state(ConnectionState::Failed);

    IrcEvent event{IrcEvent::Type::Disconnect, "", "", "", reason, ""};
    dispatch(event);
}

void IrcConnection::connect_and_join() {
    register_with_retry();
    join_channel();
}

void IrcConnection::register_with_retry() {
    const std::string& base = settings.irc_nick;
    for (int attempt = 0; attempt < policy.max_attempts; ++attempt) {
        if (try_register(policy.nickname_for(base, attempt))) {
            return;
        }
    }
    throw ConnectionError("Could not register with " + settings.irc_server + " after " +
                          std::to_string(policy.max_attempts) + " attempts");
}

bool IrcConnection::try_register(const std::string& candidate) {
    transport.close();
    buffer.clear();
    welcomed = false;
    nick_in_use = false;
    joined = false;
    join_error.clear();
    nick = candidate;

    set_state(ConnectionState::Connecting);
    spdlog::info("Connecting to {}:{} as {}", settings.irc_server, settings.irc_port, nick);
    try {
        transport.connect(settings.irc_server, settings.irc_port, settings.irc_ssl,
                          settings.irc_ssl_verify, settings.connect_timeout);
    } catch (const ConnectionError& e) {
        spdlog::error("{}", e.what());
        set_state(ConnectionState::Failed);
        throw;
    }

    send_line("NICK " + nick);
    send_line("USER " + nick + " 0 * :" + settings.irc_realname);

    wait_for(settings.welcome_timeout, [this] {
        return welcomed || nick_in_use || current == ConnectionState::Failed;
    });

    if (welcomed) {
        return true;
    }
    if (nick_in_use) {
        spdlog::warn("Nickname {} is already in use", nick);
    } else if (current != ConnectionState::Failed) {
        spdlog::warn("Welcome timeout for {}", nick);
    }
    transport.close();
    set_state(ConnectionState::Failed);
    return false;
}

void IrcConnection::join_channel() {
    const std::string& target = settings.irc_channel;
    if (current != ConnectionState::Registered) {
        throw ConnectionError("Cannot join " + target + " while " + to_string(current));
    }

    joined = false;
    join_error.clear();
    spdlog::info("Joining {}", target);
    send_line("JOIN " + target);

    wait_for(settings.join_timeout, [this] {
        return joined || !join_error.empty() || current == ConnectionState::Failed;
    });
    if (joined) {
        return;
    }

    std::string reason;
    if (!join_error.empty()) {
        reason = "Cannot join " + target + ": " + join_error;
    } else if (current == ConnectionState::Failed) {
        throw ConnectionError("Connection lost while joining " + target);
    } else {
        reason = "Join timeout for " + target;
    }
    fail(reason);
    throw ConnectionError(reason);
}

void IrcConnection::wait_for(std::chrono::milliseconds timeout, const std::function<bool()>& done) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }
        poll_once(std::min(remaining, std::chrono::milliseconds(Config::POLL_SLICE_MS)));
    }
}

void IrcConnection::send_privmsg(const std::string& target, const std::string& text) {
    send_line("PRIVMSG " + target + " :" + text);
}

void IrcConnection::send_line(const std::string& line) {
    std::string clean;
    clean.reserve(line.size() + 2);
    for (char c : line) {
        if (c != '\r' && c != '\n') clean.push_back(c);
    }
    spdlog::debug(">> {}", clean);
    if (!transport.write_all(clean + "\r\n")) {
        std::string reason = "Failed to send to " + settings.irc_server;
        if (transport.is_open()) {
            fail(reason);
        }
        throw ConnectionError(reason);
    }
}

int IrcConnection::subscribe(IrcEvent::Type type, Handler handler) {
    int id = next_handler_id++;
    handlers.emplace(id, std::make_pair(type, std::move(handler)));
    return id;
}

void IrcConnection::unsubscribe(int id) {
    handlers.erase(id);
}

void IrcConnection::dispatch(const IrcEvent& event) {
    // Handlers may unsubscribe while being called
    std::vector<Handler> matching;
    for (const auto& entry : handlers) {
        if (entry.second.first == event.type) {
            matching.push_back(entry.second.second);
        }
    }
    for (const auto& handler : matching) {
        handler(event);
    }
}

void IrcConnection::poll_once(std::chrono::milliseconds timeout) {
    if (!transport.is_open()) {
        return;
    }
    if (!transport.wait_readable(timeout)) {
        return;
    }

    char data[Config::IRC_READ_BUFFER];
    ssize_t n = transport.read_some(data, sizeof(data));
    if (n <= 0) {
        fail(n == 0 ? "Server closed the connection" : std::string("Read error: ") + strerror(errno));
        return;
    }
    buffer.append(data, static_cast<size_t>(n));

    size_t pos;
    while ((pos = buffer.find('\n')) != std::string::npos) {
        std::string line = buffer.substr(0, pos);
        buffer.erase(0, pos + 1);
        handle_line(line);
        if (!transport.is_open()) {
            break;
        }
    }
}

void IrcConnection::handle_line(const std::string& raw) {
    std::string line = IrcMessage::decode_line(raw);
    IrcMessage msg = IrcMessage::parse(line);
    if (msg.command.empty()) {
        return;
    }
    spdlog::debug("<< {}", line);

    if (msg.command == "PING") {
        if (!transport.write_all("PONG :" + msg.trailing() + "\r\n")) {
            fail("Failed to answer PING");
        }
        return;
    }

    IrcEvent event{IrcEvent::Type::Message, msg.prefix, msg.nick(), "", msg.trailing(), msg.command};

    if (msg.command == "001") {
        welcomed = true;
        spdlog::info("Connected (RPL_WELCOME) as {}", nick);
        set_state(ConnectionState::Registered);
        event.type = IrcEvent::Type::Welcome;
        event.target = msg.param(0);
    } else if (msg.command == "433") {
        nick_in_use = true;
        event.type = IrcEvent::Type::NicknameInUse;
        event.target = msg.param(1);
    } else if (msg.command == "JOIN") {
        event.type = IrcEvent::Type::Join;
        event.target = msg.param(0);
        if (StringUtils::iequals(event.nick, nick) &&
            StringUtils::iequals(event.target, settings.irc_channel)) {
            joined = true;
            spdlog::info("Joined {}", settings.irc_channel);
            if (current == ConnectionState::Registered) {
                set_state(ConnectionState::Joined);
            }
        }
    } else if (is_join_failure(msg.command)) {
        event.type = IrcEvent::Type::Error;
        event.target = msg.param(1);
        if (StringUtils::iequals(event.target, settings.irc_channel)) {
            join_error = msg.command + " " + msg.trailing();
        }
        spdlog::warn("Join refused for {}: {} {}", event.target, msg.command, msg.trailing());
    } else if (msg.command == "ERROR") {
        event.type = IrcEvent::Type::Error;
        spdlog::warn("IRC error: {}", msg.trailing());
    } else if (msg.command == "PRIVMSG" || msg.command == "NOTICE") {
        event.target = msg.param(0);
        if (IrcMessage::is_ctcp(event.text)) {
            event.type = IrcEvent::Type::Ctcp;
            event.text = IrcMessage::ctcp_payload(event.text);
        } else {
            event.type = msg.command == "PRIVMSG" ? IrcEvent::Type::Message : IrcEvent::Type::Notice;
        }
    } else {
        return;
    }
    dispatch(event);
}

void IrcConnection::disconnect(const std::string& reason) {
    if (transport.is_open()) {
        if (!transport.write_all("QUIT :" + reason + "\r\n")) {
            spdlog::debug("QUIT not delivered to {}", settings.irc_server);
        }
    }
    transport.close();
    buffer.clear();
    set_state(ConnectionState::Disconnected);
}
