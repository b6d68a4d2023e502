#pragma once
#include "Transport.hpp"
#include "IrcMessage.hpp"
#include "../core/Settings.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <utility>

enum class ConnectionState {
    Disconnected,
    Connecting,
    Registered,
    Joined,
    Failed
};

const char* to_string(ConnectionState state);

struct IrcEvent {
    enum class Type {
        Welcome,
        NicknameInUse,
        Join,
        Message,
        Notice,
        Ctcp,
        Error,
        Disconnect
    };

    Type type;
    std::string source;   // full prefix
    std::string nick;     // nick part of source
    std::string target;   // channel or nick addressed
    std::string text;     // message text, CTCP payload or error text
    std::string command;  // raw command or numeric
};

// Registration retry table: attempt 0 uses the base nickname, attempt n uses base_n.
struct RetryPolicy {
    int max_attempts = Config::MAX_REGISTRATION_ATTEMPTS;

    std::string nickname_for(const std::string& base, int attempt) const;
};

// One IRC server connection. Not thread-safe: a single thread drives
// registration, polling and every subscribed handler.
class IrcConnection {
public:
    using Handler = std::function<void(const IrcEvent&)>;

    explicit IrcConnection(const Settings& settings, RetryPolicy policy = RetryPolicy());
    ~IrcConnection();
    IrcConnection(const IrcConnection&) = delete;
    IrcConnection& operator=(const IrcConnection&) = delete;

    // register_with_retry() followed by join_channel(). Throws ConnectionError.
    void connect_and_join();
    void register_with_retry();
    void join_channel();

    void send_privmsg(const std::string& target, const std::string& text);
    void send_line(const std::string& line);

    int subscribe(IrcEvent::Type type, Handler handler);
    void unsubscribe(int id);

    // Waits at most timeout for input and dispatches every complete line.
    // Socket failures move the connection to Failed and emit Disconnect.
    void poll_once(std::chrono::milliseconds timeout);
    // Best-effort QUIT, then close. State becomes Disconnected.
    void disconnect(const std::string& reason = "done");

    ConnectionState state() const;
    const std::string& nickname() const;
    const std::string& channel() const;

private:
    Settings settings;
    RetryPolicy policy;
    Transport transport;
    ConnectionState current = ConnectionState::Disconnected;
    std::string nick;
    std::string buffer;

    std::map<int, std::pair<IrcEvent::Type, Handler>> handlers;
    int next_handler_id = 1;

    bool welcomed = false;
    bool nick_in_use = false;
    bool joined = false;
    std::string join_error;

    bool try_register(const std::string& candidate);
    void wait_for(std::chrono::milliseconds timeout, const std::function<bool()>& done);
    void set_state(ConnectionState next);
    void fail(const std::string& reason);
    void handle_line(const std::string& raw);
    void dispatch(const IrcEvent& event);
};
