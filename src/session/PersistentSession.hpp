#pragma once
#include "SearchRequest.hpp"
#include "../core/Settings.hpp"
#include "../download/WorkQueue.hpp"
#include "../network/IrcConnection.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Long-lived connection shared by many searches. Requests are queued FIFO and
// run one at a time by the session thread, which owns the IrcConnection.
class PersistentSession {
public:
    struct Status {
        bool connected;
        std::optional<std::string> error;

        json to_json() const;
    };

    explicit PersistentSession(const Settings& settings, RetryPolicy policy = RetryPolicy());
    ~PersistentSession();
    PersistentSession(const PersistentSession&) = delete;
    PersistentSession& operator=(const PersistentSession&) = delete;

    // Starts the session thread. No-op while it is already running.
    void connect();
    // True once the channel is joined; false on failure or timeout.
    bool wait_until_connected(std::chrono::milliseconds timeout);

    // Throws SessionError when the session is not connected.
    std::shared_ptr<SearchRequest> submit(const std::string& query,
                                          const std::optional<std::string>& author = std::nullopt);
    // submit() and wait. SessionError when the caller's timeout expires.
    std::vector<SearchResult> search(const std::string& query,
                                     const std::optional<std::string>& author,
                                     std::chrono::milliseconds timeout);

    void disconnect();
    Status status() const;
    bool is_connected() const;

private:
    struct ActiveSearch {
        std::shared_ptr<SearchRequest> request;
        std::vector<int> subscriptions;
        std::vector<SearchResult> inline_results;
        std::vector<SearchResult> payload_results;
        std::exception_ptr error;
        std::chrono::steady_clock::time_point started;
    };

    Settings settings;
    RetryPolicy policy;
    WorkQueue<std::shared_ptr<SearchRequest>> requests;

    // Serializes connect() and disconnect() around the worker thread.
    std::mutex lifecycle_mtx;
    std::thread worker;
    std::atomic<bool> stop{false};
    std::atomic<bool> running{false};

    mutable std::mutex state_mtx;
    std::condition_variable state_cv;
    bool connected = false;
    bool connect_finished = false;
    std::optional<std::string> last_error;

    void run_loop();
    void start_request(IrcConnection& conn, ActiveSearch& active);
    void finish_request(IrcConnection& conn, ActiveSearch& active);
    void mark_disconnected(const std::optional<std::string>& error);
    void fail_pending(std::exception_ptr error);
};
