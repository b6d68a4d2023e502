#include "PersistentSession.hpp"
#include "SearchSession.hpp"
#include "../core/Errors.hpp"
#include "../network/DccOffer.hpp"
#include "../utils/ResultParser.hpp"
#include <spdlog/spdlog.h>

json PersistentSession::Status::to_json() const {
    json j;
    j["connected"] = connected;
    j["error"] = error ? json(*error) : json(nullptr);
    return j;
}

PersistentSession::PersistentSession(const Settings& settings, RetryPolicy policy)
    : settings(settings), policy(policy) {}

PersistentSession::~PersistentSession() {
    disconnect();
}

void PersistentSession::connect() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mtx);
    if (running) {
        spdlog::info("Session already connected");
        return;
    }
    if (worker.joinable()) {
        worker.join();
    }
    stop = false;
    {
        std::lock_guard<std::mutex> lock(state_mtx);
        connected = false;
        connect_finished = false;
        last_error.reset();
    }
    running = true;
    worker = std::thread(&PersistentSession::run_loop, this);
}

bool PersistentSession::wait_until_connected(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(state_mtx);
    state_cv.wait_for(lock, timeout, [this] { return connect_finished; });
    return connected;
}

std::shared_ptr<SearchRequest> PersistentSession::submit(const std::string& query,
                                                         const std::optional<std::string>& author) {
    std::lock_guard<std::mutex> lock(state_mtx);
    if (!connected) {
        throw SessionError("IRC session not connected");
    }
    auto request = std::make_shared<SearchRequest>(query, author);
    requests.add(request);
    return request;
}

std::vector<SearchResult> PersistentSession::search(const std::string& query,
                                                    const std::optional<std::string>& author,
                                                    std::chrono::milliseconds timeout) {
    auto request = submit(query, author);
    if (!request->wait_for(timeout)) {
        request->abandon();
        throw SessionError("Search timed out");
    }
    return request->results();
}

void PersistentSession::disconnect() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mtx);
    stop = true;
    if (worker.joinable()) {
        worker.join();
    }
    {
        std::lock_guard<std::mutex> lock(state_mtx);
        if (!connected && !connect_finished) {
            return;
        }
        connected = false;
    }
    fail_pending(std::make_exception_ptr(SessionError("session disconnected")));
    spdlog::info("Session disconnected");
}

PersistentSession::Status PersistentSession::status() const {
    std::lock_guard<std::mutex> lock(state_mtx);
    return {connected, last_error};
}

bool PersistentSession::is_connected() const {
    std::lock_guard<std::mutex> lock(state_mtx);
    return connected;
}

void PersistentSession::mark_disconnected(const std::optional<std::string>& error) {
    {
        std::lock_guard<std::mutex> lock(state_mtx);
        connected = false;
        connect_finished = true;
        if (error) {
            last_error = error;
        }
    }
    state_cv.notify_all();
}

void PersistentSession::fail_pending(std::exception_ptr error) {
    auto pending = requests.drain();
    while (!pending.empty()) {
        pending.front()->fail(error);
        pending.pop();
    }
}

void PersistentSession::run_loop() {
    IrcConnection conn(settings, policy);
    std::string lost_reason;
    conn.subscribe(IrcEvent::Type::Disconnect, [&lost_reason](const IrcEvent& event) {
        lost_reason = event.text;
    });

    try {
        conn.connect_and_join();
    } catch (const LircbraryError& e) {
        spdlog::error("Session error: {}", e.what());
        mark_disconnected(std::string(e.what()));
        fail_pending(std::current_exception());
        running = false;
        return;
    }

    {
        std::lock_guard<std::mutex> lock(state_mtx);
        connected = true;
        connect_finished = true;
        last_error.reset();
    }
    state_cv.notify_all();
    spdlog::info("Session connected and idle");

    std::optional<ActiveSearch> active;
    while (!stop) {
        if (!active) {
            while (auto next = requests.try_get()) {
                if ((*next)->abandoned()) {
                    spdlog::info("Skipping abandoned search '{}'", (*next)->query());
                    continue;
                }
                active.emplace();
                active->request = *next;
                start_request(conn, *active);
                break;
            }
        }

        conn.poll_once(std::chrono::milliseconds(Config::POLL_SLICE_MS));
        if (conn.state() == ConnectionState::Failed) {
            break;
        }

        if (active) {
            bool expired = std::chrono::steady_clock::now() - active->started >= settings.search_timeout;
            if (!active->payload_results.empty() || active->error || expired ||
                active->request->abandoned()) {
                if (expired) {
                    spdlog::info("Search timeout (session)");
                }
                finish_request(conn, *active);
                active.reset();
            }
        }
    }

    if (conn.state() == ConnectionState::Failed) {
        std::string reason = lost_reason.empty() ? "connection lost" : lost_reason;
        auto error = std::make_exception_ptr(ConnectionError("Session connection lost: " + reason));
        if (active) {
            for (int id : active->subscriptions) conn.unsubscribe(id);
            active->request->fail(error);
        }
        mark_disconnected(reason);
        fail_pending(error);
    } else {
        auto error = std::make_exception_ptr(SessionError("session disconnected"));
        if (active) {
            for (int id : active->subscriptions) conn.unsubscribe(id);
            active->request->fail(error);
        }
        conn.disconnect("done");
        mark_disconnected(std::nullopt);
        fail_pending(error);
    }
    running = false;
}

void PersistentSession::start_request(IrcConnection& conn, ActiveSearch& active) {
    active.started = std::chrono::steady_clock::now();
    ActiveSearch* state = &active;

    active.subscriptions.push_back(conn.subscribe(IrcEvent::Type::Message, [state](const IrcEvent& event) {
        spdlog::info("<{}> {}", event.source, event.text);
        if (auto result = ResultParser::parse_line(event.text, event.nick)) {
            state->inline_results.push_back(std::move(*result));
        }
    }));

    active.subscriptions.push_back(conn.subscribe(IrcEvent::Type::Ctcp, [this, state](const IrcEvent& event) {
        if (!DccOffer::is_dcc_send(event.text)) return;
        if (!state->payload_results.empty() || state->error) return;
        spdlog::info("CTCP DCC from {}: {}", event.nick, event.text);
        try {
            TransferOffer offer = DccOffer::parse(event.text, event.nick, OfferPolicy::from_settings(settings));
            spdlog::info("Accepting search DCC {}", offer.to_string());
            auto parsed = SearchSession::receive_results_payload(offer, settings);
            if (parsed.empty()) {
                spdlog::warn("Results payload from {} held no results", event.nick);
            } else {
                state->payload_results = std::move(parsed);
            }
        } catch (const std::exception& e) {
            spdlog::warn("DCC error: {}", e.what());
            state->error = std::current_exception();
        }
    }));

    std::string text = SearchSession::sanitize_query(active.request->query(), active.request->author());
    spdlog::info("SEARCH {}", text);
    try {
        conn.send_privmsg(conn.channel(), SearchSession::format_command(settings.search_command, "{query}", text));
    } catch (const ConnectionError& e) {
        spdlog::error("Could not send search: {}", e.what());
        active.error = std::current_exception();
    }
}

void PersistentSession::finish_request(IrcConnection& conn, ActiveSearch& active) {
    for (int id : active.subscriptions) {
        conn.unsubscribe(id);
    }
    active.subscriptions.clear();

    auto& request = active.request;
    if (!active.payload_results.empty()) {
        request->complete(std::move(active.payload_results));
    } else if (active.error) {
        request->fail(active.error);
    } else if (!active.inline_results.empty()) {
        request->complete(std::move(active.inline_results));
    } else if (request->abandoned()) {
        request->fail(std::make_exception_ptr(SessionError("Search abandoned by caller")));
    } else {
        request->fail(std::make_exception_ptr(SessionError("Search timed out")));
    }
    spdlog::info("Search '{}' finished", request->query());
}
