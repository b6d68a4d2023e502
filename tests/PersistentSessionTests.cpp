// Integration tests for session/PersistentSession.cpp - shared connection, serialized searches

#include <catch2/catch.hpp>
#include "core/Errors.hpp"
#include "session/PersistentSession.hpp"
#include "support/FakeDccSender.hpp"
#include "support/FakeIrcServer.hpp"
#include "support/TestHelpers.hpp"
#include "support/ZipWriter.hpp"
#include <future>
#include <mutex>
#include <thread>

using namespace std::chrono_literals;

namespace {
// Records when each search command reached the server.
struct SearchLog {
    std::mutex mtx;
    std::vector<std::pair<std::string, std::chrono::steady_clock::time_point>> entries;

    void add(const std::string& text) {
        std::lock_guard<std::mutex> lock(mtx);
        entries.emplace_back(text, std::chrono::steady_clock::now());
    }
};
}

TEST_CASE("PersistentSession - Requires a connection", "[session][persistent][integration]") {
    TempDir dir;
    PersistentSession session(test_settings(6667, dir.path()));

    REQUIRE_FALSE(session.is_connected());
    REQUIRE_THROWS_AS(session.submit("dune"), SessionError);
    REQUIRE_THROWS_WITH(session.search("dune", std::nullopt, 100ms), "IRC session not connected");

    auto status = session.status();
    REQUIRE_FALSE(status.connected);
    REQUIRE(status.to_json()["error"].is_null());
}

TEST_CASE("PersistentSession - Connect failure is reported", "[session][persistent][integration]") {
    int port;
    {
        FakeIrcServer gone;
        port = gone.port();
    }
    TempDir dir;
    PersistentSession session(test_settings(port, dir.path()));
    session.connect();

    REQUIRE_FALSE(session.wait_until_connected(5s));
    auto status = session.status();
    REQUIRE_FALSE(status.connected);
    REQUIRE(status.error.has_value());
    REQUIRE_THROWS_AS(session.submit("dune"), SessionError);
}

TEST_CASE("PersistentSession - Inline search over the shared connection", "[session][persistent][integration]") {
    FakeIrcServer server;
    server.on_channel_message = [](FakeIrcServer::Client& client, const std::string& text) {
        if (text == "@search dune herbert") {
            client.privmsg_from("Search", "1 Dune | Frank Herbert");
        }
    };
    server.start();
    TempDir dir;
    Settings settings = test_settings(server.port(), dir.path());
    settings.search_timeout = 500ms;

    PersistentSession session(settings);
    session.connect();
    REQUIRE(session.wait_until_connected(5s));
    REQUIRE(session.is_connected());
    REQUIRE(session.status().to_json()["connected"].get<bool>());

    // A second connect while running is a no-op
    session.connect();

    auto results = session.search("dune.epub", std::string("herbert"), 5s);
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].id == "1");
    REQUIRE(results[0].bot == std::optional<std::string>("Search"));

    // Same connection for the next search
    auto again = session.search("dune", std::string("herbert"), 5s);
    REQUIRE(again.size() == 1);
    REQUIRE(server.connection_count() == 1);

    session.disconnect();
    REQUIRE_FALSE(session.is_connected());
    REQUIRE_THROWS_AS(session.submit("dune"), SessionError);
    REQUIRE(wait_until([&] { return server.received("QUIT"); }, 2000ms));
}

TEST_CASE("PersistentSession - Concurrent connect calls start one session", "[session][persistent][integration]") {
    FakeIrcServer server;
    server.start();
    TempDir dir;

    PersistentSession session(test_settings(server.port(), dir.path()));
    std::vector<std::thread> callers;
    for (int i = 0; i < 8; ++i) {
        callers.emplace_back([&session] { session.connect(); });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    REQUIRE(session.wait_until_connected(5s));
    // Give any second worker time to reach the server
    std::this_thread::sleep_for(300ms);
    REQUIRE(server.connection_count() == 1);

    session.disconnect();
    REQUIRE_FALSE(session.is_connected());
}

TEST_CASE("PersistentSession - Concurrent searches run one at a time", "[session][persistent][integration]") {
    SearchLog log;
    FakeIrcServer server;
    server.on_channel_message = [&log](FakeIrcServer::Client& client, const std::string& text) {
        log.add(text);
        if (text == "@search alpha") {
            client.privmsg_from("Search", "1 Alpha");
        } else if (text == "@search beta") {
            client.privmsg_from("Search", "2 Beta");
        }
    };
    server.start();
    TempDir dir;
    Settings settings = test_settings(server.port(), dir.path());
    settings.search_timeout = 400ms;

    PersistentSession session(settings);
    session.connect();
    REQUIRE(session.wait_until_connected(5s));

    auto first = std::async(std::launch::async, [&] { return session.search("alpha", std::nullopt, 5s); });
    auto second = std::async(std::launch::async, [&] { return session.search("beta", std::nullopt, 5s); });

    auto alpha = first.get();
    auto beta = second.get();
    REQUIRE(alpha.size() == 1);
    REQUIRE(alpha[0].title == "Alpha");
    REQUIRE(beta.size() == 1);
    REQUIRE(beta[0].title == "Beta");

    std::lock_guard<std::mutex> lock(log.mtx);
    REQUIRE(log.entries.size() == 2);
    // The second command waits for the first search window to close
    REQUIRE(log.entries[1].second - log.entries[0].second >= 300ms);
}

TEST_CASE("PersistentSession - Payload results finish a search early", "[session][persistent][integration]") {
    std::string zip = ZipWriter().add("results.txt", "10 Dune\n11 Dune Messiah\n").build();
    FakeDccSender sender(zip);

    FakeIrcServer server;
    server.on_channel_message = [&sender](FakeIrcServer::Client& client, const std::string& text) {
        if (text == "@search dune") {
            client.ctcp_from("Search", sender.offer("results.zip"));
        }
    };
    server.start();
    TempDir dir;
    Settings settings = test_settings(server.port(), dir.path());
    settings.search_timeout = 10s;

    PersistentSession session(settings);
    session.connect();
    REQUIRE(session.wait_until_connected(5s));

    auto results = session.search("dune", std::nullopt, 5s);
    REQUIRE(results.size() == 2);
    REQUIRE(results[1].id == "11");
}

TEST_CASE("PersistentSession - Caller timeout", "[session][persistent][integration]") {
    FakeIrcServer server;
    server.on_channel_message = [](FakeIrcServer::Client& client, const std::string& text) {
        if (text == "@search answered") {
            client.privmsg_from("Search", "3 Answered");
        }
    };
    server.start();
    TempDir dir;
    Settings settings = test_settings(server.port(), dir.path());
    settings.search_timeout = 500ms;

    PersistentSession session(settings);
    session.connect();
    REQUIRE(session.wait_until_connected(5s));

    REQUIRE_THROWS_WITH(session.search("silent", std::nullopt, 100ms), "Search timed out");

    // The session keeps serving after an abandoned search
    auto results = session.search("answered", std::nullopt, 5s);
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].id == "3");
}

TEST_CASE("PersistentSession - Search window with no results", "[session][persistent][integration]") {
    FakeIrcServer server;
    server.start();
    TempDir dir;
    Settings settings = test_settings(server.port(), dir.path());
    settings.search_timeout = 300ms;

    PersistentSession session(settings);
    session.connect();
    REQUIRE(session.wait_until_connected(5s));

    auto request = session.submit("nothing");
    REQUIRE(request->wait_for(5s));
    REQUIRE(request->finished());
    REQUIRE_THROWS_AS(request->results(), SessionError);
}

TEST_CASE("PersistentSession - Connection loss fails the pending search", "[session][persistent][integration]") {
    FakeIrcServer server;
    server.on_channel_message = [&server](FakeIrcServer::Client&, const std::string&) {
        server.drop_clients();
    };
    server.start();
    TempDir dir;
    Settings settings = test_settings(server.port(), dir.path());
    settings.search_timeout = 5s;

    PersistentSession session(settings);
    session.connect();
    REQUIRE(session.wait_until_connected(5s));

    REQUIRE_THROWS_AS(session.search("dune", std::nullopt, 5s), ConnectionError);
    REQUIRE(wait_until([&] { return !session.is_connected(); }, 2000ms));

    auto status = session.status();
    REQUIRE(status.error == std::optional<std::string>("Server closed the connection"));
    REQUIRE_THROWS_AS(session.submit("again"), SessionError);
}
