#include "SearchSession.hpp"
#include "../core/Errors.hpp"
#include "../network/DccOffer.hpp"
#include "../network/DccTransfer.hpp"
#include "../utils/FileUtils.hpp"
#include "../utils/ResultParser.hpp"
#include "../utils/StringUtils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <future>

namespace fs = std::filesystem;

SearchSession::SearchSession(const Settings& settings, RetryPolicy policy)
    : settings(settings), policy(policy) {}

std::string SearchSession::sanitize_query(const std::string& query,
                                          const std::optional<std::string>& author) {
    std::string q = StringUtils::trim(query);

    // drop a trailing extension like .epub or .pdf
    size_t dot = q.rfind('.');
    if (dot != std::string::npos) {
        size_t len = q.size() - dot - 1;
        bool is_extension = len >= 1 && len <= 5 &&
            std::all_of(q.begin() + dot + 1, q.end(), [](char c) {
                unsigned char uc = static_cast<unsigned char>(c);
                return uc < 0x80 && std::isalnum(uc);
            });
        if (is_extension) {
            q.erase(dot);
        }
    }

    for (char& c : q) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc >= 0x80 || std::isalnum(uc) || std::isspace(uc) || c == '_' || c == '\'' || c == '-') {
            continue;
        }
        c = ' ';
    }

    if (author && !author->empty()) {
        q = StringUtils::trim(q + " " + *author);
    }

    std::string out;
    bool pending_space = false;
    for (char c : q) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}

std::string SearchSession::format_command(const std::string& pattern, const std::string& placeholder,
                                          const std::string& value) {
    std::string out = pattern;
    size_t pos = 0;
    while ((pos = out.find(placeholder, pos)) != std::string::npos) {
        out.replace(pos, placeholder.size(), value);
        pos += value.size();
    }
    return out;
}

std::vector<SearchResult> SearchSession::receive_results_payload(const TransferOffer& offer,
                                                                 const Settings& settings) {
    fs::path dest = fs::path(settings.temp_dir) / FileUtils::safe_filename(offer.filename, "results");
    DccTransfer::receive(offer, dest.string(), settings.dcc_timeout);
    spdlog::info("Saved search results to {}", dest.string());

    auto results = ResultParser::parse_file(dest.string(), offer.sender);
    spdlog::info("Parsed {} results from {}", results.size(), offer.filename);
    return results;
}

std::vector<SearchResult> SearchSession::search(const std::string& query,
                                                const std::optional<std::string>& author) {
    auto worker = std::async(std::launch::async, &SearchSession::run_search, this, query, author);
    return worker.get();
}

std::string SearchSession::download(const std::string& result_id, const std::optional<std::string>& bot,
                                    const std::string& dest) {
    auto worker = std::async(std::launch::async, &SearchSession::run_download, this, result_id, bot, dest);
    return worker.get();
}

std::vector<SearchResult> SearchSession::run_search(const std::string& query,
                                                    const std::optional<std::string>& author) {
    IrcConnection conn(settings, policy);
    conn.connect_and_join();

    OfferPolicy offer_policy = OfferPolicy::from_settings(settings);
    std::vector<SearchResult> inline_results;
    std::vector<SearchResult> payload_results;

    conn.subscribe(IrcEvent::Type::Message, [&](const IrcEvent& event) {
        spdlog::info("<{}> {}", event.source, event.text);
        if (auto result = ResultParser::parse_line(event.text, event.nick)) {
            inline_results.push_back(std::move(*result));
        }
    });

    conn.subscribe(IrcEvent::Type::Ctcp, [&](const IrcEvent& event) {
        if (!DccOffer::is_dcc_send(event.text)) return;
        spdlog::info("CTCP DCC from {}: {}", event.nick, event.text);
        try {
            TransferOffer offer = DccOffer::parse(event.text, event.nick, offer_policy);
            spdlog::info("Accepting search DCC {}", offer.to_string());
            auto parsed = receive_results_payload(offer, settings);
            payload_results.insert(payload_results.end(), parsed.begin(), parsed.end());
        } catch (const std::exception& e) {
            // a bad results payload does not end the search window
            spdlog::warn("DCC error: {}", e.what());
        }
    });

    std::string text = sanitize_query(query, author);
    spdlog::info("SEARCH {}", text);
    conn.send_privmsg(conn.channel(), format_command(settings.search_command, "{query}", text));

    auto deadline = std::chrono::steady_clock::now() + settings.search_timeout;
    while (payload_results.empty() && conn.state() != ConnectionState::Failed) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) break;
        conn.poll_once(std::min(remaining, std::chrono::milliseconds(Config::POLL_SLICE_MS)));
    }

    bool lost = conn.state() == ConnectionState::Failed;
    conn.disconnect("done");

    if (!payload_results.empty()) {
        return payload_results;
    }
    if (lost && inline_results.empty()) {
        throw ConnectionError("Connection lost during search");
    }
    spdlog::info("Search for '{}' returned {} results", text, inline_results.size());
    return inline_results;
}

std::string SearchSession::run_download(const std::string& result_id, const std::optional<std::string>& bot,
                                        const std::string& dest) {
    IrcConnection conn(settings, policy);
    conn.connect_and_join();

    OfferPolicy offer_policy = OfferPolicy::from_settings(settings);
    bool done = false;
    std::exception_ptr error;

    conn.subscribe(IrcEvent::Type::Message, [&](const IrcEvent& event) {
        if (bot && !StringUtils::icontains(event.source, *bot)) return;
        spdlog::info("<{}> {}", event.source, event.text);
    });

    conn.subscribe(IrcEvent::Type::Ctcp, [&](const IrcEvent& event) {
        if (done || !DccOffer::is_dcc_send(event.text)) return;
        try {
            TransferOffer offer = DccOffer::parse(event.text, event.nick, offer_policy);
            spdlog::info("Accepting DCC {}", offer.to_string());
            DccTransfer::receive(offer, dest, settings.dcc_timeout);
        } catch (const LircbraryError& e) {
            spdlog::error("DCC error: {}", e.what());
            error = std::current_exception();
        }
        done = true;
    });

    spdlog::info("DOWNLOAD {} via {}", result_id, bot.value_or("unknown"));
    conn.send_privmsg(conn.channel(), format_command(settings.download_command, "{id}", result_id));

    auto deadline = std::chrono::steady_clock::now() + settings.dcc_timeout;
    while (!done && conn.state() != ConnectionState::Failed) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) break;
        conn.poll_once(std::min(remaining, std::chrono::milliseconds(Config::POLL_SLICE_MS)));
    }

    bool lost = conn.state() == ConnectionState::Failed;
    conn.disconnect("done");

    if (error) {
        std::rethrow_exception(error);
    }
    if (!done) {
        if (lost) {
            throw ConnectionError("Connection lost while waiting for a transfer offer");
        }
        spdlog::warn("No DCC SEND received after {}s", settings.dcc_timeout.count() / 1000);
        throw TransferError("no transfer offered");
    }
    return dest;
}
