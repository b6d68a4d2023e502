#pragma once
#include "../core/SearchResult.hpp"
#include "../core/Settings.hpp"
#include "../core/TransferOffer.hpp"
#include "../network/IrcConnection.hpp"
#include <optional>
#include <string>
#include <vector>

// One-shot operations: each call opens a fresh connection on its own worker
// thread, joins the channel, does its job and disconnects.
class SearchSession {
public:
    explicit SearchSession(const Settings& settings, RetryPolicy policy = RetryPolicy());

    // Results from a DCC payload when one arrived, otherwise the inline
    // PRIVMSG results. Throws ConnectionError if the link cannot be set up.
    std::vector<SearchResult> search(const std::string& query,
                                     const std::optional<std::string>& author = std::nullopt);

    // Requests result_id and stores the first accepted offer at dest.
    // Throws PolicyError, ProtocolError, TransferError or ConnectionError.
    std::string download(const std::string& result_id, const std::optional<std::string>& bot,
                         const std::string& dest);

    static std::string sanitize_query(const std::string& query,
                                      const std::optional<std::string>& author = std::nullopt);
    // Replaces every occurrence of placeholder in pattern.
    static std::string format_command(const std::string& pattern, const std::string& placeholder,
                                      const std::string& value);
    // Transfers a results payload into temp_dir and parses it.
    static std::vector<SearchResult> receive_results_payload(const TransferOffer& offer,
                                                             const Settings& settings);

private:
    Settings settings;
    RetryPolicy policy;

    std::vector<SearchResult> run_search(const std::string& query,
                                         const std::optional<std::string>& author);
    std::string run_download(const std::string& result_id, const std::optional<std::string>& bot,
                             const std::string& dest);
};
