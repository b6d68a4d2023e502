#pragma once
#include "../core/SearchResult.hpp"
#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <optional>
#include <string>
#include <vector>

// A search submitted to a PersistentSession. The session thread completes it
// exactly once; the submitting thread waits on it.
class SearchRequest {
public:
    SearchRequest(std::string query, std::optional<std::string> author);

    const std::string& query() const;
    const std::optional<std::string>& author() const;

    // Later calls after the first completion are ignored.
    void complete(std::vector<SearchResult> results);
    void fail(std::exception_ptr error);

    // True when the request completed within timeout.
    bool wait_for(std::chrono::milliseconds timeout) const;
    // Blocks until completion; rethrows the recorded error.
    std::vector<SearchResult> results() const;

    void abandon();
    bool abandoned() const;
    bool finished() const;

private:
    std::string text;
    std::optional<std::string> author_name;
    std::promise<std::vector<SearchResult>> promise;
    std::shared_future<std::vector<SearchResult>> future;
    std::atomic<bool> done{false};
    std::atomic<bool> dropped{false};
};
