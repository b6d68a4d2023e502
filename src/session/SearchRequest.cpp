#include "SearchRequest.hpp"

SearchRequest::SearchRequest(std::string query, std::optional<std::string> author)
    : text(std::move(query)),
      author_name(std::move(author)),
      future(promise.get_future().share()) {}

const std::string& SearchRequest::query() const {
    return text;
}

const std::optional<std::string>& SearchRequest::author() const {
    return author_name;
}

void SearchRequest::complete(std::vector<SearchResult> results) {
    if (done.exchange(true)) return;
    promise.set_value(std::move(results));
}

void SearchRequest::fail(std::exception_ptr error) {
    if (done.exchange(true)) return;
    promise.set_exception(error);
}

bool SearchRequest::wait_for(std::chrono::milliseconds timeout) const {
    return future.wait_for(timeout) == std::future_status::ready;
}

std::vector<SearchResult> SearchRequest::results() const {
    return future.get();
}

void SearchRequest::abandon() {
    dropped = true;
}

bool SearchRequest::abandoned() const {
    return dropped;
}

bool SearchRequest::finished() const {
    return done;
}
