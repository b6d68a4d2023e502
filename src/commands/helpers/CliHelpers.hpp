#ifndef CLI_HELPERS_HPP
#define CLI_HELPERS_HPP

#include "../../core/SearchResult.hpp"
#include "../../download/DownloadJobQueue.hpp"
#include <optional>
#include <string>
#include <vector>

namespace CliHelpers {

/**
 * Remove "--name value" from args
 * @param args Command arguments, modified in place
 * @param name Option name including the leading dashes
 * @return The option value, or nullopt when the option is absent
 * @throws std::invalid_argument when the option has no value
 */
std::optional<std::string> take_option(
    std::vector<std::string>& args,
    const std::string& name
);

/**
 * Remove a bare "--name" flag from args
 * @return true if the flag was present
 */
bool take_flag(
    std::vector<std::string>& args,
    const std::string& name
);

std::string join_args(const std::vector<std::string>& args);

/**
 * Print search results, one per line or as a JSON array
 */
void print_results(
    const std::vector<SearchResult>& results,
    bool as_json
);

/**
 * Poll a job until it finishes, printing every status change
 * @param queue Queue the job was submitted to
 * @param job_id Identifier returned by submit()
 * @return 0 when the job finished, 1 when it failed
 */
int follow_job(
    const DownloadJobQueue& queue,
    const std::string& job_id
);

} // namespace CliHelpers

#endif // CLI_HELPERS_HPP
