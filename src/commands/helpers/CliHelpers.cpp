#include "CliHelpers.hpp"
#include "Config.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace CliHelpers {

std::optional<std::string> take_option(std::vector<std::string>& args, const std::string& name) {
    auto it = std::find(args.begin(), args.end(), name);
    if (it == args.end()) {
        return std::nullopt;
    }
    if (it + 1 == args.end()) {
        throw std::invalid_argument(name + " needs a value");
    }
    std::string value = *(it + 1);
    args.erase(it, it + 2);
    return value;
}

bool take_flag(std::vector<std::string>& args, const std::string& name) {
    auto it = std::find(args.begin(), args.end(), name);
    if (it == args.end()) {
        return false;
    }
    args.erase(it);
    return true;
}

std::string join_args(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& arg : args) {
        if (!out.empty()) out += " ";
        out += arg;
    }
    return out;
}

void print_results(const std::vector<SearchResult>& results, bool as_json) {
    if (as_json) {
        std::cout << json(results).dump(2) << std::endl;
        return;
    }
    if (results.empty()) {
        std::cout << "No results" << std::endl;
        return;
    }
    for (const auto& result : results) {
        std::cout << result.to_string() << std::endl;
    }
    std::cout << results.size() << " results" << std::endl;
}

int follow_job(const DownloadJobQueue& queue, const std::string& job_id) {
    std::optional<JobStatus> last;
    while (true) {
        JobInfo info = queue.poll(job_id);
        if (!last || *last != info.status) {
            std::cout << "Job " << job_id << ": " << to_string(info.status) << std::endl;
            last = info.status;
        }
        if (info.status == JobStatus::Finished) {
            std::cout << "Saved to " << info.result_path.value_or("") << std::endl;
            return 0;
        }
        if (info.status == JobStatus::Failed) {
            std::cerr << "Error: " << info.error.value_or("unknown error") << std::endl;
            return 1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(Config::POLL_SLICE_MS));
    }
}

} // namespace CliHelpers
