#pragma once
#include "DownloadPipeline.hpp"
#include "WorkQueue.hpp"
#include "../core/Settings.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

enum class JobStatus {
    Queued,
    Started,
    Finished,
    Failed
};

const char* to_string(JobStatus status);

struct JobInfo {
    std::string id;
    std::string request_id;
    JobStatus status = JobStatus::Queued;
    std::chrono::system_clock::time_point enqueued_at;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> ended_at;
    std::optional<std::string> error;
    std::optional<std::string> result_path;

    bool is_done() const;
    json to_json() const;
};

// Background download jobs, run FIFO by a fixed pool of worker threads.
class DownloadJobQueue {
public:
    using JobFunction = std::function<std::string(DownloadJob&, const Settings&)>;

    explicit DownloadJobQueue(const Settings& settings, int worker_count = Config::DEFAULT_JOB_WORKERS,
                              JobFunction job_function = DownloadPipeline::run);
    ~DownloadJobQueue();
    DownloadJobQueue(const DownloadJobQueue&) = delete;
    DownloadJobQueue& operator=(const DownloadJobQueue&) = delete;

    // Returns the new job id (32 hex characters).
    std::string submit(const std::string& result_id, const std::optional<std::string>& bot = std::nullopt,
                       const std::optional<std::string>& target_folder = std::nullopt);
    // Throws std::out_of_range for an unknown id.
    JobInfo poll(const std::string& job_id) const;

    // Lets queued jobs finish, then joins the workers.
    void shutdown();

private:
    Settings settings;
    JobFunction job_function;
    WorkQueue<DownloadJob> queue;
    std::vector<std::thread> workers;

    mutable std::mutex jobs_mtx;
    std::map<std::string, JobInfo> jobs;
    bool stopped = false;

    void worker_loop();
    void update(const std::string& job_id, const std::function<void(JobInfo&)>& change);
};
