#include "DownloadJobQueue.hpp"
#include "../utils/CryptoUtils.hpp"
#include <spdlog/spdlog.h>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

const char* to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Queued: return "queued";
        case JobStatus::Started: return "started";
        case JobStatus::Finished: return "finished";
        case JobStatus::Failed: return "failed";
    }
    return "unknown";
}

static std::string iso_timestamp(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

static json optional_timestamp(const std::optional<std::chrono::system_clock::time_point>& when) {
    return when ? json(iso_timestamp(*when)) : json(nullptr);
}

bool JobInfo::is_done() const {
    return status == JobStatus::Finished || status == JobStatus::Failed;
}

json JobInfo::to_json() const {
    json j;
    j["id"] = id;
    j["request_id"] = request_id;
    j["status"] = to_string(status);
    j["enqueued_at"] = iso_timestamp(enqueued_at);
    j["started_at"] = optional_timestamp(started_at);
    j["ended_at"] = optional_timestamp(ended_at);
    j["error"] = error ? json(*error) : json(nullptr);
    j["result_path"] = result_path ? json(*result_path) : json(nullptr);
    return j;
}

DownloadJobQueue::DownloadJobQueue(const Settings& settings, int worker_count, JobFunction job_function)
    : settings(settings), job_function(std::move(job_function)) {
    if (worker_count < 1) {
        throw std::invalid_argument("DownloadJobQueue needs at least one worker");
    }
    for (int i = 0; i < worker_count; ++i) {
        workers.emplace_back(&DownloadJobQueue::worker_loop, this);
    }
}

DownloadJobQueue::~DownloadJobQueue() {
    shutdown();
}

std::string DownloadJobQueue::submit(const std::string& result_id, const std::optional<std::string>& bot,
                                     const std::optional<std::string>& target_folder) {
    DownloadJob job;
    job.id = CryptoUtils::random_hex(Config::JOB_ID_BYTES);
    job.request_id = result_id;
    job.bot = bot;
    job.target_folder = target_folder;

    {
        std::lock_guard<std::mutex> lock(jobs_mtx);
        if (stopped) {
            throw std::runtime_error("Job queue is shut down");
        }
        JobInfo info;
        info.id = job.id;
        info.request_id = result_id;
        info.enqueued_at = std::chrono::system_clock::now();
        jobs.emplace(job.id, info);
    }

    std::string id = job.id;
    spdlog::info("Job {} queued for {}", id, result_id);
    queue.add(std::move(job));
    return id;
}

JobInfo DownloadJobQueue::poll(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(jobs_mtx);
    auto it = jobs.find(job_id);
    if (it == jobs.end()) {
        throw std::out_of_range("Unknown job: " + job_id);
    }
    return it->second;
}

void DownloadJobQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(jobs_mtx);
        if (stopped) return;
        stopped = true;
    }
    queue.mark_finished();
    for (auto& worker : workers) {
        if (worker.joinable()) worker.join();
    }
}

void DownloadJobQueue::update(const std::string& job_id, const std::function<void(JobInfo&)>& change) {
    std::lock_guard<std::mutex> lock(jobs_mtx);
    auto it = jobs.find(job_id);
    if (it != jobs.end()) {
        change(it->second);
    }
}

void DownloadJobQueue::worker_loop() {
    while (true) {
        DownloadJob job;
        if (!queue.get(job)) {
            break; // No more work
        }

        update(job.id, [](JobInfo& info) {
            info.status = JobStatus::Started;
            info.started_at = std::chrono::system_clock::now();
        });
        spdlog::info("Job {} started", job.id);

        try {
            std::string path = job_function(job, settings);
            update(job.id, [&path](JobInfo& info) {
                info.status = JobStatus::Finished;
                info.result_path = path;
                info.ended_at = std::chrono::system_clock::now();
            });
            spdlog::info("Job {} finished: {}", job.id, path);
        } catch (const std::exception& e) {
            std::string message = e.what();
            update(job.id, [&message](JobInfo& info) {
                info.status = JobStatus::Failed;
                info.error = message;
                info.ended_at = std::chrono::system_clock::now();
            });
            spdlog::error("Job {} failed: {}", job.id, message);
        }
    }
}
