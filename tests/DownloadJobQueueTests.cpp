// Unit tests for download/DownloadJobQueue.cpp - background job lifecycle

#include <catch2/catch.hpp>
#include "core/Errors.hpp"
#include "download/DownloadJobQueue.hpp"
#include "support/TestHelpers.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

using namespace std::chrono_literals;

namespace {
// Job function that blocks until released, so tests can observe each status.
class GatedJob {
public:
    std::string operator()(DownloadJob& job, const Settings&) {
        std::unique_lock<std::mutex> lock(mtx);
        ++started;
        cv.notify_all();
        cv.wait(lock, [this] { return open; });
        if (job.request_id == "fail") {
            throw TransferError("no transfer offered");
        }
        return "/library/" + job.request_id + ".epub";
    }

    void release() {
        std::lock_guard<std::mutex> lock(mtx);
        open = true;
        cv.notify_all();
    }

    int started_count() {
        std::lock_guard<std::mutex> lock(mtx);
        return started;
    }

private:
    std::mutex mtx;
    std::condition_variable cv;
    bool open = false;
    int started = 0;
};

bool wait_for_status(const DownloadJobQueue& queue, const std::string& id, JobStatus status) {
    return wait_until([&] { return queue.poll(id).status == status; }, 5000ms);
}
}

TEST_CASE("DownloadJobQueue - Status names", "[download][jobs][unit]") {
    REQUIRE(std::string(to_string(JobStatus::Queued)) == "queued");
    REQUIRE(std::string(to_string(JobStatus::Started)) == "started");
    REQUIRE(std::string(to_string(JobStatus::Finished)) == "finished");
    REQUIRE(std::string(to_string(JobStatus::Failed)) == "failed");
}

TEST_CASE("DownloadJobQueue - Job lifecycle", "[download][jobs][unit]") {
    TempDir dir;
    GatedJob gate;
    DownloadJobQueue queue(test_settings(6667, dir.path()), 1,
                           [&gate](DownloadJob& job, const Settings& s) { return gate(job, s); });
    // Opens the gate before the queue joins its workers, even when a check fails
    struct Release {
        GatedJob& gate;
        ~Release() { gate.release(); }
    } release_on_exit{gate};

    std::string first = queue.submit("dune", std::string("Search"));
    std::string second = queue.submit("fail");
    REQUIRE(first.size() == 32);
    REQUIRE(first != second);

    SECTION("Queued, started, then finished with a result path") {
        REQUIRE(wait_for_status(queue, first, JobStatus::Started));
        REQUIRE(queue.poll(second).status == JobStatus::Queued);

        JobInfo started = queue.poll(first);
        REQUIRE(started.started_at.has_value());
        REQUIRE_FALSE(started.is_done());
        REQUIRE(started.to_json()["status"] == "started");

        gate.release();
        REQUIRE(wait_for_status(queue, first, JobStatus::Finished));
        JobInfo done = queue.poll(first);
        REQUIRE(done.is_done());
        REQUIRE(done.result_path == std::optional<std::string>("/library/dune.epub"));
        REQUIRE(done.ended_at.has_value());
        REQUIRE_FALSE(done.error.has_value());

        json j = done.to_json();
        REQUIRE(j["id"] == first);
        REQUIRE(j["request_id"] == "dune");
        REQUIRE(j["result_path"] == "/library/dune.epub");
        REQUIRE(j["error"].is_null());
        REQUIRE(j["enqueued_at"].get<std::string>().back() == 'Z');
    }

    SECTION("Failures record the error message") {
        gate.release();
        REQUIRE(wait_for_status(queue, second, JobStatus::Failed));
        JobInfo failed = queue.poll(second);
        REQUIRE(failed.error == std::optional<std::string>("no transfer offered"));
        REQUIRE_FALSE(failed.result_path.has_value());
        REQUIRE(failed.to_json()["status"] == "failed");
    }

    SECTION("One worker runs jobs one at a time") {
        REQUIRE(wait_until([&] { return gate.started_count() == 1; }, 5000ms));
        std::this_thread::sleep_for(100ms);
        REQUIRE(gate.started_count() == 1);
        gate.release();
        REQUIRE(wait_for_status(queue, second, JobStatus::Failed));
        REQUIRE(gate.started_count() == 2);
    }
}

TEST_CASE("DownloadJobQueue - Unknown ids and shutdown", "[download][jobs][unit]") {
    TempDir dir;
    std::atomic<int> runs{0};
    DownloadJobQueue queue(test_settings(6667, dir.path()), 2, [&runs](DownloadJob& job, const Settings&) {
        ++runs;
        return job.request_id;
    });

    REQUIRE_THROWS_AS(queue.poll("missing"), std::out_of_range);

    std::string a = queue.submit("a");
    std::string b = queue.submit("b");
    queue.shutdown();

    // Queued work drains before the workers exit
    REQUIRE(runs.load() == 2);
    REQUIRE(queue.poll(a).status == JobStatus::Finished);
    REQUIRE(queue.poll(b).result_path == std::optional<std::string>("b"));
    REQUIRE_THROWS_AS(queue.submit("c"), std::runtime_error);

    REQUIRE_THROWS_AS(DownloadJobQueue(test_settings(6667, dir.path()), 0), std::invalid_argument);
}
