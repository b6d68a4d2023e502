#pragma once
#include <queue>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <optional>

// FIFO shared between producers and one or more consumer threads.
template <typename T>
class WorkQueue {
private:
    std::queue<T> items;
    mutable std::mutex mtx;
    std::condition_variable cv;
    bool finished = false;

public:
    void add(T item) {
        std::lock_guard<std::mutex> lock(mtx);
        items.push(std::move(item));
        cv.notify_one();
    }

    // Blocks until an item is available. False once finished and drained.
    bool get(T& item) {
        std::unique_lock<std::mutex> lock(mtx);
        cv.wait(lock, [this] { return !items.empty() || finished; });

        if (items.empty()) {
            return false; // No more work
        }

        item = std::move(items.front());
        items.pop();
        return true;
    }

    std::optional<T> try_get() {
        std::lock_guard<std::mutex> lock(mtx);
        if (items.empty()) {
            return std::nullopt;
        }
        T item = std::move(items.front());
        items.pop();
        return item;
    }

    // Removes and returns everything still queued.
    std::queue<T> drain() {
        std::lock_guard<std::mutex> lock(mtx);
        std::queue<T> out;
        std::swap(out, items);
        return out;
    }

    void mark_finished() {
        std::lock_guard<std::mutex> lock(mtx);
        finished = true;
        cv.notify_all();
    }
};
