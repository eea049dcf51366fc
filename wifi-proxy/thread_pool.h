#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

namespace wifiproxy {

// Fixed pool for blocking gateway I/O so the event loop never waits on the device.
// The queue is bounded; a full queue refuses work instead of growing.
class ThreadPool {
public:
    // maxPending == 0 means unbounded
    explicit ThreadPool(size_t nthreads, size_t maxPending = 0) : maxPending_(maxPending) {
        if (nthreads == 0) nthreads = 1;
        workers_.reserve(nthreads);
        for (size_t i = 0; i < nthreads; ++i) {
            workers_.emplace_back([this]() { workerLoop(); });
        }
    }

    ~ThreadPool() { shutdown(); }

    // Queued tasks still run; new ones are refused
    void shutdown() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (closed_) return;
            closed_ = true;
        }
        cv_.notify_all();
        for (auto &t : workers_) {
            if (t.joinable()) t.join();
        }
    }

    // Returns false after shutdown() or when maxPending tasks are already waiting
    bool enqueue(std::function<void()> fn) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (closed_) return false;
            if (maxPending_ && queue_.size() >= maxPending_) return false;
            queue_.push_back(std::move(fn));
        }
        cv_.notify_one();
        return true;
    }

    size_t size() const { return workers_.size(); }
    size_t pending() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return queue_.size();
    }

private:
    void workerLoop() {
        for (;;) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lk(mtx_);
                cv_.wait(lk, [this]() { return closed_ || !queue_.empty(); });
                if (queue_.empty()) return;     // closed and drained
                job = std::move(queue_.front());
                queue_.pop_front();
            }
            try {
                job();
            } catch (const std::exception &e) {
                std::cerr << "[pool] Task failed: " << e.what() << "\n";
            }
        }
    }

    const size_t maxPending_;
    std::vector<std::thread> workers_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> queue_;
    bool closed_ = false;
};

} // namespace wifiproxy
