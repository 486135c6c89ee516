/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 */

#include "executor/thread_pool.hpp"

namespace task_swarm {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::post(std::function<void()> job) {
    {
        std::lock_guard lock(queue_mutex_);
        if (closed_) return false;
        jobs_.push_back(std::move(job));
    }
    queue_cv_.notify_one();
    return true;
}

void ThreadPool::shutdown() {
    {
        std::lock_guard lock(queue_mutex_);
        closed_ = true;
    }
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void ThreadPool::worker_loop(std::stop_token stop) {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !jobs_.empty(); });

            // Only reached with an empty queue once stop was requested.
            if (jobs_.empty()) return;

            job = std::move(jobs_.front());
            jobs_.pop_front();
            ++active_jobs_;
        }

        job();
        --active_jobs_;
    }
}

size_t ThreadPool::active_count() const noexcept {
    return active_jobs_.load();
}

size_t ThreadPool::queued_count() const {
    std::lock_guard lock(queue_mutex_);
    return jobs_.size();
}

size_t ThreadPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace task_swarm
