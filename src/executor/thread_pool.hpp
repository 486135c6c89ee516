/**
 * @file thread_pool.hpp
 * @brief std::jthread-based worker pool that runs agent executions.
 *
 * Shutdown closes the pool to new work and lets workers drain everything
 * already queued before joining, so a job that was accepted always runs.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace task_swarm {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Queue a fire-and-forget job. Jobs must not throw. Returns false once
    /// the pool has been shut down.
    bool post(std::function<void()> job);

    /// Queue a callable and get its result (or exception) through a future.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Stop accepting work, run what is queued and join the workers.
    /// Idempotent.
    void shutdown();

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::deque<std::function<void()>> jobs_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_jobs_{0};
    bool closed_ = false;
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    bool accepted = post([p = promise, f = std::forward<F>(func)]() mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f();
                p->set_value();
            } else {
                p->set_value(f());
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    });
    if (!accepted) {
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("thread pool is shut down")));
    }
    return future;
}

}  // namespace task_swarm
