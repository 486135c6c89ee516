/**
 * @file simulated_agent_executor.cpp
 * @brief SimulatedAgentExecutor implementation.
 */

#include "executor/simulated_agent_executor.hpp"

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <mutex>

namespace task_swarm {

namespace {

// splitmix64 finaliser: turns correlated inputs into well-spread bits.
uint64_t mix(uint64_t x) noexcept {
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

double unit_draw(uint64_t seed, const TaskId& id, uint64_t salt) noexcept {
    uint64_t h = mix(seed ^ mix(std::hash<TaskId>{}(id)) ^ mix(salt));
    return static_cast<double>(h >> 11) * 0x1.0p-53;
}

}  // anonymous namespace

SimulatedAgentExecutor::SimulatedAgentExecutor(SimulatedAgentOptions options)
    : options_(std::move(options)) {
    options_.failure_rate = std::clamp(options_.failure_rate, 0.0, 1.0);
}

bool SimulatedAgentExecutor::should_fail(const Task& task) const noexcept {
    if (options_.always_fail.contains(task.id)) return true;
    if (options_.failure_rate <= 0.0) return false;
    return unit_draw(options_.seed, task.id, task.retry_count) < options_.failure_rate;
}

std::chrono::milliseconds SimulatedAgentExecutor::run_time_for(const Task& task) const noexcept {
    if (options_.jitter.count() <= 0) return options_.run_time;
    auto extra = static_cast<int64_t>(
        unit_draw(options_.seed, task.id, 0xfeedULL) * static_cast<double>(options_.jitter.count()));
    return options_.run_time + std::chrono::milliseconds{extra};
}

bool SimulatedAgentExecutor::wait_for(std::chrono::milliseconds duration, std::stop_token stop) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    // Returns true only when the stop request cut the wait short.
    return cv.wait_for(lock, stop, duration, [] { return false; }) || stop.stop_requested();
}

ExecutionResult SimulatedAgentExecutor::execute(const Task& task, std::stop_token stop) {
    ++invocations_;
    size_t now_in_flight = ++in_flight_;
    size_t peak = peak_in_flight_.load();
    while (now_in_flight > peak && !peak_in_flight_.compare_exchange_weak(peak, now_in_flight)) {
    }

    auto start = std::chrono::steady_clock::now();
    bool cancelled = wait_for(run_time_for(task), stop);
    auto duration = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
    --in_flight_;

    if (cancelled) {
        return ExecutionResult{
            .task_id = task.id,
            .success = false,
            .output = {},
            .error = "cancelled via stop token",
            .duration = duration
        };
    }
    if (should_fail(task)) {
        return ExecutionResult{
            .task_id = task.id,
            .success = false,
            .output = {},
            .error = "simulated failure on attempt " + std::to_string(task.retry_count + 1),
            .duration = duration
        };
    }
    return ExecutionResult{
        .task_id = task.id,
        .success = true,
        .output = task.agent_type + " agent finished: " + task.summary,
        .error = std::nullopt,
        .duration = duration
    };
}

}  // namespace task_swarm
