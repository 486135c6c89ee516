/**
 * @file simulated_agent_executor.hpp
 * @brief Stand-in agent that sleeps for a configured time and fails
 *        deterministically at a configured rate.
 */

#pragma once

#include "executor/agent_executor.hpp"

#include <atomic>
#include <chrono>
#include <unordered_set>

namespace task_swarm {

struct SimulatedAgentOptions {
    std::chrono::milliseconds run_time{50};
    std::chrono::milliseconds jitter{0};     ///< Extra [0, jitter) per task, seeded
    double failure_rate = 0.0;               ///< Probability in [0, 1]
    uint64_t seed = 42;
    std::unordered_set<TaskId> always_fail;  ///< Ids that fail on every attempt
};

/**
 * @brief Simulated agent for the demo, tests and benchmarks.
 *
 * Whether an attempt fails depends only on (seed, task id, retry count),
 * so a run is reproducible and a retried task gets a fresh draw. The wait
 * is cooperative: a stop request ends it immediately with a failed,
 * "cancelled" result.
 */
class SimulatedAgentExecutor final : public IAgentExecutor {
public:
    explicit SimulatedAgentExecutor(SimulatedAgentOptions options = {});

    ExecutionResult execute(const Task& task, std::stop_token stop) override;

    [[nodiscard]] uint64_t invocations() const noexcept { return invocations_.load(); }
    [[nodiscard]] size_t in_flight() const noexcept { return in_flight_.load(); }
    [[nodiscard]] size_t peak_in_flight() const noexcept { return peak_in_flight_.load(); }

private:
    [[nodiscard]] bool should_fail(const Task& task) const noexcept;
    [[nodiscard]] std::chrono::milliseconds run_time_for(const Task& task) const noexcept;
    bool wait_for(std::chrono::milliseconds duration, std::stop_token stop);

    SimulatedAgentOptions options_;
    std::atomic<uint64_t> invocations_{0};
    std::atomic<size_t> in_flight_{0};
    std::atomic<size_t> peak_in_flight_{0};
};

}  // namespace task_swarm
