/**
 * @file task_set_generator.hpp
 * @brief Synthetic task sets for the demo, tests and benchmarks.
 */

#pragma once

#include "core/task.hpp"

#include <random>
#include <string>
#include <vector>

namespace task_swarm {

/**
 * @brief Factory for TaskSpec lists with common dependency shapes.
 *
 * Every TaskSpec carries an explicit id and lists only prerequisites that
 * appear earlier in the returned vector, so enqueuing in order always
 * succeeds.
 */
class TaskSetGenerator {
public:
    /// chain_0 <- chain_1 <- ... <- chain_{n-1}
    static std::vector<TaskSpec> linear_chain(size_t num_tasks,
                                              int base_priority = 5,
                                              const std::string& prefix = "chain");

    /// One source, @p width branches on it, one sink on all branches.
    /// A non-zero @p sink_quorum makes the sink a Parallel task that only
    /// needs that many branches.
    static std::vector<TaskSpec> fan_out_fan_in(size_t width,
                                                uint32_t sink_quorum = 0,
                                                const std::string& prefix = "fan");

    /// Mixed priorities, sources and deadlines. Each task depends on up to
    /// three earlier tasks, each candidate edge kept with @p edge_probability.
    static std::vector<TaskSpec> random_mixed(size_t num_tasks,
                                              double edge_probability,
                                              std::mt19937& rng,
                                              const std::string& prefix = "task");
};

}  // namespace task_swarm
