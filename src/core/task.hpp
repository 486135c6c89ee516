/**
 * @file task.hpp
 * @brief The Task record and the producer-facing TaskSpec.
 *
 * A Task is a plain value: the store owns the authoritative copy and every
 * other component works on snapshots tagged with the row version they
 * were read at.
 */

#pragma once

#include "core/types.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace task_swarm {

inline constexpr int kMinBasePriority = 0;
inline constexpr int kMaxBasePriority = 10;
inline constexpr double kMinCalculatedPriority = 0.0;
inline constexpr double kMaxCalculatedPriority = 100.0;

/**
 * @brief A single unit of schedulable work.
 */
struct Task {
    TaskId id;
    std::string summary;
    std::string prompt;
    std::string agent_type = "general";

    TaskStatus status = TaskStatus::Pending;
    TaskSource source = TaskSource::Human;

    int base_priority = 5;                     ///< Human/agent intent [0, 10]
    double calculated_priority = 0.0;          ///< Derived score [0, 100]
    int dependency_depth = 0;

    std::vector<TaskId> dependencies;          ///< Ordered, duplicate-free
    DependencyType dependency_type = DependencyType::Sequential;
    uint32_t parallel_quorum = 0;              ///< Completed deps needed when Parallel

    std::optional<Timestamp> deadline;
    std::optional<Seconds> estimated_duration;

    uint32_t retry_count = 0;
    uint32_t max_retries = 3;

    std::optional<TaskId> parent_task_id;
    std::optional<TaskId> spawned_by_task_id;

    Timestamp submitted_at{};
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;
    Timestamp last_updated_at{};

    std::optional<std::string> error_message;
    std::optional<std::string> result_output;

    uint64_t version = 0;                      ///< Optimistic-concurrency stamp

    [[nodiscard]] bool depends_on(const TaskId& other) const {
        return std::find(dependencies.begin(), dependencies.end(), other)
               != dependencies.end();
    }

    [[nodiscard]] bool has_retries_left() const noexcept {
        return retry_count < max_retries;
    }

    /// Number of completed dependencies required for readiness. A Parallel
    /// task without a quorum falls back to requiring all of them.
    [[nodiscard]] size_t required_completions() const noexcept {
        if (dependency_type == DependencyType::Parallel && parallel_quorum > 0) {
            return std::min<size_t>(parallel_quorum, dependencies.size());
        }
        return dependencies.size();
    }

    bool operator==(const Task&) const = default;
};

/**
 * @brief Everything a producer supplies when enqueuing a task.
 *
 * An empty id asks the queue to generate one.
 */
struct TaskSpec {
    TaskId id;
    std::string summary;
    std::string prompt;
    std::string agent_type = "general";
    TaskSource source = TaskSource::Human;
    int base_priority = 5;
    std::vector<TaskId> prerequisites;
    DependencyType dependency_type = DependencyType::Sequential;
    uint32_t parallel_quorum = 0;
    std::optional<Timestamp> deadline;
    std::optional<Seconds> estimated_duration;
    std::optional<uint32_t> max_retries;
    std::optional<TaskId> parent_task_id;
    std::optional<TaskId> spawned_by_task_id;
};

}  // namespace task_swarm
