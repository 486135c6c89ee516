/**
 * @file types.hpp
 * @brief Fundamental vocabulary types used throughout TaskSwarm.
 *
 * Defines TaskId, the task status/source/dependency enums and their string
 * conversions. All types are value types with no ownership semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace task_swarm {

// ─────────────────────────────────────────────
// Identity & Time
// ─────────────────────────────────────────────

using TaskId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using Seconds = std::chrono::seconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Task Status
// ─────────────────────────────────────────────

enum class TaskStatus : uint8_t {
    Pending,              ///< Created, readiness not yet resolved
    Blocked,              ///< Waiting on unmet dependencies
    Ready,                ///< Eligible for dispatch
    Running,              ///< Dispatched to an agent
    AwaitingChildren,     ///< Running task waiting on spawned children
    AwaitingValidation,   ///< Finished, queued for validation
    ValidationRunning,    ///< Validation in progress
    ValidationFailed,     ///< Validation rejected the output
    Completed,
    Failed,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Pending:            return "pending";
        case TaskStatus::Blocked:            return "blocked";
        case TaskStatus::Ready:              return "ready";
        case TaskStatus::Running:            return "running";
        case TaskStatus::AwaitingChildren:   return "awaiting_children";
        case TaskStatus::AwaitingValidation: return "awaiting_validation";
        case TaskStatus::ValidationRunning:  return "validation_running";
        case TaskStatus::ValidationFailed:   return "validation_failed";
        case TaskStatus::Completed:          return "completed";
        case TaskStatus::Failed:             return "failed";
        case TaskStatus::Cancelled:          return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] std::optional<TaskStatus> parse_task_status(std::string_view text) noexcept;

/// Completed, Failed and Cancelled. A Failed task may still be retried
/// explicitly, but it no longer blocks anything.
[[nodiscard]] constexpr bool is_terminal(TaskStatus status) noexcept {
    return status == TaskStatus::Completed
        || status == TaskStatus::Failed
        || status == TaskStatus::Cancelled;
}

/// Statuses whose calculated priority is still worth maintaining.
[[nodiscard]] constexpr bool is_schedulable(TaskStatus status) noexcept {
    return status == TaskStatus::Pending
        || status == TaskStatus::Blocked
        || status == TaskStatus::Ready;
}

/**
 * @brief Lifecycle transition table.
 *
 * Failed → Pending is the retry path; Completed and Cancelled are final.
 */
[[nodiscard]] bool can_transition(TaskStatus from, TaskStatus to) noexcept;

// ─────────────────────────────────────────────
// Task Source
// ─────────────────────────────────────────────

enum class TaskSource : uint8_t {
    Human,
    AgentRequirements,
    AgentPlanner,
    AgentImplementation
};

[[nodiscard]] constexpr std::string_view to_string(TaskSource source) noexcept {
    switch (source) {
        case TaskSource::Human:               return "human";
        case TaskSource::AgentRequirements:   return "agent_requirements";
        case TaskSource::AgentPlanner:        return "agent_planner";
        case TaskSource::AgentImplementation: return "agent_implementation";
    }
    return "unknown";
}

[[nodiscard]] std::optional<TaskSource> parse_task_source(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// Dependency Type
// ─────────────────────────────────────────────

enum class DependencyType : uint8_t {
    Sequential,   ///< Every dependency must be Completed
    Parallel      ///< At least parallel_quorum dependencies must be Completed
};

[[nodiscard]] constexpr std::string_view to_string(DependencyType type) noexcept {
    switch (type) {
        case DependencyType::Sequential: return "sequential";
        case DependencyType::Parallel:   return "parallel";
    }
    return "unknown";
}

}  // namespace task_swarm
