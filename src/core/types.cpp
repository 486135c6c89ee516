/**
 * @file types.cpp
 * @brief String parsing and the task lifecycle transition table.
 */

#include "core/types.hpp"

#include <array>

namespace task_swarm {

namespace {

constexpr std::array kAllStatuses{
    TaskStatus::Pending,           TaskStatus::Blocked,
    TaskStatus::Ready,             TaskStatus::Running,
    TaskStatus::AwaitingChildren,  TaskStatus::AwaitingValidation,
    TaskStatus::ValidationRunning, TaskStatus::ValidationFailed,
    TaskStatus::Completed,         TaskStatus::Failed,
    TaskStatus::Cancelled
};

constexpr std::array kAllSources{
    TaskSource::Human,
    TaskSource::AgentRequirements,
    TaskSource::AgentPlanner,
    TaskSource::AgentImplementation
};

}  // anonymous namespace

std::optional<TaskStatus> parse_task_status(std::string_view text) noexcept {
    for (auto status : kAllStatuses) {
        if (to_string(status) == text) return status;
    }
    return std::nullopt;
}

std::optional<TaskSource> parse_task_source(std::string_view text) noexcept {
    for (auto source : kAllSources) {
        if (to_string(source) == text) return source;
    }
    return std::nullopt;
}

bool can_transition(TaskStatus from, TaskStatus to) noexcept {
    using S = TaskStatus;
    if (to == S::Cancelled) {
        return from != S::Completed && from != S::Cancelled;
    }

    switch (from) {
        case S::Pending:
            return to == S::Blocked || to == S::Ready;
        case S::Blocked:
            return to == S::Ready || to == S::Pending;
        case S::Ready:
            return to == S::Running || to == S::Blocked;
        case S::Running:
            return to == S::Completed || to == S::Failed
                || to == S::AwaitingChildren || to == S::AwaitingValidation;
        case S::AwaitingChildren:
            return to == S::Completed || to == S::Failed;
        case S::AwaitingValidation:
            return to == S::ValidationRunning || to == S::Failed;
        case S::ValidationRunning:
            return to == S::Completed || to == S::ValidationFailed || to == S::Failed;
        case S::ValidationFailed:
            return to == S::Pending || to == S::Failed;
        case S::Failed:
            return to == S::Pending;
        case S::Completed:
        case S::Cancelled:
            return false;
    }
    return false;
}

}  // namespace task_swarm
