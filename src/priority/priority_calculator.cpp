/**
 * @file priority_calculator.cpp
 * @brief PriorityCalculator implementation.
 */

#include "priority/priority_calculator.hpp"

#include <algorithm>
#include <stdexcept>

namespace task_swarm {

namespace {

constexpr auto kMinute = std::chrono::seconds{60};
constexpr auto kHour = std::chrono::hours{1};
constexpr auto kDay = std::chrono::hours{24};
constexpr auto kWeek = std::chrono::hours{24 * 7};

}  // anonymous namespace

PriorityCalculator::PriorityCalculator(ITaskStore& store,
                                       DependencyResolver& resolver,
                                       Logger& logger,
                                       PriorityWeights weights,
                                       Clock clock,
                                       uint32_t version_conflict_retries)
    : store_(store)
    , resolver_(resolver)
    , logger_(logger)
    , weights_(weights)
    , clock_(std::move(clock))
    , version_conflict_retries_(std::max<uint32_t>(version_conflict_retries, 1)) {
    if (auto valid = weights_.validate(); !valid) {
        throw std::invalid_argument(valid.error().message);
    }
}

// ─────────────────────────────────────────────
// Sub-scores
// ─────────────────────────────────────────────

double PriorityCalculator::base_score(int base_priority) noexcept {
    int clamped = std::clamp(base_priority, kMinBasePriority, kMaxBasePriority);
    return clamped * 10.0;
}

double PriorityCalculator::depth_score(int depth) noexcept {
    return std::min(100.0, std::max(depth, 0) * 10.0);
}

double PriorityCalculator::urgency_score(std::optional<Timestamp> deadline,
                                         std::optional<Seconds> estimated_duration,
                                         Timestamp now) noexcept {
    if (!deadline) return 0.0;

    auto remaining = *deadline - now;
    if (remaining <= Timestamp::duration::zero()) return 100.0;
    if (estimated_duration && remaining < *estimated_duration) return 100.0;

    if (remaining < kMinute) return 100.0;
    if (remaining < kHour)   return 80.0;
    if (remaining < kDay)    return 50.0;
    if (remaining < kWeek)   return 30.0;
    return 10.0;
}

double PriorityCalculator::blocking_score(size_t blocked_count) noexcept {
    if (blocked_count == 0)  return 0.0;
    if (blocked_count <= 2)  return 20.0;
    if (blocked_count <= 5)  return 40.0;
    if (blocked_count <= 10) return 60.0;
    if (blocked_count <= 20) return 80.0;
    return 100.0;
}

double PriorityCalculator::source_score(TaskSource source) noexcept {
    switch (source) {
        case TaskSource::Human:               return 100.0;
        case TaskSource::AgentRequirements:   return 75.0;
        case TaskSource::AgentPlanner:        return 50.0;
        case TaskSource::AgentImplementation: return 25.0;
    }
    return 0.0;
}

double PriorityCalculator::combine(PriorityBreakdown& scores) const noexcept {
    double total = scores.base * weights_.base
                 + scores.depth * weights_.depth
                 + scores.urgency * weights_.urgency
                 + scores.blocking * weights_.blocking
                 + scores.source * weights_.source;
    scores.total = std::clamp(total, kMinCalculatedPriority, kMaxCalculatedPriority);
    return scores.total;
}

// ─────────────────────────────────────────────
// Scoring
// ─────────────────────────────────────────────

Result<PriorityBreakdown> PriorityCalculator::explain_priority(const Task& task) {
    auto depth = resolver_.calculate_dependency_depth(task.id);
    if (!depth) return depth.error();

    auto blocked = resolver_.get_blocked_tasks(task.id);
    if (!blocked) return blocked.error();

    PriorityBreakdown scores{
        .base = base_score(task.base_priority),
        .depth = depth_score(depth.value()),
        .urgency = urgency_score(task.deadline, task.estimated_duration, clock_()),
        .blocking = blocking_score(blocked.value().size()),
        .source = source_score(task.source)
    };
    scores.total = combine(scores);
    return scores;
}

Result<double> PriorityCalculator::calculate_priority(const Task& task) {
    return explain_priority(task).map([](const PriorityBreakdown& s) { return s.total; });
}

Result<double> PriorityCalculator::rescore_and_persist(const TaskId& task_id,
                                                       bool schedulable_only) {
    Error last_conflict{ErrorCode::VersionConflict, "no attempt made"};

    for (uint32_t attempt = 0; attempt < version_conflict_retries_; ++attempt) {
        auto task = store_.get_task(task_id);
        if (!task) return task.error();
        // Re-checked on every attempt: the row may have been dispatched since.
        if (schedulable_only && !is_schedulable(task.value().status)) {
            return Error{ErrorCode::InvalidState,
                         "task " + task_id + " is "
                         + std::string(to_string(task.value().status))};
        }

        auto depth = resolver_.calculate_dependency_depth(task_id);
        if (!depth) return depth.error();

        auto score = calculate_priority(task.value());
        if (!score) return score.error();

        Task next = task.value();
        next.calculated_priority = score.value();
        next.dependency_depth = depth.value();

        auto written = store_.update_task(next);
        if (written) {
            return score.value();
        }
        if (!written.error().is(ErrorCode::VersionConflict)) {
            return written.error();
        }
        last_conflict = written.error();
        logger_.debug("priority write lost a version race, retrying", {
            {"task_id", task_id}, {"attempt", attempt + 1}
        });
    }
    return last_conflict;
}

Result<double> PriorityCalculator::recalculate_priority(const TaskId& task_id) {
    return rescore_and_persist(task_id, false);
}

std::map<TaskId, double> PriorityCalculator::recalculate_priorities(
    const std::vector<TaskId>& task_ids) {
    std::map<TaskId, double> scores;

    for (const auto& id : task_ids) {
        auto score = rescore_and_persist(id, true);
        if (!score && score.error().is(ErrorCode::InvalidState)) {
            continue;
        }
        if (!score) {
            logger_.warn("priority recalculation failed", {
                {"task_id", id}, {"error", score.error().what()}
            });
            continue;
        }
        scores.emplace(id, score.value());
    }

    logger_.debug("priorities recalculated", {
        {"requested", task_ids.size()}, {"updated", scores.size()}
    });
    return scores;
}

}  // namespace task_swarm
