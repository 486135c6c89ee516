/**
 * @file task_queue.cpp
 * @brief TaskQueue implementation.
 */

#include "queue/task_queue.hpp"

#include "core/id.hpp"

#include <algorithm>
#include <unordered_set>

namespace task_swarm {

TaskQueue::TaskQueue(ITaskStore& store,
                     DependencyResolver& resolver,
                     PriorityCalculator& calculator,
                     Logger& logger,
                     QueueConfig config,
                     MetricsCollector* metrics,
                     Clock clock)
    : store_(store)
    , resolver_(resolver)
    , calculator_(calculator)
    , logger_(logger)
    , config_(config)
    , metrics_(metrics)
    , clock_(std::move(clock)) {
    config_.version_conflict_retries = std::max<uint32_t>(config_.version_conflict_retries, 1);
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

Result<Task> TaskQueue::mutate(const TaskId& task_id, const Mutator& mutator) {
    Error last_conflict{ErrorCode::VersionConflict, "no attempt made"};

    for (uint32_t attempt = 0; attempt < config_.version_conflict_retries; ++attempt) {
        auto current = store_.get_task(task_id);
        if (!current) return current.error();

        Task next = current.value();
        if (auto veto = mutator(next); !veto) {
            return veto.error();
        }

        auto written = store_.update_task(next);
        if (written) return written;
        if (!written.error().is(ErrorCode::VersionConflict)) {
            return written.error();
        }
        last_conflict = written.error();
    }

    logger_.warn("giving up after repeated version conflicts", {
        {"task_id", task_id}, {"attempts", config_.version_conflict_retries}
    });
    return last_conflict;
}

Result<void> TaskQueue::check_transition(const Task& task, TaskStatus to) const {
    if (!can_transition(task.status, to)) {
        return Error{ErrorCode::InvalidStatusTransition,
                     "task " + task.id + " cannot move from "
                     + std::string(to_string(task.status)) + " to "
                     + std::string(to_string(to))};
    }
    return Result<void>{};
}

Result<TaskStatus> TaskQueue::readiness_of(const Task& task) const {
    size_t completed = 0;
    for (const auto& dep : task.dependencies) {
        auto row = store_.get_task(dep);
        if (!row) return row.error();
        if (row.value().status == TaskStatus::Completed) ++completed;
    }
    return completed >= task.required_completions() ? TaskStatus::Ready : TaskStatus::Blocked;
}

void TaskQueue::rescore(const std::vector<TaskId>& task_ids) {
    if (task_ids.empty()) return;
    calculator_.recalculate_priorities(task_ids);
}

void TaskQueue::record_transition(const TaskId& id, TaskStatus from, TaskStatus to) {
    if (metrics_) metrics_->record_status_change(id, from, to);
}

// ─────────────────────────────────────────────
// Producers
// ─────────────────────────────────────────────

Result<Task> TaskQueue::enqueue(const TaskSpec& spec) {
    if (spec.base_priority < kMinBasePriority || spec.base_priority > kMaxBasePriority) {
        return Error{ErrorCode::InvalidArgument,
                     "base_priority must be in [0, 10], got "
                     + std::to_string(spec.base_priority)};
    }

    std::vector<TaskId> prerequisites;
    std::unordered_set<TaskId> seen;
    for (const auto& dep : spec.prerequisites) {
        if (!spec.id.empty() && dep == spec.id) {
            return Error{ErrorCode::CircularDependency,
                         "task " + spec.id + " cannot depend on itself"};
        }
        if (seen.insert(dep).second) prerequisites.push_back(dep);
    }

    if (spec.dependency_type == DependencyType::Parallel && !prerequisites.empty()
        && (spec.parallel_quorum < 1 || spec.parallel_quorum > prerequisites.size())) {
        return Error{ErrorCode::InvalidArgument,
                     "parallel_quorum must be in [1, " + std::to_string(prerequisites.size())
                     + "], got " + std::to_string(spec.parallel_quorum)};
    }

    int depth = 0;
    for (const auto& dep : prerequisites) {
        auto row = store_.get_task(dep);
        if (!row) {
            return Error{ErrorCode::TaskNotFound, "prerequisite " + dep + " not found"};
        }
        depth = std::max(depth, row.value().dependency_depth + 1);
    }

    Task task;
    task.id = spec.id.empty() ? generate_task_id() : spec.id;
    task.summary = spec.summary;
    task.prompt = spec.prompt;
    task.agent_type = spec.agent_type;
    task.source = spec.source;
    task.base_priority = spec.base_priority;
    task.dependencies = std::move(prerequisites);
    task.dependency_type = spec.dependency_type;
    task.parallel_quorum = spec.parallel_quorum;
    task.deadline = spec.deadline;
    task.estimated_duration = spec.estimated_duration;
    task.max_retries = spec.max_retries.value_or(config_.default_max_retries);
    task.parent_task_id = spec.parent_task_id;
    task.spawned_by_task_id = spec.spawned_by_task_id;
    task.dependency_depth = depth;
    task.submitted_at = clock_();

    auto initial = readiness_of(task);
    if (!initial) return initial.error();
    task.status = initial.value();

    // A new task has no dependents yet, so its blocking score is zero.
    PriorityBreakdown scores{
        .base = PriorityCalculator::base_score(task.base_priority),
        .depth = PriorityCalculator::depth_score(depth),
        .urgency = PriorityCalculator::urgency_score(task.deadline, task.estimated_duration,
                                                     task.submitted_at),
        .blocking = 0.0,
        .source = PriorityCalculator::source_score(task.source)
    };
    task.calculated_priority = calculator_.combine(scores);

    if (auto inserted = store_.insert_task(task); !inserted) {
        return inserted.error();
    }
    resolver_.invalidate_cache();

    // A prerequisite may have completed between the readiness check and the
    // insert, while the row was still invisible to complete_task.
    if (task.status == TaskStatus::Blocked) {
        bool promoted = false;
        auto rechecked = mutate(task.id, [&](Task& t) -> Result<void> {
            promoted = false;
            if (t.status != TaskStatus::Blocked) return Result<void>{};
            auto readiness = readiness_of(t);
            if (!readiness) return readiness.error();
            promoted = readiness.value() == TaskStatus::Ready;
            t.status = readiness.value();
            return Result<void>{};
        });
        if (!rechecked) {
            logger_.warn("could not re-check readiness after enqueue", {
                {"task_id", task.id}, {"error", rechecked.error().what()}
            });
        } else if (promoted) {
            task.status = TaskStatus::Ready;
            resolver_.invalidate_cache();
            record_transition(task.id, TaskStatus::Blocked, TaskStatus::Ready);
        }
    }

    // Prerequisites now block one more task.
    rescore(task.dependencies);

    logger_.info("task enqueued", {
        {"task_id", task.id},
        {"status", to_string(task.status)},
        {"priority", task.calculated_priority},
        {"depth", depth},
        {"prerequisites", task.dependencies.size()}
    });
    return store_.get_task(task.id);
}

Result<Task> TaskQueue::add_dependency(const TaskId& task_id, const TaskId& dependency_id) {
    auto task = store_.get_task(task_id);
    if (!task) return task.error();
    if (!is_schedulable(task.value().status)) {
        return Error{ErrorCode::InvalidState,
                     "cannot add a dependency to " + std::string(to_string(task.value().status))
                     + " task " + task_id};
    }

    if (auto valid = resolver_.validate_new_dependency(task_id, dependency_id); !valid) {
        return valid.error();
    }
    // The store repeats the cycle check atomically with the write.
    if (auto inserted = store_.insert_dependency(task_id, dependency_id); !inserted) {
        return inserted.error();
    }
    resolver_.invalidate_cache();

    auto demoted = mutate(task_id, [this](Task& t) -> Result<void> {
        if (t.status != TaskStatus::Ready) return Result<void>{};
        auto readiness = readiness_of(t);
        if (!readiness) return readiness.error();
        t.status = readiness.value();
        return Result<void>{};
    });
    if (!demoted) return demoted.error();
    if (task.value().status == TaskStatus::Ready && demoted.value().status == TaskStatus::Blocked) {
        record_transition(task_id, TaskStatus::Ready, TaskStatus::Blocked);
    }
    resolver_.invalidate_cache();

    std::vector<TaskId> affected{task_id, dependency_id};
    if (auto downstream = resolver_.transitive_dependents(task_id); downstream) {
        affected.insert(affected.end(), downstream.value().begin(), downstream.value().end());
    }
    rescore(affected);

    logger_.info("dependency added", {{"task_id", task_id}, {"dependency", dependency_id}});
    return store_.get_task(task_id);
}

// ─────────────────────────────────────────────
// Consumers
// ─────────────────────────────────────────────

Result<std::optional<Task>> TaskQueue::dequeue_next() {
    for (uint32_t attempt = 0; attempt < config_.version_conflict_retries; ++attempt) {
        auto candidate = store_.get_next_ready_task();
        if (!candidate) return candidate.error();
        if (!candidate.value()) {
            return std::optional<Task>{};
        }

        Task next = *candidate.value();
        next.status = TaskStatus::Running;
        next.started_at = clock_();

        auto claimed = store_.update_task(next);
        if (claimed) {
            resolver_.invalidate_cache();
            record_transition(next.id, TaskStatus::Ready, TaskStatus::Running);
            return std::optional<Task>{claimed.value()};
        }
        if (!claimed.error().is(ErrorCode::VersionConflict)) {
            return claimed.error();
        }
        // Someone else changed the row first; look again.
    }
    return Error{ErrorCode::VersionConflict, "could not claim a ready task"};
}

Result<std::vector<TaskId>> TaskQueue::complete_task(const TaskId& task_id, std::string output) {
    TaskStatus previous = TaskStatus::Running;
    auto completed = mutate(task_id, [&](Task& t) -> Result<void> {
        if (auto ok = check_transition(t, TaskStatus::Completed); !ok) return ok;
        previous = t.status;
        t.status = TaskStatus::Completed;
        t.completed_at = clock_();
        t.result_output = output;
        t.error_message.reset();
        return Result<void>{};
    });
    if (!completed) return completed.error();
    resolver_.invalidate_cache();
    record_transition(task_id, previous, TaskStatus::Completed);

    auto dependents = resolver_.get_blocked_tasks(task_id);
    if (!dependents) return dependents.error();

    std::vector<TaskId> unblocked;
    for (const auto& dependent : dependents.value()) {
        bool promoted = false;
        auto updated = mutate(dependent, [&](Task& t) -> Result<void> {
            promoted = false;
            if (t.status != TaskStatus::Blocked && t.status != TaskStatus::Pending) {
                return Result<void>{};
            }
            auto readiness = readiness_of(t);
            if (!readiness) return readiness.error();
            promoted = readiness.value() == TaskStatus::Ready;
            t.status = readiness.value();
            return Result<void>{};
        });
        if (!updated) {
            logger_.warn("could not re-evaluate dependent", {
                {"task_id", dependent}, {"error", updated.error().what()}
            });
            continue;
        }
        if (promoted) {
            unblocked.push_back(dependent);
            record_transition(dependent, TaskStatus::Blocked, TaskStatus::Ready);
        }
    }
    if (!unblocked.empty()) {
        resolver_.invalidate_cache();
        rescore(unblocked);
    }

    logger_.info("task completed", {
        {"task_id", task_id}, {"unblocked", unblocked.size()}
    });
    return unblocked;
}

Result<FailureOutcome> TaskQueue::fail_task(const TaskId& task_id, std::string error_message) {
    TaskStatus previous = TaskStatus::Running;
    auto failed = mutate(task_id, [&](Task& t) -> Result<void> {
        if (auto ok = check_transition(t, TaskStatus::Failed); !ok) return ok;
        previous = t.status;
        t.status = TaskStatus::Failed;
        t.error_message = error_message;
        t.completed_at = clock_();
        return Result<void>{};
    });
    if (!failed) return failed.error();
    resolver_.invalidate_cache();
    record_transition(task_id, previous, TaskStatus::Failed);

    FailureOutcome outcome;
    outcome.task = failed.value();
    outcome.retryable = outcome.task.has_retries_left();

    if (outcome.retryable) {
        logger_.warn("task failed, retry available", {
            {"task_id", task_id},
            {"retry_count", outcome.task.retry_count},
            {"max_retries", outcome.task.max_retries},
            {"error", error_message}
        });
        return outcome;
    }

    outcome.cascade = cascade_cancel(task_id);
    logger_.error("task failed permanently", {
        {"task_id", task_id},
        {"error", error_message},
        {"cancelled_dependents", outcome.cascade.cancelled.size()},
        {"unreachable_dependents", outcome.cascade.unreachable.size()}
    });
    return outcome;
}

Result<Task> TaskQueue::retry_task(const TaskId& task_id) {
    auto pending = mutate(task_id, [&](Task& t) -> Result<void> {
        if (auto ok = check_transition(t, TaskStatus::Pending); !ok) return ok;
        if (!t.has_retries_left()) {
            return Error{ErrorCode::RetriesExhausted,
                         "task " + t.id + " used all " + std::to_string(t.max_retries)
                         + " retries"};
        }
        t.status = TaskStatus::Pending;
        t.retry_count += 1;
        t.started_at.reset();
        t.completed_at.reset();
        return Result<void>{};
    });
    if (!pending) return pending.error();
    record_transition(task_id, TaskStatus::Failed, TaskStatus::Pending);

    auto resolved = mutate(task_id, [this](Task& t) -> Result<void> {
        if (t.status != TaskStatus::Pending) return Result<void>{};
        auto readiness = readiness_of(t);
        if (!readiness) return readiness.error();
        t.status = readiness.value();
        return Result<void>{};
    });
    if (!resolved) return resolved.error();
    resolver_.invalidate_cache();
    record_transition(task_id, TaskStatus::Pending, resolved.value().status);

    rescore({task_id});
    logger_.info("task requeued for retry", {
        {"task_id", task_id},
        {"retry_count", resolved.value().retry_count},
        {"status", to_string(resolved.value().status)}
    });
    return store_.get_task(task_id);
}

Result<CancellationReport> TaskQueue::cancel_task(const TaskId& task_id) {
    TaskStatus previous = TaskStatus::Pending;
    auto cancelled = mutate(task_id, [&](Task& t) -> Result<void> {
        if (auto ok = check_transition(t, TaskStatus::Cancelled); !ok) return ok;
        previous = t.status;
        t.status = TaskStatus::Cancelled;
        t.completed_at = clock_();
        return Result<void>{};
    });
    if (!cancelled) return cancelled.error();
    resolver_.invalidate_cache();
    record_transition(task_id, previous, TaskStatus::Cancelled);

    auto cascade = cascade_cancel(task_id);

    CancellationReport report;
    report.cancelled.push_back(task_id);
    report.cancelled.insert(report.cancelled.end(),
                            cascade.cancelled.begin(), cascade.cancelled.end());
    report.unreachable = std::move(cascade.unreachable);

    logger_.info("task cancelled", {
        {"task_id", task_id},
        {"cancelled", report.cancelled.size()},
        {"unreachable", report.unreachable.size()}
    });
    return report;
}

CancellationReport TaskQueue::cascade_cancel(const TaskId& root) {
    CancellationReport report;

    auto dependents = resolver_.transitive_dependents(root);
    if (!dependents) {
        logger_.error("cannot enumerate dependents for cascade", {
            {"task_id", root}, {"error", dependents.error().what()}
        });
        report.unreachable.push_back(root);
        if (metrics_) metrics_->record_cascade(root, report.cancelled, report.unreachable);
        return report;
    }

    for (const auto& id : dependents.value()) {
        bool changed = false;
        TaskStatus previous = TaskStatus::Pending;
        auto written = mutate(id, [&](Task& t) -> Result<void> {
            changed = false;
            if (is_terminal(t.status)) return Result<void>{};
            previous = t.status;
            t.status = TaskStatus::Cancelled;
            t.completed_at = clock_();
            t.error_message = "cancelled: prerequisite " + root + " will not complete";
            changed = true;
            return Result<void>{};
        });
        if (!written) {
            logger_.error("cascade cancellation could not reach dependent", {
                {"root", root}, {"task_id", id}, {"error", written.error().what()}
            });
            report.unreachable.push_back(id);
            continue;
        }
        if (changed) {
            report.cancelled.push_back(id);
            record_transition(id, previous, TaskStatus::Cancelled);
        }
    }

    resolver_.invalidate_cache();
    if (metrics_) metrics_->record_cascade(root, report.cancelled, report.unreachable);
    return report;
}

Result<std::vector<TaskId>> TaskQueue::resolve_ready() {
    std::vector<TaskId> candidates;
    for (auto status : {TaskStatus::Pending, TaskStatus::Blocked}) {
        auto rows = store_.list_tasks(status, 0);
        if (!rows) return rows.error();
        for (const auto& t : rows.value()) candidates.push_back(t.id);
    }

    std::vector<TaskId> promoted;
    for (const auto& id : candidates) {
        TaskStatus previous = TaskStatus::Pending;
        TaskStatus resolved = TaskStatus::Pending;
        auto written = mutate(id, [&](Task& t) -> Result<void> {
            previous = t.status;
            resolved = t.status;
            if (t.status != TaskStatus::Pending && t.status != TaskStatus::Blocked) {
                return Result<void>{};
            }
            auto readiness = readiness_of(t);
            if (!readiness) return readiness.error();
            resolved = readiness.value();
            t.status = resolved;
            return Result<void>{};
        });
        if (!written) {
            logger_.warn("readiness resolution failed", {
                {"task_id", id}, {"error", written.error().what()}
            });
            continue;
        }
        if (previous != resolved) record_transition(id, previous, resolved);
        if (resolved == TaskStatus::Ready && previous != TaskStatus::Ready) {
            promoted.push_back(id);
        }
    }

    resolver_.invalidate_cache();
    rescore(promoted);
    logger_.debug("readiness resolved", {
        {"candidates", candidates.size()}, {"promoted", promoted.size()}
    });
    return promoted;
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

Result<Task> TaskQueue::get_task(const TaskId& task_id) const {
    return store_.get_task(task_id);
}

Result<std::vector<Task>> TaskQueue::list_tasks(std::optional<TaskStatus> status) const {
    return store_.list_tasks(status, 0);
}

Result<QueueStats> TaskQueue::queue_status() const {
    auto rows = store_.list_tasks(std::nullopt, 0);
    if (!rows) return rows.error();

    QueueStats stats;
    double priority_sum = 0.0;
    for (const auto& t : rows.value()) {
        ++stats.by_status[t.status];
        priority_sum += t.calculated_priority;
        stats.max_depth = std::max(stats.max_depth, t.dependency_depth);
        if (t.status == TaskStatus::Pending || t.status == TaskStatus::Blocked) {
            if (!stats.oldest_waiting || t.submitted_at < *stats.oldest_waiting) {
                stats.oldest_waiting = t.submitted_at;
            }
        }
    }
    stats.total = rows.value().size();
    if (stats.total > 0) {
        stats.average_priority = priority_sum / static_cast<double>(stats.total);
    }
    return stats;
}

Result<std::vector<std::vector<TaskId>>> TaskQueue::execution_plan(
    const std::vector<TaskId>& task_ids) {
    return resolver_.execution_batches(task_ids);
}

}  // namespace task_swarm
