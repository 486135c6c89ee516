/**
 * @file task_queue.hpp
 * @brief Producer and consumer facing task lifecycle service.
 *
 * TaskQueue owns no data. It drives task rows in the ITaskStore through
 * their lifecycle, keeps readiness consistent with the dependency graph,
 * rescores priorities when the graph changes and invalidates the resolver
 * cache after every mutation.
 *
 * All writes are optimistic: a row is read, transformed and written back
 * with its version, and re-read on VersionConflict up to a bounded number
 * of attempts.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/task.hpp"
#include "priority/priority_calculator.hpp"
#include "resolver/dependency_resolver.hpp"
#include "store/task_store.hpp"
#include "telemetry/metrics_collector.hpp"

#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace task_swarm {

/**
 * @brief Outcome of a cascading cancellation.
 *
 * `unreachable` lists dependents that should have been cancelled but whose
 * write kept failing.
 */
struct CancellationReport {
    std::vector<TaskId> cancelled;
    std::vector<TaskId> unreachable;
};

struct FailureOutcome {
    Task task;                  ///< Row after the failure was recorded
    bool retryable = false;     ///< Retries remain; dependents stay blocked
    CancellationReport cascade; ///< Populated only for terminal failures
};

struct QueueStats {
    std::map<TaskStatus, size_t> by_status;
    size_t total = 0;
    double average_priority = 0.0;
    int max_depth = 0;
    std::optional<Timestamp> oldest_waiting;   ///< Oldest Pending/Blocked submission

    [[nodiscard]] size_t count(TaskStatus status) const {
        auto it = by_status.find(status);
        return it == by_status.end() ? 0 : it->second;
    }
};

class TaskQueue {
public:
    using Clock = std::function<Timestamp()>;

    TaskQueue(ITaskStore& store,
              DependencyResolver& resolver,
              PriorityCalculator& calculator,
              Logger& logger,
              QueueConfig config = {},
              MetricsCollector* metrics = nullptr,
              Clock clock = [] { return std::chrono::system_clock::now(); });

    // ── Producers ─────────────────────────────

    /// Validate and insert a new task as Ready or Blocked, scored.
    Result<Task> enqueue(const TaskSpec& spec);

    /// Add a prerequisite edge to a schedulable task.
    Result<Task> add_dependency(const TaskId& task_id, const TaskId& dependency_id);

    // ── Consumers ─────────────────────────────

    /// Claim the highest-priority Ready task and mark it Running.
    Result<std::optional<Task>> dequeue_next();

    /// Mark Completed and return the dependents that became Ready.
    Result<std::vector<TaskId>> complete_task(const TaskId& task_id, std::string output = {});

    Result<FailureOutcome> fail_task(const TaskId& task_id, std::string error_message);

    /// Failed -> Pending -> Ready/Blocked with one more retry consumed.
    Result<Task> retry_task(const TaskId& task_id);

    /// Cancel a task and every non-terminal transitive dependent.
    Result<CancellationReport> cancel_task(const TaskId& task_id);

    /// Promote Pending/Blocked tasks whose dependencies are met.
    Result<std::vector<TaskId>> resolve_ready();

    // ── Queries ───────────────────────────────
    [[nodiscard]] Result<Task> get_task(const TaskId& task_id) const;
    [[nodiscard]] Result<std::vector<Task>> list_tasks(
        std::optional<TaskStatus> status = std::nullopt) const;
    [[nodiscard]] Result<QueueStats> queue_status() const;
    Result<std::vector<std::vector<TaskId>>> execution_plan(const std::vector<TaskId>& task_ids);

private:
    using Mutator = std::function<Result<void>(Task&)>;

    /// Read-modify-write with version retry. The mutator sees the freshest
    /// row each attempt and may veto the write by returning an error.
    Result<Task> mutate(const TaskId& task_id, const Mutator& mutator);

    Result<void> check_transition(const Task& task, TaskStatus to) const;
    Result<TaskStatus> readiness_of(const Task& task) const;
    CancellationReport cascade_cancel(const TaskId& root);
    void rescore(const std::vector<TaskId>& task_ids);
    void record_transition(const TaskId& id, TaskStatus from, TaskStatus to);

    ITaskStore& store_;
    DependencyResolver& resolver_;
    PriorityCalculator& calculator_;
    Logger& logger_;
    QueueConfig config_;
    MetricsCollector* metrics_;
    Clock clock_;
};

}  // namespace task_swarm
