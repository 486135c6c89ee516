/**
 * @file task_store.hpp
 * @brief Abstract durable task storage consumed by the scheduling core.
 *
 * Implementations must serialize writers (single-writer discipline) while
 * allowing concurrent readers, and must reject any write whose
 * expected version does not match the stored row (optimistic concurrency).
 */

#pragma once

#include "core/result.hpp"
#include "core/task.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace task_swarm {

/**
 * @brief Keyed task storage with optimistic-concurrency writes.
 */
class ITaskStore {
public:
    virtual ~ITaskStore() = default;

    /// Insert a new row. Fails with InvalidArgument if the id exists.
    virtual Result<void> insert_task(const Task& task) = 0;

    /// Fetch one row. Fails with TaskNotFound.
    [[nodiscard]] virtual Result<Task> get_task(const TaskId& id) const = 0;

    /// Highest calculated_priority Ready task, oldest submission first on ties.
    [[nodiscard]] virtual Result<std::optional<Task>> get_next_ready_task() const = 0;

    /// Set the status of a row read at @p expected_version.
    /// Returns the updated row or VersionConflict / TaskNotFound.
    virtual Result<Task> update_status(const TaskId& id,
                                       TaskStatus new_status,
                                       uint64_t expected_version) = 0;

    /// Replace a row; @p task.version is the expected version.
    virtual Result<Task> update_task(const Task& task) = 0;

    /// Rows matching @p status_filter (all when empty), submission order.
    /// A limit of 0 means no limit.
    [[nodiscard]] virtual Result<std::vector<Task>> list_tasks(
        std::optional<TaskStatus> status_filter, size_t limit) const = 0;

    /// Persist the edge "task_id depends on dependency_id".
    /// Fails with CircularDependency (store untouched) if it would close a cycle.
    virtual Result<void> insert_dependency(const TaskId& task_id,
                                           const TaskId& dependency_id) = 0;

    [[nodiscard]] virtual size_t size() const = 0;
};

}  // namespace task_swarm
