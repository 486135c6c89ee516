/**
 * @file memory_task_store.cpp
 * @brief InMemoryTaskStore implementation.
 */

#include "store/memory_task_store.hpp"

#include <algorithm>
#include <mutex>
#include <stack>
#include <unordered_set>

namespace task_swarm {

bool InMemoryTaskStore::ReadyKey::operator<(const ReadyKey& other) const noexcept {
    if (priority != other.priority) return priority > other.priority;
    if (submitted_at != other.submitted_at) return submitted_at < other.submitted_at;
    if (sequence != other.sequence) return sequence < other.sequence;
    return id < other.id;
}

InMemoryTaskStore::InMemoryTaskStore()
    : InMemoryTaskStore([] { return std::chrono::system_clock::now(); }) {}

InMemoryTaskStore::InMemoryTaskStore(Clock clock) : clock_(std::move(clock)) {}

InMemoryTaskStore::ReadyKey InMemoryTaskStore::ready_key(const Row& row) {
    return ReadyKey{row.task.calculated_priority, row.task.submitted_at,
                    row.sequence, row.task.id};
}

// ─────────────────────────────────────────────
// Writes
// ─────────────────────────────────────────────

Result<void> InMemoryTaskStore::insert_task(const Task& task) {
    if (task.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "task id must not be empty"};
    }

    std::unique_lock lock(mutex_);

    if (rows_.contains(task.id)) {
        return Error{ErrorCode::InvalidArgument, "task " + task.id + " already exists"};
    }
    for (const auto& dep : task.dependencies) {
        if (dep == task.id) {
            return Error{ErrorCode::CircularDependency,
                         "task " + task.id + " cannot depend on itself"};
        }
        if (!rows_.contains(dep)) {
            return Error{ErrorCode::TaskNotFound, "dependency " + dep + " not found"};
        }
    }

    Row row;
    row.task = task;
    row.sequence = next_sequence_++;
    row.task.version = 1;
    auto now = clock_();
    if (row.task.submitted_at == Timestamp{}) {
        row.task.submitted_at = now;
    }
    row.task.last_updated_at = now;

    if (row.task.status == TaskStatus::Ready) {
        ready_index_.insert(ready_key(row));
    }
    rows_.emplace(task.id, std::move(row));
    return Result<void>{};
}

Result<Task> InMemoryTaskStore::update_status(const TaskId& id,
                                              TaskStatus new_status,
                                              uint64_t expected_version) {
    std::unique_lock lock(mutex_);

    auto it = rows_.find(id);
    if (it == rows_.end()) {
        return Error{ErrorCode::TaskNotFound, "task " + id + " not found"};
    }
    if (it->second.task.version != expected_version) {
        return Error{ErrorCode::VersionConflict,
                     "task " + id + " is at version " + std::to_string(it->second.task.version)
                     + ", expected " + std::to_string(expected_version)};
    }

    Task next = it->second.task;
    next.status = new_status;
    return commit(it->second, std::move(next));
}

Result<Task> InMemoryTaskStore::update_task(const Task& task) {
    std::unique_lock lock(mutex_);

    auto it = rows_.find(task.id);
    if (it == rows_.end()) {
        return Error{ErrorCode::TaskNotFound, "task " + task.id + " not found"};
    }
    if (it->second.task.version != task.version) {
        return Error{ErrorCode::VersionConflict,
                     "task " + task.id + " is at version "
                     + std::to_string(it->second.task.version)
                     + ", expected " + std::to_string(task.version)};
    }
    // Dependency edges only change through insert_dependency.
    if (it->second.task.dependencies != task.dependencies) {
        return Error{ErrorCode::InvalidArgument,
                     "dependencies of " + task.id + " must be changed via insert_dependency"};
    }

    return commit(it->second, task);
}

Result<void> InMemoryTaskStore::insert_dependency(const TaskId& task_id,
                                                  const TaskId& dependency_id) {
    if (task_id == dependency_id) {
        return Error{ErrorCode::CircularDependency,
                     "task " + task_id + " cannot depend on itself"};
    }

    std::unique_lock lock(mutex_);

    auto it = rows_.find(task_id);
    if (it == rows_.end()) {
        return Error{ErrorCode::TaskNotFound, "task " + task_id + " not found"};
    }
    if (!rows_.contains(dependency_id)) {
        return Error{ErrorCode::TaskNotFound, "dependency " + dependency_id + " not found"};
    }
    if (it->second.task.depends_on(dependency_id)) {
        return Result<void>{};
    }
    if (reaches_locked(dependency_id, task_id)) {
        return Error{ErrorCode::CircularDependency,
                     "edge " + task_id + " -> " + dependency_id + " would close a cycle"};
    }

    Task next = it->second.task;
    next.dependencies.push_back(dependency_id);
    if (auto committed = commit(it->second, std::move(next)); !committed) {
        return committed.error();
    }
    return Result<void>{};
}

Result<Task> InMemoryTaskStore::commit(Row& row, Task next) {
    bool was_ready = row.task.status == TaskStatus::Ready;
    if (was_ready) {
        ready_index_.erase(ready_key(row));
    }

    next.version = row.task.version + 1;
    next.last_updated_at = clock_();
    row.task = std::move(next);

    if (row.task.status == TaskStatus::Ready) {
        ready_index_.insert(ready_key(row));
    }
    return row.task;
}

bool InMemoryTaskStore::reaches_locked(const TaskId& from, const TaskId& target) const {
    std::unordered_set<TaskId> visited;
    std::stack<TaskId> pending;
    pending.push(from);

    while (!pending.empty()) {
        auto current = std::move(pending.top());
        pending.pop();
        if (current == target) return true;
        if (!visited.insert(current).second) continue;

        auto it = rows_.find(current);
        if (it == rows_.end()) continue;
        for (const auto& dep : it->second.task.dependencies) {
            if (!visited.contains(dep)) pending.push(dep);
        }
    }
    return false;
}

// ─────────────────────────────────────────────
// Reads
// ─────────────────────────────────────────────

Result<Task> InMemoryTaskStore::get_task(const TaskId& id) const {
    std::shared_lock lock(mutex_);
    auto it = rows_.find(id);
    if (it == rows_.end()) {
        return Error{ErrorCode::TaskNotFound, "task " + id + " not found"};
    }
    return it->second.task;
}

Result<std::optional<Task>> InMemoryTaskStore::get_next_ready_task() const {
    std::shared_lock lock(mutex_);
    if (ready_index_.empty()) {
        return std::optional<Task>{};
    }
    const auto& key = *ready_index_.begin();
    return std::optional<Task>{rows_.at(key.id).task};
}

Result<std::vector<Task>> InMemoryTaskStore::list_tasks(
    std::optional<TaskStatus> status_filter, size_t limit) const {
    std::shared_lock lock(mutex_);

    std::vector<const Row*> matched;
    matched.reserve(rows_.size());
    for (const auto& [id, row] : rows_) {
        if (!status_filter || row.task.status == *status_filter) {
            matched.push_back(&row);
        }
    }
    std::sort(matched.begin(), matched.end(), [](const Row* a, const Row* b) {
        return a->sequence < b->sequence;
    });
    if (limit != 0 && matched.size() > limit) {
        matched.resize(limit);
    }

    std::vector<Task> out;
    out.reserve(matched.size());
    for (const auto* row : matched) {
        out.push_back(row->task);
    }
    return out;
}

size_t InMemoryTaskStore::size() const {
    std::shared_lock lock(mutex_);
    return rows_.size();
}

}  // namespace task_swarm
