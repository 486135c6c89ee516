/**
 * @file memory_task_store.hpp
 * @brief In-process ITaskStore backed by hash maps and an ordered ready index.
 */

#pragma once

#include "store/task_store.hpp"

#include <functional>
#include <set>
#include <shared_mutex>
#include <unordered_map>

namespace task_swarm {

/**
 * @brief Thread-safe in-memory task store.
 *
 * A std::shared_mutex gives many concurrent readers and one writer. Ready
 * tasks are additionally kept in an ordered index so get_next_ready_task()
 * is O(log n) instead of a full scan.
 */
class InMemoryTaskStore final : public ITaskStore {
public:
    using Clock = std::function<Timestamp()>;

    InMemoryTaskStore();
    explicit InMemoryTaskStore(Clock clock);

    Result<void> insert_task(const Task& task) override;
    [[nodiscard]] Result<Task> get_task(const TaskId& id) const override;
    [[nodiscard]] Result<std::optional<Task>> get_next_ready_task() const override;
    Result<Task> update_status(const TaskId& id,
                               TaskStatus new_status,
                               uint64_t expected_version) override;
    Result<Task> update_task(const Task& task) override;
    [[nodiscard]] Result<std::vector<Task>> list_tasks(
        std::optional<TaskStatus> status_filter, size_t limit) const override;
    Result<void> insert_dependency(const TaskId& task_id,
                                   const TaskId& dependency_id) override;
    [[nodiscard]] size_t size() const override;

private:
    struct Row {
        Task task;
        uint64_t sequence = 0;   ///< Insertion order, final tie-breaker
    };

    struct ReadyKey {
        double priority;
        Timestamp submitted_at;
        uint64_t sequence;
        TaskId id;

        bool operator<(const ReadyKey& other) const noexcept;
    };

    static ReadyKey ready_key(const Row& row);

    // Caller holds the exclusive lock.
    Result<Task> commit(Row& row, Task next);
    bool reaches_locked(const TaskId& from, const TaskId& target) const;

    Clock clock_;
    std::unordered_map<TaskId, Row> rows_;
    std::set<ReadyKey> ready_index_;
    uint64_t next_sequence_ = 0;
    mutable std::shared_mutex mutex_;
};

}  // namespace task_swarm
