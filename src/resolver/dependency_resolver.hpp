/**
 * @file dependency_resolver.hpp
 * @brief Read-only graph questions about the dependency relation.
 *
 * The resolver never mutates task state. It answers depth, cycle,
 * blocking-impact, readiness and ordering queries from a cached
 * DependencyGraph snapshot of the store. The snapshot expires after a TTL
 * and is dropped wholesale by invalidate_cache(); the next query after an
 * invalidation always rebuilds from the store.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "resolver/dependency_graph.hpp"
#include "store/task_store.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace task_swarm {

struct ResolverCacheStats {
    uint64_t hits = 0;
    uint64_t rebuilds = 0;
    uint64_t invalidations = 0;
};

/**
 * @brief Dependency graph analysis with a TTL cache.
 *
 * Safe to share between the calculator, the queue and the orchestrator:
 * the snapshot pointer is guarded by a shared_mutex and the per-snapshot
 * depth memo by its own mutex.
 */
class DependencyResolver {
public:
    using Clock = std::function<SteadyTime()>;

    static constexpr std::chrono::milliseconds kDefaultCacheTtl{60'000};

    DependencyResolver(const ITaskStore& store,
                       Logger& logger,
                       std::chrono::milliseconds cache_ttl = kDefaultCacheTtl,
                       Clock clock = [] { return std::chrono::steady_clock::now(); });

    // Non-copyable, non-movable
    DependencyResolver(const DependencyResolver&) = delete;
    DependencyResolver& operator=(const DependencyResolver&) = delete;

    // ── Graph Queries ─────────────────────────

    /// 0 for a root task, otherwise 1 + the deepest dependency.
    Result<int> calculate_dependency_depth(const TaskId& task_id);

    /// True if making @p task_id depend on @p new_dependency_id would close
    /// a cycle (a self-dependency counts as one).
    Result<bool> detect_cycle(const TaskId& task_id, const TaskId& new_dependency_id);

    /// Same check, reported as a CircularDependency error.
    Result<void> validate_new_dependency(const TaskId& task_id,
                                         const TaskId& new_dependency_id);

    /// Non-terminal tasks that list @p prerequisite_id as a dependency.
    Result<std::vector<TaskId>> get_blocked_tasks(const TaskId& prerequisite_id);

    /// Every task depending on @p task_id, directly or transitively.
    Result<std::vector<TaskId>> transitive_dependents(const TaskId& task_id);

    /// Readiness check against live store state (not the cache).
    Result<bool> are_all_dependencies_met(const TaskId& task_id);

    /// Dependencies first; ties by calculated_priority desc, submission asc.
    Result<std::vector<TaskId>> topological_order(const std::vector<TaskId>& task_ids);

    /// Topological order grouped by dependency depth; tasks in one batch
    /// do not depend on each other.
    Result<std::vector<std::vector<TaskId>>> execution_batches(
        const std::vector<TaskId>& task_ids);

    // ── Cache ─────────────────────────────────
    void invalidate_cache();
    [[nodiscard]] ResolverCacheStats cache_stats() const noexcept;
    [[nodiscard]] std::chrono::milliseconds cache_ttl() const noexcept { return cache_ttl_; }

private:
    struct Snapshot {
        DependencyGraph graph;
        SteadyTime built_at;
        mutable std::mutex depth_mutex;
        mutable DependencyGraph::DepthMemo depth_memo;
    };

    Result<std::shared_ptr<const Snapshot>> snapshot();
    [[nodiscard]] bool fresh(const Snapshot& snap) const;

    const ITaskStore& store_;
    Logger& logger_;
    std::chrono::milliseconds cache_ttl_;
    Clock clock_;

    std::shared_ptr<const Snapshot> cache_;
    mutable std::shared_mutex cache_mutex_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> rebuilds_{0};
    std::atomic<uint64_t> invalidations_{0};
};

}  // namespace task_swarm
