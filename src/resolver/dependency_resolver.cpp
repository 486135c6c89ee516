/**
 * @file dependency_resolver.cpp
 * @brief DependencyResolver implementation.
 */

#include "resolver/dependency_resolver.hpp"

#include <algorithm>
#include <map>

namespace task_swarm {

DependencyResolver::DependencyResolver(const ITaskStore& store,
                                       Logger& logger,
                                       std::chrono::milliseconds cache_ttl,
                                       Clock clock)
    : store_(store)
    , logger_(logger)
    , cache_ttl_(cache_ttl)
    , clock_(std::move(clock)) {}

// ─────────────────────────────────────────────
// Snapshot Cache
// ─────────────────────────────────────────────

bool DependencyResolver::fresh(const Snapshot& snap) const {
    return clock_() - snap.built_at < cache_ttl_;
}

Result<std::shared_ptr<const DependencyResolver::Snapshot>> DependencyResolver::snapshot() {
    {
        std::shared_lock lock(cache_mutex_);
        if (cache_ && fresh(*cache_)) {
            hits_.fetch_add(1, std::memory_order_relaxed);
            return cache_;
        }
    }

    std::unique_lock lock(cache_mutex_);
    if (cache_ && fresh(*cache_)) {
        hits_.fetch_add(1, std::memory_order_relaxed);
        return cache_;
    }

    auto rows = store_.list_tasks(std::nullopt, 0);
    if (!rows) {
        return rows.error();
    }

    auto snap = std::make_shared<Snapshot>();
    snap->graph = DependencyGraph::from_tasks(rows.value());
    snap->built_at = clock_();
    cache_ = snap;
    rebuilds_.fetch_add(1, std::memory_order_relaxed);

    logger_.debug("dependency graph rebuilt", {
        {"tasks", snap->graph.task_count()},
        {"edges", snap->graph.edge_count()}
    });
    return std::shared_ptr<const Snapshot>(std::move(snap));
}

void DependencyResolver::invalidate_cache() {
    std::unique_lock lock(cache_mutex_);
    cache_.reset();
    invalidations_.fetch_add(1, std::memory_order_relaxed);
}

ResolverCacheStats DependencyResolver::cache_stats() const noexcept {
    return ResolverCacheStats{
        .hits = hits_.load(std::memory_order_relaxed),
        .rebuilds = rebuilds_.load(std::memory_order_relaxed),
        .invalidations = invalidations_.load(std::memory_order_relaxed)
    };
}

// ─────────────────────────────────────────────
// Graph Queries
// ─────────────────────────────────────────────

Result<int> DependencyResolver::calculate_dependency_depth(const TaskId& task_id) {
    auto snap = snapshot();
    if (!snap) return snap.error();

    const auto& s = *snap.value();
    std::lock_guard lock(s.depth_mutex);
    return s.graph.depth(task_id, s.depth_memo);
}

Result<bool> DependencyResolver::detect_cycle(const TaskId& task_id,
                                              const TaskId& new_dependency_id) {
    auto snap = snapshot();
    if (!snap) return snap.error();

    const auto& graph = snap.value()->graph;
    if (!graph.contains(task_id)) {
        return Error{ErrorCode::TaskNotFound, "task " + task_id + " not found"};
    }
    if (!graph.contains(new_dependency_id)) {
        return Error{ErrorCode::TaskNotFound, "task " + new_dependency_id + " not found"};
    }
    if (task_id == new_dependency_id) {
        return true;
    }
    // The new edge closes a cycle iff task_id is already a (transitive)
    // prerequisite of new_dependency_id.
    return graph.reaches(new_dependency_id, task_id);
}

Result<void> DependencyResolver::validate_new_dependency(const TaskId& task_id,
                                                         const TaskId& new_dependency_id) {
    auto cycle = detect_cycle(task_id, new_dependency_id);
    if (!cycle) return cycle.error();
    if (cycle.value()) {
        return Error{ErrorCode::CircularDependency,
                     "adding " + task_id + " -> " + new_dependency_id
                     + " would create a dependency cycle"};
    }
    return Result<void>{};
}

Result<std::vector<TaskId>> DependencyResolver::get_blocked_tasks(const TaskId& prerequisite_id) {
    auto snap = snapshot();
    if (!snap) return snap.error();

    const auto& graph = snap.value()->graph;
    if (!graph.contains(prerequisite_id)) {
        return Error{ErrorCode::TaskNotFound, "task " + prerequisite_id + " not found"};
    }

    std::vector<TaskId> blocked;
    for (const auto& dependent : graph.dependents(prerequisite_id)) {
        auto node = graph.node(dependent);
        if (node && !is_terminal(node->status)) {
            blocked.push_back(dependent);
        }
    }
    return blocked;
}

Result<std::vector<TaskId>> DependencyResolver::transitive_dependents(const TaskId& task_id) {
    auto snap = snapshot();
    if (!snap) return snap.error();

    const auto& graph = snap.value()->graph;
    if (!graph.contains(task_id)) {
        return Error{ErrorCode::TaskNotFound, "task " + task_id + " not found"};
    }
    return graph.transitive_dependents(task_id);
}

Result<bool> DependencyResolver::are_all_dependencies_met(const TaskId& task_id) {
    auto task = store_.get_task(task_id);
    if (!task) return task.error();

    const auto& t = task.value();
    size_t completed = 0;
    for (const auto& dep : t.dependencies) {
        auto row = store_.get_task(dep);
        if (!row) {
            // A missing prerequisite can never complete.
            logger_.warn("dependency row missing", {{"task_id", task_id}, {"dependency", dep}});
            continue;
        }
        if (row.value().status == TaskStatus::Completed) {
            ++completed;
        }
    }
    return completed >= t.required_completions();
}

Result<std::vector<TaskId>> DependencyResolver::topological_order(
    const std::vector<TaskId>& task_ids) {
    auto snap = snapshot();
    if (!snap) return snap.error();
    return snap.value()->graph.topological_order(task_ids);
}

Result<std::vector<std::vector<TaskId>>> DependencyResolver::execution_batches(
    const std::vector<TaskId>& task_ids) {
    auto snap = snapshot();
    if (!snap) return snap.error();

    const auto& s = *snap.value();
    auto order = s.graph.topological_order(task_ids);
    if (!order) return order.error();

    std::map<int, std::vector<TaskId>> by_depth;
    {
        std::lock_guard lock(s.depth_mutex);
        for (const auto& id : order.value()) {
            auto depth = s.graph.depth(id, s.depth_memo);
            if (!depth) return depth.error();
            by_depth[depth.value()].push_back(id);
        }
    }

    std::vector<std::vector<TaskId>> batches;
    batches.reserve(by_depth.size());
    for (auto& [depth, ids] : by_depth) {
        batches.push_back(std::move(ids));
    }
    return batches;
}

}  // namespace task_swarm
