/**
 * @file dependency_graph.hpp
 * @brief Id-keyed adjacency index over task dependency edges.
 *
 * Built from a snapshot of task rows. Nodes are never linked by pointer:
 * both edge directions are stored as id lists so the structure can be
 * rebuilt or discarded wholesale when the resolver cache is invalidated.
 * Provides depth, reachability, transitive dependents, cycle detection
 * and priority-aware topological ordering.
 */

#pragma once

#include "core/result.hpp"
#include "core/task.hpp"
#include "core/types.hpp"

#include <optional>
#include <unordered_map>
#include <vector>

namespace task_swarm {

/**
 * @brief Per-node data the graph algorithms need from a task row.
 */
struct GraphNode {
    TaskStatus status = TaskStatus::Pending;
    double calculated_priority = 0.0;
    Timestamp submitted_at{};
    uint64_t order = 0;   ///< Position in the source snapshot
};

/**
 * @brief Dependency relation of a task set.
 *
 * Edge direction: dependencies(t) lists what t requires, dependents(t)
 * lists what requires t.
 */
class DependencyGraph {
public:
    using DepthMemo = std::unordered_map<TaskId, int>;

    DependencyGraph() = default;

    [[nodiscard]] static DependencyGraph from_tasks(const std::vector<Task>& tasks);

    // ── Construction ──────────────────────────
    void add_task(const Task& task);

    // ── Queries ───────────────────────────────
    [[nodiscard]] bool contains(const TaskId& id) const;
    [[nodiscard]] const std::vector<TaskId>& dependencies(const TaskId& id) const;
    [[nodiscard]] const std::vector<TaskId>& dependents(const TaskId& id) const;
    [[nodiscard]] std::optional<GraphNode> node(const TaskId& id) const;
    [[nodiscard]] size_t task_count() const noexcept;
    [[nodiscard]] size_t edge_count() const noexcept;

    /// True if @p target is reachable from @p from by following dependencies.
    [[nodiscard]] bool reaches(const TaskId& from, const TaskId& target) const;

    /// Every task that depends on @p id directly or transitively, BFS order.
    [[nodiscard]] std::vector<TaskId> transitive_dependents(const TaskId& id) const;

    /// Longest dependency chain below @p id. Results for every visited
    /// node are written to @p memo. Fails with CircularDependency.
    [[nodiscard]] Result<int> depth(const TaskId& id, DepthMemo& memo) const;

    /// Kahn's algorithm restricted to @p subset; edges leaving the subset
    /// are ignored. Ties go to higher calculated_priority, then earlier
    /// submission.
    [[nodiscard]] Result<std::vector<TaskId>> topological_order(
        const std::vector<TaskId>& subset) const;

private:
    std::unordered_map<TaskId, GraphNode> nodes_;
    std::unordered_map<TaskId, std::vector<TaskId>> dependencies_;   // forward edges
    std::unordered_map<TaskId, std::vector<TaskId>> dependents_;     // backward edges
    size_t edge_count_ = 0;
};

}  // namespace task_swarm
