/**
 * @file dependency_graph.cpp
 * @brief DependencyGraph implementation: graph algorithms over the id index.
 *
 * Iterative DFS for depth, reachability and cycle detection (no recursion,
 * so deep chains cannot overflow the stack), BFS for transitive dependents
 * and Kahn's algorithm with a priority heap for topological ordering.
 * All traversals are O(V+E).
 */

#include "resolver/dependency_graph.hpp"

#include <algorithm>
#include <deque>
#include <queue>
#include <stack>
#include <unordered_set>

namespace task_swarm {

namespace {

const std::vector<TaskId> kNoEdges;

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

DependencyGraph DependencyGraph::from_tasks(const std::vector<Task>& tasks) {
    DependencyGraph graph;
    for (const auto& task : tasks) {
        graph.add_task(task);
    }
    return graph;
}

void DependencyGraph::add_task(const Task& task) {
    nodes_[task.id] = GraphNode{
        .status = task.status,
        .calculated_priority = task.calculated_priority,
        .submitted_at = task.submitted_at,
        .order = static_cast<uint64_t>(nodes_.size())
    };
    dependents_[task.id];

    auto& deps = dependencies_[task.id];
    for (const auto& dep : task.dependencies) {
        deps.push_back(dep);
        dependents_[dep].push_back(task.id);
        ++edge_count_;
    }
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

bool DependencyGraph::contains(const TaskId& id) const {
    return nodes_.contains(id);
}

const std::vector<TaskId>& DependencyGraph::dependencies(const TaskId& id) const {
    auto it = dependencies_.find(id);
    return it == dependencies_.end() ? kNoEdges : it->second;
}

const std::vector<TaskId>& DependencyGraph::dependents(const TaskId& id) const {
    auto it = dependents_.find(id);
    return it == dependents_.end() ? kNoEdges : it->second;
}

std::optional<GraphNode> DependencyGraph::node(const TaskId& id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return std::nullopt;
    return it->second;
}

size_t DependencyGraph::task_count() const noexcept {
    return nodes_.size();
}

size_t DependencyGraph::edge_count() const noexcept {
    return edge_count_;
}

bool DependencyGraph::reaches(const TaskId& from, const TaskId& target) const {
    std::unordered_set<TaskId> visited;
    std::stack<TaskId> pending;
    pending.push(from);

    while (!pending.empty()) {
        auto current = pending.top();
        pending.pop();
        if (current == target) return true;
        if (!visited.insert(current).second) continue;

        for (const auto& dep : dependencies(current)) {
            if (!visited.contains(dep)) pending.push(dep);
        }
    }
    return false;
}

std::vector<TaskId> DependencyGraph::transitive_dependents(const TaskId& id) const {
    std::vector<TaskId> result;
    std::unordered_set<TaskId> visited{id};
    std::deque<TaskId> queue{id};

    while (!queue.empty()) {
        auto current = queue.front();
        queue.pop_front();

        for (const auto& dependent : dependents(current)) {
            if (visited.insert(dependent).second) {
                result.push_back(dependent);
                queue.push_back(dependent);
            }
        }
    }
    return result;
}

// ─────────────────────────────────────────────
// Depth
// ─────────────────────────────────────────────

Result<int> DependencyGraph::depth(const TaskId& id, DepthMemo& memo) const {
    if (auto it = memo.find(id); it != memo.end()) {
        return it->second;
    }
    if (!contains(id)) {
        return Error{ErrorCode::TaskNotFound, "task " + id + " not found"};
    }

    struct Frame {
        TaskId node;
        size_t next_dep;
        int deepest;   ///< Max depth among finished dependencies, -1 if none
    };

    std::unordered_set<TaskId> on_path{id};
    std::vector<Frame> frames;
    frames.push_back({id, 0, -1});

    while (!frames.empty()) {
        auto& frame = frames.back();
        const auto& deps = dependencies(frame.node);

        if (frame.next_dep < deps.size()) {
            const auto& dep = deps[frame.next_dep++];
            if (!contains(dep)) continue;

            if (auto it = memo.find(dep); it != memo.end()) {
                frame.deepest = std::max(frame.deepest, it->second);
                continue;
            }
            if (on_path.contains(dep)) {
                return Error{ErrorCode::CircularDependency,
                             "cycle detected through " + frame.node + " -> " + dep};
            }
            on_path.insert(dep);
            frames.push_back({dep, 0, -1});
            continue;
        }

        int finished = frame.deepest + 1;
        memo[frame.node] = finished;
        on_path.erase(frame.node);
        frames.pop_back();

        if (!frames.empty()) {
            frames.back().deepest = std::max(frames.back().deepest, finished);
        }
    }

    return memo.at(id);
}

// ─────────────────────────────────────────────
// Topological Ordering (Kahn's Algorithm)
// ─────────────────────────────────────────────

Result<std::vector<TaskId>> DependencyGraph::topological_order(
    const std::vector<TaskId>& subset) const {
    std::vector<TaskId> members;
    std::unordered_set<TaskId> member_set;
    for (const auto& id : subset) {
        if (!contains(id)) {
            return Error{ErrorCode::TaskNotFound, "task " + id + " not found"};
        }
        if (member_set.insert(id).second) {
            members.push_back(id);
        }
    }

    std::unordered_map<TaskId, size_t> in_degree;
    for (const auto& id : members) {
        size_t degree = 0;
        for (const auto& dep : dependencies(id)) {
            if (member_set.contains(dep)) ++degree;
        }
        in_degree[id] = degree;
    }

    // Max-heap: "less" means lower priority, or later submission on ties.
    auto lower = [this](const TaskId& a, const TaskId& b) {
        const auto& na = nodes_.at(a);
        const auto& nb = nodes_.at(b);
        if (na.calculated_priority != nb.calculated_priority) {
            return na.calculated_priority < nb.calculated_priority;
        }
        if (na.submitted_at != nb.submitted_at) {
            return na.submitted_at > nb.submitted_at;
        }
        return na.order > nb.order;
    };
    std::priority_queue<TaskId, std::vector<TaskId>, decltype(lower)> zero_in(lower);

    for (const auto& id : members) {
        if (in_degree[id] == 0) zero_in.push(id);
    }

    std::vector<TaskId> order;
    order.reserve(members.size());

    while (!zero_in.empty()) {
        auto current = zero_in.top();
        zero_in.pop();
        order.push_back(current);

        for (const auto& dependent : dependents(current)) {
            if (!member_set.contains(dependent)) continue;
            if (--in_degree[dependent] == 0) {
                zero_in.push(dependent);
            }
        }
    }

    if (order.size() != members.size()) {
        std::string unprocessed;
        for (const auto& id : members) {
            if (in_degree[id] != 0) {
                if (!unprocessed.empty()) unprocessed += ", ";
                unprocessed += id;
            }
        }
        return Error{ErrorCode::CircularDependency,
                     "cannot order tasks, cycle among: " + unprocessed};
    }

    return order;
}

}  // namespace task_swarm
