/**
 * @file priority_calculator.hpp
 * @brief Multi-factor dynamic priority scoring.
 *
 * A task's calculated priority is a weighted sum of five sub-scores, each
 * in [0, 100]:
 *
 *   base      base_priority * 10
 *   depth     min(100, dependency depth * 10)
 *   urgency   bucketed time-to-deadline, 0 without a deadline
 *   blocking  bucketed count of non-terminal direct dependents
 *   source    who submitted the task
 *
 * The result is clamped to [0, 100]. The calculator keeps no state beyond
 * its weights and collaborators, so it can be shared between threads.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/task.hpp"
#include "resolver/dependency_resolver.hpp"
#include "store/task_store.hpp"

#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace task_swarm {

/**
 * @brief Sub-scores and weighted total for one task.
 */
struct PriorityBreakdown {
    double base = 0.0;
    double depth = 0.0;
    double urgency = 0.0;
    double blocking = 0.0;
    double source = 0.0;
    double total = 0.0;
};

class PriorityCalculator {
public:
    using Clock = std::function<Timestamp()>;

    /// @throws std::invalid_argument if @p weights fail validation.
    PriorityCalculator(ITaskStore& store,
                       DependencyResolver& resolver,
                       Logger& logger,
                       PriorityWeights weights = {},
                       Clock clock = [] { return std::chrono::system_clock::now(); },
                       uint32_t version_conflict_retries = 5);

    // ── Sub-scores ────────────────────────────
    [[nodiscard]] static double base_score(int base_priority) noexcept;
    [[nodiscard]] static double depth_score(int depth) noexcept;
    [[nodiscard]] static double urgency_score(std::optional<Timestamp> deadline,
                                              std::optional<Seconds> estimated_duration,
                                              Timestamp now) noexcept;
    [[nodiscard]] static double blocking_score(size_t blocked_count) noexcept;
    [[nodiscard]] static double source_score(TaskSource source) noexcept;

    /// Weighted sum of already-computed sub-scores, clamped to [0, 100].
    [[nodiscard]] double combine(PriorityBreakdown& scores) const noexcept;

    // ── Scoring ───────────────────────────────
    Result<PriorityBreakdown> explain_priority(const Task& task);
    Result<double> calculate_priority(const Task& task);

    /// Rescore one task and persist score and depth. Errors propagate.
    Result<double> recalculate_priority(const TaskId& task_id);

    /// Rescore every schedulable task in @p task_ids. Terminal or running
    /// tasks are skipped; per-task failures are logged and skipped.
    std::map<TaskId, double> recalculate_priorities(const std::vector<TaskId>& task_ids);

    [[nodiscard]] const PriorityWeights& weights() const noexcept { return weights_; }

private:
    /// With @p schedulable_only, fails with InvalidState once the row is
    /// no longer Pending, Blocked or Ready.
    Result<double> rescore_and_persist(const TaskId& task_id, bool schedulable_only);

    ITaskStore& store_;
    DependencyResolver& resolver_;
    Logger& logger_;
    PriorityWeights weights_;
    Clock clock_;
    uint32_t version_conflict_retries_;
};

}  // namespace task_swarm
