/**
 * @file task_set_generator.cpp
 * @brief TaskSetGenerator topologies.
 *
 * - Linear chains (strictly sequential pipelines, depth n-1)
 * - Fan-out/fan-in (independent parallel stage between two barriers)
 * - Random mixed workloads (stress tests, dispatch-order checks)
 */

#include "workload/task_set_generator.hpp"

#include <algorithm>
#include <chrono>

namespace task_swarm {

// ─────────────────────────────────────────────
// Linear Chain: T0 <- T1 <- T2 <- ... <- Tn-1
// ─────────────────────────────────────────────

std::vector<TaskSpec> TaskSetGenerator::linear_chain(size_t num_tasks,
                                                     int base_priority,
                                                     const std::string& prefix) {
    std::vector<TaskSpec> specs;
    specs.reserve(num_tasks);

    for (size_t i = 0; i < num_tasks; ++i) {
        TaskSpec spec;
        spec.id = prefix + "_" + std::to_string(i);
        spec.summary = "Chain step " + std::to_string(i);
        spec.prompt = "Carry out step " + std::to_string(i) + " of the pipeline";
        spec.base_priority = base_priority;
        if (i > 0) {
            spec.prerequisites.push_back(specs.back().id);
        }
        specs.push_back(std::move(spec));
    }
    return specs;
}

// ─────────────────────────────────────────────
// Fan-out / Fan-in:
//          src
//       /   |   \   (backslash)
//     b_0  b_1  b_2  ... b_{width-1}
//       \   |   /
//          sink
// ─────────────────────────────────────────────

std::vector<TaskSpec> TaskSetGenerator::fan_out_fan_in(size_t width,
                                                       uint32_t sink_quorum,
                                                       const std::string& prefix) {
    std::vector<TaskSpec> specs;
    specs.reserve(width + 2);

    TaskSpec source;
    source.id = prefix + "_src";
    source.summary = "Split the work";
    source.source = TaskSource::AgentPlanner;
    source.base_priority = 6;
    specs.push_back(source);

    TaskSpec sink;
    sink.id = prefix + "_sink";
    sink.summary = "Merge branch results";
    sink.source = TaskSource::AgentPlanner;
    if (sink_quorum > 0) {
        sink.dependency_type = DependencyType::Parallel;
        sink.parallel_quorum = std::min<uint32_t>(sink_quorum, static_cast<uint32_t>(width));
    }

    for (size_t i = 0; i < width; ++i) {
        TaskSpec branch;
        branch.id = prefix + "_branch_" + std::to_string(i);
        branch.summary = "Branch " + std::to_string(i);
        branch.agent_type = "implementation";
        branch.source = TaskSource::AgentImplementation;
        branch.prerequisites.push_back(source.id);
        sink.prerequisites.push_back(branch.id);
        specs.push_back(std::move(branch));
    }

    specs.push_back(std::move(sink));
    return specs;
}

// ─────────────────────────────────────────────
// Random mixed workload (acyclic by construction)
// ─────────────────────────────────────────────

std::vector<TaskSpec> TaskSetGenerator::random_mixed(size_t num_tasks,
                                                     double edge_probability,
                                                     std::mt19937& rng,
                                                     const std::string& prefix) {
    constexpr size_t kMaxPrerequisites = 3;
    constexpr TaskSource kSources[] = {
        TaskSource::Human, TaskSource::AgentRequirements,
        TaskSource::AgentPlanner, TaskSource::AgentImplementation
    };

    std::uniform_int_distribution<int> priority_dist(kMinBasePriority, kMaxBasePriority);
    std::uniform_int_distribution<size_t> source_dist(0, std::size(kSources) - 1);
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    std::uniform_int_distribution<int> deadline_minutes(1, 60 * 24 * 10);

    const auto now = std::chrono::system_clock::now();
    std::vector<TaskSpec> specs;
    specs.reserve(num_tasks);

    for (size_t i = 0; i < num_tasks; ++i) {
        TaskSpec spec;
        spec.id = prefix + "_" + std::to_string(i);
        spec.summary = "Mixed task " + std::to_string(i);
        spec.base_priority = priority_dist(rng);
        spec.source = kSources[source_dist(rng)];

        if (coin(rng) < 0.3) {
            spec.deadline = now + std::chrono::minutes{deadline_minutes(rng)};
        }

        if (i > 0) {
            std::uniform_int_distribution<size_t> pick(0, i - 1);
            for (size_t k = 0; k < kMaxPrerequisites; ++k) {
                if (coin(rng) >= edge_probability) continue;
                const auto& dep = specs[pick(rng)].id;
                if (std::find(spec.prerequisites.begin(), spec.prerequisites.end(), dep)
                    == spec.prerequisites.end()) {
                    spec.prerequisites.push_back(dep);
                }
            }
        }
        specs.push_back(std::move(spec));
    }
    return specs;
}

}  // namespace task_swarm
