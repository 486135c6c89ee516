/**
 * @file test_swarm_pipeline.cpp
 * @brief Integration tests exercising the full pipeline:
 *        config -> queue -> orchestrator -> telemetry files.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "executor/simulated_agent_executor.hpp"
#include "orchestrator/swarm_orchestrator.hpp"
#include "priority/priority_calculator.hpp"
#include "queue/task_queue.hpp"
#include "resolver/dependency_resolver.hpp"
#include "store/memory_task_store.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"
#include "workload/task_set_generator.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <string>
#include <thread>

using namespace task_swarm;
using namespace std::chrono_literals;

namespace {

std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    for (std::string line; std::getline(in, line);) lines.push_back(line);
    return lines;
}

size_t count_containing(const std::vector<std::string>& lines, std::string_view needle) {
    return static_cast<size_t>(std::count_if(lines.begin(), lines.end(),
        [&](const std::string& l) { return l.find(needle) != std::string::npos; }));
}

}  // namespace

class SwarmPipelineTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "ts_pipeline_test";
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }
};

// ═══════════════════════════════════════════════
// Config-driven end-to-end run
// ═══════════════════════════════════════════════

TEST_F(SwarmPipelineTest, ConfiguredRunWritesTelemetry) {
    auto config = parse_config(R"(
        [swarm]
        max_concurrent_agents = 4
        poll_interval_ms = 5
        stop_when_idle = true

        [queue]
        default_max_retries = 1

        [telemetry]
        log_level = "debug"
    )");
    ASSERT_TRUE(config.has_value()) << config.error().what();

    {
        Logger logger(std::make_unique<JsonFileSink>(dir_, "task_swarm"),
                      parse_log_level(config->telemetry.log_level).value());
        MetricsCollector metrics(std::make_unique<JsonFileSink>(dir_, "task_swarm_metrics"));

        InMemoryTaskStore store;
        DependencyResolver resolver(store, logger,
                                    std::chrono::seconds{config->resolver.cache_ttl_seconds});
        PriorityCalculator calculator(store, resolver, logger, config->priority);
        TaskQueue queue(store, resolver, calculator, logger, config->queue, &metrics);

        for (const auto& spec : TaskSetGenerator::fan_out_fan_in(6)) {
            ASSERT_TRUE(queue.enqueue(spec).has_value());
        }

        SimulatedAgentExecutor agent({.run_time = 2ms, .always_fail = {"fan_branch_3"}});
        SwarmOrchestrator swarm(queue, agent, logger,
                                SwarmOptions::from_config(config->swarm), &metrics);

        auto summary = swarm.start_swarm();
        ASSERT_TRUE(summary.has_value());
        EXPECT_EQ(summary->reason, StopReason::Idle);

        // One failing branch with one retry: 2 failed attempts, the sink is
        // cancelled, everything else succeeds.
        EXPECT_EQ(summary->failed, 2u);
        EXPECT_EQ(summary->retried, 1u);
        EXPECT_EQ(summary->succeeded, 6u);

        EXPECT_EQ(queue.get_task("fan_branch_3").value().status, TaskStatus::Failed);
        EXPECT_EQ(queue.get_task("fan_sink").value().status, TaskStatus::Cancelled);
        EXPECT_EQ(queue.get_task("fan_src").value().status, TaskStatus::Completed);

        metrics.flush();
        logger.flush();
    }

    auto metric_lines = read_lines(dir_ / "task_swarm_metrics.ndjson");
    EXPECT_EQ(count_containing(metric_lines, R"("event":"task_dispatched")"), 8u);
    EXPECT_EQ(count_containing(metric_lines, R"("event":"task_execution")"), 8u);
    EXPECT_EQ(count_containing(metric_lines, R"("event":"cascade_cancellation")"), 1u);
    EXPECT_EQ(count_containing(metric_lines, R"("event":"swarm_summary")"), 1u);

    auto log_lines = read_lines(dir_ / "task_swarm.ndjson");
    EXPECT_GT(count_containing(log_lines, R"("msg":"task enqueued")"), 0u);
    EXPECT_EQ(count_containing(log_lines, R"("msg":"swarm stopped")"), 1u);
}

TEST_F(SwarmPipelineTest, QuorumSinkRunsBeforeAllBranches) {
    Logger logger(std::make_unique<NullSink>());
    InMemoryTaskStore store;
    DependencyResolver resolver(store, logger);
    PriorityCalculator calculator(store, resolver, logger);
    TaskQueue queue(store, resolver, calculator, logger);

    for (const auto& spec : TaskSetGenerator::fan_out_fan_in(4, 2)) {
        ASSERT_TRUE(queue.enqueue(spec).has_value());
    }

    std::mutex mutex;
    std::vector<TaskId> order;
    CallbackAgentExecutor agent([&](const Task& task, std::stop_token) {
        std::lock_guard lock(mutex);
        order.push_back(task.id);
        return ExecutionResult{.task_id = task.id, .success = true};
    });

    SwarmOptions options;
    options.max_concurrent_agents = 1;
    options.poll_interval = 1ms;
    options.stop_when_idle = true;
    SwarmOrchestrator swarm(queue, agent, logger, options);

    auto summary = swarm.start_swarm();
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->succeeded, 6u);

    // The sink becomes Ready after two branches and, as an agent planner
    // task at depth 2, outranks the two branches still waiting.
    auto sink_pos = std::find(order.begin(), order.end(), "fan_sink") - order.begin();
    EXPECT_LT(sink_pos, 5);
}

TEST_F(SwarmPipelineTest, ProducersCanEnqueueWhileSwarmRuns) {
    Logger logger(std::make_unique<NullSink>());
    InMemoryTaskStore store;
    DependencyResolver resolver(store, logger);
    PriorityCalculator calculator(store, resolver, logger);
    TaskQueue queue(store, resolver, calculator, logger);

    SimulatedAgentExecutor agent({.run_time = 1ms});
    SwarmOptions options;
    options.max_concurrent_agents = 4;
    options.poll_interval = 5ms;
    SwarmOrchestrator swarm(queue, agent, logger, options);

    std::jthread runner([&swarm] { (void)swarm.start_swarm(); });

    std::mt19937 rng(3);
    std::jthread producer([&] {
        for (const auto& spec : TaskSetGenerator::random_mixed(60, 0.3, rng)) {
            if (queue.enqueue(spec)) swarm.notify_task_available();
            std::this_thread::sleep_for(1ms);
        }
    });
    producer.join();

    auto deadline = std::chrono::steady_clock::now() + 10s;
    while (std::chrono::steady_clock::now() < deadline) {
        auto stats = queue.queue_status().value();
        if (stats.count(TaskStatus::Completed) == 60) break;
        std::this_thread::sleep_for(5ms);
    }
    swarm.stop();
    runner.join();

    EXPECT_EQ(queue.queue_status().value().count(TaskStatus::Completed), 60u);
    EXPECT_EQ(swarm.status().active_executions, 0u);
}
