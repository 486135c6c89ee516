/**
 * @file main.cpp
 * @brief TaskSwarm entry point.
 *
 * Wires the modules into a complete pipeline:
 *   Config → Logger/Metrics → TaskStore → Resolver → Calculator → TaskQueue
 *          → SwarmOrchestrator (simulated agents)
 *
 * With --tasks N (default 20) a synthetic workload is enqueued and the swarm
 * exits once it is idle. With --tasks 0 it keeps polling until SIGINT or
 * SIGTERM.
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

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>

using namespace task_swarm;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::optional<std::filesystem::path> config_path;
    std::optional<uint32_t> agents;
    std::optional<uint64_t> limit;
    size_t tasks = 20;
    double fail_rate = 0.0;
    std::string log_dir;
};

void print_usage() {
    std::cout << "Usage: task_swarm [OPTIONS]\n"
              << "  --config <path>     Configuration file (default: config/default.toml if present)\n"
              << "  --agents <n>        Maximum concurrent agents\n"
              << "  --limit <n>         Stop after n finished executions (0 = unbounded)\n"
              << "  --tasks <n>         Synthetic tasks to enqueue (0 = run until signalled)\n"
              << "  --fail-rate <p>     Simulated agent failure probability in [0, 1]\n"
              << "  --log-dir <path>    Log output directory (empty = stdout)\n"
              << "  --help, -h          Show this help message\n";
}

template <typename T>
std::optional<T> parse_number(const std::string& text) {
    try {
        size_t consumed = 0;
        if constexpr (std::is_floating_point_v<T>) {
            auto value = std::stod(text, &consumed);
            if (consumed != text.size()) return std::nullopt;
            return static_cast<T>(value);
        } else {
            auto value = std::stoll(text, &consumed);
            if (consumed != text.size() || value < 0) return std::nullopt;
            return static_cast<T>(value);
        }
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::optional<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        auto number_or_fail = [&]<typename T>(std::optional<T>& out) {
            if (!has_value) return false;
            out = parse_number<T>(argv[++i]);
            return out.has_value();
        };

        if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else if (arg == "--config" && has_value) {
            args.config_path = argv[++i];
        } else if (arg == "--log-dir" && has_value) {
            args.log_dir = argv[++i];
        } else if (arg == "--agents") {
            if (!number_or_fail(args.agents) || *args.agents == 0) return std::nullopt;
        } else if (arg == "--limit") {
            if (!number_or_fail(args.limit)) return std::nullopt;
        } else if (arg == "--tasks") {
            std::optional<size_t> tasks;
            if (!number_or_fail(tasks)) return std::nullopt;
            args.tasks = *tasks;
        } else if (arg == "--fail-rate") {
            std::optional<double> rate;
            if (!number_or_fail(rate) || *rate < 0.0 || *rate > 1.0) return std::nullopt;
            args.fail_rate = *rate;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            return std::nullopt;
        }
    }
    return args;
}

Result<Config> resolve_config(const CLIArgs& args) {
    if (args.config_path) {
        return load_config(*args.config_path);
    }
    const std::filesystem::path fallback = "config/default.toml";
    if (std::filesystem::exists(fallback)) {
        return load_config(fallback);
    }
    return default_config();
}

void log_queue_summary(TaskQueue& queue, Logger& logger) {
    auto stats = queue.queue_status();
    if (!stats) {
        logger.warn("queue status unavailable", {{"error", stats.error().what()}});
        return;
    }
    const auto& s = stats.value();
    logger.info("queue summary", {
        {"total", s.total},
        {"completed", s.count(TaskStatus::Completed)},
        {"failed", s.count(TaskStatus::Failed)},
        {"cancelled", s.count(TaskStatus::Cancelled)},
        {"ready", s.count(TaskStatus::Ready)},
        {"blocked", s.count(TaskStatus::Blocked)},
        {"running", s.count(TaskStatus::Running)},
        {"avg_priority", s.average_priority},
        {"max_depth", s.max_depth}
    });
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        print_usage();
        return 2;
    }
    const auto& args = *parsed;

    // Load configuration
    auto config_result = resolve_config(args);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        return 1;
    }
    auto config = config_result.value();

    // Apply CLI overrides
    if (args.agents) config.swarm.max_concurrent_agents = *args.agents;
    if (args.limit) config.swarm.completion_limit = *args.limit;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logger & Metrics ──────────
    std::unique_ptr<ILogSink> log_sink;
    std::unique_ptr<ILogSink> metrics_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "task_swarm",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    if (config.telemetry.metrics_enabled && !config.telemetry.log_dir.empty()) {
        metrics_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir,
                                                      "task_swarm_metrics",
                                                      config.telemetry.max_file_size_mb,
                                                      config.telemetry.rotate_count);
    } else {
        metrics_sink = std::make_unique<NullSink>();
    }

    Logger logger(std::move(log_sink),
                  parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info));
    MetricsCollector metrics(std::move(metrics_sink));

    logger.info("TaskSwarm starting", {
        {"max_concurrent_agents", config.swarm.max_concurrent_agents},
        {"completion_limit", config.swarm.completion_limit},
        {"tasks", args.tasks},
        {"fail_rate", args.fail_rate}
    });

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Core Services ────────────────────────
    InMemoryTaskStore store;
    DependencyResolver resolver(store, logger,
                                std::chrono::seconds{config.resolver.cache_ttl_seconds});
    PriorityCalculator calculator(store, resolver, logger, config.priority,
                                  [] { return std::chrono::system_clock::now(); },
                                  config.queue.version_conflict_retries);
    TaskQueue queue(store, resolver, calculator, logger, config.queue, &metrics);

    SimulatedAgentExecutor executor(SimulatedAgentOptions{
        .run_time = std::chrono::milliseconds{40},
        .jitter = std::chrono::milliseconds{80},
        .failure_rate = args.fail_rate,
        .seed = 42,
        .always_fail = {}
    });

    auto options = SwarmOptions::from_config(config.swarm);
    if (args.tasks > 0) options.stop_when_idle = true;
    SwarmOrchestrator orchestrator(queue, executor, logger, options, &metrics);

    // ── Workload ─────────────────────────────
    std::mt19937 rng(42);
    for (const auto& spec : TaskSetGenerator::random_mixed(args.tasks, 0.35, rng)) {
        auto task = queue.enqueue(spec);
        if (!task) {
            logger.error("enqueue failed", {{"task_id", spec.id}, {"error", task.error().what()}});
            return 1;
        }
    }
    log_queue_summary(queue, logger);

    // Translate signals into a graceful stop.
    std::jthread signal_watcher([&orchestrator, &logger](std::stop_token stop) {
        while (!stop.stop_requested()) {
            if (g_shutdown_requested) {
                logger.info("shutdown requested");
                orchestrator.stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    // ── Run ──────────────────────────────────
    auto summary = orchestrator.start_swarm();
    signal_watcher.request_stop();

    if (!summary) {
        logger.error("swarm run failed", {{"error", summary.error().what()}});
        return 1;
    }

    log_queue_summary(queue, logger);
    auto status = orchestrator.status();
    logger.info("TaskSwarm stopped", {
        {"reason", to_string(summary.value().reason)},
        {"completed", summary.value().completed},
        {"succeeded", summary.value().succeeded},
        {"failed", summary.value().failed},
        {"retried", summary.value().retried},
        {"active_executions", status.active_executions},
        {"peak_agents", executor.peak_in_flight()}
    });

    metrics.flush();
    logger.flush();
    return 0;
}
