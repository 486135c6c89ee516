/**
 * @file swarm_orchestrator.hpp
 * @brief Dispatch loop that runs Ready tasks on a bounded set of agents.
 *
 * One thread runs start_swarm(), which pulls the highest-priority Ready
 * task from the TaskQueue whenever an agent slot is free and hands it to
 * the thread pool. Every execution ends in exactly one call to the
 * completion finaliser, which writes the terminal status, releases the
 * slot and increments the completion counter. That finaliser is the only
 * place the counter changes, and admission requires
 * `completed + active < limit`, so a completion limit is never exceeded
 * regardless of how many agents are allowed to run at once.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/task.hpp"
#include "executor/agent_executor.hpp"
#include "executor/thread_pool.hpp"
#include "queue/task_queue.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <unordered_map>
#include <vector>

namespace task_swarm {

struct SwarmOptions {
    size_t max_concurrent_agents = 10;
    std::chrono::milliseconds poll_interval{100};
    uint64_t completion_limit = 0;                   ///< 0 = unbounded
    std::chrono::milliseconds shutdown_timeout{0};   ///< 0 = wait for in-flight work
    bool auto_retry = true;
    bool stop_when_idle = false;
    size_t result_history = 10000;                   ///< Results kept for results(), 0 = all

    [[nodiscard]] static SwarmOptions from_config(const SwarmConfig& config);
};

enum class StopReason : uint8_t {
    LimitReached,
    ShutdownRequested,
    Idle
};

[[nodiscard]] constexpr std::string_view to_string(StopReason reason) noexcept {
    switch (reason) {
        case StopReason::LimitReached:      return "limit_reached";
        case StopReason::ShutdownRequested: return "shutdown_requested";
        case StopReason::Idle:              return "idle";
    }
    return "unknown";
}

struct SwarmRunSummary {
    uint64_t completed = 0;
    uint64_t succeeded = 0;
    uint64_t failed = 0;
    uint64_t retried = 0;
    StopReason reason = StopReason::ShutdownRequested;
    std::chrono::milliseconds elapsed{0};
};

struct SwarmStatus {
    bool running = false;
    size_t active_executions = 0;
    std::vector<TaskId> active_task_ids;
    uint64_t completed_count = 0;
    uint64_t succeeded = 0;
    uint64_t failed = 0;
    size_t max_concurrent_agents = 0;
    size_t available_slots = 0;
    std::optional<uint64_t> completion_limit;   ///< Limit of the current run, else the configured one
    std::optional<QueueStats> queue;
};

class SwarmOrchestrator {
public:
    SwarmOrchestrator(TaskQueue& queue,
                      IAgentExecutor& executor,
                      Logger& logger,
                      SwarmOptions options = {},
                      MetricsCollector* metrics = nullptr);
    ~SwarmOrchestrator();

    // Non-copyable, non-movable
    SwarmOrchestrator(const SwarmOrchestrator&) = delete;
    SwarmOrchestrator& operator=(const SwarmOrchestrator&) = delete;

    // ── Lifecycle ────────────────────────────

    /// Run the dispatch loop on the calling thread until the limit is
    /// reached, stop() is called, or (with stop_when_idle) nothing is left
    /// to run. In-flight executions are drained before returning.
    /// @p completion_limit overrides the configured limit; 0 = unbounded.
    Result<SwarmRunSummary> start_swarm(std::optional<uint64_t> completion_limit = std::nullopt);

    /// Stop admitting work and wait for in-flight executions. With a hard
    /// timeout (or a configured shutdown_timeout), running executions are
    /// signalled to stop and the wait gives up after the timeout. Must not
    /// be called from inside an agent execution. The request persists
    /// until reset().
    void stop(std::optional<std::chrono::milliseconds> hard_timeout = std::nullopt);

    /// Clear counters, results and any pending stop request. Only allowed
    /// between runs.
    Result<void> reset();

    /// Enqueue @p specs and run at most specs.size() executions, exiting
    /// early once nothing is runnable. Returns the results of the batch's
    /// own tasks.
    Result<std::vector<ExecutionResult>> run_batch(const std::vector<TaskSpec>& specs);

    // ── Control & Introspection ──────────────

    /// Cascade-cancel through the queue and signal any affected running
    /// executions.
    Result<CancellationReport> cancel_task(const TaskId& task_id);

    /// Wake the dispatch loop early, e.g. after enqueuing new work.
    void notify_task_available();

    [[nodiscard]] SwarmStatus status() const;
    /// The most recent executions, oldest first, up to result_history.
    [[nodiscard]] std::vector<ExecutionResult> results() const;
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] const SwarmOptions& options() const noexcept { return options_; }

private:
    struct ActiveExecution {
        std::stop_source stop;
        SteadyTime started_at;
    };

    /// Runs on a pool thread; always ends in finalize().
    void run_execution(const Task& task, std::stop_token stop) noexcept;

    /// Single completion path for an execution, whatever its outcome.
    void finalize(const Task& task, ExecutionResult result) noexcept;

    Result<SwarmRunSummary> run(uint64_t limit, bool stop_when_idle);
    bool admit(const Task& task);

    TaskQueue& queue_;
    IAgentExecutor& executor_;
    Logger& logger_;
    SwarmOptions options_;
    MetricsCollector* metrics_;

    std::atomic<bool> running_{false};

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    bool shutdown_requested_ = false;
    bool hard_stop_requested_ = false;   ///< New executions start already cancelled
    bool abandon_in_flight_ = false;
    bool wake_ = false;
    std::unordered_map<TaskId, ActiveExecution> active_;
    uint64_t completed_count_ = 0;
    uint64_t succeeded_ = 0;
    uint64_t failed_ = 0;
    uint64_t retried_ = 0;
    uint64_t run_limit_ = 0;             ///< Limit of the run in progress
    std::deque<ExecutionResult> results_;
    uint64_t results_evicted_ = 0;       ///< Results dropped from the front of results_

    // Declared last: destroyed first, joining executions while the state
    // above is still alive.
    ThreadPool pool_;
};

}  // namespace task_swarm
