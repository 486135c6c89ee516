/**
 * @file swarm_orchestrator.cpp
 * @brief SwarmOrchestrator implementation.
 */

#include "orchestrator/swarm_orchestrator.hpp"

#include <algorithm>
#include <unordered_set>

namespace task_swarm {

SwarmOptions SwarmOptions::from_config(const SwarmConfig& config) {
    return SwarmOptions{
        .max_concurrent_agents = config.max_concurrent_agents,
        .poll_interval = std::chrono::milliseconds{config.poll_interval_ms},
        .completion_limit = config.completion_limit,
        .shutdown_timeout = std::chrono::milliseconds{config.shutdown_timeout_ms},
        .auto_retry = config.auto_retry,
        .stop_when_idle = config.stop_when_idle,
        .result_history = config.result_history
    };
}

SwarmOrchestrator::SwarmOrchestrator(TaskQueue& queue,
                                     IAgentExecutor& executor,
                                     Logger& logger,
                                     SwarmOptions options,
                                     MetricsCollector* metrics)
    : queue_(queue)
    , executor_(executor)
    , logger_(logger)
    , options_(options)
    , metrics_(metrics)
    , pool_(std::max<size_t>(options.max_concurrent_agents, 1)) {
    options_.max_concurrent_agents = std::max<size_t>(options_.max_concurrent_agents, 1);
    if (options_.poll_interval.count() <= 0) {
        options_.poll_interval = std::chrono::milliseconds{1};
    }
}

SwarmOrchestrator::~SwarmOrchestrator() {
    {
        std::lock_guard lock(state_mutex_);
        shutdown_requested_ = true;
        for (auto& [id, execution] : active_) {
            execution.stop.request_stop();
        }
    }
    state_cv_.notify_all();
    pool_.shutdown();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<SwarmRunSummary> SwarmOrchestrator::start_swarm(std::optional<uint64_t> completion_limit) {
    return run(completion_limit.value_or(options_.completion_limit), options_.stop_when_idle);
}

Result<SwarmRunSummary> SwarmOrchestrator::run(uint64_t limit, bool stop_when_idle) {
    if (running_.exchange(true)) {
        return Error{ErrorCode::InvalidState, "swarm is already running"};
    }

    const auto started = std::chrono::steady_clock::now();
    std::unique_lock lock(state_mutex_);
    run_limit_ = limit;

    const uint64_t base_completed = completed_count_;
    const uint64_t base_succeeded = succeeded_;
    const uint64_t base_failed = failed_;
    const uint64_t base_retried = retried_;
    auto run_completions = [&] { return completed_count_ - base_completed; };
    auto has_capacity = [&] {
        if (active_.size() >= options_.max_concurrent_agents) return false;
        return limit == 0 || run_completions() + active_.size() < limit;
    };

    logger_.info("swarm started", {
        {"max_concurrent_agents", options_.max_concurrent_agents},
        {"completion_limit", limit},
        {"stop_when_idle", stop_when_idle}
    });

    StopReason reason = StopReason::ShutdownRequested;
    for (;;) {
        if (shutdown_requested_) {
            reason = StopReason::ShutdownRequested;
            break;
        }
        if (limit != 0 && run_completions() >= limit) {
            reason = StopReason::LimitReached;
            break;
        }

        const uint64_t seen_completions = completed_count_;
        bool queue_drained = false;

        while (!shutdown_requested_ && has_capacity()) {
            lock.unlock();
            auto next = queue_.dequeue_next();
            if (!next) {
                logger_.error("dequeue failed, backing off", {{"error", next.error().what()}});
                lock.lock();
                break;
            }
            if (!next.value()) {
                queue_drained = true;
                lock.lock();
                break;
            }
            bool posted = admit(*next.value());
            lock.lock();
            if (!posted) break;
        }

        if (stop_when_idle && queue_drained && active_.empty()
            && completed_count_ == seen_completions) {
            reason = StopReason::Idle;
            break;
        }

        state_cv_.wait_for(lock, options_.poll_interval,
                           [this] { return wake_ || shutdown_requested_; });
        wake_ = false;
    }

    // No more admissions; let in-flight executions finish.
    state_cv_.wait(lock, [this] { return active_.empty() || abandon_in_flight_; });

    SwarmRunSummary summary{
        .completed = completed_count_ - base_completed,
        .succeeded = succeeded_ - base_succeeded,
        .failed = failed_ - base_failed,
        .retried = retried_ - base_retried,
        .reason = reason,
        .elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started)
    };
    running_.store(false);
    lock.unlock();
    state_cv_.notify_all();

    if (metrics_) {
        metrics_->record_swarm_summary(summary.completed, summary.succeeded,
                                       summary.failed, summary.elapsed);
    }
    logger_.info("swarm stopped", {
        {"reason", to_string(summary.reason)},
        {"completed", summary.completed},
        {"succeeded", summary.succeeded},
        {"failed", summary.failed},
        {"retried", summary.retried},
        {"elapsed_ms", static_cast<long long>(summary.elapsed.count())}
    });
    return summary;
}

bool SwarmOrchestrator::admit(const Task& task) {
    std::stop_token token;
    {
        std::lock_guard lock(state_mutex_);
        auto it = active_.try_emplace(
            task.id, ActiveExecution{std::stop_source{}, std::chrono::steady_clock::now()}).first;
        token = it->second.stop.get_token();
        if (hard_stop_requested_) it->second.stop.request_stop();
        if (metrics_) {
            metrics_->record_task_dispatched(task.id, task.calculated_priority, active_.size());
        }
    }

    logger_.debug("task dispatched", {
        {"task_id", task.id}, {"priority", task.calculated_priority}
    });

    if (pool_.post([this, task, token] { run_execution(task, token); })) {
        return true;
    }

    finalize(task, ExecutionResult{
        .task_id = task.id,
        .success = false,
        .output = {},
        .error = "execution pool is shut down",
        .duration = Duration{0}
    });
    return false;
}

void SwarmOrchestrator::stop(std::optional<std::chrono::milliseconds> hard_timeout) {
    if (!hard_timeout && options_.shutdown_timeout.count() > 0) {
        hard_timeout = options_.shutdown_timeout;
    }

    std::unique_lock lock(state_mutex_);
    shutdown_requested_ = true;
    state_cv_.notify_all();

    auto settled = [this] { return active_.empty() && !running_.load(); };

    if (!hard_timeout) {
        state_cv_.wait(lock, settled);
        return;
    }

    hard_stop_requested_ = true;
    for (auto& [id, execution] : active_) {
        execution.stop.request_stop();
    }
    if (!state_cv_.wait_for(lock, *hard_timeout, settled)) {
        abandon_in_flight_ = true;
        for (auto& [id, execution] : active_) {
            execution.stop.request_stop();
        }
        logger_.warn("hard stop timed out, abandoning in-flight executions", {
            {"active", active_.size()},
            {"timeout_ms", static_cast<long long>(hard_timeout->count())}
        });
        state_cv_.notify_all();
    }
}

Result<void> SwarmOrchestrator::reset() {
    if (running_.load()) {
        return Error{ErrorCode::InvalidState, "cannot reset a running swarm"};
    }
    std::lock_guard lock(state_mutex_);
    if (!active_.empty()) {
        return Error{ErrorCode::InvalidState,
                     std::to_string(active_.size()) + " executions still in flight"};
    }
    completed_count_ = 0;
    succeeded_ = 0;
    failed_ = 0;
    retried_ = 0;
    run_limit_ = 0;
    results_.clear();
    results_evicted_ = 0;
    shutdown_requested_ = false;
    hard_stop_requested_ = false;
    abandon_in_flight_ = false;
    wake_ = false;
    return Result<void>{};
}

Result<std::vector<ExecutionResult>> SwarmOrchestrator::run_batch(const std::vector<TaskSpec>& specs) {
    if (running_.load()) {
        return Error{ErrorCode::InvalidState, "swarm is already running"};
    }
    if (specs.empty()) {
        return std::vector<ExecutionResult>{};
    }

    std::unordered_set<TaskId> batch_ids;
    for (const auto& spec : specs) {
        auto task = queue_.enqueue(spec);
        if (!task) {
            logger_.error("batch enqueue failed", {
                {"summary", spec.summary}, {"error", task.error().what()}
            });
            return task.error();
        }
        batch_ids.insert(task.value().id);
    }

    uint64_t first_result = 0;
    {
        std::lock_guard lock(state_mutex_);
        first_result = results_evicted_ + results_.size();
    }

    auto summary = run(specs.size(), true);
    if (!summary) return summary.error();

    std::vector<ExecutionResult> batch_results;
    std::lock_guard lock(state_mutex_);
    if (results_evicted_ > first_result) {
        logger_.warn("batch results exceeded the result history", {
            {"dropped", results_evicted_ - first_result},
            {"result_history", options_.result_history}
        });
    }
    const size_t begin = first_result > results_evicted_
        ? static_cast<size_t>(first_result - results_evicted_) : 0;
    for (size_t i = begin; i < results_.size(); ++i) {
        if (batch_ids.contains(results_[i].task_id)) {
            batch_results.push_back(results_[i]);
        }
    }
    return batch_results;
}

// ─────────────────────────────────────────────
// Control & Introspection
// ─────────────────────────────────────────────

Result<CancellationReport> SwarmOrchestrator::cancel_task(const TaskId& task_id) {
    auto report = queue_.cancel_task(task_id);
    if (!report) return report.error();

    size_t signalled = 0;
    {
        std::lock_guard lock(state_mutex_);
        for (const auto& id : report.value().cancelled) {
            auto it = active_.find(id);
            if (it != active_.end()) {
                it->second.stop.request_stop();
                ++signalled;
            }
        }
        wake_ = true;
    }
    state_cv_.notify_all();

    logger_.info("cancellation requested", {
        {"task_id", task_id},
        {"cancelled", report.value().cancelled.size()},
        {"running_signalled", signalled}
    });
    return report;
}

void SwarmOrchestrator::notify_task_available() {
    {
        std::lock_guard lock(state_mutex_);
        wake_ = true;
    }
    state_cv_.notify_all();
}

SwarmStatus SwarmOrchestrator::status() const {
    SwarmStatus status;
    {
        std::lock_guard lock(state_mutex_);
        status.running = running_.load();
        status.active_executions = active_.size();
        status.active_task_ids.reserve(active_.size());
        for (const auto& [id, execution] : active_) {
            status.active_task_ids.push_back(id);
        }
        std::sort(status.active_task_ids.begin(), status.active_task_ids.end());
        status.completed_count = completed_count_;
        status.succeeded = succeeded_;
        status.failed = failed_;
        status.max_concurrent_agents = options_.max_concurrent_agents;
        status.available_slots = options_.max_concurrent_agents
                                 - std::min(active_.size(), options_.max_concurrent_agents);
        const uint64_t limit = status.running ? run_limit_ : options_.completion_limit;
        if (limit != 0) {
            status.completion_limit = limit;
        }
    }

    if (auto stats = queue_.queue_status(); stats) {
        status.queue = stats.value();
    }
    return status;
}

std::vector<ExecutionResult> SwarmOrchestrator::results() const {
    std::lock_guard lock(state_mutex_);
    return std::vector<ExecutionResult>(results_.begin(), results_.end());
}

// ─────────────────────────────────────────────
// Execution & Completion
// ─────────────────────────────────────────────

void SwarmOrchestrator::run_execution(const Task& task, std::stop_token stop) noexcept {
    // Runs finalize() on every exit path, including unwinding.
    struct CompletionGuard {
        SwarmOrchestrator& owner;
        const Task& task;
        ExecutionResult result;

        ~CompletionGuard() { owner.finalize(task, std::move(result)); }
    };

    CompletionGuard guard{*this, task, ExecutionResult{
        .task_id = task.id,
        .success = false,
        .output = {},
        .error = "execution ended without a result",
        .duration = Duration{0}
    }};

    try {
        guard.result = executor_.execute(task, stop);
    } catch (const std::exception& e) {
        guard.result.success = false;
        guard.result.error = std::string("agent threw: ") + e.what();
    } catch (...) {
        guard.result.success = false;
        guard.result.error = "agent threw a non-standard exception";
    }
}

void SwarmOrchestrator::finalize(const Task& task, ExecutionResult result) noexcept {
    result.task_id = task.id;
    bool retried = false;

    try {
        if (result.success) {
            auto unblocked = queue_.complete_task(task.id, result.output);
            if (!unblocked) {
                // Typically cancelled while running; the task did not complete.
                logger_.warn("completion could not be recorded", {
                    {"task_id", task.id}, {"error", unblocked.error().what()}
                });
                result.success = false;
                result.error = "completion rejected: " + unblocked.error().what();
            }
        } else {
            auto outcome = queue_.fail_task(task.id, result.error.value_or("unknown failure"));
            if (!outcome) {
                logger_.warn("failure could not be recorded", {
                    {"task_id", task.id}, {"error", outcome.error().what()}
                });
            } else if (outcome.value().retryable && options_.auto_retry) {
                auto requeued = queue_.retry_task(task.id);
                if (requeued) {
                    retried = true;
                } else {
                    logger_.warn("automatic retry failed", {
                        {"task_id", task.id}, {"error", requeued.error().what()}
                    });
                }
            }
        }

        if (metrics_) {
            metrics_->record_task_execution(task.id, result.success, result.duration,
                                            result.error.value_or(""));
        }
    } catch (const std::exception& e) {
        logger_.error("completion handling threw", {{"task_id", task.id}, {"error", e.what()}});
    }

    {
        std::lock_guard lock(state_mutex_);
        active_.erase(task.id);
        ++completed_count_;
        if (result.success) {
            ++succeeded_;
        } else {
            ++failed_;
        }
        if (retried) ++retried_;
        results_.push_back(std::move(result));
        if (options_.result_history != 0) {
            while (results_.size() > options_.result_history) {
                results_.pop_front();
                ++results_evicted_;
            }
        }
        wake_ = true;
    }
    state_cv_.notify_all();
}

}  // namespace task_swarm
