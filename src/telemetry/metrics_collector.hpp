/**
 * @file metrics_collector.hpp
 * @brief Structured audit events for the swarm, written as NDJSON.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace task_swarm {

/**
 * @brief Collects and writes structured telemetry events as NDJSON.
 *
 * Every record has an "event" key and a millisecond "ts". Writes are
 * serialized so one collector can be shared by the queue and the
 * orchestrator.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_task_dispatched(const TaskId& id, double priority, size_t active_executions);
    void record_task_execution(const TaskId& id, bool success, Duration duration,
                               std::string_view error = {});
    void record_status_change(const TaskId& id, TaskStatus from, TaskStatus to);
    void record_cascade(const TaskId& root,
                        const std::vector<TaskId>& cancelled,
                        const std::vector<TaskId>& unreachable);
    void record_swarm_summary(uint64_t completed, uint64_t succeeded, uint64_t failed,
                              std::chrono::milliseconds elapsed);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace task_swarm
