/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <sstream>

namespace task_swarm {

namespace {

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

void write_id_array(std::ostringstream& oss, const std::vector<TaskId>& ids) {
    oss << '[';
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) oss << ',';
        oss << '"' << json_escape(ids[i]) << '"';
    }
    oss << ']';
}

}  // anonymous namespace

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_task_dispatched(const TaskId& id, double priority,
                                              size_t active_executions) {
    std::ostringstream oss;
    oss << R"({"event":"task_dispatched")"
        << R"(,"ts":)" << now_ms()
        << R"(,"task":")" << json_escape(id) << "\""
        << R"(,"priority":)" << priority
        << R"(,"active":)" << active_executions
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_task_execution(const TaskId& id, bool success,
                                             Duration duration, std::string_view error) {
    std::ostringstream oss;
    oss << R"({"event":"task_execution")"
        << R"(,"ts":)" << now_ms()
        << R"(,"task":")" << json_escape(id) << "\""
        << R"(,"success":)" << (success ? "true" : "false")
        << R"(,"duration_us":)" << duration.count();
    if (!error.empty()) {
        oss << R"(,"error":")" << json_escape(error) << "\"";
    }
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_status_change(const TaskId& id, TaskStatus from, TaskStatus to) {
    std::ostringstream oss;
    oss << R"({"event":"status_change")"
        << R"(,"ts":)" << now_ms()
        << R"(,"task":")" << json_escape(id) << "\""
        << R"(,"from":")" << to_string(from) << "\""
        << R"(,"to":")" << to_string(to) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_cascade(const TaskId& root,
                                      const std::vector<TaskId>& cancelled,
                                      const std::vector<TaskId>& unreachable) {
    std::ostringstream oss;
    oss << R"({"event":"cascade_cancellation")"
        << R"(,"ts":)" << now_ms()
        << R"(,"root":")" << json_escape(root) << "\""
        << R"(,"cancelled":)";
    write_id_array(oss, cancelled);
    oss << R"(,"unreachable":)";
    write_id_array(oss, unreachable);
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_swarm_summary(uint64_t completed, uint64_t succeeded,
                                            uint64_t failed,
                                            std::chrono::milliseconds elapsed) {
    std::ostringstream oss;
    oss << R"({"event":"swarm_summary")"
        << R"(,"ts":)" << now_ms()
        << R"(,"completed":)" << completed
        << R"(,"succeeded":)" << succeeded
        << R"(,"failed":)" << failed
        << R"(,"elapsed_ms":)" << elapsed.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << R"(,"ts":)" << now_ms()
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace task_swarm
