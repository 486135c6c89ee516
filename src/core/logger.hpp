/**
 * @file logger.hpp
 * @brief Structured logging infrastructure with pluggable sinks.
 *
 * Provides ILogSink (virtual interface for runtime-configurable log
 * destinations) and a thread-safe Logger front-end emitting one NDJSON
 * record per call. Records carry an event message plus optional key/value
 * fields, e.g.
 *
 *   {"level":"info","ts":"2026-01-01T00:00:00.000Z","msg":"task_dispatched","task":"t1"}
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace task_swarm {

// ─────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(std::string_view text);

// ─────────────────────────────────────────────
// Structured Fields
// ─────────────────────────────────────────────

/**
 * @brief One key/value pair attached to a log record.
 *
 * Numeric values are emitted unquoted; text values are escaped.
 */
struct LogField {
    std::string_view key;
    std::string value;
    bool quoted = true;

    LogField(std::string_view k, std::string_view v) : key(k), value(v) {}
    LogField(std::string_view k, const std::string& v) : key(k), value(v) {}
    LogField(std::string_view k, const char* v) : key(k), value(v) {}
    LogField(std::string_view k, bool v) : key(k), value(v ? "true" : "false"), quoted(false) {}
    LogField(std::string_view k, int v) : key(k), value(std::to_string(v)), quoted(false) {}
    LogField(std::string_view k, long v) : key(k), value(std::to_string(v)), quoted(false) {}
    LogField(std::string_view k, long long v) : key(k), value(std::to_string(v)), quoted(false) {}
    LogField(std::string_view k, unsigned v) : key(k), value(std::to_string(v)), quoted(false) {}
    LogField(std::string_view k, unsigned long v) : key(k), value(std::to_string(v)), quoted(false) {}
    LogField(std::string_view k, unsigned long long v)
        : key(k), value(std::to_string(v)), quoted(false) {}
    LogField(std::string_view k, double v);
};

using LogFields = std::initializer_list<LogField>;

// ─────────────────────────────────────────────
// ILogSink (virtual, runtime-configurable)
// ─────────────────────────────────────────────

/**
 * @brief Abstract interface for log output destinations.
 *
 * Virtual dispatch is acceptable here because logging is I/O-bound,
 * not on the dispatch hot path.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

/**
 * @brief Thread-safe logger front-end.
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level = LogLevel::Info);

    void debug(std::string_view message, LogFields fields = {});
    void info(std::string_view message, LogFields fields = {});
    void warn(std::string_view message, LogFields fields = {});
    void error(std::string_view message, LogFields fields = {});

    void log(LogLevel level, std::string_view message, LogFields fields = {});
    void flush();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] bool enabled(LogLevel level) const noexcept;

private:
    std::unique_ptr<ILogSink> sink_;
    std::atomic<LogLevel> min_level_;
    mutable std::mutex mutex_;
};

}  // namespace task_swarm
