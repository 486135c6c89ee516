/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <cmath>
#include <limits>
#include <toml++/toml.hpp>

namespace task_swarm {

namespace {

constexpr double kWeightTolerance = 1e-6;

/// Integer key that must fit in [@p min, UINT32_MAX]; absent keys yield @p fallback.
Result<uint32_t> read_u32(toml::node_view<const toml::node> section,
                          std::string_view section_name,
                          std::string_view key,
                          int64_t fallback,
                          int64_t min = 0) {
    auto value = section[key].value_or(fallback);
    if (value < min || value > int64_t{std::numeric_limits<uint32_t>::max()}) {
        return Error{ErrorCode::ConfigError,
                     std::string(section_name) + "." + std::string(key) + " must be in ["
                     + std::to_string(min) + ", "
                     + std::to_string(std::numeric_limits<uint32_t>::max()) + "], got "
                     + std::to_string(value)};
    }
    return static_cast<uint32_t>(value);
}

Result<Config> from_table(const toml::table& tbl) {
    Config config;

    // [swarm]
    if (auto swarm = tbl["swarm"]; swarm.is_table()) {
        auto agents = read_u32(swarm, "swarm", "max_concurrent_agents", 10, 1);
        if (!agents) return agents.error();
        config.swarm.max_concurrent_agents = agents.value();

        auto poll = read_u32(swarm, "swarm", "poll_interval_ms", 100, 1);
        if (!poll) return poll.error();
        config.swarm.poll_interval_ms = poll.value();

        auto limit = swarm["completion_limit"].value_or(int64_t{0});
        if (limit < 0) {
            return Error{ErrorCode::ConfigError, "swarm.completion_limit must be >= 0"};
        }
        config.swarm.completion_limit = static_cast<uint64_t>(limit);

        auto shutdown = read_u32(swarm, "swarm", "shutdown_timeout_ms", 0);
        if (!shutdown) return shutdown.error();
        config.swarm.shutdown_timeout_ms = shutdown.value();

        auto history = read_u32(swarm, "swarm", "result_history", 10000);
        if (!history) return history.error();
        config.swarm.result_history = history.value();

        config.swarm.auto_retry = swarm["auto_retry"].value_or(true);
        config.swarm.stop_when_idle = swarm["stop_when_idle"].value_or(false);
    }

    // [priority]
    if (auto priority = tbl["priority"]; priority.is_table()) {
        config.priority.base = priority["base_weight"].value_or(0.30);
        config.priority.depth = priority["depth_weight"].value_or(0.25);
        config.priority.urgency = priority["urgency_weight"].value_or(0.25);
        config.priority.blocking = priority["blocking_weight"].value_or(0.15);
        config.priority.source = priority["source_weight"].value_or(0.05);
    }
    if (auto valid = config.priority.validate(); !valid) {
        return valid.error();
    }

    // [resolver]
    if (auto resolver = tbl["resolver"]; resolver.is_table()) {
        auto ttl = read_u32(resolver, "resolver", "cache_ttl_seconds", 60);
        if (!ttl) return ttl.error();
        config.resolver.cache_ttl_seconds = ttl.value();
    }

    // [queue]
    if (auto queue = tbl["queue"]; queue.is_table()) {
        auto retries = read_u32(queue, "queue", "default_max_retries", 3);
        if (!retries) return retries.error();
        config.queue.default_max_retries = retries.value();

        auto conflicts = read_u32(queue, "queue", "version_conflict_retries", 5, 1);
        if (!conflicts) return conflicts.error();
        config.queue.version_conflict_retries = conflicts.value();
    }

    // [telemetry]
    if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
        config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});

        auto file_size = read_u32(telemetry, "telemetry", "max_file_size_mb", 50, 1);
        if (!file_size) return file_size.error();
        config.telemetry.max_file_size_mb = file_size.value();

        auto rotate = read_u32(telemetry, "telemetry", "rotate_count", 5);
        if (!rotate) return rotate.error();
        config.telemetry.rotate_count = rotate.value();

        config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        config.telemetry.metrics_enabled = telemetry["metrics_enabled"].value_or(true);
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{ErrorCode::ConfigError,
                     "telemetry.log_level must be debug, info, warn or error"};
    }

    return config;
}

}  // anonymous namespace

Result<void> PriorityWeights::validate() const {
    for (double w : {base, depth, urgency, blocking, source}) {
        if (w < 0.0 || w > 1.0) {
            return Error{ErrorCode::ConfigError, "priority weights must lie in [0, 1]"};
        }
    }
    if (std::fabs(sum() - 1.0) > kWeightTolerance) {
        return Error{ErrorCode::ConfigError,
                     "priority weights must sum to 1.0, got " + std::to_string(sum())};
    }
    return Result<void>{};
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::ConfigError, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace task_swarm
