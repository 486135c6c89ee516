/**
 * @file config.hpp
 * @brief Swarm configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "core/result.hpp"

namespace task_swarm {

struct SwarmConfig {
    uint32_t max_concurrent_agents = 10;
    uint32_t poll_interval_ms = 100;
    uint64_t completion_limit = 0;      ///< 0 = unbounded
    uint32_t shutdown_timeout_ms = 0;   ///< 0 = wait for in-flight executions
    bool auto_retry = true;
    bool stop_when_idle = false;
    uint32_t result_history = 10000;    ///< Execution results kept in memory, 0 = all
};

/**
 * @brief Weights of the five priority sub-scores. Must sum to 1.0.
 */
struct PriorityWeights {
    double base = 0.30;
    double depth = 0.25;
    double urgency = 0.25;
    double blocking = 0.15;
    double source = 0.05;

    [[nodiscard]] double sum() const noexcept {
        return base + depth + urgency + blocking + source;
    }

    [[nodiscard]] Result<void> validate() const;
};

struct ResolverConfig {
    uint32_t cache_ttl_seconds = 60;
};

struct QueueConfig {
    uint32_t default_max_retries = 3;
    uint32_t version_conflict_retries = 5;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    bool metrics_enabled = true;
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    SwarmConfig swarm;
    PriorityWeights priority;
    ResolverConfig resolver;
    QueueConfig queue;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing tables and keys keep their defaults. Out-of-range values and
 * weights that do not sum to 1.0 are rejected with ErrorCode::ConfigError.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from an in-memory TOML document.
 */
Result<Config> parse_config(std::string_view toml_text);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace task_swarm
