/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace task_swarm;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "ts_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.swarm.max_concurrent_agents, 10u);
    EXPECT_EQ(config.swarm.poll_interval_ms, 100u);
    EXPECT_EQ(config.swarm.completion_limit, 0u);
    EXPECT_TRUE(config.swarm.auto_retry);
    EXPECT_DOUBLE_EQ(config.priority.base, 0.30);
    EXPECT_DOUBLE_EQ(config.priority.sum(), 1.0);
    EXPECT_EQ(config.resolver.cache_ttl_seconds, 60u);
    EXPECT_EQ(config.queue.default_max_retries, 3u);
    EXPECT_EQ(config.telemetry.log_level, "info");
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [swarm]
        max_concurrent_agents = 4
        poll_interval_ms = 25
        completion_limit = 12
        shutdown_timeout_ms = 500
        auto_retry = false
        stop_when_idle = true
        result_history = 250

        [priority]
        base_weight = 0.4
        depth_weight = 0.2
        urgency_weight = 0.2
        blocking_weight = 0.1
        source_weight = 0.1

        [resolver]
        cache_ttl_seconds = 5

        [queue]
        default_max_retries = 1
        version_conflict_retries = 9

        [telemetry]
        log_dir = "/tmp/ts_logs"
        max_file_size_mb = 2
        rotate_count = 3
        log_level = "debug"
        metrics_enabled = false
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.swarm.max_concurrent_agents, 4u);
    EXPECT_EQ(config.swarm.poll_interval_ms, 25u);
    EXPECT_EQ(config.swarm.completion_limit, 12u);
    EXPECT_EQ(config.swarm.shutdown_timeout_ms, 500u);
    EXPECT_FALSE(config.swarm.auto_retry);
    EXPECT_TRUE(config.swarm.stop_when_idle);
    EXPECT_EQ(config.swarm.result_history, 250u);
    EXPECT_DOUBLE_EQ(config.priority.base, 0.4);
    EXPECT_DOUBLE_EQ(config.priority.source, 0.1);
    EXPECT_EQ(config.resolver.cache_ttl_seconds, 5u);
    EXPECT_EQ(config.queue.default_max_retries, 1u);
    EXPECT_EQ(config.queue.version_conflict_retries, 9u);
    EXPECT_EQ(config.telemetry.log_dir, std::filesystem::path("/tmp/ts_logs"));
    EXPECT_EQ(config.telemetry.max_file_size_mb, 2u);
    EXPECT_EQ(config.telemetry.rotate_count, 3u);
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_FALSE(config.telemetry.metrics_enabled);
}

TEST_F(ConfigTest, PartialConfig) {
    auto result = parse_config(R"(
        [swarm]
        max_concurrent_agents = 2
    )");
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->swarm.max_concurrent_agents, 2u);
    // Defaults for everything else
    EXPECT_EQ(result->swarm.poll_interval_ms, 100u);
    EXPECT_DOUBLE_EQ(result->priority.urgency, 0.25);
    EXPECT_EQ(result->telemetry.rotate_count, 5u);
}

TEST_F(ConfigTest, WeightsMustSumToOne) {
    auto result = parse_config(R"(
        [priority]
        base_weight = 0.9
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::ConfigError));
}

TEST_F(ConfigTest, NegativeWeightRejected) {
    PriorityWeights weights{.base = -0.1, .depth = 0.35, .urgency = 0.5,
                            .blocking = 0.2, .source = 0.05};
    auto valid = weights.validate();
    ASSERT_FALSE(static_cast<bool>(valid));
    EXPECT_TRUE(valid.error().is(ErrorCode::ConfigError));
}

TEST_F(ConfigTest, ZeroAgentsRejected) {
    auto result = parse_config(R"(
        [swarm]
        max_concurrent_agents = 0
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::ConfigError));
}

TEST_F(ConfigTest, NegativeCountsRejected) {
    for (const char* text : {
             "[swarm]\nshutdown_timeout_ms = -1",
             "[swarm]\nresult_history = -5",
             "[resolver]\ncache_ttl_seconds = -60",
             "[queue]\ndefault_max_retries = -1",
             "[queue]\nversion_conflict_retries = -2",
             "[telemetry]\nmax_file_size_mb = -50",
             "[telemetry]\nrotate_count = -1"}) {
        auto result = parse_config(text);
        ASSERT_FALSE(result.has_value()) << text;
        EXPECT_TRUE(result.error().is(ErrorCode::ConfigError)) << text;
    }
}

TEST_F(ConfigTest, CountAboveRangeRejected) {
    auto result = parse_config("[resolver]\ncache_ttl_seconds = 5000000000");
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::ConfigError));
}

TEST_F(ConfigTest, UnknownLogLevelRejected) {
    auto result = parse_config(R"(
        [telemetry]
        log_level = "chatty"
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::ConfigError));
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::ConfigError));
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    EXPECT_FALSE(result.has_value());
}

TEST_F(ConfigTest, ShippedDefaultFileParses) {
    auto result = load_config(std::filesystem::path(TASK_SWARM_SOURCE_DIR) / "config" / "default.toml");
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_DOUBLE_EQ(result->priority.sum(), 1.0);
}
