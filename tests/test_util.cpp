#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "util.hpp"

class ConfigLoadTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create a temporary directory for test files
        test_dir = std::filesystem::temp_directory_path() / "frame_governor_tests";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        // Clean up test files
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    void createTestConfig(const std::string& filename, const std::string& content) {
        std::ofstream file(test_dir / filename);
        file << content;
        file.close();
    }

    std::filesystem::path test_dir;
};

TEST_F(ConfigLoadTest, FullConfigLoad) {
    const std::string config_content = R"(
governor:
  target_fps: 60
  budget_ms: 16.0
  max_memory_mb: 128
  buffer_capacity: 8
  enable_adaptive_quality: false
  enable_frame_skipping: false
  enable_resource_throttling: false
  enable_performance_logging: false

quality:
  initial: medium
  decrease_factor: 1.3
  increase_factor: 0.5
  throttle_factor: 2.0
  memory_sample_ms: 250
  adaptive_window: 20
  throttle_window: 5

metrics:
  window: 50
  log_window: 25

monitor:
  interval_ms: 1000
  drop_warn_pct: 5.0
  memory_warn_ratio: 0.9
  log_summary: false

simulation:
  width: 1280
  height: 720
  fps: 60
  workers: 3
  high_priority_every: 5
  low_priority_every: 0
  count_rejections_as_drops: false
  ms_per_megapixel: 10.0
  fixed_cost_ms: 1.0
  jitter_ms: 0.5
  seed: 7

logging:
  level: debug

telemetry:
  metrics_port: 9191
)";

    createTestConfig("full_config.yaml", config_content);

    AppConfig config = load_config((test_dir / "full_config.yaml").string());

    EXPECT_DOUBLE_EQ(config.governor.target_fps, 60.0);
    EXPECT_DOUBLE_EQ(config.governor.budget_ms, 16.0);
    EXPECT_EQ(config.governor.max_memory_bytes, 128ull * 1024 * 1024);
    EXPECT_EQ(config.governor.buffer_capacity, 8u);
    EXPECT_FALSE(config.governor.enable_adaptive_quality);
    EXPECT_FALSE(config.governor.enable_frame_skipping);
    EXPECT_FALSE(config.governor.enable_resource_throttling);
    EXPECT_FALSE(config.governor.enable_performance_logging);

    EXPECT_EQ(config.governor.initial_quality, QualityLevel::Medium);
    EXPECT_DOUBLE_EQ(config.governor.decrease_factor, 1.3);
    EXPECT_DOUBLE_EQ(config.governor.increase_factor, 0.5);
    EXPECT_DOUBLE_EQ(config.governor.throttle_factor, 2.0);
    EXPECT_DOUBLE_EQ(config.governor.memory_sample_ms, 250.0);
    EXPECT_EQ(config.governor.adaptive_window, 20u);
    EXPECT_EQ(config.governor.throttle_window, 5u);
    EXPECT_EQ(config.governor.metrics_window, 50u);
    EXPECT_EQ(config.governor.log_window, 25u);

    EXPECT_EQ(config.monitor.interval_ms, 1000);
    EXPECT_DOUBLE_EQ(config.monitor.drop_warn_pct, 5.0);
    EXPECT_DOUBLE_EQ(config.monitor.memory_warn_ratio, 0.9);
    EXPECT_FALSE(config.monitor.log_summary);

    EXPECT_EQ(config.pipeline.width, 1280);
    EXPECT_EQ(config.pipeline.height, 720);
    EXPECT_EQ(config.pipeline.fps, 60);
    EXPECT_EQ(config.pipeline.workers, 3);
    EXPECT_EQ(config.pipeline.high_priority_every, 5);
    EXPECT_EQ(config.pipeline.low_priority_every, 0);
    EXPECT_FALSE(config.pipeline.count_rejections_as_drops);
    EXPECT_DOUBLE_EQ(config.simulation.ms_per_megapixel, 10.0);
    EXPECT_DOUBLE_EQ(config.simulation.fixed_cost_ms, 1.0);
    EXPECT_DOUBLE_EQ(config.simulation.jitter_ms, 0.5);
    EXPECT_EQ(config.simulation.seed, 7u);

    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.metrics_port, 9191);

    EXPECT_NO_THROW(validate_profile(config.governor));
}

TEST_F(ConfigLoadTest, EmptyConfig) {
    createTestConfig("empty_config.yaml", "{}");

    AppConfig config = load_config((test_dir / "empty_config.yaml").string());

    // Should use default values for all settings
    EXPECT_DOUBLE_EQ(config.governor.budget_ms, 33.0);
    EXPECT_EQ(config.governor.buffer_capacity, 5u);
    EXPECT_EQ(config.governor.initial_quality, QualityLevel::High);
    EXPECT_EQ(config.pipeline.fps, 30);
    EXPECT_EQ(config.monitor.interval_ms, 5000);
    EXPECT_EQ(config.log_level, "info");
    EXPECT_EQ(config.metrics_port, 9090);
}

TEST_F(ConfigLoadTest, PartialConfig) {
    const std::string config_content = R"(
governor:
  budget_ms: 40.0
)";
    createTestConfig("partial_config.yaml", config_content);

    AppConfig config = load_config((test_dir / "partial_config.yaml").string());
    EXPECT_DOUBLE_EQ(config.governor.budget_ms, 40.0);
    EXPECT_DOUBLE_EQ(config.governor.target_fps, 30.0);
    EXPECT_EQ(config.governor.max_memory_bytes, 200ull * 1024 * 1024);
}

TEST_F(ConfigLoadTest, UnknownQualityLevel) {
    const std::string config_content = R"(
quality:
  initial: extreme
)";
    createTestConfig("bad_quality.yaml", config_content);
    EXPECT_THROW(load_config((test_dir / "bad_quality.yaml").string()), std::invalid_argument);
}

TEST_F(ConfigLoadTest, MissingFile) {
    EXPECT_THROW(load_config((test_dir / "missing.yaml").string()), YAML::BadFile);
}

TEST_F(ConfigLoadTest, MalformedYaml) {
    createTestConfig("malformed.yaml", "governor: [unclosed");
    EXPECT_THROW(load_config((test_dir / "malformed.yaml").string()), YAML::Exception);
}

TEST(LogLevelTest, AppliesKnownLevels) {
    const auto before = spdlog::get_level();
    apply_log_level("error");
    EXPECT_EQ(spdlog::get_level(), spdlog::level::err);
    apply_log_level("bogus");
    EXPECT_EQ(spdlog::get_level(), spdlog::level::err);
    apply_log_level("debug");
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
    spdlog::set_level(before);
}
