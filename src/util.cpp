#include "util.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

#include "quality.hpp"

AppConfig load_config(const std::string& path) {
  YAML::Node y = YAML::LoadFile(path);
  AppConfig c{};

  if (y["governor"]) {
    auto n = y["governor"];
    if (n["target_fps"]) c.governor.target_fps = n["target_fps"].as<double>();
    if (n["budget_ms"]) c.governor.budget_ms = n["budget_ms"].as<double>();
    if (n["max_memory_mb"])
      c.governor.max_memory_bytes = n["max_memory_mb"].as<uint64_t>() * 1024 * 1024;
    if (n["buffer_capacity"]) c.governor.buffer_capacity = n["buffer_capacity"].as<size_t>();
    if (n["enable_adaptive_quality"])
      c.governor.enable_adaptive_quality = n["enable_adaptive_quality"].as<bool>();
    if (n["enable_frame_skipping"])
      c.governor.enable_frame_skipping = n["enable_frame_skipping"].as<bool>();
    if (n["enable_resource_throttling"])
      c.governor.enable_resource_throttling = n["enable_resource_throttling"].as<bool>();
    if (n["enable_performance_logging"])
      c.governor.enable_performance_logging = n["enable_performance_logging"].as<bool>();
  }
  if (y["quality"]) {
    auto n = y["quality"];
    if (n["initial"]) {
      const auto name = n["initial"].as<std::string>();
      auto level = parse_quality_level(name);
      if (!level) throw std::invalid_argument("unknown quality level: " + name);
      c.governor.initial_quality = *level;
    }
    if (n["decrease_factor"]) c.governor.decrease_factor = n["decrease_factor"].as<double>();
    if (n["increase_factor"]) c.governor.increase_factor = n["increase_factor"].as<double>();
    if (n["throttle_factor"]) c.governor.throttle_factor = n["throttle_factor"].as<double>();
    if (n["memory_sample_ms"]) c.governor.memory_sample_ms = n["memory_sample_ms"].as<double>();
    if (n["adaptive_window"]) c.governor.adaptive_window = n["adaptive_window"].as<size_t>();
    if (n["throttle_window"]) c.governor.throttle_window = n["throttle_window"].as<size_t>();
  }
  if (y["metrics"]) {
    auto n = y["metrics"];
    if (n["window"]) c.governor.metrics_window = n["window"].as<size_t>();
    if (n["log_window"]) c.governor.log_window = n["log_window"].as<size_t>();
  }
  if (y["monitor"]) {
    auto n = y["monitor"];
    if (n["interval_ms"]) c.monitor.interval_ms = n["interval_ms"].as<int>();
    if (n["drop_warn_pct"]) c.monitor.drop_warn_pct = n["drop_warn_pct"].as<double>();
    if (n["memory_warn_ratio"]) c.monitor.memory_warn_ratio = n["memory_warn_ratio"].as<double>();
    if (n["log_summary"]) c.monitor.log_summary = n["log_summary"].as<bool>();
  }
  if (y["simulation"]) {
    auto n = y["simulation"];
    if (n["width"]) c.pipeline.width = n["width"].as<int>();
    if (n["height"]) c.pipeline.height = n["height"].as<int>();
    if (n["fps"]) c.pipeline.fps = n["fps"].as<int>();
    if (n["workers"]) c.pipeline.workers = n["workers"].as<int>();
    if (n["high_priority_every"]) c.pipeline.high_priority_every = n["high_priority_every"].as<int>();
    if (n["low_priority_every"]) c.pipeline.low_priority_every = n["low_priority_every"].as<int>();
    if (n["count_rejections_as_drops"])
      c.pipeline.count_rejections_as_drops = n["count_rejections_as_drops"].as<bool>();
    if (n["ms_per_megapixel"]) c.simulation.ms_per_megapixel = n["ms_per_megapixel"].as<double>();
    if (n["fixed_cost_ms"]) c.simulation.fixed_cost_ms = n["fixed_cost_ms"].as<double>();
    if (n["jitter_ms"]) c.simulation.jitter_ms = n["jitter_ms"].as<double>();
    if (n["seed"]) c.simulation.seed = n["seed"].as<uint64_t>();
  }
  if (y["logging"] && y["logging"]["level"]) c.log_level = y["logging"]["level"].as<std::string>();
  if (y["telemetry"] && y["telemetry"]["metrics_port"])
    c.metrics_port = y["telemetry"]["metrics_port"].as<int>();

  return c;
}

void apply_log_level(const std::string& level) {
  if (level == "debug") {
    spdlog::set_level(spdlog::level::debug);
  } else if (level == "info") {
    spdlog::set_level(spdlog::level::info);
  } else if (level == "warn") {
    spdlog::set_level(spdlog::level::warn);
  } else if (level == "error") {
    spdlog::set_level(spdlog::level::err);
  }
}
