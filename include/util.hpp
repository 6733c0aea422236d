#pragma once
#include <string>

#include "analyzer.hpp"
#include "monitor.hpp"
#include "pipeline.hpp"
#include "types.hpp"

struct AppConfig {
  GovernorProfile governor;
  PipelineConfig pipeline;
  SimulationConfig simulation;
  MonitorConfig monitor;
  std::string log_level{"info"};
  int metrics_port{9090};
};

// Missing keys keep their defaults. Throws YAML::Exception on malformed input
// and std::invalid_argument on unknown enum values.
AppConfig load_config(const std::string& path);

// "debug", "info", "warn" or "error"; anything else leaves the level alone.
void apply_log_level(const std::string& level);
