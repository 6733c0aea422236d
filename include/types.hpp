#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;

enum class FramePriority { Low = 0, Normal = 1, High = 2 };

const char* to_string(FramePriority p);

// Metadata for a captured frame. Pixel memory belongs to the capture source;
// the governor only ever copies this struct.
struct Frame {
  uint64_t id{};
  TimePoint t_capture{};
  FramePriority priority{FramePriority::Normal};
  const void* pixels{nullptr};
};

enum class QualityLevel { Low = 0, Medium = 1, High = 2, Ultra = 3 };

struct GovernorProfile {
  double target_fps{30.0};
  double budget_ms{33.0};
  uint64_t max_memory_bytes{200ull * 1024 * 1024};
  size_t buffer_capacity{5};
  QualityLevel initial_quality{QualityLevel::High};

  bool enable_adaptive_quality{true};
  bool enable_frame_skipping{true};
  bool enable_resource_throttling{true};
  bool enable_performance_logging{true};

  double decrease_factor{1.2};
  double increase_factor{0.6};
  double throttle_factor{1.5};
  // Minimum age of the cached memory reading before the admission path re-samples it.
  double memory_sample_ms{100.0};

  size_t adaptive_window{30};
  size_t throttle_window{10};
  size_t metrics_window{100};
  size_t log_window{30};
};

// Throws std::invalid_argument describing the first bad field.
void validate_profile(const GovernorProfile& p);
