#include "types.hpp"

#include <stdexcept>

const char* to_string(FramePriority p) {
  switch (p) {
    case FramePriority::Low:
      return "low";
    case FramePriority::Normal:
      return "normal";
    case FramePriority::High:
      return "high";
  }
  return "normal";
}

void validate_profile(const GovernorProfile& p) {
  if (!(p.target_fps > 0.0)) throw std::invalid_argument("target_fps must be positive");
  if (!(p.budget_ms > 0.0)) throw std::invalid_argument("budget_ms must be positive");
  if (p.max_memory_bytes == 0) throw std::invalid_argument("max_memory_bytes must be non-zero");
  if (p.buffer_capacity == 0) throw std::invalid_argument("buffer_capacity must be non-zero");
  if (!(p.increase_factor > 0.0) || !(p.increase_factor < p.decrease_factor))
    throw std::invalid_argument("increase_factor must be positive and below decrease_factor");
  if (!(p.throttle_factor > 0.0)) throw std::invalid_argument("throttle_factor must be positive");
  if (!(p.memory_sample_ms >= 0.0))
    throw std::invalid_argument("memory_sample_ms must not be negative");
  if (p.adaptive_window == 0 || p.throttle_window == 0 || p.metrics_window == 0 ||
      p.log_window == 0)
    throw std::invalid_argument("window sizes must be non-zero");
  if (p.throttle_window > p.metrics_window)
    throw std::invalid_argument("throttle_window cannot exceed metrics_window");
}
