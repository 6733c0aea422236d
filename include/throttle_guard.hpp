#pragma once
#include <atomic>
#include <cstdint>

#include "metrics.hpp"
#include "platform.hpp"
#include "types.hpp"

enum class ThrottleCause : uint8_t { None = 0, Memory = 1, Latency = 2 };

const char* to_string(ThrottleCause c);

// Emergency brake: trips while resident memory is above the ceiling or the
// short-window mean latency is above budget * throttle_factor.
//
// is_throttling() runs on the capture path: it re-samples memory at most once
// per memory_sample_ms of the injected clock and never logs. State changes are
// logged by log_transition(), called from worker and monitor threads.
class ThrottleGuard {
public:
  ThrottleGuard(const GovernorProfile& p, IClock& clock, IMemoryProbe& probe,
                const MetricsRegistry& metrics);

  bool is_throttling();
  uint64_t refresh_memory();
  uint64_t memory_bytes() const { return memory_bytes_.load(std::memory_order_relaxed); }
  ThrottleCause cause() const { return cause_.load(); }

  // Logs the entry into or exit from throttling since the last call. Returns
  // true if a line was logged.
  bool log_transition();

  void set_profile(const GovernorProfile& p);
  void reset();

private:
  bool memory_is_stale() const;

  IClock& clock_;
  IMemoryProbe& probe_;
  const MetricsRegistry& metrics_;

  std::atomic<bool> enabled_{true};
  std::atomic<uint64_t> max_memory_bytes_{0};
  std::atomic<double> latency_limit_ms_{0.0};
  std::atomic<size_t> window_{10};
  std::atomic<double> memory_sample_ms_{100.0};

  std::atomic<uint64_t> memory_bytes_{0};
  std::atomic<int64_t> sampled_at_ns_{0};

  std::atomic<bool> throttling_{false};
  std::atomic<bool> reported_{false};
  std::atomic<ThrottleCause> cause_{ThrottleCause::None};
  std::atomic<double> trip_avg_ms_{0.0};
  std::atomic<uint64_t> trip_memory_bytes_{0};
};
