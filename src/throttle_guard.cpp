#include "throttle_guard.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

const char* to_string(ThrottleCause c) {
  switch (c) {
    case ThrottleCause::Memory: return "memory";
    case ThrottleCause::Latency: return "latency";
    case ThrottleCause::None: break;
  }
  return "none";
}

namespace {

int64_t to_ns(TimePoint t) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
}

}  // namespace

ThrottleGuard::ThrottleGuard(const GovernorProfile& p, IClock& clock, IMemoryProbe& probe,
                             const MetricsRegistry& metrics)
    : clock_(clock), probe_(probe), metrics_(metrics) {
  set_profile(p);
  refresh_memory();
}

bool ThrottleGuard::is_throttling() {
  if (!enabled_.load(std::memory_order_relaxed)) return false;

  if (memory_is_stale()) refresh_memory();
  const uint64_t mem = memory_bytes_.load(std::memory_order_relaxed);
  const uint64_t mem_cap = max_memory_bytes_.load(std::memory_order_relaxed);
  const double avg = metrics_.recent_avg_ms(window_.load(std::memory_order_relaxed));
  const double limit = latency_limit_ms_.load(std::memory_order_relaxed);

  ThrottleCause c = ThrottleCause::None;
  if (mem > mem_cap) {
    c = ThrottleCause::Memory;
  } else if (avg > limit) {
    c = ThrottleCause::Latency;
  }
  const bool now = c != ThrottleCause::None;

  if (now && !throttling_.load()) {
    trip_memory_bytes_.store(mem);
    trip_avg_ms_.store(avg);
  }
  cause_.store(c);
  throttling_.store(now);
  return now;
}

bool ThrottleGuard::memory_is_stale() const {
  const int64_t age_ns = to_ns(clock_.now()) - sampled_at_ns_.load(std::memory_order_relaxed);
  return static_cast<double>(age_ns) >= memory_sample_ms_.load(std::memory_order_relaxed) * 1e6;
}

uint64_t ThrottleGuard::refresh_memory() {
  const uint64_t mem = probe_.resident_memory_bytes();
  memory_bytes_.store(mem, std::memory_order_relaxed);
  sampled_at_ns_.store(to_ns(clock_.now()), std::memory_order_relaxed);
  return mem;
}

bool ThrottleGuard::log_transition() {
  const bool now = throttling_.load();
  if (reported_.exchange(now) == now) return false;

  if (!now) {
    spdlog::info("Throttling cleared");
    return true;
  }
  const uint64_t mem_cap = max_memory_bytes_.load(std::memory_order_relaxed);
  if (trip_memory_bytes_.load() > mem_cap) {
    spdlog::warn("Throttling: memory usage too high: {}MB (limit {}MB)",
                 trip_memory_bytes_.load() / (1024 * 1024), mem_cap / (1024 * 1024));
  } else {
    spdlog::warn("Throttling: processing time too high: {:.1f}ms (limit {:.1f}ms)",
                 trip_avg_ms_.load(), latency_limit_ms_.load());
  }
  return true;
}

void ThrottleGuard::set_profile(const GovernorProfile& p) {
  enabled_.store(p.enable_resource_throttling);
  max_memory_bytes_.store(p.max_memory_bytes);
  latency_limit_ms_.store(p.budget_ms * p.throttle_factor);
  window_.store(p.throttle_window);
  memory_sample_ms_.store(p.memory_sample_ms);
}

void ThrottleGuard::reset() {
  throttling_.store(false);
  cause_.store(ThrottleCause::None);
}
