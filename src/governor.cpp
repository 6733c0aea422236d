#include "governor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>

using namespace std::chrono;

namespace {

const GovernorProfile& validated(const GovernorProfile& p) {
  validate_profile(p);
  return p;
}

}  // namespace

FrameGovernor::FrameGovernor(const GovernorProfile& profile, IClock& clock, IMemoryProbe& probe)
    : clock_(clock),
      profile_(validated(profile)),
      quality_(profile.initial_quality),
      metrics_(profile.metrics_window, profile.log_window),
      throttle_(profile, clock, probe, metrics_),
      adaptive_(profile),
      store_(profile.buffer_capacity) {
  frame_skipping_ = profile.enable_frame_skipping;
  adaptive_enabled_ = profile.enable_adaptive_quality;
  perf_logging_ = profile.enable_performance_logging;
  target_fps_ = profile.target_fps;
  spdlog::info("Frame governor created - quality {}, budget {}ms, capacity {}",
               to_string(quality_.current()), profile.budget_ms, profile.buffer_capacity);
}

std::vector<Frame> FrameGovernor::configure(double target_fps, double budget_ms,
                                            uint64_t max_memory_bytes, size_t capacity) {
  GovernorProfile p = profile();
  p.target_fps = target_fps;
  p.budget_ms = budget_ms;
  p.max_memory_bytes = max_memory_bytes;
  p.buffer_capacity = capacity;
  return configure(p);
}

std::vector<Frame> FrameGovernor::configure(const GovernorProfile& p) {
  validate_profile(p);
  if (p.throttle_window > metrics_.window_capacity())
    throw std::invalid_argument("throttle_window cannot exceed the metrics window");

  {
    std::lock_guard<std::mutex> g(profile_mu_);
    profile_ = p;
  }
  frame_skipping_ = p.enable_frame_skipping;
  adaptive_enabled_ = p.enable_adaptive_quality;
  perf_logging_ = p.enable_performance_logging;
  target_fps_ = p.target_fps;
  throttle_.set_profile(p);
  adaptive_.set_profile(p);

  const std::vector<StoredFrame> evicted = store_.set_capacity(p.buffer_capacity);
  release_evicted(evicted);

  spdlog::info("Governor configured - target {} fps, budget {}ms, memory limit {}MB, capacity {}",
               p.target_fps, p.budget_ms, p.max_memory_bytes / (1024 * 1024), p.buffer_capacity);
  std::vector<Frame> frames;
  frames.reserve(evicted.size());
  for (const auto& e : evicted) frames.push_back(e.frame);
  return frames;
}

GovernorProfile FrameGovernor::profile() const {
  std::lock_guard<std::mutex> g(profile_mu_);
  return profile_;
}

void FrameGovernor::set_quality_level(QualityLevel level) {
  quality_.set(level);
  adaptive_.reset();
  spdlog::info("Quality level set to: {}", to_string(level));
}

bool FrameGovernor::should_admit(TimePoint now) {
  std::lock_guard<std::mutex> g(admit_mu_);
  return check_locked(now);
}

void FrameGovernor::begin_admission(TimePoint now) {
  std::lock_guard<std::mutex> g(admit_mu_);
  begin_locked(now);
}

bool FrameGovernor::try_admit(TimePoint now) {
  std::lock_guard<std::mutex> g(admit_mu_);
  if (!check_locked(now)) return false;
  begin_locked(now);
  return true;
}

bool FrameGovernor::check_locked(TimePoint now) {
  const QualitySettings& q = quality_.settings();
  if (frame_skipping_ && has_admitted_) {
    const double since_ms = duration<double, std::milli>(now - last_admitted_).count();
    if (since_ms < q.min_interval_ms) return false;
  }
  if (in_flight_ >= q.max_concurrent_analyzers) return false;
  if (throttle_.is_throttling()) return false;
  return true;
}

void FrameGovernor::begin_locked(TimePoint now) {
  last_admitted_ = now;
  has_admitted_ = true;
  ++in_flight_;
}

void FrameGovernor::release_slot() {
  std::lock_guard<std::mutex> g(admit_mu_);
  in_flight_ = std::max(0, in_flight_ - 1);
}

void FrameGovernor::end_analysis(double duration_ms) {
  release_slot();
  const double ms = std::max(0.0, duration_ms);

  if (metrics_.add_duration(ms) && perf_logging_) {
    spdlog::info("Avg processing time (last {} frames): {:.2f}ms", metrics_.log_window_size(),
                 metrics_.log_window_avg_ms());
  }
  throttle_.refresh_memory();
  throttle_.log_transition();

  if (adaptive_enabled_) {
    apply(adaptive_.on_analysis_complete(ms, quality_.current(), in_flight()));
  }
}

void FrameGovernor::apply(const QualityDecision& d) {
  switch (d.action) {
    case QualityAction::Decrease:
      if (quality_.decrease())
        spdlog::info("Quality decreased to: {} ({})", to_string(quality_.current()), d.reason);
      break;
    case QualityAction::Increase:
      if (quality_.increase())
        spdlog::info("Quality increased to: {} ({})", to_string(quality_.current()), d.reason);
      break;
    case QualityAction::Hold:
      break;
  }
}

void FrameGovernor::record_dropped_frame() { metrics_.inc_drop(); }

std::optional<Frame> FrameGovernor::buffer(const Frame& f, bool holds_slot) {
  auto evicted = store_.add(f, holds_slot);
  if (!evicted) return std::nullopt;
  release_evicted({*evicted});
  return evicted->frame;
}

void FrameGovernor::release_evicted(const std::vector<StoredFrame>& evicted) {
  if (evicted.empty()) return;
  for (const auto& e : evicted) {
    if (e.holds_slot) release_slot();
  }
  metrics_.inc_drop(evicted.size());
}

int FrameGovernor::in_flight() const {
  std::lock_guard<std::mutex> g(admit_mu_);
  return in_flight_;
}

GovernorSnapshot FrameGovernor::snapshot() {
  GovernorSnapshot s = metrics_.snapshot(target_fps_.load());
  s.memory_bytes = throttle_.refresh_memory();
  s.quality = quality_.current();
  s.throttling = throttle_.is_throttling();
  throttle_.log_transition();
  s.in_flight = in_flight();
  s.buffered_frames = store_.size();
  return s;
}

std::string FrameGovernor::prometheus_text() { return metrics_.prometheus_text(snapshot()); }

std::vector<Frame> FrameGovernor::reset() {
  std::vector<Frame> pending = store_.clear();
  metrics_.reset();
  adaptive_.reset();
  throttle_.reset();
  {
    std::lock_guard<std::mutex> g(admit_mu_);
    in_flight_ = 0;
    has_admitted_ = false;
    last_admitted_ = TimePoint{};
  }
  spdlog::info("Performance metrics reset ({} buffered frames released)", pending.size());
  return pending;
}
