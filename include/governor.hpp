#pragma once
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "controller.hpp"
#include "frame_store.hpp"
#include "metrics.hpp"
#include "platform.hpp"
#include "quality.hpp"
#include "throttle_guard.hpp"
#include "types.hpp"

// Frame admission and adaptive-quality governor. Owned by the capture
// pipeline and handed to collaborators by reference.
//
// Locking: the frame store, the admission counters and each metric window
// have their own mutex; the quality level is atomic. No call holds a lock
// longer than the bookkeeping it protects.
class FrameGovernor {
public:
  // Throws std::invalid_argument if the profile is invalid.
  FrameGovernor(const GovernorProfile& profile, IClock& clock, IMemoryProbe& probe);

  // Frames evicted by a capacity reduction are returned for release. Throws
  // std::invalid_argument and keeps the previous configuration on bad input.
  // metrics_window and log_window only take effect at construction.
  std::vector<Frame> configure(double target_fps, double budget_ms, uint64_t max_memory_bytes,
                               size_t capacity);
  std::vector<Frame> configure(const GovernorProfile& profile);
  GovernorProfile profile() const;

  void set_quality_level(QualityLevel level);
  QualityLevel quality_level() const { return quality_.current(); }
  const QualitySettings& current_settings() const { return quality_.settings(); }

  // Pure admission check: interval, concurrency cap, throttling.
  bool should_admit(TimePoint now);
  bool should_admit() { return should_admit(clock_.now()); }
  // Records an admission: stamps the interval clock and takes an in-flight slot.
  void begin_admission(TimePoint now);
  void begin_admission() { begin_admission(clock_.now()); }
  // should_admit + begin_admission under one lock.
  bool try_admit(TimePoint now);
  bool try_admit() { return try_admit(clock_.now()); }
  // Releases the in-flight slot (never below zero) and feeds the duration to
  // the metrics and the adaptive controller.
  void end_analysis(double duration_ms);
  // Admission rejections count as drops only when the host reports them here.
  void record_dropped_frame();

  // Buffers a frame that holds no admission slot. An evicted frame counts as
  // dropped.
  std::optional<Frame> add_frame(const Frame& f) { return buffer(f, false); }
  // Buffers a frame admitted by try_admit() or begin_admission(). If it is
  // evicted before it runs, its in-flight slot is given back.
  std::optional<Frame> add_admitted_frame(const Frame& f) { return buffer(f, true); }
  std::optional<Frame> take_next_frame() { return store_.take_next(); }
  size_t buffered_frames() const { return store_.size(); }

  int in_flight() const;
  bool is_throttling() { return throttle_.is_throttling(); }
  ThrottleCause throttle_cause() const { return throttle_.cause(); }
  uint64_t refresh_resource_usage() { return throttle_.refresh_memory(); }

  GovernorSnapshot snapshot();
  std::string prometheus_text();

  // Clears counters, windows and the store; the quality level is kept.
  // Returns the frames that were buffered.
  std::vector<Frame> reset();

  const MetricsRegistry& metrics() const { return metrics_; }

private:
  bool check_locked(TimePoint now);
  void begin_locked(TimePoint now);
  void release_slot();
  std::optional<Frame> buffer(const Frame& f, bool holds_slot);
  void release_evicted(const std::vector<StoredFrame>& evicted);
  void apply(const QualityDecision& d);

  IClock& clock_;

  mutable std::mutex profile_mu_;
  GovernorProfile profile_;
  std::atomic<bool> frame_skipping_{true};
  std::atomic<bool> adaptive_enabled_{true};
  std::atomic<bool> perf_logging_{true};
  std::atomic<double> target_fps_{30.0};

  QualityStateMachine quality_;
  MetricsRegistry metrics_;
  ThrottleGuard throttle_;
  AdaptiveController adaptive_;
  PriorityFrameStore store_;

  mutable std::mutex admit_mu_;
  int in_flight_{0};
  bool has_admitted_{false};
  TimePoint last_admitted_{};
};
