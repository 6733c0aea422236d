#pragma once
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "types.hpp"

class RollingWindow {
public:
  explicit RollingWindow(size_t cap = 100) : cap_(std::max<size_t>(1, cap)) {}
  void add(double x) {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.size() == cap_) vals_.pop_front();
    vals_.push_back(x);
  }
  // Mean of the whole window, 0 when empty.
  double mean() const { return mean_last(cap_); }
  // Mean of the newest n samples (fewer if the window is shorter), 0 when empty.
  double mean_last(size_t n) const {
    std::lock_guard<std::mutex> g(mu_);
    const size_t k = std::min(n, vals_.size());
    if (k == 0) return 0.0;
    double sum = 0.0;
    for (auto it = vals_.end() - static_cast<std::ptrdiff_t>(k); it != vals_.end(); ++it) sum += *it;
    return sum / static_cast<double>(k);
  }
  // Percentile p in [0,100]
  double perc(double p) const {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.empty()) return 0.0;
    std::vector<double> v(vals_.begin(), vals_.end());
    std::sort(v.begin(), v.end());
    double rank = (p / 100.0) * static_cast<double>(v.size() - 1);
    size_t lo = static_cast<size_t>(rank);
    size_t hi = std::min(v.size() - 1, lo + 1);
    double frac = rank - static_cast<double>(lo);
    return v[lo] + (v[hi] - v[lo]) * frac;
  }
  size_t size() const {
    std::lock_guard<std::mutex> g(mu_);
    return vals_.size();
  }
  size_t capacity() const { return cap_; }
  bool full() const { return size() == cap_; }
  void clear() {
    std::lock_guard<std::mutex> g(mu_);
    vals_.clear();
  }

private:
  size_t cap_;
  mutable std::mutex mu_;
  std::deque<double> vals_;
};

struct GovernorSnapshot {
  double avg_processing_ms{0};
  double p95_processing_ms{0};
  double estimated_fps{0};
  double dropped_pct{0};
  uint64_t memory_bytes{0};
  QualityLevel quality{QualityLevel::High};
  bool throttling{false};
  int in_flight{0};
  uint64_t frames_total{0};
  uint64_t frames_dropped{0};
  size_t buffered_frames{0};
};

// Rolling processing-time windows plus frame outcome counters. Pure
// bookkeeping: memory, quality and admission state are filled in by the owner.
class MetricsRegistry {
public:
  explicit MetricsRegistry(size_t window = 100, size_t log_window = 30);

  // Returns true when a periodic log line is due (every log_window-th completion).
  bool add_duration(double ms);
  void inc_drop(uint64_t n = 1) {
    dropped_total_.fetch_add(n, std::memory_order_relaxed);
    frames_total_.fetch_add(n, std::memory_order_relaxed);
  }

  uint64_t frames_total() const { return frames_total_.load(std::memory_order_relaxed); }
  uint64_t dropped_total() const { return dropped_total_.load(std::memory_order_relaxed); }
  uint64_t completed_total() const { return completed_total_.load(std::memory_order_relaxed); }

  double avg_ms() const { return durations_.mean(); }
  double recent_avg_ms(size_t n) const { return durations_.mean_last(n); }
  double log_window_avg_ms() const { return log_window_.mean(); }
  size_t samples() const { return durations_.size(); }
  size_t window_capacity() const { return durations_.capacity(); }
  size_t log_window_size() const { return log_window_.capacity(); }

  // Timing and counter fields only.
  GovernorSnapshot snapshot(double target_fps) const;
  std::string prometheus_text(const GovernorSnapshot& s) const;

  void reset();

private:
  RollingWindow durations_;
  RollingWindow log_window_;
  size_t log_every_;
  std::atomic<uint64_t> frames_total_{0};
  std::atomic<uint64_t> dropped_total_{0};
  std::atomic<uint64_t> completed_total_{0};
};
