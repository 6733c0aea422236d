#include "metrics.hpp"
#include <sstream>

#include "quality.hpp"

MetricsRegistry::MetricsRegistry(size_t window, size_t log_window)
    : durations_(window), log_window_(log_window), log_every_(std::max<size_t>(1, log_window)) {}

bool MetricsRegistry::add_duration(double ms) {
  durations_.add(ms);
  log_window_.add(ms);
  frames_total_.fetch_add(1, std::memory_order_relaxed);
  const auto done = completed_total_.fetch_add(1, std::memory_order_relaxed) + 1;
  return done % log_every_ == 0;
}

GovernorSnapshot MetricsRegistry::snapshot(double target_fps) const {
  GovernorSnapshot s{};
  s.avg_processing_ms = durations_.mean();
  s.p95_processing_ms = durations_.perc(95);
  s.estimated_fps = s.avg_processing_ms > 0 ? std::min(1000.0 / s.avg_processing_ms, target_fps) : 0.0;
  const auto total = frames_total_.load();
  const auto dropped = dropped_total_.load();
  s.frames_total = total;
  s.frames_dropped = dropped;
  s.dropped_pct = total ? (static_cast<double>(dropped) / static_cast<double>(total)) * 100.0 : 0.0;
  return s;
}

std::string MetricsRegistry::prometheus_text(const GovernorSnapshot& s) const {
  std::ostringstream os;
  os << "governor_processing_ms{stat=\"avg\"} " << s.avg_processing_ms << "\n";
  os << "governor_processing_ms{stat=\"p95\"} " << s.p95_processing_ms << "\n";
  os << "governor_estimated_fps " << s.estimated_fps << "\n";

  os << "governor_frames_total " << s.frames_total << "\n";
  os << "governor_frames_dropped_total " << s.frames_dropped << "\n";
  os << "governor_dropped_frame_percent " << s.dropped_pct << "\n";

  os << "governor_memory_bytes " << s.memory_bytes << "\n";
  os << "governor_quality_level{level=\"" << to_string(s.quality) << "\"} "
     << static_cast<int>(s.quality) << "\n";
  os << "governor_throttling " << (s.throttling ? 1 : 0) << "\n";
  os << "governor_in_flight " << s.in_flight << "\n";
  os << "governor_buffered_frames " << s.buffered_frames << "\n";
  return os.str();
}

void MetricsRegistry::reset() {
  durations_.clear();
  log_window_.clear();
  frames_total_.store(0);
  dropped_total_.store(0);
  completed_total_.store(0);
}
