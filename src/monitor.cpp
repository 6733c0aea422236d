#include "monitor.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <chrono>

#include "quality.hpp"

void GovernorMonitor::start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread([this] {
    std::unique_lock<std::mutex> lk(mu_);
    while (running_) {
      cv_.wait_for(lk, std::chrono::milliseconds(cfg_.interval_ms), [this] { return !running_; });
      if (!running_) break;
      lk.unlock();
      tick();
      lk.lock();
    }
  });
}

void GovernorMonitor::stop() {
  {
    std::lock_guard<std::mutex> g(mu_);
    if (!running_.exchange(false)) return;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

std::vector<std::string> GovernorMonitor::tick() {
  GovernorSnapshot s = gov_.snapshot();
  const auto warnings = check(s, gov_.profile().max_memory_bytes);
  for (const auto& w : warnings) spdlog::warn("{}", w);
  if (cfg_.log_summary) {
    spdlog::info("Governor: quality={} avg={:.2f}ms fps={:.1f} dropped={:.1f}% in_flight={} "
                 "buffered={} mem={}MB{}",
                 to_string(s.quality), s.avg_processing_ms, s.estimated_fps, s.dropped_pct,
                 s.in_flight, s.buffered_frames, s.memory_bytes / (1024 * 1024),
                 s.throttling ? " [throttling]" : "");
  }
  ticks_.fetch_add(1);
  return warnings;
}

std::vector<std::string> GovernorMonitor::check(const GovernorSnapshot& s,
                                                uint64_t max_memory_bytes) const {
  std::vector<std::string> out;
  if (s.dropped_pct > cfg_.drop_warn_pct) {
    out.push_back(fmt::format("High dropped frame rate: {:.1f}%", s.dropped_pct));
  }
  const double mem_limit = static_cast<double>(max_memory_bytes) * cfg_.memory_warn_ratio;
  if (static_cast<double>(s.memory_bytes) > mem_limit) {
    out.push_back(fmt::format("Memory usage approaching limit: {}MB of {}MB",
                              s.memory_bytes / (1024 * 1024), max_memory_bytes / (1024 * 1024)));
  }
  return out;
}
