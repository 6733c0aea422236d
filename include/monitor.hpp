#pragma once
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "governor.hpp"
#include "metrics.hpp"

struct MonitorConfig {
  int interval_ms{5000};
  double drop_warn_pct{10.0};
  double memory_warn_ratio{0.8};
  bool log_summary{true};
};

// Periodic health check. Runs on its own thread so snapshot work and logging
// stay off the capture path.
class GovernorMonitor {
public:
  GovernorMonitor(FrameGovernor& gov, MonitorConfig cfg) : gov_(gov), cfg_(cfg) {}
  ~GovernorMonitor() { stop(); }

  void start();
  void stop();
  bool running() const { return running_.load(); }

  // One check: pulls a snapshot and logs. Returns the warnings raised.
  std::vector<std::string> tick();
  std::vector<std::string> check(const GovernorSnapshot& s, uint64_t max_memory_bytes) const;
  uint64_t ticks() const { return ticks_.load(); }

private:
  FrameGovernor& gov_;
  MonitorConfig cfg_;

  std::mutex mu_;
  std::condition_variable cv_;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> ticks_{0};
  std::thread thread_;
};
