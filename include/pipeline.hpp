#pragma once
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

#include "analyzer.hpp"
#include "governor.hpp"
#include "types.hpp"

struct PipelineConfig {
  int width{1920};
  int height{1080};
  int fps{30};
  int workers{6};
  int high_priority_every{10};  // every Nth frame is High, 0 disables
  int low_priority_every{3};    // every Nth frame is Low, 0 disables
  bool count_rejections_as_drops{true};
};

// Synthetic capture source plus analyzer worker pool, wired through a
// governor it borrows. Stands in for the camera pipeline that owns the
// governor in the real application.
class Pipeline {
public:
  Pipeline(PipelineConfig cfg, FrameGovernor& gov, Analyzer& analyzer);
  ~Pipeline() { stop(); }
  void start();  // Start capture and worker threads
  void stop();   // Stop and join threads
  bool running() const { return running_.load(); }

  uint64_t frames_produced() const { return produced_.load(); }
  uint64_t frames_admitted() const { return admitted_.load(); }
  uint64_t frames_analyzed() const { return analyzed_.load(); }

  FramePriority priority_for(uint64_t frame_id) const;

private:
  void capture_loop();
  void worker_loop();

  PipelineConfig cfg_;
  FrameGovernor& gov_;
  Analyzer& analyzer_;

  std::mutex work_mu_;
  std::condition_variable work_cv_;

  std::atomic<bool> running_{false};
  std::atomic<uint64_t> produced_{0};
  std::atomic<uint64_t> admitted_{0};
  std::atomic<uint64_t> analyzed_{0};
  std::thread capture_thread_;
  std::vector<std::thread> workers_;
};
