#include "pipeline.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include "quality.hpp"

using namespace std::chrono;

Pipeline::Pipeline(PipelineConfig cfg, FrameGovernor& gov, Analyzer& analyzer)
    : cfg_(cfg), gov_(gov), analyzer_(analyzer) {
  if (cfg_.fps <= 0) throw std::invalid_argument("pipeline fps must be positive");
  if (cfg_.workers <= 0) throw std::invalid_argument("pipeline needs at least one worker");
}

FramePriority Pipeline::priority_for(uint64_t frame_id) const {
  if (cfg_.high_priority_every > 0 && frame_id % cfg_.high_priority_every == 0)
    return FramePriority::High;
  if (cfg_.low_priority_every > 0 && frame_id % cfg_.low_priority_every == 0)
    return FramePriority::Low;
  return FramePriority::Normal;
}

void Pipeline::start() {
  if (running_.exchange(true)) return;
  spdlog::info("Starting pipeline: {}x{} @ {} fps, {} workers, analyzer '{}'", cfg_.width,
               cfg_.height, cfg_.fps, cfg_.workers, analyzer_.name());
  for (int i = 0; i < cfg_.workers; ++i) workers_.emplace_back([this] { worker_loop(); });
  capture_thread_ = std::thread([this] { capture_loop(); });
}

void Pipeline::stop() {
  {
    std::lock_guard<std::mutex> g(work_mu_);
    if (!running_.exchange(false)) return;
  }
  work_cv_.notify_all();
  if (capture_thread_.joinable()) capture_thread_.join();
  for (auto& w : workers_) {
    if (w.joinable()) w.join();
  }
  workers_.clear();
  spdlog::info("Pipeline stopped: produced {}, admitted {}, analyzed {}, {} left buffered",
               produced_.load(), admitted_.load(), analyzed_.load(), gov_.buffered_frames());
}

void Pipeline::capture_loop() {
  const auto period = duration_cast<Clock::duration>(duration<double>(1.0 / cfg_.fps));
  auto next_tick = Clock::now();
  uint64_t frame_id = 0;

  while (running_) {
    Frame f;
    f.id = frame_id++;
    f.t_capture = Clock::now();
    f.priority = priority_for(f.id);
    produced_.fetch_add(1);

    if (gov_.try_admit(f.t_capture)) {
      admitted_.fetch_add(1);
      if (auto evicted = gov_.add_admitted_frame(f)) {
        spdlog::debug("Capture released evicted frame {}", evicted->id);
      }
      work_cv_.notify_one();
    } else if (cfg_.count_rejections_as_drops) {
      gov_.record_dropped_frame();
    }

    next_tick += period;
    std::this_thread::sleep_until(next_tick);
  }
}

void Pipeline::worker_loop() {
  while (running_) {
    {
      std::unique_lock<std::mutex> lk(work_mu_);
      work_cv_.wait_for(lk, milliseconds(20),
                        [this] { return !running_ || gov_.buffered_frames() > 0; });
    }
    if (!running_) break;

    auto next = gov_.take_next_frame();
    if (!next) continue;

    const Resolution target = fit_to_target(cfg_.width, cfg_.height, gov_.quality_level());
    const auto t0 = Clock::now();
    AnalysisResult r = analyzer_.analyze(*next, target);
    const double ms = duration<double, std::milli>(Clock::now() - t0).count();
    gov_.end_analysis(ms);
    analyzed_.fetch_add(1);
    spdlog::debug("Frame {} analyzed at {}x{} in {:.2f}ms", r.frame_id, r.analyzed.width,
                  r.analyzed.height, ms);
  }
}
