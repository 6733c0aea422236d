#include "analyzer.hpp"

#include <algorithm>
#include <chrono>
#include <random>
#include <thread>

double SimulatedAnalyzer::cost_ms(const Frame& f, Resolution target) const {
  const double mp = static_cast<double>(target.width) * target.height / 1.0e6;
  std::mt19937_64 rng(cfg_.seed ^ (f.id * 0x9E3779B97F4A7C15ull));
  std::uniform_real_distribution<double> jitter(-cfg_.jitter_ms, cfg_.jitter_ms);
  const double j = cfg_.jitter_ms > 0 ? jitter(rng) : 0.0;
  return std::max(0.0, cfg_.fixed_cost_ms + mp * cfg_.ms_per_megapixel + j);
}

AnalysisResult SimulatedAnalyzer::analyze(const Frame& f, Resolution target) {
  const double ms = cost_ms(f, target);
  std::this_thread::sleep_for(std::chrono::duration<double, std::milli>(ms));

  AnalysisResult r;
  r.frame_id = f.id;
  r.analyzed = target;
  r.score = ms;
  r.label = name();
  return r;
}
