#include "controller.hpp"

#include <spdlog/fmt/fmt.h>

#include <numeric>

QualityDecision AdaptiveController::on_analysis_complete(double duration_ms, QualityLevel current,
                                                         int in_flight) {
  std::lock_guard<std::mutex> g(mu_);
  window_.push_back(duration_ms);
  while (window_.size() > profile_.adaptive_window) window_.pop_front();
  if (window_.size() < profile_.adaptive_window) {
    return {QualityAction::Hold, current, current, "warming up"};
  }

  const double avg =
      std::accumulate(window_.begin(), window_.end(), 0.0) / static_cast<double>(window_.size());
  QualityDecision d = evaluate_locked(avg, current, in_flight);
  if (d.action != QualityAction::Hold) window_.clear();
  return d;
}

QualityDecision AdaptiveController::evaluate(double avg_ms, QualityLevel current,
                                             int in_flight) const {
  std::lock_guard<std::mutex> g(mu_);
  return evaluate_locked(avg_ms, current, in_flight);
}

QualityDecision AdaptiveController::evaluate_locked(double avg_ms, QualityLevel current,
                                                    int in_flight) const {
  const double hi = profile_.budget_ms * profile_.decrease_factor;
  const double lo = profile_.budget_ms * profile_.increase_factor;
  const int cap = quality_settings(current).max_concurrent_analyzers;

  if (avg_ms > hi) {
    if (current == QualityLevel::Low) return {QualityAction::Hold, current, current, "at lowest"};
    auto next = static_cast<QualityLevel>(static_cast<int>(current) - 1);
    return {QualityAction::Decrease, current, next,
            fmt::format("avg {:.1f}ms above {:.1f}ms", avg_ms, hi)};
  }
  if (avg_ms < lo && in_flight < cap / 2) {
    if (current == QualityLevel::Ultra) return {QualityAction::Hold, current, current, "at highest"};
    auto next = static_cast<QualityLevel>(static_cast<int>(current) + 1);
    return {QualityAction::Increase, current, next,
            fmt::format("avg {:.1f}ms below {:.1f}ms", avg_ms, lo)};
  }
  return {QualityAction::Hold, current, current, "no-change"};
}

void AdaptiveController::set_profile(const GovernorProfile& p) {
  std::lock_guard<std::mutex> g(mu_);
  profile_ = p;
  while (window_.size() > profile_.adaptive_window) window_.pop_front();
}

void AdaptiveController::reset() {
  std::lock_guard<std::mutex> g(mu_);
  window_.clear();
}

size_t AdaptiveController::samples() const {
  std::lock_guard<std::mutex> g(mu_);
  return window_.size();
}
