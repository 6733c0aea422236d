#pragma once
#include <deque>
#include <mutex>
#include <string>

#include "quality.hpp"
#include "types.hpp"

enum class QualityAction { Hold, Increase, Decrease };

struct QualityDecision {
  QualityAction action{QualityAction::Hold};
  QualityLevel from{QualityLevel::High};
  QualityLevel to{QualityLevel::High};
  std::string reason;
};

// Slow feedback loop: trims quality one level at a time from a full window of
// completed-analysis durations. The window restarts after every transition so
// each level is judged only on samples taken at that level.
class AdaptiveController {
public:
  explicit AdaptiveController(GovernorProfile p) : profile_(p) {}

  // Records one duration and returns the transition to apply, if any.
  QualityDecision on_analysis_complete(double duration_ms, QualityLevel current, int in_flight);
  // Evaluates a mean against the band without touching the window.
  QualityDecision evaluate(double avg_ms, QualityLevel current, int in_flight) const;

  void set_profile(const GovernorProfile& p);
  void reset();
  size_t samples() const;

private:
  QualityDecision evaluate_locked(double avg_ms, QualityLevel current, int in_flight) const;

  mutable std::mutex mu_;
  GovernorProfile profile_;
  std::deque<double> window_;
};
