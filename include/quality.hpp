#pragma once
#include <atomic>
#include <optional>
#include <string>

#include "types.hpp"

struct Resolution {
  int width{0};
  int height{0};
};

// Fixed per-level configuration. Lower levels analyze smaller frames, fewer
// at a time, less often.
struct QualitySettings {
  QualityLevel level{QualityLevel::High};
  Resolution target{};
  int max_concurrent_analyzers{0};
  double min_interval_ms{0.0};
};

const QualitySettings& quality_settings(QualityLevel level);
const char* to_string(QualityLevel level);
std::optional<QualityLevel> parse_quality_level(const std::string& name);

// Aspect-preserving downscale of a (width x height) frame into the level's
// target resolution. Frames already inside the target are returned as is.
Resolution fit_to_target(int width, int height, QualityLevel level);

// Low < Medium < High < Ultra, single-step transitions only.
class QualityStateMachine {
public:
  explicit QualityStateMachine(QualityLevel initial = QualityLevel::High) : level_(initial) {}

  QualityLevel current() const { return level_.load(std::memory_order_acquire); }
  const QualitySettings& settings() const { return quality_settings(current()); }

  // Both return false (and change nothing) at the end of the range.
  bool increase();
  bool decrease();
  void set(QualityLevel level) { level_.store(level, std::memory_order_release); }

private:
  bool step(int delta);

  std::atomic<QualityLevel> level_;
};
