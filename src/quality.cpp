#include "quality.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

namespace {

const std::array<QualitySettings, 4> kLevels{{
    {QualityLevel::Low, {320, 240}, 2, 1000.0 / 10.0},
    {QualityLevel::Medium, {640, 480}, 3, 1000.0 / 15.0},
    {QualityLevel::High, {1280, 720}, 4, 1000.0 / 20.0},
    {QualityLevel::Ultra, {1920, 1080}, 6, 1000.0 / 30.0},
}};

}  // namespace

const QualitySettings& quality_settings(QualityLevel level) {
  return kLevels[static_cast<size_t>(level)];
}

const char* to_string(QualityLevel level) {
  switch (level) {
    case QualityLevel::Low:
      return "low";
    case QualityLevel::Medium:
      return "medium";
    case QualityLevel::High:
      return "high";
    case QualityLevel::Ultra:
      return "ultra";
  }
  return "high";
}

std::optional<QualityLevel> parse_quality_level(const std::string& name) {
  std::string s(name);
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (s == "low") return QualityLevel::Low;
  if (s == "medium") return QualityLevel::Medium;
  if (s == "high") return QualityLevel::High;
  if (s == "ultra") return QualityLevel::Ultra;
  return std::nullopt;
}

Resolution fit_to_target(int width, int height, QualityLevel level) {
  const Resolution target = quality_settings(level).target;
  if (width <= 0 || height <= 0) return {0, 0};
  if (width <= target.width && height <= target.height) return {width, height};

  const double scale = std::min(static_cast<double>(target.width) / width,
                                static_cast<double>(target.height) / height);
  const int w = std::max(1, static_cast<int>(std::lround(width * scale)));
  const int h = std::max(1, static_cast<int>(std::lround(height * scale)));
  return {std::min(w, target.width), std::min(h, target.height)};
}

bool QualityStateMachine::increase() { return step(+1); }

bool QualityStateMachine::decrease() { return step(-1); }

bool QualityStateMachine::step(int delta) {
  QualityLevel cur = level_.load(std::memory_order_acquire);
  for (;;) {
    const int next = static_cast<int>(cur) + delta;
    if (next < static_cast<int>(QualityLevel::Low) || next > static_cast<int>(QualityLevel::Ultra))
      return false;
    if (level_.compare_exchange_weak(cur, static_cast<QualityLevel>(next),
                                     std::memory_order_acq_rel))
      return true;
  }
}
