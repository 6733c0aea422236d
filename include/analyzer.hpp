#pragma once
#include <cstdint>
#include <string>

#include "quality.hpp"
#include "types.hpp"

struct AnalysisResult {
  uint64_t frame_id{0};
  Resolution analyzed{};
  double score{0.0};
  std::string label;
};

// One per-frame analysis (exposure, focus, composition, ...). Implementations
// are shared between worker threads and must be safe to call concurrently.
class Analyzer {
public:
  virtual ~Analyzer() = default;
  virtual AnalysisResult analyze(const Frame& f, Resolution target) = 0;
  virtual std::string name() const = 0;
};

struct SimulationConfig {
  double ms_per_megapixel{20.0};
  double fixed_cost_ms{2.0};
  double jitter_ms{3.0};
  uint64_t seed{42};
};

// Stands in for a real analyzer: burns time proportional to the target
// resolution, with deterministic per-frame jitter.
class SimulatedAnalyzer : public Analyzer {
public:
  explicit SimulatedAnalyzer(SimulationConfig cfg) : cfg_(cfg) {}
  AnalysisResult analyze(const Frame& f, Resolution target) override;
  std::string name() const override { return "simulated"; }

  double cost_ms(const Frame& f, Resolution target) const;

private:
  SimulationConfig cfg_;
};
