#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <utility>

#include "types.hpp"

// Monotonic time source.
class IClock {
public:
  virtual ~IClock() = default;
  virtual TimePoint now() const = 0;
};

class SteadyClock : public IClock {
public:
  TimePoint now() const override { return Clock::now(); }
};

// Resident memory of the current process. Best effort: 0 when unavailable.
class IMemoryProbe {
public:
  virtual ~IMemoryProbe() = default;
  virtual uint64_t resident_memory_bytes() = 0;
};

// Reads the resident set size from /proc/self/statm.
class ProcMemoryProbe : public IMemoryProbe {
public:
  explicit ProcMemoryProbe(std::string statm_path = "/proc/self/statm")
      : path_(std::move(statm_path)) {}
  uint64_t resident_memory_bytes() override;

private:
  std::string path_;
  std::atomic<bool> failing_{false};
};
