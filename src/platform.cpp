#include "platform.hpp"

#include <spdlog/spdlog.h>
#include <unistd.h>

#include <fstream>

uint64_t ProcMemoryProbe::resident_memory_bytes() {
  std::ifstream in(path_);
  uint64_t size_pages = 0, resident_pages = 0;
  const long page = ::sysconf(_SC_PAGESIZE);
  if (!in || !(in >> size_pages >> resident_pages) || page <= 0) {
    // Log once per failure streak.
    if (!failing_.exchange(true)) spdlog::debug("Resident memory query failed ({})", path_);
    return 0;
  }
  if (failing_.exchange(false)) spdlog::debug("Resident memory query recovered");
  return resident_pages * static_cast<uint64_t>(page);
}
