#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

#include "types.hpp"

// A buffered frame. holds_slot marks a frame that took an admission slot
// before it was buffered; the slot must be given back if the frame is evicted.
struct StoredFrame {
  Frame frame;
  bool holds_slot{false};
};

// Bounded, thread-safe store of pending frames. Over capacity, the entry with
// the lowest priority (oldest capture time on ties) is evicted. take_next()
// serves the highest priority, most recent entry; freshness wins over arrival
// order.
class PriorityFrameStore {
public:
  explicit PriorityFrameStore(size_t capacity = 5);

  // Returns the evicted frame, if the insert pushed the store over capacity.
  // The evicted frame may be the one just added.
  std::optional<StoredFrame> add(const Frame& f, bool holds_slot = false);
  std::optional<Frame> take_next();

  size_t size() const;
  size_t capacity() const;
  // Shrinking evicts surplus entries in eviction order and returns them.
  std::vector<StoredFrame> set_capacity(size_t capacity);
  // Returns the frames that were pending so the caller can release them.
  std::vector<Frame> clear();

private:
  struct Entry {
    Frame frame;
    bool holds_slot;
    uint64_t seq;  // insertion order, breaks exact timestamp ties
  };

  size_t evict_index_locked() const;
  Entry remove_locked(size_t idx);

  mutable std::mutex mu_;
  std::vector<Entry> entries_;
  size_t capacity_;
  uint64_t next_seq_{0};
};
