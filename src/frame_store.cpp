#include "frame_store.hpp"

#include <algorithm>

namespace {

// Strict "a ranks below b": lower priority, then older capture, then earlier insert.
template <typename E>
bool ranks_below(const E& a, const E& b) {
  if (a.frame.priority != b.frame.priority) return a.frame.priority < b.frame.priority;
  if (a.frame.t_capture != b.frame.t_capture) return a.frame.t_capture < b.frame.t_capture;
  return a.seq < b.seq;
}

}  // namespace

PriorityFrameStore::PriorityFrameStore(size_t capacity) : capacity_(std::max<size_t>(1, capacity)) {
  entries_.reserve(capacity_ + 1);
}

std::optional<StoredFrame> PriorityFrameStore::add(const Frame& f, bool holds_slot) {
  std::lock_guard<std::mutex> g(mu_);
  entries_.push_back({f, holds_slot, next_seq_++});
  if (entries_.size() <= capacity_) return std::nullopt;
  Entry e = remove_locked(evict_index_locked());
  return StoredFrame{e.frame, e.holds_slot};
}

std::optional<Frame> PriorityFrameStore::take_next() {
  std::lock_guard<std::mutex> g(mu_);
  if (entries_.empty()) return std::nullopt;
  auto it = std::max_element(entries_.begin(), entries_.end(),
                             [](const Entry& a, const Entry& b) { return ranks_below(a, b); });
  return remove_locked(static_cast<size_t>(it - entries_.begin())).frame;
}

size_t PriorityFrameStore::size() const {
  std::lock_guard<std::mutex> g(mu_);
  return entries_.size();
}

size_t PriorityFrameStore::capacity() const {
  std::lock_guard<std::mutex> g(mu_);
  return capacity_;
}

std::vector<StoredFrame> PriorityFrameStore::set_capacity(size_t capacity) {
  std::lock_guard<std::mutex> g(mu_);
  capacity_ = std::max<size_t>(1, capacity);
  std::vector<StoredFrame> evicted;
  while (entries_.size() > capacity_) {
    Entry e = remove_locked(evict_index_locked());
    evicted.push_back({e.frame, e.holds_slot});
  }
  return evicted;
}

std::vector<Frame> PriorityFrameStore::clear() {
  std::lock_guard<std::mutex> g(mu_);
  std::vector<Frame> out;
  out.reserve(entries_.size());
  for (const auto& e : entries_) out.push_back(e.frame);
  entries_.clear();
  return out;
}

size_t PriorityFrameStore::evict_index_locked() const {
  auto it = std::min_element(entries_.begin(), entries_.end(),
                             [](const Entry& a, const Entry& b) { return ranks_below(a, b); });
  return static_cast<size_t>(it - entries_.begin());
}

PriorityFrameStore::Entry PriorityFrameStore::remove_locked(size_t idx) {
  Entry e = entries_[idx];
  entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(idx));
  return e;
}
