#pragma once
#include "instrument-bench/Errors.hpp"

#include <algorithm>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace instbench {

template <typename T> struct ElementSize {
  size_t operator()(const T &) const { return sizeof(T); }
};

/// Fixed-capacity FIFO. A push into a full buffer evicts the oldest element.
/// Every operation takes the buffer's own reentrant lock.
template <typename T, typename SizeOf = ElementSize<T>> class RingBuffer {
public:
  explicit RingBuffer(size_t capacity) : slots_(checked(capacity)) {}

  RingBuffer(const RingBuffer &) = delete;
  RingBuffer &operator=(const RingBuffer &) = delete;

  /// Returns the evicted element, if any
  std::optional<T> push(T item) {
    std::lock_guard lock(mutex_);
    std::optional<T> evicted;
    size_t tail = (head_ + count_) % slots_.size();
    if (count_ == slots_.size()) {
      evicted = std::move(slots_[head_]);
      bytes_ -= size_of_(*evicted);
      head_ = (head_ + 1) % slots_.size();
      tail = (head_ + count_ - 1) % slots_.size();
      ++evicted_;
    } else {
      ++count_;
    }
    bytes_ += size_of_(item);
    slots_[tail] = std::move(item);
    ++pushed_;
    return evicted;
  }

  size_t size() const {
    std::lock_guard lock(mutex_);
    return count_;
  }

  size_t capacity() const {
    std::lock_guard lock(mutex_);
    return slots_.size();
  }

  bool empty() const { return size() == 0; }

  bool full() const {
    std::lock_guard lock(mutex_);
    return count_ == slots_.size();
  }

  void clear() {
    std::lock_guard lock(mutex_);
    for (auto &slot : slots_) {
      slot.reset();
    }
    head_ = 0;
    count_ = 0;
    bytes_ = 0;
  }

  /// Oldest first
  std::vector<T> snapshot() const { return recent(size()); }

  /// The newest n elements, oldest first
  std::vector<T> recent(size_t n) const {
    std::lock_guard lock(mutex_);
    n = std::min(n, count_);
    std::vector<T> out;
    out.reserve(n);
    for (size_t i = count_ - n; i < count_; ++i) {
      out.push_back(*slots_[(head_ + i) % slots_.size()]);
    }
    return out;
  }

  std::optional<T> oldest() const {
    std::lock_guard lock(mutex_);
    if (count_ == 0) {
      return std::nullopt;
    }
    return slots_[head_];
  }

  std::optional<T> newest() const {
    std::lock_guard lock(mutex_);
    if (count_ == 0) {
      return std::nullopt;
    }
    return slots_[(head_ + count_ - 1) % slots_.size()];
  }

  /// Elements matching pred, oldest first, at most max_count of them
  template <typename Pred>
  std::vector<T> select(Pred pred, size_t max_count = SIZE_MAX) const {
    std::lock_guard lock(mutex_);
    std::vector<T> out;
    for (size_t i = 0; i < count_ && out.size() < max_count; ++i) {
      const T &item = *slots_[(head_ + i) % slots_.size()];
      if (pred(item)) {
        out.push_back(item);
      }
    }
    return out;
  }

  /// Keeps the newest elements that fit; returns how many were dropped
  size_t resize(size_t new_capacity) {
    checked(new_capacity);
    std::lock_guard lock(mutex_);
    if (new_capacity == slots_.size()) {
      return 0;
    }
    size_t keep = std::min(count_, new_capacity);
    size_t dropped = count_ - keep;

    std::vector<std::optional<T>> next(new_capacity);
    size_t bytes = 0;
    for (size_t i = 0; i < keep; ++i) {
      auto &slot = slots_[(head_ + dropped + i) % slots_.size()];
      bytes += size_of_(*slot);
      next[i] = std::move(slot);
    }
    slots_ = std::move(next);
    head_ = 0;
    count_ = keep;
    bytes_ = bytes;
    evicted_ += dropped;
    return dropped;
  }

  /// Estimated footprint of the stored elements
  size_t memory_bytes() const {
    std::lock_guard lock(mutex_);
    return bytes_ + slots_.size() * sizeof(std::optional<T>);
  }

  uint64_t total_pushed() const {
    std::lock_guard lock(mutex_);
    return pushed_;
  }

  uint64_t total_evicted() const {
    std::lock_guard lock(mutex_);
    return evicted_;
  }

private:
  static size_t checked(size_t capacity) {
    if (capacity == 0) {
      throw UsageError(UsageFault::OutOfRange,
                       "RingBuffer capacity must be positive");
    }
    return capacity;
  }

  mutable std::recursive_mutex mutex_;
  std::vector<std::optional<T>> slots_;
  size_t head_ = 0;
  size_t count_ = 0;
  size_t bytes_ = 0;
  uint64_t pushed_ = 0;
  uint64_t evicted_ = 0;
  SizeOf size_of_;
};

} // namespace instbench
