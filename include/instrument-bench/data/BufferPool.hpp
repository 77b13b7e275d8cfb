#pragma once
#include "instrument-bench/EventChannel.hpp"
#include "instrument-bench/Sample.hpp"
#include "instrument-bench/data/RingBuffer.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace instbench {

struct SampleSize {
  size_t operator()(const Sample &s) const { return s.approx_bytes(); }
};

using SampleBuffer = RingBuffer<Sample, SampleSize>;

struct BufferStatus {
  std::string instrument_id;
  size_t size = 0;
  size_t capacity = 0;
  size_t memory_bytes = 0;
  std::optional<Timestamp> oldest;
  std::optional<Timestamp> newest;

  nlohmann::json to_json() const;
};

struct MemoryUsage {
  size_t total_bytes = 0;
  size_t limit_bytes = 0;
  std::map<std::string, size_t> per_buffer;
  uint64_t samples_added = 0;
  uint64_t samples_evicted = 0;

  nlohmann::json to_json() const;
};

struct BufferPoolOptions {
  size_t default_capacity = 1000;
  size_t memory_limit_bytes = 100 * 1024 * 1024;
  size_t min_capacity = 100;
};

/// Per-instrument sample history. Each buffer has its own lock; the pool lock
/// only guards the buffer map.
class INSTRUMENT_BENCH_API BufferPool {
public:
  explicit BufferPool(BufferPoolOptions options = {});

  BufferPool(const BufferPool &) = delete;
  BufferPool &operator=(const BufferPool &) = delete;

  /// False if a buffer for id already exists
  bool create_buffer(const std::string &id, size_t capacity = 0);
  bool remove_buffer(const std::string &id);
  bool has_buffer(const std::string &id) const;
  std::vector<std::string> buffer_ids() const;

  /// Appends to the sample's instrument buffer, creating it on first use
  void add(const Sample &sample);

  std::vector<Sample> recent(const std::string &id, size_t n) const;
  std::vector<Sample> all(const std::string &id) const;

  /// Samples with from <= timestamp <= to, oldest first, at most max_count
  std::vector<Sample> range(const std::string &id, Timestamp from,
                            Timestamp to, size_t max_count = SIZE_MAX) const;

  std::optional<Sample> oldest(const std::string &id) const;
  std::optional<Sample> newest(const std::string &id) const;

  bool clear(const std::string &id);
  void clear_all();
  bool resize(const std::string &id, size_t capacity);

  std::optional<BufferStatus> status(const std::string &id) const;
  MemoryUsage memory_usage() const;

  /// Drops empty buffers, then shrinks if still over the limit
  void optimize_memory();

  const BufferPoolOptions &options() const { return options_; }

  /// Bytes in use after a shrink
  EventChannel<size_t> memory_pressure;

private:
  std::shared_ptr<SampleBuffer> find(const std::string &id) const;
  std::shared_ptr<SampleBuffer> find_or_create(const std::string &id);
  size_t total_bytes() const;
  void check_memory();
  void shrink_all();

  BufferPoolOptions options_;
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<SampleBuffer>> buffers_;
  std::atomic<uint64_t> samples_added_{0};
  std::atomic<uint64_t> samples_evicted_{0};
};

} // namespace instbench
