#include "instrument-bench/data/BufferPool.hpp"
#include "instrument-bench/Logger.hpp"

#include <algorithm>

namespace instbench {

nlohmann::json BufferStatus::to_json() const {
  nlohmann::json j;
  j["instrument_id"] = instrument_id;
  j["size"] = size;
  j["capacity"] = capacity;
  j["memory_bytes"] = memory_bytes;
  j["oldest"] = oldest ? nlohmann::json(format_timestamp(*oldest)) : nullptr;
  j["newest"] = newest ? nlohmann::json(format_timestamp(*newest)) : nullptr;
  return j;
}

nlohmann::json MemoryUsage::to_json() const {
  nlohmann::json j;
  j["total_bytes"] = total_bytes;
  j["total_mb"] = static_cast<double>(total_bytes) / (1024.0 * 1024.0);
  j["limit_bytes"] = limit_bytes;
  j["per_buffer"] = per_buffer;
  j["samples_added"] = samples_added;
  j["samples_evicted"] = samples_evicted;
  return j;
}

BufferPool::BufferPool(BufferPoolOptions options) : options_(options) {
  if (options_.default_capacity == 0) {
    options_.default_capacity = 1;
  }
  options_.min_capacity = std::max<size_t>(1, options_.min_capacity);
}

bool BufferPool::create_buffer(const std::string &id, size_t capacity) {
  std::lock_guard lock(mutex_);
  if (buffers_.count(id)) {
    LOG_DEBUG("BUFFER", id, "Buffer already exists");
    return false;
  }
  size_t cap = capacity > 0 ? capacity : options_.default_capacity;
  buffers_.emplace(id, std::make_shared<SampleBuffer>(cap));
  LOG_INFO("BUFFER", id, "Created buffer (capacity {})", cap);
  return true;
}

bool BufferPool::remove_buffer(const std::string &id) {
  std::lock_guard lock(mutex_);
  if (buffers_.erase(id) == 0) {
    return false;
  }
  LOG_INFO("BUFFER", id, "Removed buffer");
  return true;
}

bool BufferPool::has_buffer(const std::string &id) const {
  std::lock_guard lock(mutex_);
  return buffers_.count(id) > 0;
}

std::vector<std::string> BufferPool::buffer_ids() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(buffers_.size());
  for (const auto &[id, buffer] : buffers_) {
    ids.push_back(id);
  }
  return ids;
}

std::shared_ptr<SampleBuffer> BufferPool::find(const std::string &id) const {
  std::lock_guard lock(mutex_);
  auto it = buffers_.find(id);
  return it == buffers_.end() ? nullptr : it->second;
}

std::shared_ptr<SampleBuffer>
BufferPool::find_or_create(const std::string &id) {
  std::lock_guard lock(mutex_);
  auto &slot = buffers_[id];
  if (!slot) {
    slot = std::make_shared<SampleBuffer>(options_.default_capacity);
    LOG_INFO("BUFFER", id, "Auto-created buffer (capacity {})",
             options_.default_capacity);
  }
  return slot;
}

void BufferPool::add(const Sample &sample) {
  auto buffer = find_or_create(sample.instrument_id());
  if (buffer->push(sample)) {
    ++samples_evicted_;
  }
  ++samples_added_;
  check_memory();
}

std::vector<Sample> BufferPool::recent(const std::string &id, size_t n) const {
  auto buffer = find(id);
  return buffer ? buffer->recent(n) : std::vector<Sample>{};
}

std::vector<Sample> BufferPool::all(const std::string &id) const {
  auto buffer = find(id);
  return buffer ? buffer->snapshot() : std::vector<Sample>{};
}

std::vector<Sample> BufferPool::range(const std::string &id, Timestamp from,
                                      Timestamp to, size_t max_count) const {
  auto buffer = find(id);
  if (!buffer || from > to) {
    return {};
  }
  return buffer->select(
      [&](const Sample &s) {
        return s.timestamp() >= from && s.timestamp() <= to;
      },
      max_count);
}

std::optional<Sample> BufferPool::oldest(const std::string &id) const {
  auto buffer = find(id);
  return buffer ? buffer->oldest() : std::nullopt;
}

std::optional<Sample> BufferPool::newest(const std::string &id) const {
  auto buffer = find(id);
  return buffer ? buffer->newest() : std::nullopt;
}

bool BufferPool::clear(const std::string &id) {
  auto buffer = find(id);
  if (!buffer) {
    return false;
  }
  buffer->clear();
  return true;
}

void BufferPool::clear_all() {
  std::lock_guard lock(mutex_);
  for (auto &[id, buffer] : buffers_) {
    buffer->clear();
  }
}

bool BufferPool::resize(const std::string &id, size_t capacity) {
  auto buffer = find(id);
  if (!buffer || capacity == 0) {
    return false;
  }
  samples_evicted_ += buffer->resize(capacity);
  LOG_DEBUG("BUFFER", id, "Resized to {}", capacity);
  return true;
}

std::optional<BufferStatus> BufferPool::status(const std::string &id) const {
  auto buffer = find(id);
  if (!buffer) {
    return std::nullopt;
  }
  BufferStatus st;
  st.instrument_id = id;
  st.size = buffer->size();
  st.capacity = buffer->capacity();
  st.memory_bytes = buffer->memory_bytes();
  if (auto s = buffer->oldest()) {
    st.oldest = s->timestamp();
  }
  if (auto s = buffer->newest()) {
    st.newest = s->timestamp();
  }
  return st;
}

MemoryUsage BufferPool::memory_usage() const {
  MemoryUsage usage;
  usage.limit_bytes = options_.memory_limit_bytes;
  {
    std::lock_guard lock(mutex_);
    for (const auto &[id, buffer] : buffers_) {
      size_t bytes = buffer->memory_bytes();
      usage.per_buffer[id] = bytes;
      usage.total_bytes += bytes;
    }
  }
  usage.samples_added = samples_added_.load();
  usage.samples_evicted = samples_evicted_.load();
  return usage;
}

size_t BufferPool::total_bytes() const {
  std::lock_guard lock(mutex_);
  size_t total = 0;
  for (const auto &[id, buffer] : buffers_) {
    total += buffer->memory_bytes();
  }
  return total;
}

void BufferPool::check_memory() {
  if (total_bytes() > options_.memory_limit_bytes) {
    shrink_all();
  }
}

void BufferPool::shrink_all() {
  std::vector<std::pair<std::string, std::shared_ptr<SampleBuffer>>> targets;
  {
    std::lock_guard lock(mutex_);
    targets.assign(buffers_.begin(), buffers_.end());
  }

  size_t dropped = 0;
  for (auto &[id, buffer] : targets) {
    size_t cap = buffer->capacity();
    size_t next = std::max(options_.min_capacity, cap / 2);
    if (next < cap) {
      dropped += buffer->resize(next);
    }
  }
  samples_evicted_ += dropped;

  size_t usage = total_bytes();
  LOG_WARN("BUFFER", "pool",
           "Memory limit exceeded, halved buffer capacities ({} samples "
           "dropped, {} bytes in use)",
           dropped, usage);
  memory_pressure.emit(usage);
}

void BufferPool::optimize_memory() {
  {
    std::lock_guard lock(mutex_);
    for (auto it = buffers_.begin(); it != buffers_.end();) {
      if (it->second->empty()) {
        LOG_DEBUG("BUFFER", it->first, "Dropping empty buffer");
        it = buffers_.erase(it);
      } else {
        ++it;
      }
    }
  }
  check_memory();
}

} // namespace instbench
