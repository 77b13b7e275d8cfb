#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace instbench {

/// Typed many-listener notification channel. Listeners run on the emitting
/// thread, outside the channel lock, so a listener may connect or disconnect.
template <typename... Args> class EventChannel {
public:
  using Listener = std::function<void(Args...)>;
  using ListenerId = uint64_t;

  ListenerId connect(Listener listener) {
    std::lock_guard lock(mutex_);
    ListenerId id = next_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
  }

  bool disconnect(ListenerId id) {
    std::lock_guard lock(mutex_);
    return listeners_.erase(id) > 0;
  }

  void disconnect_all() {
    std::lock_guard lock(mutex_);
    listeners_.clear();
  }

  size_t listener_count() const {
    std::lock_guard lock(mutex_);
    return listeners_.size();
  }

  void emit(Args... args) const {
    std::vector<Listener> snapshot;
    {
      std::lock_guard lock(mutex_);
      snapshot.reserve(listeners_.size());
      for (const auto &[id, listener] : listeners_) {
        snapshot.push_back(listener);
      }
    }
    for (const auto &listener : snapshot) {
      listener(args...);
    }
  }

private:
  mutable std::mutex mutex_;
  std::map<ListenerId, Listener> listeners_;
  ListenerId next_id_ = 1;
};

} // namespace instbench
