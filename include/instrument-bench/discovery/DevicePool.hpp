#pragma once
#include "instrument-bench/EventChannel.hpp"
#include "instrument-bench/discovery/DeviceInfo.hpp"
#include "instrument-bench/discovery/PortRegistry.hpp"
#include "instrument-bench/driver/DriverFactory.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace instbench {

struct PoolEntry {
  std::shared_ptr<PowerSupplyLike> driver;
  DeviceInfo info;
  ConnectionParams params;
};

/// Simultaneously connected drivers keyed by port/address, one active
class INSTRUMENT_BENCH_API DevicePool {
public:
  /// registry may be null; when given, the pool tracks its connected flags
  /// and drops devices the registry reports lost
  DevicePool(DeviceKind kind, DriverFactory factory,
             PortRegistry *registry = nullptr);
  ~DevicePool();

  DevicePool(const DevicePool &) = delete;
  DevicePool &operator=(const DevicePool &) = delete;

  /// Idempotent when already connected. I/O runs outside the pool lock.
  bool connect(const std::string &port, const ConnectionParams &params);

  /// Add a driver that a ConnectionTask already connected
  bool adopt(const std::string &port, std::shared_ptr<PowerSupplyLike> driver,
             const ConnectionParams &params);

  /// Removes the device; promotes another member if it was active
  bool disconnect(const std::string &port);

  /// No-op unless port is in the pool
  bool set_active(const std::string &port);

  /// Disconnects every member, logging individual failures
  void disconnect_all();

  std::shared_ptr<PowerSupplyLike> get(const std::string &port) const;
  std::shared_ptr<PowerSupplyLike> active() const;
  std::optional<std::string> active_port() const;
  std::optional<DeviceInfo> info(const std::string &port) const;
  std::vector<std::string> ports() const;
  size_t size() const;
  bool contains(const std::string &port) const;

  DeviceKind kind() const { return kind_; }

  /// Pool membership changed; carries the current port list
  EventChannel<const std::vector<std::string> &> devices_changed;
  /// New active port ("" when the pool became empty) and its device id
  EventChannel<const std::string &, const std::string &> active_changed;
  EventChannel<const std::string &, bool> device_status_changed;

private:
  void insert(const std::string &port, PoolEntry entry);
  void notify_membership(bool active_moved);

  DeviceKind kind_;
  DriverFactory factory_;
  PortRegistry *registry_;
  EventChannel<const std::string &, const std::string &>::ListenerId
      lost_listener_ = 0;

  mutable std::mutex mutex_;
  std::map<std::string, PoolEntry> devices_;
  std::optional<std::string> active_port_;
};

} // namespace instbench
