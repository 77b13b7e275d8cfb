#include "instrument-bench/discovery/DevicePool.hpp"
#include "instrument-bench/Logger.hpp"

namespace instbench {

DevicePool::DevicePool(DeviceKind kind, DriverFactory factory,
                       PortRegistry *registry)
    : kind_(kind), factory_(std::move(factory)), registry_(registry) {
  if (registry_) {
    lost_listener_ = registry_->device_lost.connect(
        [this](const std::string &port, const std::string &) {
          if (contains(port)) {
            LOG_WARN("POOL", port, "Port vanished, dropping device");
            disconnect(port);
          }
        });
  }
}

DevicePool::~DevicePool() {
  if (registry_) {
    registry_->device_lost.disconnect(lost_listener_);
  }
  disconnect_all();
}

bool DevicePool::connect(const std::string &port,
                         const ConnectionParams &params) {
  {
    std::lock_guard lock(mutex_);
    auto it = devices_.find(port);
    if (it != devices_.end() && it->second.driver->is_connected()) {
      LOG_DEBUG("POOL", port, "Already connected");
      return true;
    }
  }

  auto driver = factory_(kind_, port);
  if (!driver) {
    LOG_ERROR("POOL", port, "No driver available for {}", to_string(kind_));
    return false;
  }

  try {
    driver->connect(params);
  } catch (const std::exception &ex) {
    LOG_ERROR("POOL", port, "Connection failed: {}", ex.what());
    device_status_changed.emit(port, false);
    return false;
  }

  return adopt(port, driver, params);
}

bool DevicePool::adopt(const std::string &port,
                       std::shared_ptr<PowerSupplyLike> driver,
                       const ConnectionParams &params) {
  if (!driver || !driver->is_connected()) {
    LOG_ERROR("POOL", port, "Refusing to adopt a disconnected driver");
    return false;
  }

  PoolEntry entry;
  entry.driver = driver;
  entry.params = params;
  if (registry_) {
    if (auto known = registry_->device(port)) {
      entry.info = *known;
    }
  }
  entry.info.address = port;
  entry.info.kind = driver->kind();
  entry.info.device_id = driver->identity();
  entry.info.connected = true;
  if (params.transport == TransportKind::Serial) {
    entry.info.baud_rate = params.port;
  }
  entry.info.timeout = params.timeout;

  insert(port, std::move(entry));

  if (registry_ && params.transport == TransportKind::Serial) {
    registry_->mark_connected(port, driver->identity());
  }
  device_status_changed.emit(port, true);
  return true;
}

void DevicePool::insert(const std::string &port, PoolEntry entry) {
  std::shared_ptr<PowerSupplyLike> replaced;
  bool became_active = false;
  {
    std::lock_guard lock(mutex_);
    auto it = devices_.find(port);
    if (it != devices_.end()) {
      replaced = it->second.driver;
    }
    devices_[port] = std::move(entry);
    if (!active_port_) {
      active_port_ = port;
      became_active = true;
    }
  }

  if (replaced && replaced != get(port)) {
    try {
      replaced->disconnect();
    } catch (const std::exception &ex) {
      LOG_WARN("POOL", port, "Stale driver disconnect failed: {}", ex.what());
    }
  }

  LOG_INFO("POOL", port, "Device added{}", became_active ? " (active)" : "");
  notify_membership(became_active);
}

bool DevicePool::disconnect(const std::string &port) {
  PoolEntry removed;
  bool active_moved = false;
  {
    std::lock_guard lock(mutex_);
    auto it = devices_.find(port);
    if (it == devices_.end()) {
      return false;
    }
    removed = std::move(it->second);
    devices_.erase(it);

    if (active_port_ && *active_port_ == port) {
      active_moved = true;
      if (devices_.empty()) {
        active_port_.reset();
      } else {
        active_port_ = devices_.begin()->first;
      }
    }
  }

  try {
    removed.driver->disconnect();
  } catch (const std::exception &ex) {
    LOG_ERROR("POOL", port, "Disconnect failed: {}", ex.what());
  }

  if (registry_) {
    registry_->mark_disconnected(port);
  }
  LOG_INFO("POOL", port, "Device removed");
  device_status_changed.emit(port, false);
  notify_membership(active_moved);
  return true;
}

bool DevicePool::set_active(const std::string &port) {
  {
    std::lock_guard lock(mutex_);
    if (!devices_.count(port)) {
      LOG_WARN("POOL", port, "Cannot activate: not in pool");
      return false;
    }
    if (active_port_ && *active_port_ == port) {
      return true;
    }
    active_port_ = port;
  }
  LOG_INFO("POOL", port, "Active device switched");
  notify_membership(true);
  return true;
}

void DevicePool::disconnect_all() {
  std::map<std::string, PoolEntry> removed;
  {
    std::lock_guard lock(mutex_);
    removed.swap(devices_);
    active_port_.reset();
  }
  if (removed.empty()) {
    return;
  }

  LOG_INFO("POOL", "ALL", "Disconnecting {} devices", removed.size());
  for (auto &[port, entry] : removed) {
    try {
      entry.driver->disconnect();
    } catch (const std::exception &ex) {
      LOG_ERROR("POOL", port, "Disconnect failed: {}", ex.what());
    }
    if (registry_) {
      registry_->mark_disconnected(port);
    }
    device_status_changed.emit(port, false);
  }
  notify_membership(true);
}

void DevicePool::notify_membership(bool active_moved) {
  std::vector<std::string> current = ports();
  devices_changed.emit(current);
  if (!active_moved) {
    return;
  }
  std::string port;
  std::string device_id;
  {
    std::lock_guard lock(mutex_);
    if (active_port_) {
      port = *active_port_;
      device_id = devices_.at(port).info.device_id;
    }
  }
  active_changed.emit(port, device_id);
}

std::shared_ptr<PowerSupplyLike> DevicePool::get(const std::string &port) const {
  std::lock_guard lock(mutex_);
  auto it = devices_.find(port);
  return it == devices_.end() ? nullptr : it->second.driver;
}

std::shared_ptr<PowerSupplyLike> DevicePool::active() const {
  std::lock_guard lock(mutex_);
  if (!active_port_) {
    return nullptr;
  }
  return devices_.at(*active_port_).driver;
}

std::optional<std::string> DevicePool::active_port() const {
  std::lock_guard lock(mutex_);
  return active_port_;
}

std::optional<DeviceInfo> DevicePool::info(const std::string &port) const {
  std::lock_guard lock(mutex_);
  auto it = devices_.find(port);
  if (it == devices_.end()) {
    return std::nullopt;
  }
  return it->second.info;
}

std::vector<std::string> DevicePool::ports() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> out;
  for (const auto &[port, entry] : devices_) {
    out.push_back(port);
  }
  return out;
}

size_t DevicePool::size() const {
  std::lock_guard lock(mutex_);
  return devices_.size();
}

bool DevicePool::contains(const std::string &port) const {
  std::lock_guard lock(mutex_);
  return devices_.count(port) > 0;
}

} // namespace instbench
