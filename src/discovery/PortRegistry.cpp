#include "instrument-bench/discovery/PortRegistry.hpp"
#include "instrument-bench/Errors.hpp"
#include "instrument-bench/Logger.hpp"
#include "instrument-bench/transport/SerialTransport.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <set>

namespace fs = std::filesystem;

namespace instbench {

namespace {

constexpr std::chrono::milliseconds kQueryWait{500};
constexpr size_t kMaxGenericIdLength = 50;

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string trim(const std::string &s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

std::string read_first_line(const fs::path &path) {
  std::ifstream in(path);
  std::string line;
  if (in) {
    std::getline(in, line);
  }
  return trim(line);
}

std::string describe_tty(const fs::path &tty_dir) {
  // USB adapters expose product/manufacturer a few levels above the tty
  for (const char *rel : {"device/../product", "device/../../product"}) {
    fs::path candidate = tty_dir / rel;
    std::error_code ec;
    if (fs::exists(candidate, ec)) {
      std::string product = read_first_line(candidate);
      if (!product.empty()) {
        return product;
      }
    }
  }
  return "Serial port";
}

} // namespace

nlohmann::json DeviceInfo::to_json() const {
  return {{"address", address},
          {"description", description},
          {"kind", to_string(kind)},
          {"device_type", device_type},
          {"device_id", device_id},
          {"connected", connected},
          {"baud_rate", baud_rate},
          {"timeout_ms", timeout.count()}};
}

std::vector<PortEntry> enumerate_serial_ports() {
  std::vector<PortEntry> ports;
  const fs::path sys_tty("/sys/class/tty");
  std::error_code ec;
  if (!fs::exists(sys_tty, ec)) {
    return ports;
  }

  for (const auto &entry : fs::directory_iterator(sys_tty, ec)) {
    const fs::path device_link = entry.path() / "device";
    if (!fs::exists(device_link, ec)) {
      continue; // virtual console or pty
    }

    std::string name = entry.path().filename().string();
    fs::path driver = device_link / "driver";
    if (fs::exists(driver, ec)) {
      std::string driver_name =
          fs::canonical(driver, ec).filename().string();
      // Legacy 8250 UARTs are always listed, even with no hardware behind them
      if (driver_name == "serial8250") {
        continue;
      }
    }
    ports.push_back({"/dev/" + name, describe_tty(entry.path())});
  }

  std::sort(ports.begin(), ports.end(),
            [](const PortEntry &a, const PortEntry &b) {
              return a.device < b.device;
            });
  return ports;
}

std::optional<std::string>
identify_serial_port(const std::string &port, int baud_rate,
                     std::chrono::milliseconds timeout) {
  SerialTransport transport(port, baud_rate, std::min(timeout, kQueryWait));
  try {
    transport.open();
  } catch (const BenchError &ex) {
    LOG_DEBUG("PORTS", port, "Cannot open for identification: {}", ex.what());
    return std::nullopt;
  }

  for (const char *command : {"*IDN?", ":SYST:ERR?", "*OPC?"}) {
    try {
      transport.flush_input();
      std::string reply = trim(transport.query(command));
      if (!reply.empty()) {
        transport.close();
        return reply;
      }
    } catch (const ConnectionError &ex) {
      LOG_TRACE("PORTS", port, "No reply to {}: {}", command, ex.what());
    }
  }
  transport.close();
  return std::string();
}

PortRegistry::PortRegistry(PortEnumerator enumerator, PortIdentifier identifier)
    : enumerator_(std::move(enumerator)), identifier_(std::move(identifier)) {}

PortRegistry::~PortRegistry() { stop_monitoring(); }

Classification PortRegistry::classify(const std::string &response) {
  Classification result;
  std::string text = trim(response);
  if (text.empty()) {
    result.device_type = "unidentified";
    return result;
  }

  std::string l = lower(text);
  if (l.find("rigol") != std::string::npos &&
      l.find("dp711") != std::string::npos) {
    result.kind = DeviceKind::PowerSupply;
    result.device_type = "Rigol DP711";
    // RIGOL TECHNOLOGIES,DP711,<serial>,<firmware>
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
      auto comma = text.find(',', start);
      fields.push_back(trim(text.substr(start, comma - start)));
      if (comma == std::string::npos)
        break;
      start = comma + 1;
    }
    result.device_id = fields.size() > 2 ? fields[2] : "Unknown";
  } else if (l.find("keithley") != std::string::npos &&
             l.find("2461") != std::string::npos) {
    result.kind = DeviceKind::SourceMeter;
    result.device_type = "Keithley 2461";
    result.device_id = text;
  } else if (l.find("rigol") != std::string::npos) {
    result.kind = DeviceKind::PowerSupply;
    result.device_type = "Rigol Device";
    result.device_id = text;
  } else {
    result.device_type = "Generic SCPI Device";
    result.device_id = text.substr(0, kMaxGenericIdLength);
  }
  return result;
}

std::optional<DeviceInfo> PortRegistry::identify(const std::string &port,
                                                 int baud_rate) {
  auto reply = identifier_(port, baud_rate, probe_timeout_);
  if (!reply) {
    return std::nullopt;
  }

  DeviceInfo info;
  info.address = port;
  info.baud_rate = baud_rate;
  info.timeout = probe_timeout_;

  auto c = classify(*reply);
  info.kind = c.kind;
  info.device_type = c.device_type;
  info.device_id = c.device_id;
  info.description = reply->empty() ? "Device detected (no identification)"
                                    : c.device_type;
  LOG_DEBUG("PORTS", port, "Identified as {} ({})", info.device_type,
            info.device_id);
  return info;
}

std::vector<DeviceInfo> PortRegistry::scan(bool identify_new) {
  std::lock_guard scan_lock(scan_mutex_);

  std::vector<PortEntry> listed;
  try {
    listed = enumerator_();
  } catch (const std::exception &ex) {
    LOG_ERROR("PORTS", "SCAN", "Port enumeration failed: {}", ex.what());
    return devices();
  }

  std::set<std::string> current;
  for (const auto &entry : listed) {
    current.insert(entry.device);
  }

  std::map<std::string, DeviceInfo> previous;
  {
    std::lock_guard lock(mutex_);
    previous = devices_;
  }

  std::map<std::string, DeviceInfo> next;
  for (const auto &entry : listed) {
    auto known = previous.find(entry.device);
    if (known != previous.end()) {
      next.emplace(entry.device, known->second);
      continue;
    }

    DeviceInfo info;
    info.address = entry.device;
    info.description = entry.description;
    if (identify_new) {
      if (auto identified = identify(entry.device)) {
        info = *identified;
        if (!entry.description.empty() &&
            info.device_type == "unidentified") {
          info.description = entry.description;
        }
      } else {
        info.device_type = "unidentified";
      }
    }
    LOG_INFO("PORTS", entry.device, "Port added: {}", info.device_type);
    next.emplace(entry.device, info);
  }

  std::vector<std::pair<std::string, std::string>> lost;
  bool changed = next.size() != previous.size();
  for (const auto &[port, info] : previous) {
    if (current.count(port)) {
      continue;
    }
    changed = true;
    LOG_INFO("PORTS", port, "Port removed");
    if (info.connected) {
      LOG_WARN("PORTS", port, "Device {} disconnected unexpectedly",
               info.device_id);
      lost.emplace_back(port, info.device_id);
    }
  }

  std::vector<DeviceInfo> snapshot;
  {
    std::lock_guard lock(mutex_);
    // Connection state may have changed while identification ran
    for (auto &[port, info] : next) {
      auto live = devices_.find(port);
      if (live != devices_.end()) {
        info.connected = live->second.connected;
        if (live->second.connected) {
          info.device_id = live->second.device_id;
        }
      }
    }
    devices_ = std::move(next);
    for (const auto &[port, info] : devices_) {
      snapshot.push_back(info);
    }
  }

  for (const auto &[port, id] : lost) {
    device_lost.emit(port, id);
  }
  if (changed) {
    ports_updated.emit(snapshot);
  }
  return snapshot;
}

void PortRegistry::start_monitoring(std::chrono::milliseconds interval) {
  if (monitoring_.exchange(true)) {
    return;
  }
  monitor_thread_ = std::thread([this, interval] { monitor_loop(interval); });
  LOG_INFO("PORTS", "MONITOR", "Port monitoring started ({} ms)",
           interval.count());
}

void PortRegistry::stop_monitoring() {
  if (!monitoring_.exchange(false)) {
    return;
  }
  {
    std::lock_guard lock(monitor_mutex_);
  }
  monitor_cv_.notify_all();
  if (monitor_thread_.joinable()) {
    monitor_thread_.join();
  }
  LOG_INFO("PORTS", "MONITOR", "Port monitoring stopped");
}

void PortRegistry::monitor_loop(std::chrono::milliseconds interval) {
  while (monitoring_) {
    try {
      scan();
    } catch (const std::exception &ex) {
      LOG_ERROR("PORTS", "MONITOR", "Scan failed: {}", ex.what());
    }

    std::unique_lock lock(monitor_mutex_);
    if (monitor_cv_.wait_for(lock, interval, [this] { return !monitoring_; })) {
      break;
    }
  }
}

void PortRegistry::mark_connected(const std::string &port,
                                  const std::string &device_id) {
  {
    std::lock_guard lock(mutex_);
    auto &info = devices_[port];
    info.address = port;
    info.connected = true;
    if (!device_id.empty()) {
      info.device_id = device_id;
    }
  }
  device_connected.emit(port, device_id);
}

void PortRegistry::mark_disconnected(const std::string &port) {
  std::string device_id;
  {
    std::lock_guard lock(mutex_);
    auto it = devices_.find(port);
    if (it == devices_.end() || !it->second.connected) {
      return;
    }
    it->second.connected = false;
    device_id = it->second.device_id;
  }
  device_disconnected.emit(port, device_id);
}

std::vector<DeviceInfo> PortRegistry::devices() const {
  std::lock_guard lock(mutex_);
  std::vector<DeviceInfo> out;
  for (const auto &[port, info] : devices_) {
    out.push_back(info);
  }
  return out;
}

std::optional<DeviceInfo> PortRegistry::device(const std::string &port) const {
  std::lock_guard lock(mutex_);
  auto it = devices_.find(port);
  if (it == devices_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<DeviceInfo>
PortRegistry::available_ports(bool exclude_connected) const {
  std::lock_guard lock(mutex_);
  std::vector<DeviceInfo> out;
  for (const auto &[port, info] : devices_) {
    if (exclude_connected && info.connected) {
      continue;
    }
    out.push_back(info);
  }
  return out;
}

std::vector<DeviceInfo> PortRegistry::connected_devices() const {
  std::lock_guard lock(mutex_);
  std::vector<DeviceInfo> out;
  for (const auto &[port, info] : devices_) {
    if (info.connected) {
      out.push_back(info);
    }
  }
  return out;
}

} // namespace instbench
