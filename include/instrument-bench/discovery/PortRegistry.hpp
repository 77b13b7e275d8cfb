#pragma once
#include "instrument-bench/EventChannel.hpp"
#include "instrument-bench/discovery/DeviceInfo.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace instbench {

/// A serial port as listed by the operating system
struct PortEntry {
  std::string device;
  std::string description;
};

/// Outcome of classifying an identification reply
struct Classification {
  DeviceKind kind = DeviceKind::Unknown;
  std::string device_type;
  std::string device_id;
};

using PortEnumerator = std::function<std::vector<PortEntry>()>;

/// Reply to the first identification query that got one: "" when the port
/// opened but stayed silent, nullopt when it could not be opened
using PortIdentifier = std::function<std::optional<std::string>(
    const std::string &port, int baud_rate, std::chrono::milliseconds timeout)>;

/// Serial ports under /sys/class/tty backed by a real device
INSTRUMENT_BENCH_API std::vector<PortEntry> enumerate_serial_ports();

/// Sends *IDN?, :SYST:ERR? and *OPC? in turn until one gets a reply
INSTRUMENT_BENCH_API std::optional<std::string>
identify_serial_port(const std::string &port, int baud_rate,
                     std::chrono::milliseconds timeout);

/// Periodic serial-port enumeration with identification and diffing
class INSTRUMENT_BENCH_API PortRegistry {
public:
  explicit PortRegistry(PortEnumerator enumerator = enumerate_serial_ports,
                        PortIdentifier identifier = identify_serial_port);
  ~PortRegistry();

  PortRegistry(const PortRegistry &) = delete;
  PortRegistry &operator=(const PortRegistry &) = delete;

  /// One synchronous pass. New ports are identified (unless identify is
  /// false); known and connected ports keep their info.
  std::vector<DeviceInfo> scan(bool identify = true);

  /// Open the port briefly and classify whatever answers
  std::optional<DeviceInfo> identify(const std::string &port,
                                     int baud_rate = kDefaultBaudRate);

  static Classification classify(const std::string &response);

  void start_monitoring(std::chrono::milliseconds interval);
  void stop_monitoring();
  bool monitoring() const { return monitoring_; }

  /// Serial ports only; scans would report a network address as lost
  void mark_connected(const std::string &port, const std::string &device_id);
  void mark_disconnected(const std::string &port);

  std::vector<DeviceInfo> devices() const;
  std::optional<DeviceInfo> device(const std::string &port) const;
  std::vector<DeviceInfo> available_ports(bool exclude_connected = true) const;
  std::vector<DeviceInfo> connected_devices() const;

  void set_probe_timeout(std::chrono::milliseconds timeout) {
    probe_timeout_ = timeout;
  }

  EventChannel<const std::vector<DeviceInfo> &> ports_updated;
  EventChannel<const std::string &, const std::string &> device_connected;
  EventChannel<const std::string &, const std::string &> device_disconnected;
  /// A port marked connected vanished from a scan
  EventChannel<const std::string &, const std::string &> device_lost;

private:
  void monitor_loop(std::chrono::milliseconds interval);

  PortEnumerator enumerator_;
  PortIdentifier identifier_;
  std::chrono::milliseconds probe_timeout_{2000};

  mutable std::mutex mutex_;
  std::map<std::string, DeviceInfo> devices_;

  std::mutex scan_mutex_;
  std::atomic<bool> monitoring_{false};
  std::mutex monitor_mutex_;
  std::condition_variable monitor_cv_;
  std::thread monitor_thread_;
};

} // namespace instbench
