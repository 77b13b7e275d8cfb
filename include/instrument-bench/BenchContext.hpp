#pragma once
#include "instrument-bench/Config.hpp"
#include "instrument-bench/data/BufferPool.hpp"
#include "instrument-bench/data/SessionManager.hpp"
#include "instrument-bench/discovery/DevicePool.hpp"
#include "instrument-bench/discovery/PortRegistry.hpp"

#include <memory>

namespace instbench {

/// Owns the long-lived managers, wired from one configuration. Constructed
/// once by the application and passed by reference.
class INSTRUMENT_BENCH_API BenchContext {
public:
  /// A null driver_factory creates configured SCPI drivers
  explicit BenchContext(const ConfigStore &config,
                        DriverFactory driver_factory = nullptr,
                        PortEnumerator enumerator = enumerate_serial_ports,
                        PortIdentifier identifier = identify_serial_port);
  ~BenchContext();

  BenchContext(const BenchContext &) = delete;
  BenchContext &operator=(const BenchContext &) = delete;

  const ConfigStore &config() const { return config_; }
  BufferPool &buffers() { return *buffers_; }
  PortRegistry &ports() { return *registry_; }
  SessionManager &sessions() { return *sessions_; }

  /// Throws UsageError for DeviceKind::Unknown
  DevicePool &pool(DeviceKind kind);

  static BufferPoolOptions buffer_options(const ConfigStore &config);
  static SessionOptions session_options(const ConfigStore &config);

private:
  const ConfigStore &config_;
  std::unique_ptr<BufferPool> buffers_;
  std::unique_ptr<PortRegistry> registry_;
  std::unique_ptr<DevicePool> source_meters_;
  std::unique_ptr<DevicePool> power_supplies_;
  std::unique_ptr<SessionManager> sessions_;
};

} // namespace instbench
