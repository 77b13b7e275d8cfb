#include "instrument-bench/BenchContext.hpp"
#include "instrument-bench/Logger.hpp"

namespace instbench {

BufferPoolOptions BenchContext::buffer_options(const ConfigStore &config) {
  BufferPoolOptions opts;
  opts.default_capacity = static_cast<size_t>(
      config.get<int>("data.buffer.real_time_buffer_size", 1000));
  opts.memory_limit_bytes =
      static_cast<size_t>(config.get<int>("data.buffer.memory_limit_mb", 100)) *
      1024 * 1024;
  opts.min_capacity =
      static_cast<size_t>(config.get<int>("data.buffer.min_capacity", 100));
  return opts;
}

SessionOptions BenchContext::session_options(const ConfigStore &config) {
  SessionOptions opts;
  opts.auto_save_interval = std::chrono::milliseconds(static_cast<int64_t>(
      config.get<double>("data.storage.auto_save_interval", 300.0) * 1000.0));
  opts.save_each_sample = config.get<bool>("data.storage.auto_save", false);
  opts.persistent_buffer_size = static_cast<size_t>(
      config.get<int>("data.buffer.persistent_buffer_size", 10000));
  opts.analytics.window_size =
      static_cast<size_t>(config.get<int>("data.analytics.window_size", 100));
  opts.analytics.threshold_sigma =
      config.get<double>("data.analytics.threshold_sigma", 3.0);
  opts.analytics.min_history =
      static_cast<size_t>(config.get<int>("data.analytics.min_history", 10));
  return opts;
}

BenchContext::BenchContext(const ConfigStore &config,
                           DriverFactory driver_factory,
                           PortEnumerator enumerator,
                           PortIdentifier identifier)
    : config_(config) {
  if (!driver_factory) {
    driver_factory = [&config](DeviceKind kind, const std::string &name) {
      return make_driver(kind, name, config);
    };
  }

  buffers_ = std::make_unique<BufferPool>(buffer_options(config));

  registry_ = std::make_unique<PortRegistry>(std::move(enumerator),
                                             std::move(identifier));
  registry_->set_probe_timeout(std::chrono::milliseconds(static_cast<int64_t>(
      config.get<double>("discovery.probe_timeout", 2.0) * 1000.0)));

  source_meters_ = std::make_unique<DevicePool>(
      DeviceKind::SourceMeter, driver_factory, registry_.get());
  power_supplies_ = std::make_unique<DevicePool>(
      DeviceKind::PowerSupply, driver_factory, registry_.get());

  auto sink = make_sink(config.get("data.storage.default_format", "csv"),
                        config.get("data.storage.base_path", "data"));
  sessions_ = std::make_unique<SessionManager>(*buffers_, std::move(sink),
                                               session_options(config));

  LOG_DEBUG("CONFIG", "context", "Bench context ready");
}

BenchContext::~BenchContext() {
  sessions_.reset();
  power_supplies_.reset();
  source_meters_.reset();
  registry_->stop_monitoring();
}

DevicePool &BenchContext::pool(DeviceKind kind) {
  switch (kind) {
  case DeviceKind::SourceMeter:
    return *source_meters_;
  case DeviceKind::PowerSupply:
    return *power_supplies_;
  default:
    throw UsageError(UsageFault::InvalidArgument,
                     "No device pool for kind " + std::string(to_string(kind)));
  }
}

} // namespace instbench
