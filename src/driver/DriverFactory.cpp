#include "instrument-bench/driver/DriverFactory.hpp"
#include "instrument-bench/driver/PowerSupply.hpp"
#include "instrument-bench/driver/SourceMeter.hpp"

namespace instbench {

namespace {

std::chrono::milliseconds seconds_to_ms(double seconds) {
  return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

} // namespace

std::shared_ptr<PowerSupplyLike> make_driver(DeviceKind kind,
                                             const std::string &name,
                                             TransportFactory transport_factory) {
  switch (kind) {
  case DeviceKind::SourceMeter:
    return std::make_shared<ScpiSourceMeter>(name,
                                             std::move(transport_factory));
  case DeviceKind::PowerSupply:
    return std::make_shared<ScpiPowerSupply>(name,
                                             std::move(transport_factory));
  case DeviceKind::Unknown:
    break;
  }
  LOG_ERROR("DRIVER", name, "No driver for device kind '{}'", to_string(kind));
  return nullptr;
}

std::shared_ptr<PowerSupplyLike> make_driver(DeviceKind kind,
                                             const std::string &name,
                                             const ConfigStore &config,
                                             TransportFactory transport_factory) {
  if (kind == DeviceKind::SourceMeter) {
    SourceMeterProfile profile;
    profile.idn_match = config.get("instruments.source_meter.idn_match",
                                   profile.idn_match.c_str());
    return std::make_shared<ScpiSourceMeter>(
        name, std::move(transport_factory), profile);
  }
  if (kind == DeviceKind::PowerSupply) {
    PowerSupplyProfile profile;
    std::string match =
        config.get("instruments.power_supply.idn_match", "DP711");
    profile.idn_matches = {match, "RIGOL"};
    return std::make_shared<ScpiPowerSupply>(
        name, std::move(transport_factory), profile);
  }
  return make_driver(kind, name, std::move(transport_factory));
}

ConnectionParams connection_params_for(DeviceKind kind,
                                       const std::string &target,
                                       const ConfigStore &config) {
  const std::string section = kind == DeviceKind::PowerSupply
                                  ? "instruments.power_supply."
                                  : "instruments.source_meter.";

  int port = config.get<int>("instruments.source_meter.connection.port",
                             kDefaultScpiPort);
  int baud = config.get<int>("instruments.power_supply.connection.baud_rate",
                             kDefaultBaudRate);
  auto params = ConnectionParams::parse(target, port, baud);

  double default_timeout = kind == DeviceKind::PowerSupply ? 5.0 : 10.0;
  params.timeout = seconds_to_ms(
      config.get<double>(section + "connection.timeout", default_timeout));
  params.retry_count = config.get<int>(section + "retry_attempts", 3);
  params.retry_delay =
      seconds_to_ms(config.get<double>(section + "retry_delay", 2.0));
  params.probe_timeout = seconds_to_ms(
      config.get<double>("instruments.source_meter.probe_timeout", 2.0));
  return params;
}

} // namespace instbench
