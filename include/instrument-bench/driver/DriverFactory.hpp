#pragma once
#include "instrument-bench/Config.hpp"
#include "instrument-bench/driver/InstrumentDriver.hpp"

#include <functional>
#include <memory>

namespace instbench {

/// Creates an unconnected driver for a port/address
using DriverFactory = std::function<std::shared_ptr<PowerSupplyLike>(
    DeviceKind kind, const std::string &name)>;

/// Driver of the requested kind; nullptr for DeviceKind::Unknown
INSTRUMENT_BENCH_API std::shared_ptr<PowerSupplyLike>
make_driver(DeviceKind kind, const std::string &name,
            TransportFactory transport_factory = make_transport);

/// Same, with identification and limits taken from configuration
INSTRUMENT_BENCH_API std::shared_ptr<PowerSupplyLike>
make_driver(DeviceKind kind, const std::string &name,
            const ConfigStore &config,
            TransportFactory transport_factory = make_transport);

/// Connection parameters for a target, with per-kind defaults from config
INSTRUMENT_BENCH_API ConnectionParams
connection_params_for(DeviceKind kind, const std::string &target,
                      const ConfigStore &config);

} // namespace instbench
