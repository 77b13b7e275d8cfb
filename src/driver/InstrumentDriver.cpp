#include "instrument-bench/driver/InstrumentDriver.hpp"
#include "instrument-bench/Logger.hpp"

#include <algorithm>
#include <cctype>

namespace instbench {

const char *to_string(DeviceKind kind) {
  switch (kind) {
  case DeviceKind::SourceMeter:
    return "source_meter";
  case DeviceKind::PowerSupply:
    return "power_supply";
  case DeviceKind::Unknown:
    break;
  }
  return "unknown";
}

DeviceKind parse_device_kind(const std::string &text) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "smu" || lower == "source_meter" || lower == "sourcemeter") {
    return DeviceKind::SourceMeter;
  }
  if (lower == "psu" || lower == "power_supply" || lower == "powersupply") {
    return DeviceKind::PowerSupply;
  }
  return DeviceKind::Unknown;
}

std::string InstrumentDriver::connect(const ConnectionParams &params) {
  open(params);
  try {
    std::string id = verify_identity();
    initialize();
    LOG_INFO("DRIVER", name(), "Connected to {} via {}", id,
             params.to_string());
    return id;
  } catch (const std::exception &ex) {
    LOG_ERROR("DRIVER", name(), "Connection setup failed: {}", ex.what());
    disconnect();
    throw;
  }
}

} // namespace instbench
