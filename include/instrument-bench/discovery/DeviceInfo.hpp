#pragma once
#include "instrument-bench/driver/InstrumentDriver.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

namespace instbench {

/// What is known about one port/address
struct INSTRUMENT_BENCH_API DeviceInfo {
  std::string address;
  std::string description;
  DeviceKind kind = DeviceKind::Unknown;
  std::string device_type = "Unknown";
  std::string device_id;
  bool connected = false;
  int baud_rate = kDefaultBaudRate;
  std::chrono::milliseconds timeout{2000};

  nlohmann::json to_json() const;
};

} // namespace instbench
