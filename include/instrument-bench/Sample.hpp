#pragma once
#include "instrument-bench/export.h"

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace instbench {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/// One measurement point from one instrument. Immutable after construction;
/// missing resistance and power are derived from voltage and current.
class INSTRUMENT_BENCH_API Sample {
public:
  Sample(Timestamp timestamp, std::string instrument_id, double voltage,
         double current, std::optional<double> resistance = std::nullopt,
         std::optional<double> power = std::nullopt,
         nlohmann::json metadata = nlohmann::json());

  Timestamp timestamp() const { return timestamp_; }
  const std::string &instrument_id() const { return instrument_id_; }
  double voltage() const { return voltage_; }
  double current() const { return current_; }
  /// Absent only when current is zero and none was measured
  std::optional<double> resistance() const { return resistance_; }
  double power() const { return power_; }
  const nlohmann::json &metadata() const { return metadata_; }

  /// Seconds since the epoch with sub-second precision
  double epoch_seconds() const;

  /// Approximate heap plus inline footprint, used for memory accounting
  size_t approx_bytes() const;

  nlohmann::json to_json() const;
  static Sample from_json(const nlohmann::json &j);

private:
  Timestamp timestamp_;
  std::string instrument_id_;
  double voltage_;
  double current_;
  std::optional<double> resistance_;
  double power_;
  nlohmann::json metadata_;
};

/// Raw readings as returned by a driver, before timestamping
struct Reading {
  double voltage = 0.0;
  double current = 0.0;
  std::optional<double> resistance;
  std::optional<double> power;
};

/// ISO-8601 local time with milliseconds
INSTRUMENT_BENCH_API std::string format_timestamp(Timestamp ts);

INSTRUMENT_BENCH_API Timestamp from_epoch_seconds(double seconds);

} // namespace instbench
