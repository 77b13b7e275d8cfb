#pragma once
#include "instrument-bench/Sample.hpp"
#include "instrument-bench/UnitCodec.hpp"
#include "instrument-bench/export.h"
#include "instrument-bench/transport/Transport.hpp"

#include <string>
#include <vector>

namespace instbench {

enum class DeviceKind { Unknown, SourceMeter, PowerSupply };

INSTRUMENT_BENCH_API const char *to_string(DeviceKind kind);

/// "smu"/"source_meter" or "psu"/"power_supply"; Unknown otherwise
INSTRUMENT_BENCH_API DeviceKind parse_device_kind(const std::string &text);

enum class SourceFunction { Voltage, Current };

/// Connection lifecycle and error queue common to every instrument
class INSTRUMENT_BENCH_API InstrumentDriver {
public:
  virtual ~InstrumentDriver() = default;

  virtual DeviceKind kind() const = 0;
  virtual const std::string &name() const = 0;

  /// open(), verify_identity() and initialize() in one call. The transport
  /// is closed again if any phase fails. Returns the identity string.
  std::string connect(const ConnectionParams &params);

  /// Open a fresh transport; nothing from a previous session is reused
  virtual void open(const ConnectionParams &params) = 0;

  /// Query *IDN? and require the expected model substring.
  /// Throws ConnectionError(IdentityMismatch).
  virtual std::string verify_identity() = 0;

  /// Bring the instrument to a known state after identification
  virtual void initialize() = 0;

  virtual void disconnect() = 0;
  virtual bool is_connected() const = 0;

  /// *RST and *CLS
  virtual void reset() = 0;

  /// Identity captured by the last successful verify_identity()
  virtual std::string identity() const = 0;

  /// Drain the instrument error queue (bounded number of polls)
  virtual std::vector<std::string> check_errors() = 0;

  /// Passthrough for commands the typed interface doesn't cover
  virtual void send_raw(const std::string &command) = 0;
  virtual std::string query_raw(const std::string &command) = 0;
};

/// Shared operation set of sourcing instruments
class INSTRUMENT_BENCH_API PowerSupplyLike : public InstrumentDriver {
public:
  /// Source a voltage with a current compliance limit
  virtual void set_voltage(const Quantity &voltage,
                           const Quantity &current_limit) = 0;

  /// Source a current with a voltage compliance limit
  virtual void set_current(const Quantity &current,
                           const Quantity &voltage_limit) = 0;

  virtual void output_on() = 0;
  virtual void output_off() = 0;
  virtual bool output_state() = 0;

  virtual double measure_voltage() = 0;
  virtual double measure_current() = 0;
  virtual double measure_power() = 0;

  /// One batched query; falls back to individual queries on a short reply
  virtual Reading measure_all() = 0;
};

/// Adds source-function selection and four-quantity measurement
class INSTRUMENT_BENCH_API SourceMeterLike : public PowerSupplyLike {
public:
  virtual void set_source_function(SourceFunction function) = 0;
  virtual SourceFunction source_function() const = 0;

  /// Compliance limit of the active source function
  virtual void set_compliance(const Quantity &limit) = 0;

  virtual double measure_resistance() = 0;
};

} // namespace instbench
