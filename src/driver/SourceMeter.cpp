#include "instrument-bench/driver/SourceMeter.hpp"
#include "instrument-bench/Errors.hpp"
#include "instrument-bench/Logger.hpp"

#include <fmt/format.h>
#include <thread>

namespace instbench {

namespace {

std::string join(const std::vector<std::string> &items) {
  std::string out;
  for (const auto &item : items) {
    if (!out.empty()) {
      out += "; ";
    }
    out += item;
  }
  return out;
}

} // namespace

ScpiSourceMeter::ScpiSourceMeter(std::string name, TransportFactory factory,
                                 SourceMeterProfile profile)
    : name_(std::move(name)), profile_(std::move(profile)),
      channel_(name_, std::move(factory)) {}

ScpiSourceMeter::~ScpiSourceMeter() { channel_.close(); }

const char *ScpiSourceMeter::batched_measure_query() {
  return ":MEAS:VOLT?;:MEAS:CURR?;:MEAS:RES?;:MEAS:POW?";
}

void ScpiSourceMeter::open(const ConnectionParams &params) {
  LOG_INFO("DRIVER", name_, "Opening {} ({})", params.to_string(),
           to_string(params.transport));
  channel_.open(params);
}

std::string ScpiSourceMeter::verify_identity() {
  auto guard = channel_.lock();
  std::string idn = channel_.query("*IDN?");
  if (idn.find(profile_.idn_match) == std::string::npos) {
    LOG_ERROR("DRIVER", name_, "Unexpected identity '{}' (want '{}')", idn,
              profile_.idn_match);
    throw ConnectionError(ConnectionFailure::IdentityMismatch,
                          fmt::format("'{}' does not contain '{}'", idn,
                                      profile_.idn_match));
  }
  identity_ = idn;
  return identity_;
}

void ScpiSourceMeter::initialize() {
  auto guard = channel_.lock();
  channel_.send("*RST");
  std::this_thread::sleep_for(profile_.reset_settle);
  channel_.send("*CLS");
  function_ = SourceFunction::Voltage;
  auto errors = check_errors();
  if (!errors.empty()) {
    LOG_WARN("DRIVER", name_, "Errors after reset: {}", join(errors));
  }
}

void ScpiSourceMeter::disconnect() {
  if (channel_.is_open()) {
    channel_.close();
    LOG_INFO("DRIVER", name_, "Disconnected");
  }
}

void ScpiSourceMeter::reset() {
  auto guard = channel_.lock();
  channel_.send("*RST");
  channel_.send("*CLS");
  function_ = SourceFunction::Voltage;
}

std::string ScpiSourceMeter::identity() const {
  return identity_;
}

std::vector<std::string> ScpiSourceMeter::check_errors() {
  return channel_.drain_errors(":SYST:ERR?", profile_.max_error_polls);
}

void ScpiSourceMeter::send_raw(const std::string &command) {
  channel_.send(command);
}

std::string ScpiSourceMeter::query_raw(const std::string &command) {
  return channel_.query(command);
}

void ScpiSourceMeter::throw_on_errors(const std::string &operation) {
  auto errors = check_errors();
  if (!errors.empty()) {
    throw ProtocolError(
        ProtocolFault::InstrumentFault,
        fmt::format("{} {} failed: {}", name_, operation, join(errors)));
  }
}

void ScpiSourceMeter::set_source_function(SourceFunction function) {
  auto guard = channel_.lock();
  channel_.send(function == SourceFunction::Voltage ? ":SOUR:FUNC VOLT"
                                                    : ":SOUR:FUNC CURR");
  function_ = function;
}

SourceFunction ScpiSourceMeter::source_function() const { return function_; }

void ScpiSourceMeter::set_voltage(const Quantity &voltage,
                                  const Quantity &current_limit) {
  double v = voltage.value();
  double limit = current_limit.value();

  auto guard = channel_.lock();
  set_source_function(SourceFunction::Voltage);
  channel_.send("*CLS");
  channel_.send(":SOUR:VOLT:LEV " + UnitCodec::to_scpi(v));
  channel_.send(":SOUR:VOLT:ILIM " + UnitCodec::to_scpi(limit));
  throw_on_errors("set_voltage");
  LOG_DEBUG("DRIVER", name_, "Voltage {} (limit {})",
            UnitCodec::format(v, "V"), UnitCodec::format(limit, "A"));
}

void ScpiSourceMeter::set_current(const Quantity &current,
                                  const Quantity &voltage_limit) {
  double i = current.value();
  double limit = voltage_limit.value();

  auto guard = channel_.lock();
  set_source_function(SourceFunction::Current);
  channel_.send("*CLS");
  channel_.send(":SOUR:CURR:LEV " + UnitCodec::to_scpi(i));
  channel_.send(":SOUR:CURR:VLIM " + UnitCodec::to_scpi(limit));
  throw_on_errors("set_current");
  LOG_DEBUG("DRIVER", name_, "Current {} (limit {})",
            UnitCodec::format(i, "A"), UnitCodec::format(limit, "V"));
}

void ScpiSourceMeter::set_compliance(const Quantity &limit) {
  double value = limit.value();
  auto guard = channel_.lock();
  if (function_ == SourceFunction::Voltage) {
    channel_.send(":SOUR:VOLT:ILIM " + UnitCodec::to_scpi(value));
  } else {
    channel_.send(":SOUR:CURR:VLIM " + UnitCodec::to_scpi(value));
  }
  throw_on_errors("set_compliance");
}

void ScpiSourceMeter::output_on() {
  channel_.send(":OUTP:STAT ON");
  LOG_INFO("DRIVER", name_, "Output ON");
}

void ScpiSourceMeter::output_off() {
  channel_.send(":OUTP:STAT OFF");
  LOG_INFO("DRIVER", name_, "Output OFF");
}

bool ScpiSourceMeter::output_state() {
  std::string reply = channel_.query(":OUTP:STAT?");
  return reply == "1" || reply == "ON";
}

double ScpiSourceMeter::measure_voltage() {
  return channel_.query_double(":MEAS:VOLT?");
}

double ScpiSourceMeter::measure_current() {
  return channel_.query_double(":MEAS:CURR?");
}

double ScpiSourceMeter::measure_resistance() {
  return channel_.query_double(":MEAS:RES?");
}

double ScpiSourceMeter::measure_power() {
  return channel_.query_double(":MEAS:POW?");
}

Reading ScpiSourceMeter::measure_all() {
  auto guard = channel_.lock();
  std::string reply = channel_.query(batched_measure_query());
  auto values = parse_numeric_fields(reply);

  Reading reading;
  if (values && values->size() == 4) {
    reading.voltage = (*values)[0];
    reading.current = (*values)[1];
    reading.resistance = (*values)[2];
    reading.power = (*values)[3];
    return reading;
  }

  LOG_WARN("DRIVER", name_,
           "Batched measurement reply '{}' incomplete, querying individually",
           reply);
  channel_.flush_input();
  reading.voltage = measure_voltage();
  reading.current = measure_current();
  reading.resistance = measure_resistance();
  reading.power = measure_power();
  return reading;
}

void ScpiSourceMeter::set_measurement_speed(double nplc) {
  if (nplc < profile_.min_nplc || nplc > profile_.max_nplc) {
    throw UsageError(UsageFault::OutOfRange,
                     fmt::format("NPLC {} outside [{}, {}]", nplc,
                                 profile_.min_nplc, profile_.max_nplc));
  }
  auto guard = channel_.lock();
  channel_.send(":SENS:VOLT:NPLC " + UnitCodec::to_scpi(nplc));
  channel_.send(":SENS:CURR:NPLC " + UnitCodec::to_scpi(nplc));
  throw_on_errors("set_measurement_speed");
}

void ScpiSourceMeter::set_auto_range(bool enabled) {
  const char *state = enabled ? "ON" : "OFF";
  auto guard = channel_.lock();
  channel_.send(fmt::format(":SENS:VOLT:RANG:AUTO {}", state));
  channel_.send(fmt::format(":SENS:CURR:RANG:AUTO {}", state));
  throw_on_errors("set_auto_range");
}

void ScpiSourceMeter::set_measure_function(MeasureFunction function) {
  const char *name = "VOLT";
  if (function == MeasureFunction::Current) {
    name = "CURR";
  } else if (function == MeasureFunction::Resistance) {
    name = "RES";
  }
  auto guard = channel_.lock();
  channel_.send(fmt::format(":SENS:FUNC \"{}\"", name));
  throw_on_errors("set_measure_function");
}

void ScpiSourceMeter::beep(double frequency_hz, double duration_s) {
  channel_.send(fmt::format(":SYST:BEEP {}, {}",
                            UnitCodec::to_scpi(frequency_hz),
                            UnitCodec::to_scpi(duration_s)));
}

} // namespace instbench
