#include "instrument-bench/driver/PowerSupply.hpp"
#include "instrument-bench/Errors.hpp"
#include "instrument-bench/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace instbench {

namespace {

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

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

std::string fixed3(double value) { return fmt::format("{:.3f}", value); }

} // namespace

nlohmann::json ProtectionStatus::to_json() const {
  return {{"raw", raw},
          {"ovp", over_voltage},
          {"ocp", over_current},
          {"unregulated", unregulated},
          {"otp", over_temperature}};
}

ProtectionStatus ProtectionStatus::decode(int register_value) {
  ProtectionStatus status;
  status.raw = register_value;
  status.over_voltage = (register_value & 0x01) != 0;
  status.over_current = (register_value & 0x02) != 0;
  status.unregulated = (register_value & 0x08) != 0;
  status.over_temperature = (register_value & 0x10) != 0;
  return status;
}

ScpiPowerSupply::ScpiPowerSupply(std::string name, TransportFactory factory,
                                 PowerSupplyProfile profile)
    : name_(std::move(name)), profile_(std::move(profile)),
      channel_(name_, std::move(factory)) {}

ScpiPowerSupply::~ScpiPowerSupply() { channel_.close(); }

void ScpiPowerSupply::open(const ConnectionParams &params) {
  LOG_INFO("DRIVER", name_, "Opening {} ({})", params.to_string(),
           to_string(params.transport));
  channel_.open(params);
}

std::string ScpiPowerSupply::verify_identity() {
  auto guard = channel_.lock();
  std::string idn = channel_.query("*IDN?");
  std::string idn_upper = upper(idn);
  bool matched = std::any_of(
      profile_.idn_matches.begin(), profile_.idn_matches.end(),
      [&](const std::string &m) {
        return idn_upper.find(upper(m)) != std::string::npos;
      });
  if (!matched) {
    LOG_ERROR("DRIVER", name_, "Unexpected identity '{}'", idn);
    throw ConnectionError(ConnectionFailure::IdentityMismatch,
                          fmt::format("'{}' is not a supported supply", idn));
  }
  identity_ = idn;
  return identity_;
}

void ScpiPowerSupply::initialize() {
  auto guard = channel_.lock();
  channel_.send("*CLS");
  channel_.send("OUTPut:STATe OFF");
  channel_.send("SOURce:VOLTage " + fixed3(0.0));
  channel_.send("SOURce:CURRent " + fixed3(1.0));
  auto errors = check_errors();
  if (!errors.empty()) {
    LOG_WARN("DRIVER", name_, "Errors during initialization: {}",
             join(errors));
  }
}

void ScpiPowerSupply::disconnect() {
  if (!channel_.is_open()) {
    return;
  }
  try {
    output_off();
  } catch (const std::exception &ex) {
    LOG_WARN("DRIVER", name_, "Could not turn output off before close: {}",
             ex.what());
  }
  channel_.close();
  LOG_INFO("DRIVER", name_, "Disconnected");
}

void ScpiPowerSupply::reset() {
  auto guard = channel_.lock();
  channel_.send("*RST");
  channel_.send("*CLS");
}

std::string ScpiPowerSupply::identity() const { return identity_; }

std::vector<std::string> ScpiPowerSupply::check_errors() {
  return channel_.drain_errors("SYSTem:ERRor?", profile_.max_error_polls);
}

void ScpiPowerSupply::send_raw(const std::string &command) {
  channel_.send(command);
}

std::string ScpiPowerSupply::query_raw(const std::string &command) {
  return channel_.query(command);
}

void ScpiPowerSupply::check_range(double value, double low, double high,
                                  const char *what) const {
  if (value < low || value > high) {
    throw UsageError(UsageFault::OutOfRange,
                     fmt::format("{}: {} {} outside [{}, {}]", name_, what,
                                 value, low, high));
  }
}

void ScpiPowerSupply::check_slot(int slot) const {
  if (slot < 1 || slot > profile_.memory_slots) {
    throw UsageError(UsageFault::OutOfRange,
                     fmt::format("{}: memory slot {} outside [1, {}]", name_,
                                 slot, profile_.memory_slots));
  }
}

void ScpiPowerSupply::throw_on_errors(const std::string &operation) {
  auto errors = check_errors();
  if (!errors.empty()) {
    throw ProtocolError(
        ProtocolFault::InstrumentFault,
        fmt::format("{} {} failed: {}", name_, operation, join(errors)));
  }
}

void ScpiPowerSupply::set_voltage(const Quantity &voltage,
                                  const Quantity &current_limit) {
  double v = voltage.value();
  double limit = current_limit.value();
  check_range(v, 0.0, profile_.max_voltage, "voltage");
  check_range(limit, 0.0, profile_.max_current, "current limit");

  auto guard = channel_.lock();
  channel_.send("SOURce:VOLTage " + fixed3(v));
  channel_.send("SOURce:CURRent " + fixed3(limit));
  throw_on_errors("set_voltage");
  LOG_DEBUG("DRIVER", name_, "Voltage {} (limit {})",
            UnitCodec::format(v, "V"), UnitCodec::format(limit, "A"));
}

void ScpiPowerSupply::set_current(const Quantity &current,
                                  const Quantity &voltage_limit) {
  double i = current.value();
  double limit = voltage_limit.value();
  check_range(i, 0.0, profile_.max_current, "current");
  check_range(limit, 0.0, profile_.max_voltage, "voltage limit");

  auto guard = channel_.lock();
  channel_.send("SOURce:CURRent " + fixed3(i));
  channel_.send("SOURce:VOLTage " + fixed3(limit));
  throw_on_errors("set_current");
}

void ScpiPowerSupply::apply(const Quantity &voltage, const Quantity &current) {
  double v = voltage.value();
  double i = current.value();
  check_range(v, 0.0, profile_.max_voltage, "voltage");
  check_range(i, 0.0, profile_.max_current, "current");

  auto guard = channel_.lock();
  channel_.send(fmt::format("APPLy CH1,{},{}", fixed3(v), fixed3(i)));
  throw_on_errors("apply");
}

void ScpiPowerSupply::output_on() {
  channel_.send("OUTPut:STATe ON");
  LOG_INFO("DRIVER", name_, "Output ON");
}

void ScpiPowerSupply::output_off() {
  channel_.send("OUTPut:STATe OFF");
  LOG_INFO("DRIVER", name_, "Output OFF");
}

bool ScpiPowerSupply::output_state() {
  std::string reply = upper(channel_.query("OUTPut:STATe?"));
  return reply == "1" || reply == "ON";
}

double ScpiPowerSupply::measure_voltage() {
  return channel_.query_double("MEASure:VOLTage?");
}

double ScpiPowerSupply::measure_current() {
  return channel_.query_double("MEASure:CURRent?");
}

double ScpiPowerSupply::measure_power() {
  return channel_.query_double("MEASure:POWer?");
}

Reading ScpiPowerSupply::measure_all() {
  auto guard = channel_.lock();
  std::string reply = channel_.query("MEASure:ALL?");
  auto values = parse_numeric_fields(reply);

  Reading reading;
  if (values && values->size() == 3) {
    reading.voltage = (*values)[0];
    reading.current = (*values)[1];
    reading.power = (*values)[2];
    return reading;
  }

  LOG_WARN("DRIVER", name_,
           "Batched measurement reply '{}' malformed, querying individually",
           reply);
  channel_.flush_input();
  reading.voltage = measure_voltage();
  reading.current = measure_current();
  reading.power = measure_power();
  return reading;
}

double ScpiPowerSupply::voltage_setpoint() {
  return channel_.query_double("SOURce:VOLTage?");
}

double ScpiPowerSupply::current_setpoint() {
  return channel_.query_double("SOURce:CURRent?");
}

void ScpiPowerSupply::set_over_voltage_protection(const Quantity &level,
                                                  bool enabled) {
  double value = level.value();
  check_range(value, profile_.min_ovp, profile_.max_ovp, "OVP level");

  auto guard = channel_.lock();
  channel_.send("SOURce:VOLTage:PROTection:LEVel " + fixed3(value));
  channel_.send(fmt::format("SOURce:VOLTage:PROTection:STATe {}",
                            enabled ? "ON" : "OFF"));
  throw_on_errors("set_over_voltage_protection");
}

void ScpiPowerSupply::set_over_current_protection(const Quantity &level,
                                                  bool enabled) {
  double value = level.value();
  check_range(value, profile_.min_ocp, profile_.max_ocp, "OCP level");

  auto guard = channel_.lock();
  channel_.send("SOURce:CURRent:PROTection:LEVel " + fixed3(value));
  channel_.send(fmt::format("SOURce:CURRent:PROTection:STATe {}",
                            enabled ? "ON" : "OFF"));
  throw_on_errors("set_over_current_protection");
}

ProtectionStatus ScpiPowerSupply::protection_status() {
  double value = channel_.query_double("STATus:QUEStionable:CONDition?");
  auto status = ProtectionStatus::decode(static_cast<int>(value));
  if (status.tripped()) {
    LOG_WARN("DRIVER", name_, "Protection tripped: {}",
             status.to_json().dump());
  }
  return status;
}

void ScpiPowerSupply::clear_protection() {
  channel_.send("OUTPut:PROTection:CLEar");
}

void ScpiPowerSupply::set_track_mode(TrackMode mode) {
  const char *name = "INDEP";
  if (mode == TrackMode::Series) {
    name = "SER";
  } else if (mode == TrackMode::Parallel) {
    name = "PARA";
  }
  channel_.send(fmt::format("OUTPut:TRACk {}", name));
}

void ScpiPowerSupply::save_state(int slot) {
  check_slot(slot);
  channel_.send(fmt::format("*SAV {}", slot));
}

void ScpiPowerSupply::recall_state(int slot) {
  check_slot(slot);
  channel_.send(fmt::format("*RCL {}", slot));
}

double ScpiPowerSupply::temperature() {
  return channel_.query_double("SYSTem:TEMPerature?");
}

} // namespace instbench
