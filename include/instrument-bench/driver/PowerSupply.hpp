#pragma once
#include "instrument-bench/driver/InstrumentDriver.hpp"
#include "instrument-bench/driver/ScpiChannel.hpp"

#include <nlohmann/json.hpp>

namespace instbench {

struct PowerSupplyProfile {
  std::vector<std::string> idn_matches{"DP711", "RIGOL"};
  int max_error_polls = 10;
  double max_voltage = 30.0;
  double max_current = 5.0;
  double max_power = 150.0;
  double min_ovp = 0.1;
  double max_ovp = 33.0;
  double min_ocp = 0.01;
  double max_ocp = 5.5;
  int memory_slots = 5;
};

/// Decoded questionable-status condition register
struct ProtectionStatus {
  int raw = 0;
  bool over_voltage = false;   // bit 0
  bool over_current = false;   // bit 1
  bool unregulated = false;    // bit 3
  bool over_temperature = false; // bit 4

  bool tripped() const {
    return over_voltage || over_current || over_temperature;
  }
  nlohmann::json to_json() const;
  static ProtectionStatus decode(int register_value);
};

enum class TrackMode { Independent, Series, Parallel };

/// Rigol DP711-style single-channel programmable supply over SCPI
class INSTRUMENT_BENCH_API ScpiPowerSupply : public PowerSupplyLike {
public:
  explicit ScpiPowerSupply(std::string name,
                           TransportFactory factory = make_transport,
                           PowerSupplyProfile profile = {});
  ~ScpiPowerSupply() override;

  DeviceKind kind() const override { return DeviceKind::PowerSupply; }
  const std::string &name() const override { return name_; }

  void open(const ConnectionParams &params) override;
  std::string verify_identity() override;
  void initialize() override;
  /// Turns the output off before closing
  void disconnect() override;
  bool is_connected() const override { return channel_.is_open(); }
  void reset() override;
  std::string identity() const override;
  std::vector<std::string> check_errors() override;
  void send_raw(const std::string &command) override;
  std::string query_raw(const std::string &command) override;

  void set_voltage(const Quantity &voltage,
                   const Quantity &current_limit) override;
  void set_current(const Quantity &current,
                   const Quantity &voltage_limit) override;
  /// APPLy CH1,v,i in a single command
  void apply(const Quantity &voltage, const Quantity &current);

  void output_on() override;
  void output_off() override;
  bool output_state() override;

  double measure_voltage() override;
  double measure_current() override;
  double measure_power() override;
  Reading measure_all() override;

  double voltage_setpoint();
  double current_setpoint();

  void set_over_voltage_protection(const Quantity &level, bool enabled = true);
  void set_over_current_protection(const Quantity &level, bool enabled = true);
  ProtectionStatus protection_status();
  void clear_protection();

  void set_track_mode(TrackMode mode);

  /// Store or recall settings in memory slot 1..5
  void save_state(int slot);
  void recall_state(int slot);

  double temperature();

  const PowerSupplyProfile &profile() const { return profile_; }

private:
  void check_range(double value, double low, double high,
                   const char *what) const;
  void check_slot(int slot) const;
  void throw_on_errors(const std::string &operation);

  std::string name_;
  PowerSupplyProfile profile_;
  ScpiChannel channel_;
  std::string identity_;
};

} // namespace instbench
