#pragma once
#include "instrument-bench/driver/InstrumentDriver.hpp"
#include "instrument-bench/driver/ScpiChannel.hpp"

#include <atomic>
#include <chrono>

namespace instbench {

struct SourceMeterProfile {
  std::string idn_match = "2461";
  std::chrono::milliseconds reset_settle{1000};
  int max_error_polls = 20;
  double min_nplc = 0.01;
  double max_nplc = 10.0;
};

enum class MeasureFunction { Voltage, Current, Resistance };

/// Keithley 2461-style source-measure unit over SCPI
class INSTRUMENT_BENCH_API ScpiSourceMeter : public SourceMeterLike {
public:
  explicit ScpiSourceMeter(std::string name,
                           TransportFactory factory = make_transport,
                           SourceMeterProfile profile = {});
  ~ScpiSourceMeter() override;

  DeviceKind kind() const override { return DeviceKind::SourceMeter; }
  const std::string &name() const override { return name_; }

  void open(const ConnectionParams &params) override;
  std::string verify_identity() override;
  void initialize() override;
  void disconnect() override;
  bool is_connected() const override { return channel_.is_open(); }
  void reset() override;
  std::string identity() const override;
  std::vector<std::string> check_errors() override;
  void send_raw(const std::string &command) override;
  std::string query_raw(const std::string &command) override;

  void set_source_function(SourceFunction function) override;
  SourceFunction source_function() const override;
  void set_voltage(const Quantity &voltage,
                   const Quantity &current_limit) override;
  void set_current(const Quantity &current,
                   const Quantity &voltage_limit) override;
  void set_compliance(const Quantity &limit) override;

  void output_on() override;
  void output_off() override;
  bool output_state() override;

  double measure_voltage() override;
  double measure_current() override;
  double measure_resistance() override;
  double measure_power() override;
  Reading measure_all() override;

  /// Integration time in power-line cycles (0.01 to 10)
  void set_measurement_speed(double nplc);
  void set_auto_range(bool enabled);
  void set_measure_function(MeasureFunction function);
  void beep(double frequency_hz, double duration_s);

  /// Combined query issued by measure_all()
  static const char *batched_measure_query();

private:
  void throw_on_errors(const std::string &operation);

  std::string name_;
  SourceMeterProfile profile_;
  ScpiChannel channel_;
  std::string identity_;
  std::atomic<SourceFunction> function_{SourceFunction::Voltage};
};

} // namespace instbench
