#pragma once
#include "instrument-bench/driver/InstrumentDriver.hpp"
#include "instrument-bench/Errors.hpp"

#include <atomic>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace instbench {
namespace test {

/// In-memory source meter / power supply with failure injection. The
/// simulated load is a resistor: measured current is voltage / load.
class MockDriver : public SourceMeterLike {
public:
  explicit MockDriver(std::string name,
                      DeviceKind kind = DeviceKind::SourceMeter);

  DeviceKind kind() const override { return kind_; }
  const std::string &name() const override { return name_; }

  void open(const ConnectionParams &params) override;
  std::string verify_identity() override;
  void initialize() override;
  void disconnect() override;
  bool is_connected() const override { return connected_; }
  void reset() override;
  std::string identity() const override;
  std::vector<std::string> check_errors() override { return {}; }
  void send_raw(const std::string &command) override;
  std::string query_raw(const std::string &command) override;

  void set_voltage(const Quantity &voltage,
                   const Quantity &current_limit) override;
  void set_current(const Quantity &current,
                   const Quantity &voltage_limit) override;
  void output_on() override;
  void output_off() override;
  bool output_state() override { return output_; }

  double measure_voltage() override;
  double measure_current() override;
  double measure_power() override;
  Reading measure_all() override;

  void set_source_function(SourceFunction function) override {
    function_ = function;
  }
  SourceFunction source_function() const override { return function_; }
  void set_compliance(const Quantity &limit) override;
  double measure_resistance() override;

  // Failure injection
  void set_identity(const std::string &idn);
  void fail_open(ConnectionFailure failure);
  void fail_open_times(int times, ConnectionFailure failure);
  /// verify_identity() throws ConnectionError(IdentityMismatch)
  void reject_identity(bool enabled) { reject_identity_ = enabled; }
  void throw_on_disconnect(bool enabled) { throw_on_disconnect_ = enabled; }
  /// measure_all() throws ProtocolError once this many readings were taken
  void fail_measure_after(int readings) { fail_after_ = readings; }
  void throw_on_output_off(bool enabled) { throw_on_output_off_ = enabled; }
  void set_load(double ohms) { load_ohms_ = ohms; }
  /// Readings returned by measure_all() before the load model is used
  void queue_reading(const Reading &reading);

  // Observation
  std::vector<double> voltage_history() const;
  int open_calls() const { return open_calls_; }
  int disconnect_calls() const { return disconnect_calls_; }
  int output_off_calls() const { return output_off_calls_; }
  int measure_calls() const { return measure_calls_; }
  double compliance() const { return compliance_; }

private:
  void require_connected() const;

  std::string name_;
  DeviceKind kind_;

  mutable std::mutex mutex_;
  std::string identity_;
  std::string expected_identity_;
  std::optional<ConnectionFailure> open_failure_;
  int open_failures_left_ = 0;
  std::deque<Reading> queued_;
  std::vector<double> voltage_history_;

  std::atomic<bool> connected_{false};
  std::atomic<bool> output_{false};
  std::atomic<bool> reject_identity_{false};
  std::atomic<bool> throw_on_disconnect_{false};
  std::atomic<bool> throw_on_output_off_{false};
  std::atomic<int> fail_after_{-1};
  std::atomic<int> open_calls_{0};
  std::atomic<int> disconnect_calls_{0};
  std::atomic<int> output_off_calls_{0};
  std::atomic<int> measure_calls_{0};
  std::atomic<double> voltage_{0.0};
  std::atomic<double> compliance_{0.1};
  std::atomic<double> load_ohms_{1000.0};
  std::atomic<SourceFunction> function_{SourceFunction::Voltage};
};

} // namespace test
} // namespace instbench
