#pragma once
#include "instrument-bench/Sample.hpp"
#include "instrument-bench/driver/InstrumentDriver.hpp"

#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

namespace instbench {

/// What a MeasurementTask does on each iteration
class INSTRUMENT_BENCH_API MeasurementStrategy {
public:
  virtual ~MeasurementStrategy() = default;

  virtual std::string name() const = 0;

  virtual bool setup(PowerSupplyLike &driver, const nlohmann::json &params) = 0;
  virtual std::optional<Sample> measure_once(PowerSupplyLike &driver) = 0;
  virtual bool should_continue() const = 0;
  /// 0..100, or -1 when unbounded
  virtual int progress() const = 0;
  virtual void cleanup(PowerSupplyLike &driver) = 0;

  /// Pause inserted after each sample
  virtual std::chrono::milliseconds interval() const {
    return std::chrono::milliseconds(0);
  }

  /// cleanup() turns the output off on every exit path
  virtual bool switches_output_off() const { return false; }

  /// Returns false when the wait was cut short by a stop
  using Sleeper = std::function<bool(std::chrono::milliseconds)>;

  /// Installed by the owning task so waits inside measure_once() end on stop
  void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

protected:
  bool pause_for(std::chrono::milliseconds duration);

private:
  Sleeper sleeper_;
};

/// Repeated batched measure_all() at a fixed interval, optionally capped.
/// Params: instrument_id, interval_ms (1000), max_measurements (unbounded).
class INSTRUMENT_BENCH_API ContinuousStrategy : public MeasurementStrategy {
public:
  std::string name() const override { return "continuous"; }

  bool setup(PowerSupplyLike &driver, const nlohmann::json &params) override;
  std::optional<Sample> measure_once(PowerSupplyLike &driver) override;
  bool should_continue() const override;
  int progress() const override;
  void cleanup(PowerSupplyLike &driver) override;
  std::chrono::milliseconds interval() const override { return interval_; }

  size_t count() const { return count_; }

private:
  std::string instrument_id_;
  std::chrono::milliseconds interval_{1000};
  std::optional<size_t> max_measurements_;
  size_t count_ = 0;
};

/// Voltage sweep definition
struct INSTRUMENT_BENCH_API SweepPlan {
  double start = 0.0;
  double stop = 0.0;
  double step = 0.0;
  std::chrono::milliseconds delay{100};
  double compliance = 0.1; // current limit while sourcing voltage

  /// Reads start/stop/step (numbers or prefixed strings), delay_ms and
  /// current_limit
  static SweepPlan from_json(const nlohmann::json &params);

  /// start, start+step, ... computed by index. Never passes stop; if the
  /// step does not divide the span, stop itself is the final point.
  /// Throws UsageError for a zero step or one pointing away from stop.
  std::vector<double> targets() const;

  static constexpr size_t kMaxPoints = 1000000;
};

/// Sets each target, waits the per-point delay, then reads all quantities.
/// Output is always switched off in cleanup.
class INSTRUMENT_BENCH_API SweepStrategy : public MeasurementStrategy {
public:
  std::string name() const override { return "sweep"; }

  bool setup(PowerSupplyLike &driver, const nlohmann::json &params) override;
  std::optional<Sample> measure_once(PowerSupplyLike &driver) override;
  bool should_continue() const override;
  int progress() const override;
  void cleanup(PowerSupplyLike &driver) override;
  bool switches_output_off() const override { return true; }

  const std::vector<double> &targets() const { return targets_; }
  const SweepPlan &plan() const { return plan_; }

private:
  std::string instrument_id_;
  SweepPlan plan_;
  std::vector<double> targets_;
  size_t index_ = 0;
};

} // namespace instbench
