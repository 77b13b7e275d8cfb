#include "instrument-bench/worker/MeasurementStrategy.hpp"
#include "instrument-bench/Errors.hpp"
#include "instrument-bench/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <thread>

namespace instbench {

bool MeasurementStrategy::pause_for(std::chrono::milliseconds duration) {
  if (sleeper_) {
    return sleeper_(duration);
  }
  std::this_thread::sleep_for(duration);
  return true;
}

namespace {

double number_param(const nlohmann::json &params, const char *key,
                    double fallback) {
  if (!params.is_object() || !params.contains(key) || params[key].is_null()) {
    return fallback;
  }
  const auto &value = params[key];
  if (value.is_number()) {
    return value.get<double>();
  }
  if (value.is_string()) {
    return UnitCodec::parse(value.get<std::string>());
  }
  throw UsageError(UsageFault::InvalidArgument,
                   fmt::format("Parameter '{}' must be a number", key));
}

double required_number(const nlohmann::json &params, const char *key) {
  if (!params.is_object() || !params.contains(key)) {
    throw UsageError(UsageFault::InvalidArgument,
                     fmt::format("Missing sweep parameter '{}'", key));
  }
  return number_param(params, key, 0.0);
}

std::string instrument_id_from(const nlohmann::json &params,
                               const PowerSupplyLike &driver) {
  if (!params.is_object()) {
    return driver.name();
  }
  return params.value("instrument_id", driver.name());
}

} // namespace

// ---------------------------------------------------------------------------
// ContinuousStrategy

bool ContinuousStrategy::setup(PowerSupplyLike &driver,
                               const nlohmann::json &params) {
  instrument_id_ = instrument_id_from(params, driver);
  interval_ = std::chrono::milliseconds(
      static_cast<int64_t>(number_param(params, "interval_ms", 1000)));
  max_measurements_.reset();
  if (params.is_object() && params.contains("max_measurements") &&
      !params["max_measurements"].is_null()) {
    max_measurements_ = params["max_measurements"].get<size_t>();
  }
  count_ = 0;

  if (!driver.is_connected()) {
    throw UsageError(UsageFault::NotConnected,
                     fmt::format("{} is not connected", driver.name()));
  }
  LOG_INFO("WORKER", instrument_id_, "Continuous measurement every {} ms{}",
           interval_.count(),
           max_measurements_ ? fmt::format(", {} samples", *max_measurements_)
                             : std::string());
  return true;
}

std::optional<Sample> ContinuousStrategy::measure_once(PowerSupplyLike &driver) {
  Reading r = driver.measure_all();
  ++count_;
  return Sample(Clock::now(), instrument_id_, r.voltage, r.current,
                r.resistance, r.power,
                {{"measurement_number", count_}, {"mode", name()}});
}

bool ContinuousStrategy::should_continue() const {
  return !max_measurements_ || count_ < *max_measurements_;
}

int ContinuousStrategy::progress() const {
  if (!max_measurements_ || *max_measurements_ == 0) {
    return -1;
  }
  return static_cast<int>(
      std::min<size_t>(100, count_ * 100 / *max_measurements_));
}

void ContinuousStrategy::cleanup(PowerSupplyLike &) {
  LOG_INFO("WORKER", instrument_id_, "Continuous measurement ended after {}",
           count_);
}

// ---------------------------------------------------------------------------
// SweepPlan

SweepPlan SweepPlan::from_json(const nlohmann::json &params) {
  SweepPlan plan;
  plan.start = required_number(params, "start");
  plan.stop = required_number(params, "stop");
  plan.step = required_number(params, "step");
  plan.delay = std::chrono::milliseconds(
      static_cast<int64_t>(number_param(params, "delay_ms", 100)));
  plan.compliance = number_param(params, "current_limit", 0.1);
  return plan;
}

std::vector<double> SweepPlan::targets() const {
  if (step == 0.0 || !std::isfinite(step)) {
    throw UsageError(UsageFault::InvalidArgument, "Sweep step must be non-zero");
  }
  double span = stop - start;
  if (span * step < 0.0) {
    throw UsageError(UsageFault::InvalidArgument,
                     fmt::format("Step {} moves away from stop {}", step, stop));
  }

  double count = std::floor(span / step + 1e-9);
  if (count + 2 > static_cast<double>(kMaxPoints)) {
    throw UsageError(UsageFault::OutOfRange,
                     fmt::format("Sweep would need {} points", count + 1));
  }

  const double tolerance = 1e-9 * std::fabs(step);
  const bool ascending = step > 0.0;
  std::vector<double> points;
  points.reserve(static_cast<size_t>(count) + 2);
  for (size_t i = 0; i <= static_cast<size_t>(count); ++i) {
    double value = start + static_cast<double>(i) * step;
    points.push_back(ascending ? std::min(value, stop) : std::max(value, stop));
  }
  if (std::fabs(points.back() - stop) > tolerance) {
    points.push_back(stop);
  }
  return points;
}

// ---------------------------------------------------------------------------
// SweepStrategy

bool SweepStrategy::setup(PowerSupplyLike &driver,
                          const nlohmann::json &params) {
  instrument_id_ = instrument_id_from(params, driver);
  plan_ = SweepPlan::from_json(params);
  targets_ = plan_.targets();
  index_ = 0;

  if (auto *smu = dynamic_cast<SourceMeterLike *>(&driver)) {
    smu->set_source_function(SourceFunction::Voltage);
  }
  driver.set_voltage(targets_.front(), plan_.compliance);
  driver.output_on();

  LOG_INFO("WORKER", instrument_id_,
           "Sweep {} -> {} step {}: {} points, {} ms delay, limit {}",
           UnitCodec::format(plan_.start, "V"),
           UnitCodec::format(plan_.stop, "V"), plan_.step, targets_.size(),
           plan_.delay.count(), UnitCodec::format(plan_.compliance, "A"));
  return true;
}

std::optional<Sample> SweepStrategy::measure_once(PowerSupplyLike &driver) {
  if (index_ >= targets_.size()) {
    return std::nullopt;
  }

  double target = targets_[index_];
  driver.set_voltage(target, plan_.compliance);
  if (!pause_for(plan_.delay)) {
    return std::nullopt;
  }
  Reading r = driver.measure_all();
  ++index_;

  return Sample(Clock::now(), instrument_id_, r.voltage, r.current,
                r.resistance, r.power,
                {{"set_voltage", target},
                 {"point_number", index_},
                 {"total_points", targets_.size()},
                 {"mode", name()}});
}

bool SweepStrategy::should_continue() const {
  return index_ < targets_.size();
}

int SweepStrategy::progress() const {
  if (targets_.empty()) {
    return 100;
  }
  return static_cast<int>(index_ * 100 / targets_.size());
}

void SweepStrategy::cleanup(PowerSupplyLike &driver) {
  driver.output_off();
  LOG_INFO("WORKER", instrument_id_, "Sweep finished at point {}/{}", index_,
           targets_.size());
}

} // namespace instbench
