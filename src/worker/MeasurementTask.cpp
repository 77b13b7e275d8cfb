#include "instrument-bench/worker/MeasurementTask.hpp"
#include "instrument-bench/Logger.hpp"

namespace instbench {

MeasurementTask::MeasurementTask(std::shared_ptr<PowerSupplyLike> driver,
                                 std::unique_ptr<MeasurementStrategy> strategy,
                                 nlohmann::json params)
    : WorkerEngine((strategy ? strategy->name() : std::string("measure")) +
                   ":" + (driver ? driver->name() : std::string("none"))),
      driver_(std::move(driver)), strategy_(std::move(strategy)),
      params_(std::move(params)) {}

MeasurementTask::~MeasurementTask() { stop_and_join(); }

bool MeasurementTask::setup() {
  if (!driver_ || !strategy_) {
    throw UsageError(UsageFault::InvalidArgument,
                     "Measurement needs a driver and a strategy");
  }
  sample_count_ = 0;
  strategy_->set_sleeper(
      [this](std::chrono::milliseconds d) { return sleep_for(d); });
  return strategy_->setup(*driver_, params_);
}

bool MeasurementTask::execute_once() {
  if (!strategy_->should_continue()) {
    return false;
  }

  if (auto s = strategy_->measure_once(*driver_)) {
    ++sample_count_;
    sample.emit(*s);
    report_result(s->to_json());
  }
  report_progress(strategy_->progress());

  auto interval = strategy_->interval();
  if (interval.count() > 0 && strategy_->should_continue()) {
    sleep_for(interval);
  }
  return true;
}

void MeasurementTask::cleanup() {
  if (!driver_ || !strategy_) {
    return;
  }

  bool output_off_sent = false;
  try {
    strategy_->cleanup(*driver_);
    output_off_sent = strategy_->switches_output_off();
  } catch (const std::exception &ex) {
    LOG_ERROR("WORKER", name(), "Strategy cleanup failed: {}", ex.what());
  }

  bool must_switch_off =
      failed() || stop_requested() || strategy_->switches_output_off();
  if (must_switch_off && !output_off_sent) {
    try {
      driver_->output_off();
    } catch (const std::exception &ex) {
      LOG_ERROR("WORKER", name(), "Could not switch output off: {}",
                ex.what());
    }
  }
}

} // namespace instbench
