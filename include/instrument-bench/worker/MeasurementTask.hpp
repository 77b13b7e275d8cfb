#pragma once
#include "instrument-bench/worker/MeasurementStrategy.hpp"
#include "instrument-bench/worker/WorkerEngine.hpp"

#include <memory>

namespace instbench {

/// Drives a MeasurementStrategy against one instrument on its own thread.
/// Samples go out through `sample` (and as JSON through `result`) in the
/// order they are taken. After a failure or a stop the output is switched
/// off during cleanup.
class INSTRUMENT_BENCH_API MeasurementTask : public WorkerEngine {
public:
  MeasurementTask(std::shared_ptr<PowerSupplyLike> driver,
                  std::unique_ptr<MeasurementStrategy> strategy,
                  nlohmann::json params = nlohmann::json::object());
  ~MeasurementTask() override;

  const MeasurementStrategy &strategy() const { return *strategy_; }
  uint64_t sample_count() const { return sample_count_; }

  EventChannel<const Sample &> sample;

protected:
  bool setup() override;
  bool execute_once() override;
  void cleanup() override;

private:
  std::shared_ptr<PowerSupplyLike> driver_;
  std::unique_ptr<MeasurementStrategy> strategy_;
  nlohmann::json params_;
  std::atomic<uint64_t> sample_count_{0};
};

} // namespace instbench
