#pragma once
#include "instrument-bench/Sample.hpp"

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace instbench {

struct Anomaly {
  std::string instrument_id;
  std::string quantity;
  double value = 0.0;
  double mean = 0.0;
  double stddev = 0.0;
  double z_score = 0.0;
  Timestamp timestamp;

  nlohmann::json to_json() const;
};

struct AnomalyOptions {
  size_t window_size = 100;
  double threshold_sigma = 3.0;
  size_t min_history = 10;
};

/// Sliding-window z-score check per instrument and quantity. A sample is
/// compared against the window before it, then added to it.
class INSTRUMENT_BENCH_API AnomalyDetector {
public:
  explicit AnomalyDetector(AnomalyOptions options = {});

  std::vector<Anomaly> check(const Sample &sample);

  void reset();
  void reset(const std::string &instrument_id);

  const AnomalyOptions &options() const { return options_; }

private:
  using Window = std::deque<double>;

  bool evaluate(Window &window, const std::string &quantity, double value,
                const Sample &sample, Anomaly &out) const;

  AnomalyOptions options_;
  std::mutex mutex_;
  std::map<std::string, std::map<std::string, Window>> history_;
};

} // namespace instbench
