#include "instrument-bench/data/AnomalyDetector.hpp"

#include <cmath>

namespace instbench {

nlohmann::json Anomaly::to_json() const {
  return {{"instrument_id", instrument_id},
          {"quantity", quantity},
          {"value", value},
          {"mean", mean},
          {"stddev", stddev},
          {"z_score", z_score},
          {"timestamp", format_timestamp(timestamp)}};
}

AnomalyDetector::AnomalyDetector(AnomalyOptions options) : options_(options) {
  if (options_.window_size == 0) {
    options_.window_size = 1;
  }
}

std::vector<Anomaly> AnomalyDetector::check(const Sample &sample) {
  std::lock_guard lock(mutex_);
  auto &windows = history_[sample.instrument_id()];

  const std::pair<const char *, double> quantities[] = {
      {"voltage", sample.voltage()},
      {"current", sample.current()},
      {"power", sample.power()}};

  std::vector<Anomaly> found;
  for (const auto &[quantity, value] : quantities) {
    if (!std::isfinite(value)) {
      continue;
    }
    Anomaly anomaly;
    if (evaluate(windows[quantity], quantity, value, sample, anomaly)) {
      found.push_back(anomaly);
    }
  }
  return found;
}

bool AnomalyDetector::evaluate(Window &window, const std::string &quantity,
                               double value, const Sample &sample,
                               Anomaly &out) const {
  bool flagged = false;
  if (window.size() >= options_.min_history) {
    double sum = 0.0;
    for (double v : window) {
      sum += v;
    }
    double mean = sum / static_cast<double>(window.size());
    double sq = 0.0;
    for (double v : window) {
      sq += (v - mean) * (v - mean);
    }
    double stddev = std::sqrt(sq / static_cast<double>(window.size()));

    // A flat window has no spread to compare against
    if (stddev > 0.0) {
      double z = std::abs(value - mean) / stddev;
      if (z > options_.threshold_sigma) {
        out.instrument_id = sample.instrument_id();
        out.quantity = quantity;
        out.value = value;
        out.mean = mean;
        out.stddev = stddev;
        out.z_score = z;
        out.timestamp = sample.timestamp();
        flagged = true;
      }
    }
  }

  window.push_back(value);
  while (window.size() > options_.window_size) {
    window.pop_front();
  }
  return flagged;
}

void AnomalyDetector::reset() {
  std::lock_guard lock(mutex_);
  history_.clear();
}

void AnomalyDetector::reset(const std::string &instrument_id) {
  std::lock_guard lock(mutex_);
  history_.erase(instrument_id);
}

} // namespace instbench
