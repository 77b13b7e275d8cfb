#include "instrument-bench/Sample.hpp"

#include <cmath>
#include <ctime>
#include <fmt/format.h>

namespace instbench {

Sample::Sample(Timestamp timestamp, std::string instrument_id, double voltage,
               double current, std::optional<double> resistance,
               std::optional<double> power, nlohmann::json metadata)
    : timestamp_(timestamp), instrument_id_(std::move(instrument_id)),
      voltage_(voltage), current_(current), resistance_(resistance),
      power_(power.value_or(voltage * current)),
      metadata_(std::move(metadata)) {
  if (!resistance_ && current_ != 0.0) {
    resistance_ = voltage_ / current_;
  }
}

double Sample::epoch_seconds() const {
  return std::chrono::duration<double>(timestamp_.time_since_epoch()).count();
}

size_t Sample::approx_bytes() const {
  size_t bytes = sizeof(Sample) + instrument_id_.capacity();
  if (!metadata_.is_null()) {
    bytes += metadata_.dump().size();
  }
  return bytes;
}

nlohmann::json Sample::to_json() const {
  nlohmann::json j;
  j["timestamp"] = format_timestamp(timestamp_);
  j["epoch"] = epoch_seconds();
  j["instrument_id"] = instrument_id_;
  j["voltage"] = voltage_;
  j["current"] = current_;
  if (resistance_ && std::isfinite(*resistance_)) {
    j["resistance"] = *resistance_;
  } else {
    j["resistance"] = nullptr;
  }
  j["power"] = power_;
  if (!metadata_.is_null()) {
    j["metadata"] = metadata_;
  }
  return j;
}

Sample Sample::from_json(const nlohmann::json &j) {
  std::optional<double> resistance;
  if (j.contains("resistance") && !j["resistance"].is_null()) {
    resistance = j["resistance"].get<double>();
  }
  std::optional<double> power;
  if (j.contains("power") && !j["power"].is_null()) {
    power = j["power"].get<double>();
  }
  return Sample(from_epoch_seconds(j.at("epoch").get<double>()),
                j.at("instrument_id").get<std::string>(),
                j.at("voltage").get<double>(), j.at("current").get<double>(),
                resistance, power, j.value("metadata", nlohmann::json()));
}

std::string format_timestamp(Timestamp ts) {
  auto t = Clock::to_time_t(ts);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                ts.time_since_epoch())
                .count() %
            1000;
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  return fmt::format("{}.{:03d}", buf, static_cast<int>(ms));
}

Timestamp from_epoch_seconds(double seconds) {
  return Timestamp(std::chrono::duration_cast<Clock::duration>(
      std::chrono::duration<double>(seconds)));
}

} // namespace instbench
