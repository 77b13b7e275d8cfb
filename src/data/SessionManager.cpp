#include "instrument-bench/data/SessionManager.hpp"
#include "instrument-bench/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <fmt/format.h>

namespace instbench {

namespace {

std::string local_time(Timestamp ts, const char *pattern) {
  auto t = Clock::to_time_t(ts);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[64];
  std::strftime(buf, sizeof(buf), pattern, &tm);
  return buf;
}

QuantityStats compute(const std::vector<double> &values) {
  QuantityStats st;
  st.count = values.size();
  if (values.empty()) {
    return st;
  }
  auto [lo, hi] = std::minmax_element(values.begin(), values.end());
  st.min = *lo;
  st.max = *hi;
  double sum = 0.0;
  for (double v : values) {
    sum += v;
  }
  st.mean = sum / static_cast<double>(values.size());
  double sq = 0.0;
  for (double v : values) {
    sq += (v - st.mean) * (v - st.mean);
  }
  st.stddev = std::sqrt(sq / static_cast<double>(values.size()));
  return st;
}

void sort_by_time(std::vector<Sample> &samples) {
  std::stable_sort(samples.begin(), samples.end(),
                   [](const Sample &a, const Sample &b) {
                     return a.timestamp() < b.timestamp();
                   });
}

} // namespace

std::string default_session_name(Timestamp ts) {
  return "session_" + local_time(ts, "%Y%m%d_%H%M%S");
}

nlohmann::json QuantityStats::to_json() const {
  return {{"count", count},
          {"mean", mean},
          {"min", min},
          {"max", max},
          {"stddev", stddev}};
}

InstrumentStats InstrumentStats::summarize(const std::string &instrument_id,
                                           const std::vector<Sample> &samples) {
  InstrumentStats st;
  st.instrument_id = instrument_id;
  st.count = samples.size();
  if (samples.empty()) {
    return st;
  }

  std::vector<double> v, i, p, r;
  v.reserve(samples.size());
  i.reserve(samples.size());
  p.reserve(samples.size());
  auto first = samples.front().timestamp();
  auto last = first;
  for (const auto &s : samples) {
    v.push_back(s.voltage());
    i.push_back(s.current());
    p.push_back(s.power());
    if (s.resistance() && std::isfinite(*s.resistance())) {
      r.push_back(*s.resistance());
    }
    first = std::min(first, s.timestamp());
    last = std::max(last, s.timestamp());
  }
  st.voltage = compute(v);
  st.current = compute(i);
  st.power = compute(p);
  st.resistance = compute(r);
  st.duration_s = std::chrono::duration<double>(last - first).count();
  return st;
}

nlohmann::json InstrumentStats::to_json() const {
  return {{"instrument_id", instrument_id}, {"count", count},
          {"duration_s", duration_s},       {"voltage", voltage.to_json()},
          {"current", current.to_json()},   {"power", power.to_json()},
          {"resistance", resistance.to_json()}};
}

nlohmann::json SessionStats::to_json() const {
  nlohmann::json j;
  j["session_name"] = session_name;
  j["started"] = format_timestamp(started);
  j["ended"] = format_timestamp(ended);
  j["duration_s"] = duration_s;
  j["total_samples"] = total_samples;
  j["instruments"] = nlohmann::json::object();
  for (const auto &[id, st] : instruments) {
    j["instruments"][id] = st.to_json();
  }
  j["saved_path"] = saved_path ? nlohmann::json(*saved_path) : nullptr;
  return j;
}

SessionManager::SessionManager(BufferPool &pool,
                               std::shared_ptr<StorageSink> sink,
                               SessionOptions options)
    : pool_(pool), options_(options), detector_(options.analytics),
      sink_(std::move(sink)) {
  if (options_.persistent_buffer_size == 0) {
    options_.persistent_buffer_size = 1;
  }
}

SessionManager::~SessionManager() {
  stop_auto_save();
  if (auto name = current_session()) {
    LOG_WARN("SESSION", *name, "Session still active at shutdown, not saved");
  }
}

std::string SessionManager::start(std::optional<std::string> name) {
  if (active()) {
    end();
  }

  std::string session_name = (name && !name->empty())
                                 ? *name
                                 : default_session_name(Clock::now());
  {
    std::lock_guard lock(mutex_);
    session_ = session_name;
    session_start_ = Clock::now();
    session_data_.clear();
  }
  detector_.reset();
  start_auto_save();

  LOG_INFO("SESSION", session_name, "Session started");
  session_started.emit(session_name);
  return session_name;
}

std::optional<SessionStats> SessionManager::end() {
  stop_auto_save();

  SessionStats stats;
  std::vector<Sample> samples;
  {
    std::lock_guard lock(mutex_);
    if (!session_) {
      return std::nullopt;
    }
    stats.session_name = *session_;
    stats.started = session_start_;
    stats.ended = Clock::now();
    for (const auto &[id, data] : session_data_) {
      std::vector<Sample> per(data.begin(), data.end());
      stats.instruments.emplace(id, InstrumentStats::summarize(id, per));
      stats.total_samples += per.size();
    }
    samples = collect_locked(std::nullopt);
    session_.reset();
    session_data_.clear();
  }
  stats.duration_s =
      std::chrono::duration<double>(stats.ended - stats.started).count();

  if (!samples.empty()) {
    stats.saved_path = persist(stats.session_name, samples);
  }

  LOG_INFO("SESSION", stats.session_name,
           "Session ended: {} samples from {} instruments in {:.1f}s",
           stats.total_samples, stats.instruments.size(), stats.duration_s);
  session_ended.emit(stats.session_name, stats);
  return stats;
}

void SessionManager::add_sample(const Sample &sample) {
  pool_.add(sample);
  std::optional<std::string> stream;
  {
    std::lock_guard lock(mutex_);
    if (session_) {
      auto &data = session_data_[sample.instrument_id()];
      data.push_back(sample);
      while (data.size() > options_.persistent_buffer_size) {
        data.pop_front();
      }
      if (options_.save_each_sample) {
        stream = *session_ + "_live";
      }
    }
  }
  if (stream) {
    save_point(*stream, sample);
  }

  auto anomalies = detector_.check(sample);
  sample_added.emit(sample);
  for (const auto &anomaly : anomalies) {
    LOG_WARN("SESSION", anomaly.instrument_id,
             "Anomalous {} {:.6g} (mean {:.6g}, z {:.2f})", anomaly.quantity,
             anomaly.value, anomaly.mean, anomaly.z_score);
    anomaly_detected.emit(anomaly);
  }
}

bool SessionManager::register_instrument(const std::string &instrument_id,
                                         size_t capacity) {
  return pool_.create_buffer(instrument_id, capacity);
}

std::optional<std::string> SessionManager::current_session() const {
  std::lock_guard lock(mutex_);
  return session_;
}

std::vector<Sample> SessionManager::session_samples(
    const std::optional<std::string> &instrument_id) const {
  std::lock_guard lock(mutex_);
  return collect_locked(instrument_id);
}

std::vector<Sample> SessionManager::collect_locked(
    const std::optional<std::string> &instrument_id) const {
  std::vector<Sample> out;
  for (const auto &[id, data] : session_data_) {
    if (!instrument_id || *instrument_id == id) {
      out.insert(out.end(), data.begin(), data.end());
    }
  }
  sort_by_time(out);
  return out;
}

InstrumentStats SessionManager::statistics(
    const std::string &instrument_id,
    std::optional<std::chrono::milliseconds> window) const {
  auto samples = pool_.all(instrument_id);
  if (window) {
    auto cutoff = Clock::now() - *window;
    samples.erase(std::remove_if(samples.begin(), samples.end(),
                                 [&](const Sample &s) {
                                   return s.timestamp() < cutoff;
                                 }),
                  samples.end());
  }
  return InstrumentStats::summarize(instrument_id, samples);
}

void SessionManager::clear(const std::optional<std::string> &instrument_id) {
  if (instrument_id) {
    pool_.clear(*instrument_id);
    detector_.reset(*instrument_id);
  } else {
    pool_.clear_all();
    detector_.reset();
  }

  std::lock_guard lock(mutex_);
  if (instrument_id) {
    session_data_.erase(*instrument_id);
  } else {
    session_data_.clear();
  }
}

std::optional<std::string>
SessionManager::export_range(const std::optional<std::string> &instrument_id,
                             Timestamp from, Timestamp to) {
  std::vector<Sample> data;
  if (active()) {
    data = session_samples(instrument_id);
  } else if (instrument_id) {
    data = pool_.all(*instrument_id);
  } else {
    for (const auto &id : pool_.buffer_ids()) {
      auto part = pool_.all(id);
      data.insert(data.end(), part.begin(), part.end());
    }
    sort_by_time(data);
  }

  data.erase(std::remove_if(data.begin(), data.end(),
                            [&](const Sample &s) {
                              return s.timestamp() < from ||
                                     s.timestamp() > to;
                            }),
             data.end());

  std::string tag = instrument_id.value_or("all");
  if (data.empty()) {
    LOG_WARN("SESSION", tag, "Nothing to export in the requested range");
    return std::nullopt;
  }
  return persist(fmt::format("{}_export_{}", tag,
                             local_time(Clock::now(), "%Y%m%d_%H%M%S")),
                 data);
}

std::optional<std::string> SessionManager::save_backup() {
  std::string name;
  std::vector<Sample> samples;
  {
    std::lock_guard lock(mutex_);
    if (!session_) {
      return std::nullopt;
    }
    samples = collect_locked(std::nullopt);
    name = *session_ + "_backup_" + local_time(Clock::now(), "%H%M%S");
  }
  if (samples.empty()) {
    return std::nullopt;
  }
  LOG_DEBUG("SESSION", name, "Auto-saving {} samples", samples.size());
  return persist(name, samples);
}

void SessionManager::set_sink(std::shared_ptr<StorageSink> sink) {
  std::lock_guard lock(sink_mutex_);
  sink_ = std::move(sink);
}

std::optional<std::string>
SessionManager::persist(const std::string &name,
                        const std::vector<Sample> &samples) {
  std::string failure;
  {
    std::lock_guard lock(sink_mutex_);
    if (!sink_) {
      LOG_WARN("SESSION", name, "No storage sink configured, data not saved");
      return std::nullopt;
    }
    try {
      return sink_->save_session(name, samples);
    } catch (const std::exception &ex) {
      failure = ex.what();
    }
  }
  LOG_ERROR("SESSION", name, "Failed to save session: {}", failure);
  storage_error.emit(failure);
  return std::nullopt;
}

void SessionManager::save_point(const std::string &stream_name,
                                 const Sample &sample) {
  std::string failure;
  {
    std::lock_guard lock(sink_mutex_);
    if (!sink_) {
      return;
    }
    try {
      sink_->save_point(stream_name, sample);
      return;
    } catch (const std::exception &ex) {
      failure = ex.what();
    }
  }
  LOG_ERROR("SESSION", stream_name, "Failed to save sample: {}", failure);
  storage_error.emit(failure);
}

void SessionManager::start_auto_save() {
  if (options_.auto_save_interval.count() <= 0) {
    return;
  }
  stop_auto_save();
  {
    std::lock_guard lock(auto_save_mutex_);
    auto_save_stop_ = false;
  }
  auto_save_thread_ = std::thread([this] { auto_save_loop(); });
}

void SessionManager::stop_auto_save() {
  {
    std::lock_guard lock(auto_save_mutex_);
    auto_save_stop_ = true;
  }
  auto_save_cv_.notify_all();
  if (auto_save_thread_.joinable()) {
    auto_save_thread_.join();
  }
}

void SessionManager::auto_save_loop() {
  std::unique_lock lock(auto_save_mutex_);
  while (!auto_save_stop_) {
    if (auto_save_cv_.wait_for(lock, options_.auto_save_interval,
                               [this] { return auto_save_stop_; })) {
      break;
    }
    lock.unlock();
    save_backup();
    lock.lock();
  }
}

} // namespace instbench
