#pragma once
#include "instrument-bench/EventChannel.hpp"
#include "instrument-bench/Sample.hpp"
#include "instrument-bench/data/AnomalyDetector.hpp"
#include "instrument-bench/data/BufferPool.hpp"
#include "instrument-bench/data/StorageSink.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace instbench {

struct QuantityStats {
  size_t count = 0;
  double mean = 0.0;
  double min = 0.0;
  double max = 0.0;
  double stddev = 0.0;

  nlohmann::json to_json() const;
};

struct InstrumentStats {
  std::string instrument_id;
  size_t count = 0;
  double duration_s = 0.0;
  QuantityStats voltage;
  QuantityStats current;
  QuantityStats power;
  /// Only samples that carry a resistance contribute
  QuantityStats resistance;

  static InstrumentStats summarize(const std::string &instrument_id,
                                   const std::vector<Sample> &samples);
  nlohmann::json to_json() const;
};

struct SessionStats {
  std::string session_name;
  Timestamp started;
  Timestamp ended;
  double duration_s = 0.0;
  size_t total_samples = 0;
  std::map<std::string, InstrumentStats> instruments;
  std::optional<std::string> saved_path;

  nlohmann::json to_json() const;
};

struct SessionOptions {
  /// Zero disables auto-save
  std::chrono::milliseconds auto_save_interval{std::chrono::seconds(300)};
  size_t persistent_buffer_size = 10000;
  /// Append every session sample to <session>_live through the sink
  bool save_each_sample = false;
  AnomalyOptions analytics;
};

/// Recording sessions. Every sample goes to the BufferPool; while a session is
/// active it is also accumulated for statistics and persistence.
class INSTRUMENT_BENCH_API SessionManager {
public:
  SessionManager(BufferPool &pool, std::shared_ptr<StorageSink> sink,
                 SessionOptions options = {});
  ~SessionManager();

  SessionManager(const SessionManager &) = delete;
  SessionManager &operator=(const SessionManager &) = delete;

  /// Starts a session, ending any active one first. Returns its name.
  std::string start(std::optional<std::string> name = std::nullopt);

  /// Statistics of the ended session; nullopt when none was active
  std::optional<SessionStats> end();

  void add_sample(const Sample &sample);

  bool register_instrument(const std::string &instrument_id,
                           size_t capacity = 0);

  std::optional<std::string> current_session() const;
  bool active() const { return current_session().has_value(); }

  /// Accumulated samples of the active session, sorted by time
  std::vector<Sample> session_samples(
      const std::optional<std::string> &instrument_id = std::nullopt) const;

  /// Statistics over the buffered history, optionally limited to the
  /// trailing window
  InstrumentStats
  statistics(const std::string &instrument_id,
             std::optional<std::chrono::milliseconds> window = std::nullopt)
      const;

  /// Clears buffers and session accumulation for one or all instruments
  void clear(const std::optional<std::string> &instrument_id = std::nullopt);

  /// Writes samples within [from, to] through the sink; session data when a
  /// session is active, buffered history otherwise
  std::optional<std::string>
  export_range(const std::optional<std::string> &instrument_id, Timestamp from,
               Timestamp to);

  /// Writes the active session as <session>_backup_HHMMSS
  std::optional<std::string> save_backup();

  void set_sink(std::shared_ptr<StorageSink> sink);

  EventChannel<const Sample &> sample_added;
  EventChannel<const Anomaly &> anomaly_detected;
  EventChannel<const std::string &> session_started;
  EventChannel<const std::string &, const SessionStats &> session_ended;
  EventChannel<const std::string &> storage_error;

private:
  std::optional<std::string> persist(const std::string &name,
                                     const std::vector<Sample> &samples);
  void save_point(const std::string &stream_name, const Sample &sample);
  std::vector<Sample> collect_locked(
      const std::optional<std::string> &instrument_id) const;
  void start_auto_save();
  void stop_auto_save();
  void auto_save_loop();

  BufferPool &pool_;
  SessionOptions options_;
  AnomalyDetector detector_;

  std::mutex sink_mutex_;
  std::shared_ptr<StorageSink> sink_;

  mutable std::mutex mutex_;
  std::optional<std::string> session_;
  Timestamp session_start_;
  std::map<std::string, std::deque<Sample>> session_data_;

  std::mutex auto_save_mutex_;
  std::condition_variable auto_save_cv_;
  bool auto_save_stop_ = false;
  std::thread auto_save_thread_;
};

/// "session_YYYYmmdd_HHMMSS" in local time
INSTRUMENT_BENCH_API std::string default_session_name(Timestamp ts);

} // namespace instbench
