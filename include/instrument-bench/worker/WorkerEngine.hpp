#pragma once
#include "instrument-bench/EventChannel.hpp"
#include "instrument-bench/worker/WorkerStatus.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <thread>

namespace instbench {

constexpr int kProgressIndeterminate = -1;
constexpr std::chrono::milliseconds kDefaultStopTimeout{5000};
constexpr std::chrono::milliseconds kPausePollInterval{100};

/// Runs setup() / execute_once() / cleanup() on a dedicated thread and
/// reports everything through typed channels.
///
/// cleanup() runs exactly once on every exit path. Concrete tasks must call
/// stop_and_join() from their own destructor; the engine cannot call back
/// into a partially destroyed object.
class INSTRUMENT_BENCH_API WorkerEngine {
public:
  explicit WorkerEngine(std::string name);
  virtual ~WorkerEngine();

  WorkerEngine(const WorkerEngine &) = delete;
  WorkerEngine &operator=(const WorkerEngine &) = delete;

  /// Only from Idle
  bool start();

  /// No-op unless Running
  bool pause();

  /// No-op unless Paused
  bool resume();

  /// Ask the loop to exit at the next boundary; does not block
  void request_stop();

  /// request_stop() then wait up to timeout for the thread. On timeout false
  /// is returned and the thread stays owned by the engine; a later stop(),
  /// wait() or stop_and_join() reaps it.
  bool stop(std::chrono::milliseconds timeout = kDefaultStopTimeout);

  /// Wait for the run to finish on its own
  bool wait(std::chrono::milliseconds timeout);

  WorkerStatus status() const;
  const std::string &name() const { return name_; }
  uint64_t operation_count() const { return operation_count_; }
  uint64_t error_count() const { return error_count_; }
  std::optional<WorkerError> last_error() const;

  /// (from, to)
  EventChannel<WorkerStatus, WorkerStatus> state_changed;
  /// 0..100 or kProgressIndeterminate
  EventChannel<int> progress;
  EventChannel<const WorkerError &> error;
  /// Successive result payloads, each with "task" and "timestamp"
  EventChannel<const nlohmann::json &> result;
  /// {task, operations, errors} on reaching Completed
  EventChannel<const nlohmann::json &> completed;

protected:
  virtual bool setup() = 0;
  /// false ends the loop without error
  virtual bool execute_once() = 0;
  virtual void cleanup() = 0;

  /// For destructors: stop(), then block until the thread is gone even if
  /// it is stuck in I/O past the stop timeout.
  void stop_and_join(std::chrono::milliseconds timeout = kDefaultStopTimeout);

  bool stop_requested() const { return stop_requested_; }

  /// A failure was recorded during this run (meaningful inside cleanup())
  bool failed() const { return failed_; }

  /// Sleep that wakes early on stop; false when a stop was requested
  bool sleep_for(std::chrono::milliseconds duration);

  void report_progress(int percent);
  void report_result(nlohmann::json payload);

private:
  void run();
  void wake();
  bool transition(WorkerStatus to);
  void finish(WorkerStatus to);
  void record_failure(ErrorCategory category, const std::string &message);
  bool join_with_timeout(std::chrono::milliseconds timeout);

  std::string name_;

  mutable std::mutex state_mutex_;
  WorkerStatus status_ = WorkerStatus::Idle;
  std::optional<WorkerError> last_error_;

  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> paused_{false};
  std::atomic<bool> failed_{false};
  std::atomic<uint64_t> operation_count_{0};
  std::atomic<uint64_t> error_count_{0};

  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
  bool finished_ = true;
  std::condition_variable done_cv_;

  std::thread thread_;
};

} // namespace instbench
