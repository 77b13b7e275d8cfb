#pragma once
#include "instrument-bench/driver/InstrumentDriver.hpp"
#include "instrument-bench/transport/SocketTransport.hpp"
#include "instrument-bench/worker/WorkerEngine.hpp"

#include <memory>
#include <vector>

namespace instbench {

/// Fast reachability check for socket-style params
INSTRUMENT_BENCH_API ProbeResult probe_target(const ConnectionParams &params);

/// Probe, open, identify and initialize one instrument off the caller's
/// thread. cancel() is honoured between phases; a blocking read in progress
/// is not interrupted, so the worst-case delay is one I/O timeout.
class INSTRUMENT_BENCH_API ConnectionTask : public WorkerEngine {
public:
  ConnectionTask(std::shared_ptr<InstrumentDriver> driver,
                 ConnectionParams params);
  ~ConnectionTask() override;

  void cancel() { request_stop(); }

  bool succeeded() const { return succeeded_; }
  std::string identity() const;
  const ConnectionParams &params() const { return params_; }
  std::shared_ptr<InstrumentDriver> driver() const { return driver_; }

  EventChannel<const std::string &> connected;
  /// Failure kind plus a diagnostic naming the cause
  EventChannel<ConnectionFailure, const std::string &> connection_failed;

protected:
  bool setup() override;
  bool execute_once() override;
  void cleanup() override;

private:
  void fail(ConnectionFailure failure, const std::string &detail);

  std::shared_ptr<InstrumentDriver> driver_;
  const ConnectionParams params_;
  std::atomic<bool> succeeded_{false};
  mutable std::mutex identity_mutex_;
  std::string identity_;
};

struct ReconnectPolicy {
  int max_attempts = 3;
  std::chrono::milliseconds retry_delay{2000};
  /// Pause between closing the old link and opening the new one
  std::chrono::milliseconds settle{1000};

  static ReconnectPolicy from(const ConnectionParams &params) {
    ReconnectPolicy policy;
    policy.max_attempts = params.retry_count;
    policy.retry_delay = params.retry_delay;
    return policy;
  }
};

/// Retries the full connection up to max_attempts times, reopening the
/// transport from scratch on each attempt
class INSTRUMENT_BENCH_API ReconnectionTask : public WorkerEngine {
public:
  ReconnectionTask(std::shared_ptr<InstrumentDriver> driver,
                   ConnectionParams params, ReconnectPolicy policy);
  ReconnectionTask(std::shared_ptr<InstrumentDriver> driver,
                   ConnectionParams params)
      : ReconnectionTask(std::move(driver), params,
                         ReconnectPolicy::from(params)) {}
  ~ReconnectionTask() override;

  int attempts() const { return attempt_; }
  bool succeeded() const { return succeeded_; }

  EventChannel<int> attempt;
  EventChannel<int, const std::string &> attempt_failed;
  EventChannel<const std::string &> reconnected;
  EventChannel<int> max_attempts_reached;

protected:
  bool setup() override;
  bool execute_once() override;
  void cleanup() override {}

private:
  std::shared_ptr<InstrumentDriver> driver_;
  const ConnectionParams params_;
  const ReconnectPolicy policy_;
  std::atomic<int> attempt_{0};
  std::atomic<bool> succeeded_{false};
  std::string last_failure_;
};

struct BatchTarget {
  std::string port;
  std::shared_ptr<InstrumentDriver> driver;
  ConnectionParams params;
};

/// Connects several instruments one after another
class INSTRUMENT_BENCH_API BatchConnectionTask : public WorkerEngine {
public:
  explicit BatchConnectionTask(std::vector<BatchTarget> targets);
  ~BatchConnectionTask() override;

  size_t connected_count() const { return connected_count_; }
  size_t failed_count() const { return failed_count_; }

  EventChannel<const std::string &, const std::string &> device_connected;
  EventChannel<const std::string &, const std::string &> device_failed;

protected:
  bool setup() override;
  bool execute_once() override;
  void cleanup() override {}

private:
  std::vector<BatchTarget> targets_;
  size_t index_ = 0;
  std::atomic<size_t> connected_count_{0};
  std::atomic<size_t> failed_count_{0};
};

} // namespace instbench
