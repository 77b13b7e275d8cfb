#include "instrument-bench/worker/ConnectionTask.hpp"
#include "instrument-bench/Logger.hpp"
#include "instrument-bench/transport/VisaSocketTransport.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <tuple>

namespace instbench {

ProbeResult probe_target(const ConnectionParams &params) {
  std::string host = params.address;
  int port = params.port;
  if (params.transport == TransportKind::VisaSocket) {
    std::tie(host, port) =
        VisaSocketTransport::parse_resource(params.address, params.port);
  }
  return SocketTransport::probe(host, port, params.probe_timeout);
}

// ---------------------------------------------------------------------------
// ConnectionTask

ConnectionTask::ConnectionTask(std::shared_ptr<InstrumentDriver> driver,
                               ConnectionParams params)
    : WorkerEngine("connect:" + params.to_string()), driver_(std::move(driver)),
      params_(std::move(params)) {}

ConnectionTask::~ConnectionTask() { stop_and_join(); }

std::string ConnectionTask::identity() const {
  std::lock_guard lock(identity_mutex_);
  return identity_;
}

bool ConnectionTask::setup() {
  if (!driver_) {
    throw UsageError(UsageFault::InvalidArgument, "No driver to connect");
  }
  succeeded_ = false;
  LOG_INFO("WORKER", name(), "Connecting {} to {}", driver_->name(),
           params_.to_string());
  return true;
}

void ConnectionTask::fail(ConnectionFailure failure,
                          const std::string &detail) {
  connection_failed.emit(failure, fmt::format("{}: {}", describe(failure),
                                              detail));
  throw ConnectionError(failure, detail);
}

bool ConnectionTask::execute_once() {
  report_progress(0);

  if (params_.is_network()) {
    auto probe = probe_target(params_);
    if (!probe.reachable) {
      // Whatever the socket reported, a failed probe means nothing answers
      fail(ConnectionFailure::Unreachable, probe.detail);
    }
  }
  if (stop_requested()) {
    return false;
  }
  report_progress(25);

  try {
    driver_->open(params_);
    if (stop_requested()) {
      return false;
    }
    report_progress(50);

    std::string id = driver_->verify_identity();
    if (stop_requested()) {
      return false;
    }
    report_progress(75);

    driver_->initialize();
    {
      std::lock_guard lock(identity_mutex_);
      identity_ = id;
    }
    succeeded_ = true;
  } catch (const ConnectionError &ex) {
    connection_failed.emit(ex.failure(), ex.what());
    throw;
  }

  report_progress(100);
  LOG_INFO("WORKER", name(), "Connected: {}", identity());
  connected.emit(identity());
  report_result({{"identity", identity()},
                 {"address", params_.to_string()},
                 {"driver", driver_->name()}});
  return false;
}

void ConnectionTask::cleanup() {
  if (!succeeded_ && driver_ && driver_->is_connected()) {
    LOG_INFO("WORKER", name(), "Closing partially opened link");
    driver_->disconnect();
  }
}

// ---------------------------------------------------------------------------
// ReconnectionTask

ReconnectionTask::ReconnectionTask(std::shared_ptr<InstrumentDriver> driver,
                                   ConnectionParams params,
                                   ReconnectPolicy policy)
    : WorkerEngine("reconnect:" + params.to_string()),
      driver_(std::move(driver)), params_(std::move(params)),
      policy_(policy) {}

ReconnectionTask::~ReconnectionTask() { stop_and_join(); }

bool ReconnectionTask::setup() {
  if (!driver_) {
    throw UsageError(UsageFault::InvalidArgument, "No driver to reconnect");
  }
  attempt_ = 0;
  succeeded_ = false;
  return true;
}

bool ReconnectionTask::execute_once() {
  if (attempt_ >= policy_.max_attempts) {
    LOG_WARN("WORKER", name(), "Giving up after {} attempts",
             policy_.max_attempts);
    max_attempts_reached.emit(policy_.max_attempts);
    throw ConnectionError(
        ConnectionFailure::Unreachable,
        fmt::format("gave up after {} attempts: {}", policy_.max_attempts,
                    last_failure_));
  }

  int n = ++attempt_;
  LOG_INFO("WORKER", name(), "Reconnection attempt {}/{}", n,
           policy_.max_attempts);
  attempt.emit(n);
  report_progress(n * 100 / std::max(1, policy_.max_attempts));

  if (driver_->is_connected()) {
    driver_->disconnect();
  }
  if (!sleep_for(policy_.settle)) {
    return false;
  }

  try {
    std::string id = driver_->connect(params_);
    succeeded_ = true;
    reconnected.emit(id);
    report_result({{"identity", id}, {"attempts", n}});
    return false;
  } catch (const BenchError &ex) {
    last_failure_ = ex.what();
    LOG_WARN("WORKER", name(), "Attempt {} failed: {}", n, ex.what());
    attempt_failed.emit(n, last_failure_);
  }

  if (attempt_ < policy_.max_attempts) {
    return sleep_for(policy_.retry_delay);
  }
  return true;
}

// ---------------------------------------------------------------------------
// BatchConnectionTask

BatchConnectionTask::BatchConnectionTask(std::vector<BatchTarget> targets)
    : WorkerEngine("batch-connect"), targets_(std::move(targets)) {}

BatchConnectionTask::~BatchConnectionTask() { stop_and_join(); }

bool BatchConnectionTask::setup() {
  index_ = 0;
  connected_count_ = 0;
  failed_count_ = 0;
  LOG_INFO("WORKER", name(), "Connecting {} instruments", targets_.size());
  return true;
}

bool BatchConnectionTask::execute_once() {
  if (index_ >= targets_.size()) {
    report_result({{"connected", connected_count_.load()},
                   {"failed", failed_count_.load()},
                   {"total", targets_.size()}});
    return false;
  }

  const auto &target = targets_[index_];
  try {
    if (!target.driver) {
      throw UsageError(UsageFault::InvalidArgument, "no driver");
    }
    std::string id = target.driver->connect(target.params);
    ++connected_count_;
    device_connected.emit(target.port, id);
  } catch (const BenchError &ex) {
    ++failed_count_;
    LOG_WARN("WORKER", name(), "{} failed: {}", target.port, ex.what());
    device_failed.emit(target.port, ex.what());
  }

  ++index_;
  report_progress(static_cast<int>(index_ * 100 / targets_.size()));
  return true;
}

} // namespace instbench
