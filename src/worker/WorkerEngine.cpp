#include "instrument-bench/worker/WorkerEngine.hpp"
#include "instrument-bench/Logger.hpp"
#include "instrument-bench/Sample.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace instbench {

const char *to_string(WorkerStatus status) {
  switch (status) {
  case WorkerStatus::Idle:
    return "idle";
  case WorkerStatus::Running:
    return "running";
  case WorkerStatus::Paused:
    return "paused";
  case WorkerStatus::Stopping:
    return "stopping";
  case WorkerStatus::Failed:
    return "failed";
  case WorkerStatus::Completed:
    return "completed";
  }
  return "idle";
}

bool is_valid_transition(WorkerStatus from, WorkerStatus to) {
  switch (from) {
  case WorkerStatus::Idle:
    return to == WorkerStatus::Running;
  case WorkerStatus::Running:
    return to == WorkerStatus::Paused || to == WorkerStatus::Stopping ||
           to == WorkerStatus::Failed || to == WorkerStatus::Completed;
  case WorkerStatus::Paused:
    return to == WorkerStatus::Running || to == WorkerStatus::Stopping;
  case WorkerStatus::Stopping:
    return to == WorkerStatus::Idle;
  case WorkerStatus::Failed:
  case WorkerStatus::Completed:
    return false;
  }
  return false;
}

WorkerEngine::WorkerEngine(std::string name) : name_(std::move(name)) {}

WorkerEngine::~WorkerEngine() {
  if (thread_.joinable()) {
    bool finished;
    {
      std::lock_guard lock(wake_mutex_);
      finished = finished_;
    }
    if (!finished) {
      LOG_ERROR("WORKER", name_,
                "Destroyed while running (missing stop_and_join())");
      request_stop();
    }
    thread_.join();
  }
}

WorkerStatus WorkerEngine::status() const {
  std::lock_guard lock(state_mutex_);
  return status_;
}

std::optional<WorkerError> WorkerEngine::last_error() const {
  std::lock_guard lock(state_mutex_);
  return last_error_;
}

bool WorkerEngine::transition(WorkerStatus to) {
  WorkerStatus from;
  {
    std::lock_guard lock(state_mutex_);
    from = status_;
    if (!is_valid_transition(from, to)) {
      LOG_DEBUG("WORKER", name_, "Ignoring transition {} -> {}",
                to_string(from), to_string(to));
      return false;
    }
    status_ = to;
  }
  LOG_DEBUG("WORKER", name_, "{} -> {}", to_string(from), to_string(to));
  state_changed.emit(from, to);
  return true;
}

bool WorkerEngine::start() {
  if (status() != WorkerStatus::Idle) {
    LOG_WARN("WORKER", name_, "Cannot start from state {}",
             to_string(status()));
    return false;
  }

  // A previous run that ended in Idle leaves a finished thread behind
  if (thread_.joinable()) {
    thread_.join();
  }

  stop_requested_ = false;
  paused_ = false;
  failed_ = false;
  operation_count_ = 0;
  {
    std::lock_guard lock(wake_mutex_);
    finished_ = false;
  }

  if (!transition(WorkerStatus::Running)) {
    std::lock_guard lock(wake_mutex_);
    finished_ = true;
    return false;
  }

  LOG_INFO("WORKER", name_, "Starting");
  thread_ = std::thread(&WorkerEngine::run, this);
  return true;
}

bool WorkerEngine::pause() {
  if (!transition(WorkerStatus::Paused)) {
    return false;
  }
  paused_ = true;
  LOG_INFO("WORKER", name_, "Paused");
  return true;
}

bool WorkerEngine::resume() {
  {
    std::lock_guard lock(state_mutex_);
    if (status_ != WorkerStatus::Paused) {
      return false;
    }
  }
  paused_ = false;
  if (!transition(WorkerStatus::Running)) {
    return false;
  }
  wake();
  LOG_INFO("WORKER", name_, "Resumed");
  return true;
}

void WorkerEngine::request_stop() {
  WorkerStatus from;
  bool moved = false;
  {
    std::lock_guard lock(state_mutex_);
    from = status_;
    stop_requested_ = true;
    paused_ = false;
    if (is_valid_transition(from, WorkerStatus::Stopping)) {
      status_ = WorkerStatus::Stopping;
      moved = true;
    }
  }
  wake();
  if (moved) {
    LOG_INFO("WORKER", name_, "Stop requested");
    state_changed.emit(from, WorkerStatus::Stopping);
  }
}

bool WorkerEngine::stop(std::chrono::milliseconds timeout) {
  request_stop();
  if (!thread_.joinable()) {
    return true;
  }
  if (thread_.get_id() == std::this_thread::get_id()) {
    // Called from a listener on the worker thread; the loop exits by itself
    return true;
  }
  return join_with_timeout(timeout);
}

bool WorkerEngine::wait(std::chrono::milliseconds timeout) {
  if (!thread_.joinable()) {
    return true;
  }
  if (thread_.get_id() == std::this_thread::get_id()) {
    return false;
  }
  std::unique_lock lock(wake_mutex_);
  if (!done_cv_.wait_for(lock, timeout, [this] { return finished_; })) {
    return false;
  }
  lock.unlock();
  thread_.join();
  return true;
}

bool WorkerEngine::join_with_timeout(std::chrono::milliseconds timeout) {
  std::unique_lock lock(wake_mutex_);
  if (done_cv_.wait_for(lock, timeout, [this] { return finished_; })) {
    lock.unlock();
    thread_.join();
    return true;
  }
  LOG_WARN("WORKER", name_, "Did not stop within {} ms", timeout.count());
  return false;
}

void WorkerEngine::stop_and_join(std::chrono::milliseconds timeout) {
  if (stop(timeout) || !thread_.joinable()) {
    return;
  }
  LOG_ERROR("WORKER", name_,
            "Still blocked after stop timeout, waiting for it to exit");
  thread_.join();
}

void WorkerEngine::wake() {
  // Taking the lock orders the flag change before any waiter's predicate check
  { std::lock_guard lock(wake_mutex_); }
  wake_cv_.notify_all();
}

bool WorkerEngine::sleep_for(std::chrono::milliseconds duration) {
  std::unique_lock lock(wake_mutex_);
  wake_cv_.wait_for(lock, duration, [this] { return stop_requested_.load(); });
  return !stop_requested_;
}

void WorkerEngine::report_progress(int percent) {
  if (percent != kProgressIndeterminate) {
    percent = std::clamp(percent, 0, 100);
  }
  progress.emit(percent);
}

void WorkerEngine::report_result(nlohmann::json payload) {
  if (!payload.is_object()) {
    payload = nlohmann::json{{"value", payload}};
  }
  payload["task"] = name_;
  payload["timestamp"] = format_timestamp(Clock::now());
  result.emit(payload);
}

void WorkerEngine::record_failure(ErrorCategory category,
                                  const std::string &message) {
  failed_ = true;
  ++error_count_;
  WorkerError err{category, message, name_};
  {
    std::lock_guard lock(state_mutex_);
    last_error_ = err;
  }
  LOG_ERROR("WORKER", name_, "{} error: {}", to_string(category), message);
  error.emit(err);
}

void WorkerEngine::finish(WorkerStatus to) {
  std::vector<std::pair<WorkerStatus, WorkerStatus>> changes;
  {
    std::lock_guard lock(state_mutex_);
    auto step = [&](WorkerStatus next) {
      if (is_valid_transition(status_, next)) {
        changes.emplace_back(status_, next);
        status_ = next;
      }
    };
    if (status_ == WorkerStatus::Stopping) {
      to = WorkerStatus::Idle;
    } else if (to == WorkerStatus::Idle) {
      step(WorkerStatus::Stopping);
    } else if (status_ == WorkerStatus::Paused) {
      step(WorkerStatus::Running);
    }
    step(to);
  }
  for (const auto &[from, next] : changes) {
    LOG_DEBUG("WORKER", name_, "{} -> {}", to_string(from), to_string(next));
    state_changed.emit(from, next);
  }

  if (to == WorkerStatus::Completed) {
    completed.emit(nlohmann::json{{"task", name_},
                                  {"operations", operation_count_.load()},
                                  {"errors", error_count_.load()}});
  }
  LOG_INFO("WORKER", name_, "Finished in state {} ({} operations, {} errors)",
           to_string(status()), operation_count_.load(), error_count_.load());
}

void WorkerEngine::run() {
  bool cleaned = false;
  auto run_cleanup = [&] {
    if (cleaned) {
      return;
    }
    cleaned = true;
    try {
      cleanup();
    } catch (const BenchError &ex) {
      record_failure(ex.category(), std::string("cleanup: ") + ex.what());
    } catch (const std::exception &ex) {
      record_failure(ErrorCategory::Internal,
                     std::string("cleanup: ") + ex.what());
    }
  };

  bool ready = false;
  try {
    ready = setup();
    if (!ready && !failed_) {
      record_failure(ErrorCategory::Internal, "setup failed");
    }
  } catch (const BenchError &ex) {
    record_failure(ex.category(), ex.what());
  } catch (const std::exception &ex) {
    record_failure(ErrorCategory::Internal, ex.what());
  }

  if (ready) {
    try {
      while (!stop_requested_) {
        if (paused_) {
          std::unique_lock lock(wake_mutex_);
          wake_cv_.wait_for(lock, kPausePollInterval, [this] {
            return !paused_ || stop_requested_;
          });
          continue;
        }
        if (!execute_once()) {
          break;
        }
        ++operation_count_;
      }
    } catch (const BenchError &ex) {
      record_failure(ex.category(), ex.what());
    } catch (const std::exception &ex) {
      record_failure(ErrorCategory::Internal, ex.what());
    }
  }

  run_cleanup();

  if (failed_) {
    finish(WorkerStatus::Failed);
  } else if (stop_requested_) {
    finish(WorkerStatus::Idle);
  } else {
    finish(WorkerStatus::Completed);
  }

  {
    std::lock_guard lock(wake_mutex_);
    finished_ = true;
  }
  done_cv_.notify_all();
}

} // namespace instbench
