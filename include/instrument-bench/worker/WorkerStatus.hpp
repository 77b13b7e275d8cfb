#pragma once
#include "instrument-bench/Errors.hpp"
#include "instrument-bench/export.h"

#include <string>

namespace instbench {

enum class WorkerStatus { Idle, Running, Paused, Stopping, Failed, Completed };

INSTRUMENT_BENCH_API const char *to_string(WorkerStatus status);

/// Idle->Running, Running<->Paused, Running|Paused->Stopping->Idle,
/// Running->Failed, Running->Completed
INSTRUMENT_BENCH_API bool is_valid_transition(WorkerStatus from,
                                              WorkerStatus to);

inline bool is_terminal(WorkerStatus status) {
  return status == WorkerStatus::Failed || status == WorkerStatus::Completed;
}

/// Typed error notification from a task
struct WorkerError {
  ErrorCategory category = ErrorCategory::Internal;
  std::string message;
  std::string task;
};

} // namespace instbench
