#include "instrument-bench/Errors.hpp"

namespace instbench {

const char *to_string(ErrorCategory category) {
  switch (category) {
  case ErrorCategory::Connection:
    return "connection";
  case ErrorCategory::Protocol:
    return "protocol";
  case ErrorCategory::Usage:
    return "usage";
  case ErrorCategory::Resource:
    return "resource";
  case ErrorCategory::Internal:
    return "internal";
  }
  return "internal";
}

const char *describe(ConnectionFailure failure) {
  switch (failure) {
  case ConnectionFailure::Unreachable:
    return "unreachable";
  case ConnectionFailure::TimedOut:
    return "timed out";
  case ConnectionFailure::IdentityMismatch:
    return "unexpected identity";
  }
  return "unreachable";
}

ConnectionError::ConnectionError(ConnectionFailure failure,
                                 const std::string &message)
    : BenchError(ErrorCategory::Connection,
                 std::string(describe(failure)) + ": " + message),
      failure_(failure) {}

} // namespace instbench
