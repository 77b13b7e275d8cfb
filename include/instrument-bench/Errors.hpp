#pragma once
#include "instrument-bench/export.h"

#include <stdexcept>
#include <string>

namespace instbench {

enum class ErrorCategory { Connection, Protocol, Usage, Resource, Internal };

enum class ConnectionFailure { Unreachable, TimedOut, IdentityMismatch };

enum class ProtocolFault { Malformed, InstrumentFault };

enum class UsageFault { NotConnected, OutOfRange, InvalidArgument };

INSTRUMENT_BENCH_API const char *to_string(ErrorCategory category);

/// Human diagnostic: "unreachable", "timed out", "unexpected identity"
INSTRUMENT_BENCH_API const char *describe(ConnectionFailure failure);

/// Base of every error raised by transports, drivers and the data layer
class INSTRUMENT_BENCH_API BenchError : public std::runtime_error {
public:
  BenchError(ErrorCategory category, const std::string &message)
      : std::runtime_error(message), category_(category) {}

  ErrorCategory category() const noexcept { return category_; }

private:
  ErrorCategory category_;
};

class INSTRUMENT_BENCH_API ConnectionError : public BenchError {
public:
  ConnectionError(ConnectionFailure failure, const std::string &message);

  ConnectionFailure failure() const noexcept { return failure_; }

private:
  ConnectionFailure failure_;
};

class INSTRUMENT_BENCH_API ProtocolError : public BenchError {
public:
  ProtocolError(ProtocolFault fault, const std::string &message)
      : BenchError(ErrorCategory::Protocol, message), fault_(fault) {}

  ProtocolFault fault() const noexcept { return fault_; }

private:
  ProtocolFault fault_;
};

class INSTRUMENT_BENCH_API UsageError : public BenchError {
public:
  UsageError(UsageFault fault, const std::string &message)
      : BenchError(ErrorCategory::Usage, message), fault_(fault) {}

  UsageFault fault() const noexcept { return fault_; }

private:
  UsageFault fault_;
};

class INSTRUMENT_BENCH_API ResourceError : public BenchError {
public:
  explicit ResourceError(const std::string &message)
      : BenchError(ErrorCategory::Resource, message) {}
};

} // namespace instbench
