#pragma once
#include "instrument-bench/export.h"
#include "instrument-bench/transport/Transport.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace instbench {

/// Serialized SCPI command/response exchange over one transport.
/// Every public driver operation holds lock() for its whole sequence, so
/// concurrent callers cannot interleave commands and replies.
class INSTRUMENT_BENCH_API ScpiChannel {
public:
  ScpiChannel(std::string owner, TransportFactory factory);
  ~ScpiChannel();

  ScpiChannel(const ScpiChannel &) = delete;
  ScpiChannel &operator=(const ScpiChannel &) = delete;

  /// Drops any previous transport and opens a new one
  void open(const ConnectionParams &params);
  void close();
  bool is_open() const;

  std::unique_lock<std::recursive_mutex> lock() {
    return std::unique_lock<std::recursive_mutex>(mutex_);
  }

  /// Throws UsageError(NotConnected) when closed
  void send(const std::string &command);
  std::string query(const std::string &command);

  /// Throws ProtocolError(Malformed) when the reply is not a number
  double query_double(const std::string &command);

  /// Poll error_query until the reply reports no error ("0,..." / "+0,...")
  /// or max_polls is reached
  std::vector<std::string> drain_errors(const std::string &error_query,
                                        int max_polls);

  void flush_input();

  const ConnectionParams &params() const { return params_; }

private:
  void require_open() const;

  std::string owner_;
  TransportFactory factory_;
  std::unique_ptr<Transport> transport_;
  ConnectionParams params_;
  mutable std::recursive_mutex mutex_;
};

/// Split a reply on ',' and ';', trimming whitespace around each field
INSTRUMENT_BENCH_API std::vector<std::string>
split_reply(const std::string &reply);

/// Parse every field as a double; nullopt if any field is not numeric
INSTRUMENT_BENCH_API std::optional<std::vector<double>>
parse_numeric_fields(const std::string &reply);

} // namespace instbench
