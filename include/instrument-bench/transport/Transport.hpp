#pragma once
#include "instrument-bench/export.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace instbench {

enum class TransportKind { Socket, VisaSocket, Serial };

INSTRUMENT_BENCH_API const char *to_string(TransportKind kind);

constexpr int kDefaultScpiPort = 5025;
constexpr int kDefaultBaudRate = 9600;

/// Immutable description of how to reach one instrument
struct INSTRUMENT_BENCH_API ConnectionParams {
  TransportKind transport = TransportKind::Socket;
  std::string address;  // host name, VISA resource, or serial device path
  int port = kDefaultScpiPort; // TCP port, or baud rate for serial links
  std::chrono::milliseconds timeout{10000};
  int retry_count = 3;
  std::chrono::milliseconds retry_delay{2000};
  std::chrono::milliseconds probe_timeout{2000};

  bool is_network() const { return transport != TransportKind::Serial; }

  /// "tcp:host[:port]", "visa:TCPIP0::host::port::SOCKET",
  /// "serial:/dev/ttyUSB0[:baud]". A bare "/dev/..." means serial and a
  /// bare host means tcp. Throws UsageError on malformed input.
  static ConnectionParams parse(const std::string &target,
                                int default_port = kDefaultScpiPort,
                                int default_baud = kDefaultBaudRate);

  std::string to_string() const;
};

/// Line-oriented byte channel carrying SCPI text
class INSTRUMENT_BENCH_API Transport {
public:
  virtual ~Transport() = default;

  /// Throws ConnectionError (Unreachable or TimedOut)
  virtual void open() = 0;
  virtual void close() = 0;
  virtual bool is_open() const = 0;

  /// Appends the '\n' terminator
  virtual void write_line(const std::string &line) = 0;

  /// One reply line without its terminator. Throws ConnectionError(TimedOut)
  virtual std::string read_line() = 0;

  /// Discard anything already received
  virtual void flush_input() {}

  virtual void set_timeout(std::chrono::milliseconds timeout) = 0;
  virtual std::chrono::milliseconds timeout() const = 0;

  virtual TransportKind kind() const = 0;
  virtual std::string describe() const = 0;

  std::string query(const std::string &command) {
    write_line(command);
    return read_line();
  }
};

using TransportFactory =
    std::function<std::unique_ptr<Transport>(const ConnectionParams &)>;

/// Transport for params.transport, not yet opened
INSTRUMENT_BENCH_API std::unique_ptr<Transport>
make_transport(const ConnectionParams &params);

} // namespace instbench
