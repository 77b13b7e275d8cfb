#pragma once
#include "instrument-bench/Errors.hpp"
#include "instrument-bench/transport/StreamTransport.hpp"

namespace instbench {

struct ProbeResult {
  bool reachable = false;
  ConnectionFailure failure = ConnectionFailure::Unreachable;
  std::string detail;
};

/// Raw SCPI over TCP ("host:port", port 5025 by default)
class INSTRUMENT_BENCH_API SocketTransport : public StreamTransport {
public:
  SocketTransport(std::string host, int port,
                  std::chrono::milliseconds timeout);

  void open() override;

  TransportKind kind() const override { return TransportKind::Socket; }
  std::string describe() const override;

  const std::string &host() const { return host_; }
  int port() const { return port_; }

  /// Fast TCP reachability check: connect and close within timeout
  static ProbeResult probe(const std::string &host, int port,
                           std::chrono::milliseconds timeout);

protected:
  ssize_t write_some(const char *data, size_t len) override;

private:
  std::string host_;
  int port_;
};

} // namespace instbench
