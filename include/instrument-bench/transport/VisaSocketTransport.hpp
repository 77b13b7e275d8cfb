#pragma once
#include "instrument-bench/transport/SocketTransport.hpp"

#include <utility>

namespace instbench {

/// VISA-style resource "TCPIP[n]::host[::port]::SOCKET" over a TCP socket
class INSTRUMENT_BENCH_API VisaSocketTransport : public SocketTransport {
public:
  VisaSocketTransport(const std::string &resource,
                      std::chrono::milliseconds timeout,
                      int default_port = kDefaultScpiPort);

  TransportKind kind() const override { return TransportKind::VisaSocket; }
  std::string describe() const override { return resource_; }

  /// Host and port of a SOCKET resource. Throws UsageError otherwise.
  static std::pair<std::string, int>
  parse_resource(const std::string &resource,
                 int default_port = kDefaultScpiPort);

private:
  std::string resource_;
};

} // namespace instbench
