#include "instrument-bench/transport/Transport.hpp"
#include "instrument-bench/Errors.hpp"
#include "instrument-bench/transport/SerialTransport.hpp"
#include "instrument-bench/transport/SocketTransport.hpp"
#include "instrument-bench/transport/VisaSocketTransport.hpp"

#include <fmt/format.h>

namespace instbench {

namespace {

int parse_int(const std::string &text, const std::string &what) {
  try {
    size_t used = 0;
    int value = std::stoi(text, &used);
    if (used != text.size()) {
      throw std::invalid_argument(text);
    }
    return value;
  } catch (const std::exception &) {
    throw UsageError(UsageFault::InvalidArgument,
                     fmt::format("Invalid {}: '{}'", what, text));
  }
}

bool starts_with(const std::string &s, const std::string &prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

const char *to_string(TransportKind kind) {
  switch (kind) {
  case TransportKind::Socket:
    return "tcp";
  case TransportKind::VisaSocket:
    return "visa";
  case TransportKind::Serial:
    return "serial";
  }
  return "tcp";
}

ConnectionParams ConnectionParams::parse(const std::string &target,
                                         int default_port, int default_baud) {
  if (target.empty()) {
    throw UsageError(UsageFault::InvalidArgument, "Empty connection target");
  }

  ConnectionParams params;
  std::string rest = target;

  if (starts_with(target, "visa:") || starts_with(target, "TCPIP")) {
    params.transport = TransportKind::VisaSocket;
    params.address = starts_with(target, "visa:") ? target.substr(5) : target;
    params.port =
        VisaSocketTransport::parse_resource(params.address, default_port)
            .second;
    return params;
  }

  if (starts_with(target, "serial:")) {
    params.transport = TransportKind::Serial;
    rest = target.substr(7);
  } else if (starts_with(target, "tcp:")) {
    params.transport = TransportKind::Socket;
    rest = target.substr(4);
  } else if (starts_with(target, "/dev/") || starts_with(target, "COM")) {
    params.transport = TransportKind::Serial;
  }

  auto colon = rest.rfind(':');
  if (params.transport == TransportKind::Serial) {
    params.port = default_baud;
    if (colon != std::string::npos) {
      params.address = rest.substr(0, colon);
      params.port = parse_int(rest.substr(colon + 1), "baud rate");
    } else {
      params.address = rest;
    }
    params.timeout = std::chrono::milliseconds(5000);
  } else {
    params.port = default_port;
    if (colon != std::string::npos) {
      params.address = rest.substr(0, colon);
      params.port = parse_int(rest.substr(colon + 1), "port");
    } else {
      params.address = rest;
    }
  }

  if (params.address.empty()) {
    throw UsageError(UsageFault::InvalidArgument,
                     fmt::format("Missing address in '{}'", target));
  }
  return params;
}

std::string ConnectionParams::to_string() const {
  switch (transport) {
  case TransportKind::VisaSocket:
    return address;
  case TransportKind::Serial:
    return fmt::format("{}@{}", address, port);
  case TransportKind::Socket:
    break;
  }
  return fmt::format("{}:{}", address, port);
}

std::unique_ptr<Transport> make_transport(const ConnectionParams &params) {
  switch (params.transport) {
  case TransportKind::VisaSocket:
    return std::make_unique<VisaSocketTransport>(params.address,
                                                 params.timeout, params.port);
  case TransportKind::Serial:
    return std::make_unique<SerialTransport>(params.address, params.port,
                                             params.timeout);
  case TransportKind::Socket:
    break;
  }
  return std::make_unique<SocketTransport>(params.address, params.port,
                                           params.timeout);
}

} // namespace instbench
