#include "instrument-bench/transport/VisaSocketTransport.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <vector>

namespace instbench {

namespace {

std::vector<std::string> split_resource(const std::string &resource) {
  std::vector<std::string> fields;
  size_t start = 0;
  while (true) {
    auto sep = resource.find("::", start);
    fields.push_back(resource.substr(start, sep - start));
    if (sep == std::string::npos) {
      break;
    }
    start = sep + 2;
  }
  return fields;
}

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

} // namespace

std::pair<std::string, int>
VisaSocketTransport::parse_resource(const std::string &resource,
                                    int default_port) {
  auto fields = split_resource(resource);
  if (fields.size() < 3 || upper(fields.front()).rfind("TCPIP", 0) != 0 ||
      upper(fields.back()) != "SOCKET" || fields[1].empty()) {
    throw UsageError(
        UsageFault::InvalidArgument,
        fmt::format("Unsupported VISA resource '{}' (expected "
                    "TCPIP[n]::host[::port]::SOCKET)",
                    resource));
  }

  int port = default_port;
  if (fields.size() == 4) {
    try {
      port = std::stoi(fields[2]);
    } catch (const std::exception &) {
      throw UsageError(UsageFault::InvalidArgument,
                       fmt::format("Invalid port in '{}'", resource));
    }
  } else if (fields.size() > 4) {
    throw UsageError(UsageFault::InvalidArgument,
                     fmt::format("Too many fields in '{}'", resource));
  }
  return {fields[1], port};
}

VisaSocketTransport::VisaSocketTransport(const std::string &resource,
                                         std::chrono::milliseconds timeout,
                                         int default_port)
    : SocketTransport(parse_resource(resource, default_port).first,
                      parse_resource(resource, default_port).second, timeout),
      resource_(resource) {}

} // namespace instbench
