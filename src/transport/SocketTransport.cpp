#include "instrument-bench/transport/SocketTransport.hpp"
#include "instrument-bench/Logger.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fmt/format.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace instbench {

namespace {

struct ConnectOutcome {
  int fd = -1;
  ConnectionFailure failure = ConnectionFailure::Unreachable;
  std::string detail;
};

// Non-blocking connect bounded by timeout; the returned fd stays non-blocking
ConnectOutcome connect_with_timeout(const std::string &host, int port,
                                    std::chrono::milliseconds timeout) {
  ConnectOutcome outcome;

  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *result = nullptr;
  std::string service = std::to_string(port);
  int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
  if (rc != 0 || !result) {
    outcome.detail =
        fmt::format("cannot resolve {}: {}", host, ::gai_strerror(rc));
    return outcome;
  }

  int fd = ::socket(result->ai_family, result->ai_socktype, result->ai_protocol);
  if (fd < 0) {
    outcome.detail = fmt::format("socket() failed: {}", std::strerror(errno));
    ::freeaddrinfo(result);
    return outcome;
  }
  ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL, 0) | O_NONBLOCK);

  rc = ::connect(fd, result->ai_addr, result->ai_addrlen);
  ::freeaddrinfo(result);

  if (rc < 0 && errno != EINPROGRESS) {
    outcome.detail = fmt::format("cannot reach {}:{}: {}", host, port,
                                 std::strerror(errno));
    ::close(fd);
    return outcome;
  }

  if (rc < 0) {
    pollfd pfd{fd, POLLOUT, 0};
    int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready == 0) {
      outcome.failure = ConnectionFailure::TimedOut;
      outcome.detail = fmt::format("no response from {}:{} within {} ms",
                                   host, port, timeout.count());
      ::close(fd);
      return outcome;
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
    if (ready < 0 || so_error != 0) {
      outcome.detail =
          fmt::format("cannot reach {}:{}: {}", host, port,
                      std::strerror(ready < 0 ? errno : so_error));
      ::close(fd);
      return outcome;
    }
  }

  outcome.fd = fd;
  return outcome;
}

} // namespace

SocketTransport::SocketTransport(std::string host, int port,
                                 std::chrono::milliseconds timeout)
    : StreamTransport(timeout), host_(std::move(host)), port_(port) {}

std::string SocketTransport::describe() const {
  return fmt::format("{}:{}", host_, port_);
}

void SocketTransport::open() {
  if (is_open()) {
    return;
  }

  LOG_DEBUG("TRANSPORT", describe(), "Connecting (timeout {} ms)",
            timeout_.count());
  auto outcome = connect_with_timeout(host_, port_, timeout_);
  if (outcome.fd < 0) {
    LOG_WARN("TRANSPORT", describe(), "Connect failed: {}", outcome.detail);
    throw ConnectionError(outcome.failure, outcome.detail);
  }

  fd_ = outcome.fd;
  int flag = 1;
  if (::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) < 0) {
    LOG_WARN("TRANSPORT", describe(), "Couldn't disable Nagle: {}",
             std::strerror(errno));
  }
  rx_buffer_.clear();
  LOG_INFO("TRANSPORT", describe(), "Connected");
}

ssize_t SocketTransport::write_some(const char *data, size_t len) {
  return ::send(fd_, data, len, MSG_NOSIGNAL);
}

ProbeResult SocketTransport::probe(const std::string &host, int port,
                                   std::chrono::milliseconds timeout) {
  ProbeResult result;
  auto outcome = connect_with_timeout(host, port, timeout);
  if (outcome.fd < 0) {
    result.failure = outcome.failure;
    result.detail = outcome.detail;
    LOG_DEBUG("TRANSPORT", fmt::format("{}:{}", host, port),
              "Probe failed: {}", outcome.detail);
    return result;
  }
  ::close(outcome.fd);
  result.reachable = true;
  return result;
}

} // namespace instbench
