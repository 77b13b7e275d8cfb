#include "instrument-bench/transport/StreamTransport.hpp"
#include "instrument-bench/Errors.hpp"
#include "instrument-bench/Logger.hpp"

#include <cerrno>
#include <cstring>
#include <fmt/format.h>
#include <poll.h>
#include <unistd.h>

namespace instbench {

StreamTransport::~StreamTransport() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

void StreamTransport::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
    LOG_DEBUG("TRANSPORT", describe(), "Closed");
  }
  rx_buffer_.clear();
}

ssize_t StreamTransport::write_some(const char *data, size_t len) {
  return ::write(fd_, data, len);
}

void StreamTransport::write_line(const std::string &line) {
  if (fd_ < 0) {
    throw UsageError(UsageFault::NotConnected,
                     fmt::format("{} is not open", describe()));
  }

  LOG_TRACE("TRANSPORT", describe(), "TX {}", line);
  std::string data = line + "\n";
  size_t sent = 0;
  auto deadline = std::chrono::steady_clock::now() + timeout_;

  while (sent < data.size()) {
    ssize_t n = write_some(data.data() + sent, data.size() - sent);
    if (n > 0) {
      sent += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
      throw ConnectionError(ConnectionFailure::Unreachable,
                            fmt::format("write to {} failed: {}", describe(),
                                        std::strerror(errno)));
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      throw ConnectionError(ConnectionFailure::TimedOut,
                            fmt::format("write to {} timed out", describe()));
    }
    pollfd pfd{fd_, POLLOUT, 0};
    ::poll(&pfd, 1, static_cast<int>(remaining.count()));
  }
}

std::string StreamTransport::read_line() {
  if (fd_ < 0) {
    throw UsageError(UsageFault::NotConnected,
                     fmt::format("{} is not open", describe()));
  }

  auto deadline = std::chrono::steady_clock::now() + timeout_;
  while (true) {
    auto newline = rx_buffer_.find('\n');
    if (newline != std::string::npos) {
      std::string line = rx_buffer_.substr(0, newline);
      rx_buffer_.erase(0, newline + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      LOG_TRACE("TRANSPORT", describe(), "RX {}", line);
      return line;
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      throw ConnectionError(
          ConnectionFailure::TimedOut,
          fmt::format("no reply from {} within {} ms", describe(),
                      timeout_.count()));
    }

    pollfd pfd{fd_, POLLIN, 0};
    int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw ConnectionError(ConnectionFailure::Unreachable,
                            fmt::format("poll on {} failed: {}", describe(),
                                        std::strerror(errno)));
    }
    if (ready == 0) {
      continue;
    }

    char buf[512];
    ssize_t n = ::read(fd_, buf, sizeof(buf));
    if (n > 0) {
      rx_buffer_.append(buf, static_cast<size_t>(n));
    } else if (n == 0) {
      throw ConnectionError(ConnectionFailure::Unreachable,
                            fmt::format("{} closed by peer", describe()));
    } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
      throw ConnectionError(ConnectionFailure::Unreachable,
                            fmt::format("read from {} failed: {}", describe(),
                                        std::strerror(errno)));
    }
  }
}

void StreamTransport::flush_input() {
  rx_buffer_.clear();
  if (fd_ < 0) {
    return;
  }
  char buf[256];
  pollfd pfd{fd_, POLLIN, 0};
  while (::poll(&pfd, 1, 0) > 0 && (pfd.revents & POLLIN)) {
    if (::read(fd_, buf, sizeof(buf)) <= 0) {
      break;
    }
  }
}

} // namespace instbench
