#include "instrument-bench/transport/SerialTransport.hpp"
#include "instrument-bench/Errors.hpp"
#include "instrument-bench/Logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fmt/format.h>
#include <map>
#include <termios.h>
#include <unistd.h>

namespace instbench {

namespace {

const std::map<int, speed_t> &baud_table() {
  static const std::map<int, speed_t> table{
      {1200, B1200},     {2400, B2400},     {4800, B4800},
      {9600, B9600},     {19200, B19200},   {38400, B38400},
      {57600, B57600},   {115200, B115200}, {230400, B230400},
      {460800, B460800}, {921600, B921600}};
  return table;
}

} // namespace

SerialTransport::SerialTransport(std::string device, int baud_rate,
                                 std::chrono::milliseconds timeout)
    : StreamTransport(timeout), device_(std::move(device)),
      baud_rate_(baud_rate) {
  if (!is_supported_baud(baud_rate_)) {
    throw UsageError(UsageFault::OutOfRange,
                     fmt::format("Unsupported baud rate {}", baud_rate_));
  }
}

bool SerialTransport::is_supported_baud(int baud_rate) {
  return baud_table().count(baud_rate) > 0;
}

std::vector<int> SerialTransport::supported_bauds() {
  std::vector<int> bauds;
  for (const auto &[baud, speed] : baud_table()) {
    bauds.push_back(baud);
  }
  return bauds;
}

std::string SerialTransport::describe() const {
  return fmt::format("{}@{}", device_, baud_rate_);
}

void SerialTransport::open() {
  if (is_open()) {
    return;
  }

  int fd = ::open(device_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd < 0) {
    throw ConnectionError(ConnectionFailure::Unreachable,
                          fmt::format("cannot open {}: {}", device_,
                                      std::strerror(errno)));
  }

  termios tty{};
  if (::tcgetattr(fd, &tty) != 0) {
    std::string err = std::strerror(errno);
    ::close(fd);
    throw ConnectionError(ConnectionFailure::Unreachable,
                          fmt::format("tcgetattr on {} failed: {}", device_,
                                      err));
  }

  ::cfmakeraw(&tty);
  speed_t speed = baud_table().at(baud_rate_);
  ::cfsetispeed(&tty, speed);
  ::cfsetospeed(&tty, speed);

  // 8N1, no flow control
  tty.c_cflag &= ~(PARENB | CSTOPB | CSIZE | CRTSCTS);
  tty.c_cflag |= CS8 | CLOCAL | CREAD;
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);
  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = 0;

  if (::tcsetattr(fd, TCSANOW, &tty) != 0) {
    std::string err = std::strerror(errno);
    ::close(fd);
    throw ConnectionError(ConnectionFailure::Unreachable,
                          fmt::format("tcsetattr on {} failed: {}", device_,
                                      err));
  }
  ::tcflush(fd, TCIOFLUSH);

  fd_ = fd;
  rx_buffer_.clear();
  LOG_INFO("TRANSPORT", describe(), "Serial port opened (8N1)");
}

} // namespace instbench
