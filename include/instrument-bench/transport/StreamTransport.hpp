#pragma once
#include "instrument-bench/transport/Transport.hpp"

#include <string>
#include <sys/types.h>

namespace instbench {

/// Shared poll()-driven line I/O over a file descriptor
class INSTRUMENT_BENCH_API StreamTransport : public Transport {
public:
  explicit StreamTransport(std::chrono::milliseconds timeout)
      : timeout_(timeout) {}
  ~StreamTransport() override;

  StreamTransport(const StreamTransport &) = delete;
  StreamTransport &operator=(const StreamTransport &) = delete;

  void close() override;
  bool is_open() const override { return fd_ >= 0; }

  void write_line(const std::string &line) override;
  std::string read_line() override;
  void flush_input() override;

  void set_timeout(std::chrono::milliseconds timeout) override {
    timeout_ = timeout;
  }
  std::chrono::milliseconds timeout() const override { return timeout_; }

protected:
  virtual ssize_t write_some(const char *data, size_t len);

  int fd_ = -1;
  std::chrono::milliseconds timeout_;
  std::string rx_buffer_;
};

} // namespace instbench
