#pragma once
#include "instrument-bench/transport/StreamTransport.hpp"

#include <vector>

namespace instbench {

/// RS-232 at a configurable baud rate, 8N1, raw mode
class INSTRUMENT_BENCH_API SerialTransport : public StreamTransport {
public:
  SerialTransport(std::string device, int baud_rate,
                  std::chrono::milliseconds timeout);

  void open() override;

  TransportKind kind() const override { return TransportKind::Serial; }
  std::string describe() const override;

  const std::string &device() const { return device_; }
  int baud_rate() const { return baud_rate_; }

  static bool is_supported_baud(int baud_rate);
  static std::vector<int> supported_bauds();

private:
  std::string device_;
  int baud_rate_;
};

} // namespace instbench
