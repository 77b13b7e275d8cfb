#include "instrument-bench/driver/ScpiChannel.hpp"
#include "instrument-bench/Errors.hpp"
#include "instrument-bench/Logger.hpp"

#include <fmt/format.h>
#include <optional>

namespace instbench {

namespace {

std::string trim(const std::string &s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

std::optional<double> to_double(const std::string &text) {
  try {
    size_t used = 0;
    double value = std::stod(text, &used);
    if (used != text.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

bool is_no_error(const std::string &reply) {
  return reply.empty() || reply.rfind("0,", 0) == 0 ||
         reply.rfind("+0,", 0) == 0 || reply == "0";
}

} // namespace

std::vector<std::string> split_reply(const std::string &reply) {
  std::vector<std::string> fields;
  std::string current;
  for (char c : reply) {
    if (c == ',' || c == ';') {
      fields.push_back(trim(current));
      current.clear();
    } else {
      current += c;
    }
  }
  std::string last = trim(current);
  if (!last.empty() || !fields.empty()) {
    fields.push_back(last);
  }
  return fields;
}

std::optional<std::vector<double>>
parse_numeric_fields(const std::string &reply) {
  std::vector<double> values;
  for (const auto &field : split_reply(reply)) {
    auto value = to_double(field);
    if (!value) {
      return std::nullopt;
    }
    values.push_back(*value);
  }
  return values;
}

ScpiChannel::ScpiChannel(std::string owner, TransportFactory factory)
    : owner_(std::move(owner)), factory_(std::move(factory)) {}

ScpiChannel::~ScpiChannel() { close(); }

void ScpiChannel::open(const ConnectionParams &params) {
  auto guard = lock();
  close();
  params_ = params;
  auto transport = factory_(params);
  transport->open();
  transport_ = std::move(transport);
  LOG_DEBUG("DRIVER", owner_, "Channel open on {}", transport_->describe());
}

void ScpiChannel::close() {
  auto guard = lock();
  if (transport_) {
    transport_->close();
    transport_.reset();
  }
}

bool ScpiChannel::is_open() const {
  std::lock_guard guard(mutex_);
  return transport_ && transport_->is_open();
}

void ScpiChannel::require_open() const {
  if (!transport_ || !transport_->is_open()) {
    throw UsageError(UsageFault::NotConnected,
                     fmt::format("{} is not connected", owner_));
  }
}

void ScpiChannel::send(const std::string &command) {
  auto guard = lock();
  require_open();
  LOG_TRACE("DRIVER", owner_, ">> {}", command);
  transport_->write_line(command);
}

std::string ScpiChannel::query(const std::string &command) {
  auto guard = lock();
  require_open();
  LOG_TRACE("DRIVER", owner_, ">> {}", command);
  std::string reply = trim(transport_->query(command));
  LOG_TRACE("DRIVER", owner_, "<< {}", reply);
  return reply;
}

double ScpiChannel::query_double(const std::string &command) {
  std::string reply = query(command);
  auto value = to_double(reply);
  if (!value) {
    throw ProtocolError(ProtocolFault::Malformed,
                        fmt::format("{}: non-numeric reply '{}' to {}",
                                    owner_, reply, command));
  }
  return *value;
}

std::vector<std::string> ScpiChannel::drain_errors(const std::string &error_query,
                                                   int max_polls) {
  auto guard = lock();
  std::vector<std::string> errors;
  for (int i = 0; i < max_polls; ++i) {
    std::string reply = query(error_query);
    if (is_no_error(reply)) {
      return errors;
    }
    errors.push_back(reply);
  }
  LOG_WARN("DRIVER", owner_, "Error queue still not empty after {} polls",
           max_polls);
  return errors;
}

void ScpiChannel::flush_input() {
  auto guard = lock();
  if (transport_) {
    transport_->flush_input();
  }
}

} // namespace instbench
