#include "instrument-bench/UnitCodec.hpp"
#include "instrument-bench/Errors.hpp"

#include <array>
#include <cmath>
#include <fmt/format.h>
#include <regex>
#include <utility>

namespace instbench {

namespace {

struct Prefix {
  const char *symbol;
  double multiplier;
};

// Descending order; format() walks it to find the first fitting prefix
constexpr std::array<Prefix, 10> kPrefixes{{{"T", 1e12},
                                            {"G", 1e9},
                                            {"M", 1e6},
                                            {"k", 1e3},
                                            {"", 1.0},
                                            {"m", 1e-3},
                                            {"\xC2\xB5", 1e-6},
                                            {"n", 1e-9},
                                            {"p", 1e-12},
                                            {"f", 1e-15}}};

const std::regex &quantity_pattern() {
  // number, optional prefix, optional unit symbol
  static const std::regex pattern(
      R"(^\s*([-+]?(?:\d+\.?\d*|\.\d+)(?:[eE][-+]?\d+)?)\s*)"
      "(T|G|M|k|m|u|\xC2\xB5|\xCE\xBC|n|p|f)?"
      "(V|A|W|s|Hz|Ohm|ohm|\xCE\xA9)?\\s*$");
  return pattern;
}

} // namespace

std::optional<double> UnitCodec::prefix_multiplier(const std::string &prefix) {
  if (prefix == "u" || prefix == "\xCE\xBC")
    return 1e-6;
  for (const auto &p : kPrefixes) {
    if (prefix == p.symbol)
      return p.multiplier;
  }
  return std::nullopt;
}

std::optional<double> UnitCodec::try_parse(const std::string &text) {
  std::smatch match;
  if (!std::regex_match(text, match, quantity_pattern())) {
    return std::nullopt;
  }

  double mantissa = 0.0;
  try {
    mantissa = std::stod(match[1].str());
  } catch (const std::exception &) {
    return std::nullopt;
  }

  auto multiplier = prefix_multiplier(match[2].str());
  if (!multiplier) {
    return std::nullopt;
  }
  return mantissa * *multiplier;
}

double UnitCodec::parse(const std::string &text) {
  auto value = try_parse(text);
  if (!value) {
    throw UsageError(UsageFault::InvalidArgument,
                     fmt::format("Invalid numeric value: '{}'", text));
  }
  return *value;
}

std::string UnitCodec::format(double value, const std::string &unit,
                              int precision) {
  if (value == 0.0 || !std::isfinite(value)) {
    return fmt::format("{:.{}f} {}", value, precision, unit);
  }

  double magnitude = std::fabs(value);
  for (const auto &p : kPrefixes) {
    double scaled = magnitude / p.multiplier;
    if (scaled >= 1.0 && scaled < 1000.0) {
      return fmt::format("{:.{}f} {}{}", value / p.multiplier, precision,
                         p.symbol, unit);
    }
  }

  // Beyond the table on either side
  const auto &edge = magnitude >= 1.0 ? kPrefixes.front() : kPrefixes.back();
  return fmt::format("{:.{}f} {}{}", value / edge.multiplier, precision,
                     edge.symbol, unit);
}

std::string UnitCodec::to_scpi(double value) {
  double magnitude = std::fabs(value);
  if (magnitude >= 1e6 || (magnitude < 1e-6 && value != 0.0)) {
    return fmt::format("{:.6e}", value);
  }
  return fmt::format("{:.9g}", value);
}

double Quantity::value() const {
  if (auto number = std::get_if<double>(&repr_)) {
    return *number;
  }
  return UnitCodec::parse(std::get<std::string>(repr_));
}

std::string Quantity::to_string() const {
  if (auto number = std::get_if<double>(&repr_)) {
    return UnitCodec::to_scpi(*number);
  }
  return std::get<std::string>(repr_);
}

} // namespace instbench
