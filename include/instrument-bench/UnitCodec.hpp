#pragma once
#include "instrument-bench/export.h"

#include <optional>
#include <string>
#include <variant>

namespace instbench {

/// Engineering-prefix parsing and formatting ("500mV" <-> 0.5)
class INSTRUMENT_BENCH_API UnitCodec {
public:
  /// Parse a bare number or a prefixed value with optional unit symbol.
  /// Throws UsageError(InvalidArgument) on malformed input.
  static double parse(const std::string &text);

  static std::optional<double> try_parse(const std::string &text);

  static bool is_valid(const std::string &text) {
    return try_parse(text).has_value();
  }

  /// Scale into [1, 1000) with the matching prefix, e.g. "500.000000 mV"
  static std::string format(double value, const std::string &unit = "",
                            int precision = 6);

  /// Numeric rendering for SCPI command arguments
  static std::string to_scpi(double value);

  /// Multiplier for a single prefix symbol, nullopt when unknown
  static std::optional<double> prefix_multiplier(const std::string &prefix);
};

/// A numeric argument given either as a plain number or as a prefixed string
class INSTRUMENT_BENCH_API Quantity {
public:
  Quantity(double value) : repr_(value) {}
  Quantity(int value) : repr_(static_cast<double>(value)) {}
  Quantity(const char *text) : repr_(std::string(text)) {}
  Quantity(std::string text) : repr_(std::move(text)) {}

  /// Base-unit value, parsed through UnitCodec when given as text
  double value() const;

  std::string to_string() const;

private:
  std::variant<double, std::string> repr_;
};

} // namespace instbench
