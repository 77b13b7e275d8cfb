#include "instrument-bench/Errors.hpp"
#include "instrument-bench/UnitCodec.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace instbench;

namespace {

void expect_close(double expected, double actual) {
  EXPECT_NEAR(expected, actual, std::fabs(expected) * 1e-12 + 1e-300)
      << "expected " << expected << " got " << actual;
}

} // namespace

TEST(UnitCodecTest, ParsesPrefixedValues) {
  expect_close(0.5, UnitCodec::parse("500mV"));
  expect_close(1e-8, UnitCodec::parse("10nA"));
  expect_close(1200.0, UnitCodec::parse("1.2k"));
  expect_close(-2.5e-6, UnitCodec::parse("-2.5uA"));
  expect_close(1e-4, UnitCodec::parse("100 \xC2\xB5V"));
  expect_close(4700.0, UnitCodec::parse("4.7kOhm"));
  expect_close(2e6, UnitCodec::parse("2MHz"));
  expect_close(3e-12, UnitCodec::parse("3p"));
}

TEST(UnitCodecTest, ParsesBareNumbers) {
  expect_close(1.5, UnitCodec::parse("1.5"));
  expect_close(0.0033, UnitCodec::parse("3.3e-3"));
  expect_close(-7.0, UnitCodec::parse("  -7  "));
  expect_close(0.25, UnitCodec::parse(".25"));
}

TEST(UnitCodecTest, RejectsMalformedInput) {
  for (const char *text : {"", "abc", "5 volts", "1.2.3", "k5", "--1"}) {
    EXPECT_FALSE(UnitCodec::try_parse(text).has_value()) << text;
    EXPECT_FALSE(UnitCodec::is_valid(text)) << text;
    EXPECT_THROW(UnitCodec::parse(text), UsageError) << text;
  }
}

TEST(UnitCodecTest, MalformedInputIsAnInvalidArgument) {
  try {
    UnitCodec::parse("twelve volts");
    FAIL() << "expected UsageError";
  } catch (const UsageError &e) {
    EXPECT_EQ(e.fault(), UsageFault::InvalidArgument);
    EXPECT_EQ(e.category(), ErrorCategory::Usage);
  }
}

TEST(UnitCodecTest, ParseFormatRoundTrip) {
  const std::vector<std::pair<std::string, std::string>> cases = {
      {"500mV", "V"},   {"10nA", "A"},    {"1.2k", ""},
      {"2.5uA", "A"},   {"-3.3V", "V"},   {"47kOhm", "Ohm"},
      {"150W", "W"},    {"0.75mA", "A"},  {"12.5MHz", "Hz"},
      {"999p", ""},    {"1", ""},        {"-0.001", ""}};

  for (const auto &[text, unit] : cases) {
    double value = UnitCodec::parse(text);
    std::string formatted = UnitCodec::format(value, unit);
    double reparsed = UnitCodec::parse(formatted);
    EXPECT_NEAR(value, reparsed, std::fabs(value) * 1e-6)
        << text << " -> " << formatted;
  }
}

TEST(UnitCodecTest, FormatPicksFittingPrefix) {
  EXPECT_EQ("1.50 kV", UnitCodec::format(1500.0, "V", 2));
  EXPECT_EQ("500.000000 \xC2\xB5"
            "A",
            UnitCodec::format(0.0005, "A"));
  EXPECT_EQ("2.000 mA", UnitCodec::format(0.002, "A", 3));
  EXPECT_EQ("-3.30 V", UnitCodec::format(-3.3, "V", 2));
  EXPECT_EQ("0.0 V", UnitCodec::format(0.0, "V", 1));
}

TEST(UnitCodecTest, ScpiRendering) {
  EXPECT_EQ("0.5", UnitCodec::to_scpi(0.5));
  EXPECT_EQ("0", UnitCodec::to_scpi(0.0));
  EXPECT_EQ("12.345", UnitCodec::to_scpi(12.345));
  EXPECT_EQ("1.000000e-07", UnitCodec::to_scpi(1e-7));
  EXPECT_EQ("2.000000e+06", UnitCodec::to_scpi(2e6));
}

TEST(UnitCodecTest, PrefixTable) {
  EXPECT_DOUBLE_EQ(1e3, *UnitCodec::prefix_multiplier("k"));
  EXPECT_DOUBLE_EQ(1e-6, *UnitCodec::prefix_multiplier("u"));
  EXPECT_DOUBLE_EQ(1e-6, *UnitCodec::prefix_multiplier("\xC2\xB5"));
  EXPECT_DOUBLE_EQ(1.0, *UnitCodec::prefix_multiplier(""));
  EXPECT_FALSE(UnitCodec::prefix_multiplier("x").has_value());
}

TEST(QuantityTest, AcceptsNumbersAndText) {
  EXPECT_DOUBLE_EQ(2.0, Quantity(2).value());
  EXPECT_DOUBLE_EQ(0.1, Quantity(0.1).value());
  expect_close(0.5, Quantity("500mV").value());
  expect_close(0.02, Quantity(std::string("20mA")).value());
  EXPECT_EQ("500mV", Quantity("500mV").to_string());
  EXPECT_THROW(Quantity("bogus").value(), UsageError);
}
