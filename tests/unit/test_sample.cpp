#include "instrument-bench/Sample.hpp"

#include <gtest/gtest.h>

using namespace instbench;

TEST(SampleTest, DerivesPowerAndResistance) {
  Sample s(Clock::now(), "smu", 2.0, 0.5);
  EXPECT_DOUBLE_EQ(1.0, s.power());
  ASSERT_TRUE(s.resistance().has_value());
  EXPECT_DOUBLE_EQ(4.0, *s.resistance());
}

TEST(SampleTest, MeasuredValuesWinOverDerived) {
  Sample s(Clock::now(), "smu", 2.0, 0.5, 3.9, 0.98);
  EXPECT_DOUBLE_EQ(3.9, *s.resistance());
  EXPECT_DOUBLE_EQ(0.98, s.power());
}

TEST(SampleTest, ZeroCurrentLeavesResistanceUnset) {
  Sample s(Clock::now(), "psu", 5.0, 0.0);
  EXPECT_FALSE(s.resistance().has_value());
  EXPECT_DOUBLE_EQ(0.0, s.power());
  EXPECT_TRUE(s.to_json()["resistance"].is_null());
}

TEST(SampleTest, JsonCarriesAllFields) {
  auto ts = from_epoch_seconds(1700000000.25);
  Sample s(ts, "psu", 1.5, 0.1, std::nullopt, std::nullopt,
           {{"point_number", 3}});
  auto j = s.to_json();
  EXPECT_EQ("psu", j["instrument_id"]);
  EXPECT_DOUBLE_EQ(1.5, j["voltage"].get<double>());
  EXPECT_DOUBLE_EQ(0.1, j["current"].get<double>());
  EXPECT_NEAR(0.15, j["power"].get<double>(), 1e-12);
  EXPECT_NEAR(1700000000.25, j["epoch"].get<double>(), 1e-3);
  EXPECT_EQ(3, j["metadata"]["point_number"]);

  Sample back = Sample::from_json(j);
  EXPECT_EQ("psu", back.instrument_id());
  EXPECT_NEAR(s.epoch_seconds(), back.epoch_seconds(), 1e-3);
  EXPECT_EQ(3, back.metadata()["point_number"]);
}

TEST(SampleTest, TimestampHasMilliseconds) {
  auto text = format_timestamp(from_epoch_seconds(1700000000.125));
  ASSERT_GE(text.size(), 4u);
  EXPECT_EQ(".125", text.substr(text.size() - 4));
  EXPECT_NE(std::string::npos, text.find('T'));
}
