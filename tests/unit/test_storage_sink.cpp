#include "instrument-bench/Errors.hpp"
#include "instrument-bench/data/StorageSink.hpp"
#include "test_utils/TestFixtures.hpp"

#include <fstream>
#include <gtest/gtest.h>

using namespace instbench;

namespace {

std::vector<Sample> bench_samples() {
  auto t0 = from_epoch_seconds(1700000000.125);
  return {
      Sample(t0, "smu", 1.0, 0.001, 1000.0, 0.001,
             {{"set_voltage", 1.0}, {"point_number", 1}}),
      Sample(t0 + std::chrono::milliseconds(250), "psu, bench 2", 5.0, 0.0),
      Sample(t0 + std::chrono::milliseconds(500), "smu", -2.5, -0.0025),
  };
}

void expect_same(const std::vector<Sample> &expected,
                 const std::vector<Sample> &actual) {
  ASSERT_EQ(expected.size(), actual.size());
  for (size_t i = 0; i < expected.size(); ++i) {
    const auto &e = expected[i];
    const auto &a = actual[i];
    EXPECT_EQ(e.instrument_id(), a.instrument_id());
    EXPECT_NEAR(e.epoch_seconds(), a.epoch_seconds(), 1e-3) << "row " << i;
    EXPECT_DOUBLE_EQ(e.voltage(), a.voltage());
    EXPECT_DOUBLE_EQ(e.current(), a.current());
    EXPECT_DOUBLE_EQ(e.power(), a.power());
    EXPECT_EQ(e.resistance().has_value(), a.resistance().has_value());
    EXPECT_EQ(e.metadata(), a.metadata());
  }
}

} // namespace

class StorageSinkTest : public test::TempDirTest {};

TEST_F(StorageSinkTest, CsvRoundTrip) {
  CsvSink sink(dir_);
  auto samples = bench_samples();
  auto path = sink.save_session("run1", samples);
  EXPECT_EQ((dir_ / "run1.csv").string(), path);

  std::ifstream in(path);
  std::string header;
  std::getline(in, header);
  EXPECT_EQ(CsvSink::kHeader, header);

  expect_same(samples, sink.load_session("run1"));
}

TEST_F(StorageSinkTest, JsonRoundTrip) {
  JsonSink sink(dir_);
  auto samples = bench_samples();
  auto path = sink.save_session("run2", samples);
  EXPECT_EQ((dir_ / "run2.json").string(), path);

  std::ifstream in(path);
  auto doc = nlohmann::json::parse(in);
  EXPECT_EQ("run2", doc["session_name"]);
  EXPECT_EQ(3, doc["measurement_count"]);
  EXPECT_TRUE(doc.contains("created_at"));
  EXPECT_EQ(3u, doc["measurements"].size());

  expect_same(samples, sink.load_session("run2"));
}

TEST_F(StorageSinkTest, CreatesNestedDirectories) {
  CsvSink sink(dir_ / "a" / "b");
  sink.save_session("nested", bench_samples());
  EXPECT_TRUE(std::filesystem::exists(dir_ / "a" / "b" / "nested.csv"));
}

TEST_F(StorageSinkTest, MissingSessionLoadsEmpty) {
  CsvSink csv(dir_);
  JsonSink json(dir_);
  EXPECT_TRUE(csv.load_session("nope").empty());
  EXPECT_TRUE(json.load_session("nope").empty());
}

TEST_F(StorageSinkTest, UnwritableLocationThrows) {
  // A regular file where the directory should be
  std::ofstream(dir_ / "blocker") << "x";
  CsvSink sink(dir_ / "blocker" / "data");
  EXPECT_THROW(sink.save_session("s", bench_samples()), ResourceError);
  EXPECT_THROW(sink.save_point("s", bench_samples().front()), ResourceError);
}

TEST_F(StorageSinkTest, BadCsvRowsAreSkipped) {
  std::ofstream(dir_ / "mixed.csv")
      << CsvSink::kHeader << "\n"
      << "2023-11-14T22:13:20.125,smu,1,0.001,1000,0.001,\n"
      << "garbage\n"
      << "not-a-time,smu,1,1,,1,\n"
      << "2023-11-14T22:13:21.000,smu,2,0.002,,0.004,\n";
  CsvSink sink(dir_);
  auto samples = sink.load_session("mixed");
  ASSERT_EQ(2u, samples.size());
  EXPECT_DOUBLE_EQ(2.0, samples[1].voltage());
  EXPECT_DOUBLE_EQ(1000.0, samples[1].resistance().value());
}

TEST_F(StorageSinkTest, MakeSinkByFormat) {
  EXPECT_EQ("csv", make_sink("csv", dir_.string())->format());
  EXPECT_EQ("json", make_sink("JSON", dir_.string())->format());
  try {
    make_sink("hdf5", dir_.string());
    FAIL() << "unknown format accepted";
  } catch (const UsageError &ex) {
    EXPECT_EQ(UsageFault::InvalidArgument, ex.fault());
  }
}

TEST(CsvRecordTest, QuotedFields) {
  auto f = split_csv_record(R"(a,"b, c","say ""hi""",,"{""k"":1}")");
  ASSERT_EQ(5u, f.size());
  EXPECT_EQ("b, c", f[1]);
  EXPECT_EQ("say \"hi\"", f[2]);
  EXPECT_EQ("", f[3]);
  EXPECT_EQ("{\"k\":1}", f[4]);
}

TEST_F(StorageSinkTest, CsvPointsAppendToOneFile) {
  CsvSink sink(dir_);
  auto samples = bench_samples();
  for (const auto &s : samples) {
    sink.save_point("live", s);
  }

  std::ifstream in(dir_ / "live.csv");
  std::string line;
  size_t headers = 0;
  while (std::getline(in, line)) {
    if (line == CsvSink::kHeader) {
      ++headers;
    }
  }
  EXPECT_EQ(1u, headers);
  expect_same(samples, sink.load_session("live"));
}

TEST_F(StorageSinkTest, JsonPointsAreOnePerLine) {
  JsonSink sink(dir_ / "nested");
  auto samples = bench_samples();
  for (const auto &s : samples) {
    sink.save_point("live", s);
  }

  std::ifstream in(dir_ / "nested" / "live.jsonl");
  std::vector<Sample> read;
  std::string line;
  while (std::getline(in, line)) {
    read.push_back(Sample::from_json(nlohmann::json::parse(line)));
  }
  expect_same(samples, read);
}
