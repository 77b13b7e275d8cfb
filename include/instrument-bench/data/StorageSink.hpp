#pragma once
#include "instrument-bench/Sample.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace instbench {

/// Persistence target for finished or snapshotted sessions. Implementations
/// throw ResourceError when the data cannot be written.
class INSTRUMENT_BENCH_API StorageSink {
public:
  virtual ~StorageSink() = default;

  /// Returns the path written
  virtual std::string save_session(const std::string &session_name,
                                   const std::vector<Sample> &samples) = 0;

  /// Appends one sample to the live record named stream_name, creating it on
  /// first use
  virtual void save_point(const std::string &stream_name,
                          const Sample &sample) = 0;

  /// Empty when the session does not exist
  virtual std::vector<Sample> load_session(const std::string &session_name) = 0;

  virtual std::string format() const = 0;
};

class INSTRUMENT_BENCH_API FileSink : public StorageSink {
public:
  explicit FileSink(std::filesystem::path base_path);

  const std::filesystem::path &base_path() const { return base_path_; }

protected:
  std::filesystem::path path_for(const std::string &session_name) const;
  void ensure_directory() const;

  std::filesystem::path base_path_;
};

/// One row per sample; metadata is a JSON string column
class INSTRUMENT_BENCH_API CsvSink : public FileSink {
public:
  using FileSink::FileSink;

  static constexpr const char *kHeader =
      "timestamp,instrument_id,voltage,current,resistance,power,metadata";

  std::string save_session(const std::string &session_name,
                           const std::vector<Sample> &samples) override;
  /// Same layout as a saved session, so load_session reads it back
  void save_point(const std::string &stream_name,
                  const Sample &sample) override;
  std::vector<Sample> load_session(const std::string &session_name) override;
  std::string format() const override { return "csv"; }
};

/// {session_name, created_at, measurement_count, measurements}
class INSTRUMENT_BENCH_API JsonSink : public FileSink {
public:
  using FileSink::FileSink;

  std::string save_session(const std::string &session_name,
                           const std::vector<Sample> &samples) override;
  /// One JSON object per line in <stream_name>.jsonl
  void save_point(const std::string &stream_name,
                  const Sample &sample) override;
  std::vector<Sample> load_session(const std::string &session_name) override;
  std::string format() const override { return "json"; }
};

/// "csv" or "json"; throws UsageError for anything else
INSTRUMENT_BENCH_API std::unique_ptr<StorageSink>
make_sink(const std::string &format, const std::string &base_path);

/// Split one CSV record, honouring double-quoted fields
INSTRUMENT_BENCH_API std::vector<std::string>
split_csv_record(const std::string &line);

} // namespace instbench
