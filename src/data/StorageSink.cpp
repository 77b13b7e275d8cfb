#include "instrument-bench/data/StorageSink.hpp"
#include "instrument-bench/Errors.hpp"
#include "instrument-bench/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <fmt/format.h>
#include <fstream>

namespace instbench {

namespace fs = std::filesystem;

namespace {

std::string csv_quote(const std::string &field) {
  if (field.find_first_of(",\"\n") == std::string::npos) {
    return field;
  }
  std::string out = "\"";
  for (char c : field) {
    if (c == '"') {
      out += '"';
    }
    out += c;
  }
  out += '"';
  return out;
}

std::string number_or_empty(const std::optional<double> &v) {
  return v ? fmt::format("{:.9g}", *v) : std::string();
}

void write_csv_row(std::ostream &out, const Sample &s) {
  std::string metadata = s.metadata().is_null() ? "" : s.metadata().dump();
  out << fmt::format("{},{},{:.9g},{:.9g},{},{:.9g},{}\n",
                     csv_quote(format_timestamp(s.timestamp())),
                     csv_quote(s.instrument_id()), s.voltage(), s.current(),
                     number_or_empty(s.resistance()), s.power(),
                     csv_quote(metadata));
}

} // namespace

std::vector<std::string> split_csv_record(const std::string &line) {
  std::vector<std::string> fields;
  std::string field;
  bool quoted = false;
  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (quoted) {
      if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
        field += '"';
        ++i;
      } else if (c == '"') {
        quoted = false;
      } else {
        field += c;
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields.push_back(field);
      field.clear();
    } else if (c != '\r') {
      field += c;
    }
  }
  fields.push_back(field);
  return fields;
}

FileSink::FileSink(fs::path base_path) : base_path_(std::move(base_path)) {}

fs::path FileSink::path_for(const std::string &session_name) const {
  return base_path_ / (session_name + "." + format());
}

void FileSink::ensure_directory() const {
  std::error_code ec;
  fs::create_directories(base_path_, ec);
  if (ec) {
    throw ResourceError(fmt::format("Cannot create directory {}: {}",
                                    base_path_.string(), ec.message()));
  }
}

std::string CsvSink::save_session(const std::string &session_name,
                                  const std::vector<Sample> &samples) {
  ensure_directory();
  auto path = path_for(session_name);
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    throw ResourceError("Cannot open " + path.string() + " for writing");
  }

  out << kHeader << "\n";
  for (const auto &s : samples) {
    write_csv_row(out, s);
  }
  out.flush();
  if (!out) {
    throw ResourceError("Write failed for " + path.string());
  }
  LOG_INFO("SINK", session_name, "Saved {} samples to {}", samples.size(),
           path.string());
  return path.string();
}

void CsvSink::save_point(const std::string &stream_name,
                         const Sample &sample) {
  ensure_directory();
  auto path = path_for(stream_name);
  std::error_code ec;
  bool fresh = !fs::exists(path, ec) || fs::file_size(path, ec) == 0;
  std::ofstream out(path, std::ios::app);
  if (!out) {
    throw ResourceError("Cannot open " + path.string() + " for appending");
  }
  if (fresh) {
    out << kHeader << "\n";
  }
  write_csv_row(out, sample);
  out.flush();
  if (!out) {
    throw ResourceError("Write failed for " + path.string());
  }
}

std::vector<Sample> CsvSink::load_session(const std::string &session_name) {
  auto path = path_for(session_name);
  std::ifstream in(path);
  if (!in) {
    return {};
  }

  std::vector<Sample> samples;
  std::string line;
  std::getline(in, line); // header
  size_t line_no = 1;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) {
      continue;
    }
    auto f = split_csv_record(line);
    if (f.size() < 6) {
      LOG_WARN("SINK", session_name, "Skipping short row at line {}", line_no);
      continue;
    }
    try {
      // The ISO column is local time at millisecond precision; rebuild from it
      std::tm tm{};
      int ms = 0;
      if (sscanf(f[0].c_str(), "%d-%d-%dT%d:%d:%d.%d", &tm.tm_year, &tm.tm_mon,
                 &tm.tm_mday, &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &ms) < 6) {
        throw std::invalid_argument("bad timestamp '" + f[0] + "'");
      }
      tm.tm_year -= 1900;
      tm.tm_mon -= 1;
      tm.tm_isdst = -1;
      Timestamp ts = Clock::from_time_t(std::mktime(&tm)) +
                     std::chrono::milliseconds(ms);

      std::optional<double> resistance;
      if (!f[4].empty()) {
        resistance = std::stod(f[4]);
      }
      nlohmann::json metadata;
      if (f.size() > 6 && !f[6].empty()) {
        metadata = nlohmann::json::parse(f[6]);
      }
      samples.emplace_back(ts, f[1], std::stod(f[2]), std::stod(f[3]),
                           resistance, std::stod(f[5]), std::move(metadata));
    } catch (const std::exception &ex) {
      LOG_WARN("SINK", session_name, "Skipping bad row at line {}: {}",
               line_no, ex.what());
    }
  }
  return samples;
}

std::string JsonSink::save_session(const std::string &session_name,
                                   const std::vector<Sample> &samples) {
  ensure_directory();
  nlohmann::json doc;
  doc["session_name"] = session_name;
  doc["created_at"] = format_timestamp(Clock::now());
  doc["measurement_count"] = samples.size();
  doc["measurements"] = nlohmann::json::array();
  for (const auto &s : samples) {
    doc["measurements"].push_back(s.to_json());
  }

  auto path = path_for(session_name);
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    throw ResourceError("Cannot open " + path.string() + " for writing");
  }
  out << doc.dump(2) << "\n";
  out.flush();
  if (!out) {
    throw ResourceError("Write failed for " + path.string());
  }
  LOG_INFO("SINK", session_name, "Saved {} samples to {}", samples.size(),
           path.string());
  return path.string();
}

void JsonSink::save_point(const std::string &stream_name,
                          const Sample &sample) {
  ensure_directory();
  auto path = base_path_ / (stream_name + ".jsonl");
  std::ofstream out(path, std::ios::app);
  if (!out) {
    throw ResourceError("Cannot open " + path.string() + " for appending");
  }
  out << sample.to_json().dump() << "\n";
  out.flush();
  if (!out) {
    throw ResourceError("Write failed for " + path.string());
  }
}

std::vector<Sample> JsonSink::load_session(const std::string &session_name) {
  auto path = path_for(session_name);
  std::ifstream in(path);
  if (!in) {
    return {};
  }

  std::vector<Sample> samples;
  try {
    auto doc = nlohmann::json::parse(in);
    for (const auto &m : doc.value("measurements", nlohmann::json::array())) {
      samples.push_back(Sample::from_json(m));
    }
  } catch (const nlohmann::json::exception &ex) {
    LOG_ERROR("SINK", session_name, "Failed to parse {}: {}", path.string(),
              ex.what());
    return {};
  }
  return samples;
}

std::unique_ptr<StorageSink> make_sink(const std::string &format,
                                       const std::string &base_path) {
  std::string f = format;
  std::transform(f.begin(), f.end(), f.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (f == "csv") {
    return std::make_unique<CsvSink>(base_path);
  }
  if (f == "json") {
    return std::make_unique<JsonSink>(base_path);
  }
  throw UsageError(UsageFault::InvalidArgument,
                   "Unknown storage format '" + format + "'");
}

} // namespace instbench
