#pragma once
#include "instrument-bench/Logger.hpp"
#include "instrument-bench/export.h"

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace instbench {

/// Dotted-key configuration lookup ("data.buffer.memory_limit_mb") over a
/// YAML document layered on built-in defaults.
class INSTRUMENT_BENCH_API ConfigStore {
public:
  ConfigStore();

  /// Merge a YAML file over the current values
  bool load_file(const std::string &path);

  /// Merge a YAML document over the current values
  bool load_string(const std::string &yaml);

  /// Save the effective configuration
  bool save_file(const std::string &path) const;

  bool has(const std::string &key) const;

  template <typename T> T get(const std::string &key, const T &fallback) const {
    std::lock_guard lock(mutex_);
    auto node = find(key);
    if (!node) {
      return fallback;
    }
    try {
      return node->template as<T>();
    } catch (const YAML::Exception &ex) {
      LOG_WARN("CONFIG", key, "Bad value type, using fallback: {}", ex.what());
      return fallback;
    }
  }

  std::string get(const std::string &key, const char *fallback) const {
    return get<std::string>(key, std::string(fallback));
  }

  template <typename T> void set(const std::string &key, const T &value) {
    std::lock_guard lock(mutex_);
    assign(key, YAML::Node(value));
  }

  /// Restore the built-in defaults
  void reset();

  std::string dump() const;

  static const char *default_document();

private:
  std::optional<YAML::Node> find(const std::string &key) const;
  void assign(const std::string &key, const YAML::Node &value);

  mutable std::mutex mutex_;
  YAML::Node root_;
};

/// Split "a.b.c" into its path components
INSTRUMENT_BENCH_API std::vector<std::string>
split_key(const std::string &key);

} // namespace instbench
