#include "instrument-bench/Config.hpp"

#include <fstream>
#include <sstream>

namespace instbench {

namespace {

const char *kDefaults = R"(
instruments:
  source_meter:
    connection:
      port: 5025
      timeout: 10.0
    retry_attempts: 3
    retry_delay: 2.0
    probe_timeout: 2.0
    idn_match: "2461"
    current_limit: 0.1
    voltage_limit: 21.0
  power_supply:
    connection:
      baud_rate: 9600
      timeout: 5.0
    retry_attempts: 3
    retry_delay: 2.0
    idn_match: "DP711"
discovery:
  scan_interval_ms: 2000
  probe_timeout: 2.0
measurement:
  interval_ms: 1000
  sweep_delay_ms: 100
data:
  storage:
    default_format: csv
    auto_save: false
    auto_save_interval: 300
    base_path: data
  buffer:
    real_time_buffer_size: 1000
    persistent_buffer_size: 10000
    memory_limit_mb: 100
    min_capacity: 100
  analytics:
    window_size: 100
    threshold_sigma: 3.0
    min_history: 10
logging:
  file: instrument_bench.log
  level: info
)";

std::optional<YAML::Node> find_path(const YAML::Node &node,
                                    const std::vector<std::string> &parts,
                                    size_t index) {
  if (index == parts.size()) {
    return node;
  }
  if (!node.IsMap()) {
    return std::nullopt;
  }
  const YAML::Node child = node[parts[index]];
  if (!child.IsDefined() || child.IsNull()) {
    return std::nullopt;
  }
  return find_path(child, parts, index + 1);
}

void assign_path(YAML::Node node, const std::vector<std::string> &parts,
                 size_t index, const YAML::Node &value) {
  if (index + 1 == parts.size()) {
    node[parts[index]] = value;
    return;
  }
  YAML::Node child = node[parts[index]];
  if (!child.IsMap()) {
    child = YAML::Node(YAML::NodeType::Map);
  }
  assign_path(child, parts, index + 1, value);
}

void merge(YAML::Node base, const YAML::Node &overlay) {
  for (const auto &kv : overlay) {
    const std::string key = kv.first.as<std::string>();
    YAML::Node target = base[key];
    if (kv.second.IsMap() && target.IsMap()) {
      merge(target, kv.second);
    } else {
      base[key] = YAML::Clone(kv.second);
    }
  }
}

} // namespace

std::vector<std::string> split_key(const std::string &key) {
  std::vector<std::string> parts;
  std::stringstream ss(key);
  std::string part;
  while (std::getline(ss, part, '.')) {
    if (!part.empty()) {
      parts.push_back(part);
    }
  }
  return parts;
}

ConfigStore::ConfigStore() : root_(YAML::Load(kDefaults)) {}

const char *ConfigStore::default_document() { return kDefaults; }

bool ConfigStore::load_file(const std::string &path) {
  try {
    YAML::Node overlay = YAML::LoadFile(path);
    std::lock_guard lock(mutex_);
    if (overlay.IsMap()) {
      merge(root_, overlay);
    }
    LOG_INFO("CONFIG", "LOAD", "Loaded configuration from {}", path);
    return true;
  } catch (const YAML::Exception &ex) {
    LOG_ERROR("CONFIG", "LOAD", "Failed to load {}: {}", path, ex.what());
    return false;
  }
}

bool ConfigStore::load_string(const std::string &yaml) {
  try {
    YAML::Node overlay = YAML::Load(yaml);
    std::lock_guard lock(mutex_);
    if (overlay.IsMap()) {
      merge(root_, overlay);
    }
    return true;
  } catch (const YAML::Exception &ex) {
    LOG_ERROR("CONFIG", "LOAD", "Failed to parse configuration: {}",
              ex.what());
    return false;
  }
}

bool ConfigStore::save_file(const std::string &path) const {
  std::ofstream out(path);
  if (!out) {
    LOG_ERROR("CONFIG", "SAVE", "Cannot open {} for writing", path);
    return false;
  }
  out << dump() << "\n";
  return static_cast<bool>(out);
}

bool ConfigStore::has(const std::string &key) const {
  std::lock_guard lock(mutex_);
  return find(key).has_value();
}

void ConfigStore::reset() {
  std::lock_guard lock(mutex_);
  root_ = YAML::Load(kDefaults);
}

std::string ConfigStore::dump() const {
  std::lock_guard lock(mutex_);
  YAML::Emitter emitter;
  emitter << root_;
  return emitter.c_str();
}

std::optional<YAML::Node> ConfigStore::find(const std::string &key) const {
  auto parts = split_key(key);
  if (parts.empty()) {
    return std::nullopt;
  }
  return find_path(root_, parts, 0);
}

void ConfigStore::assign(const std::string &key, const YAML::Node &value) {
  auto parts = split_key(key);
  if (parts.empty()) {
    return;
  }
  assign_path(root_, parts, 0, value);
}

} // namespace instbench
