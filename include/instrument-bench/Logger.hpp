#pragma once
#include "instrument-bench/export.h"

#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace instbench {

/// Centralized logging with component tag and device/task id context
class INSTRUMENT_BENCH_API InstrumentLogger {
public:
  static InstrumentLogger &instance();

  // Initialize with file and console sinks
  void init(const std::string &log_file = "instrument_bench.log",
            spdlog::level::level_enum level = spdlog::level::info) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Already initialized: only the level changes
    if (logger_) {
      logger_->set_level(level);
      logger_->flush_on(level);
      return;
    }

    try {
      auto console_sink =
          std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_level(spdlog::level::info);

      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_file, 1024 * 1024 * 10, 5); // 10MB, 5 backups
      file_sink->set_level(spdlog::level::trace);

      std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
      logger_ = std::make_shared<spdlog::logger>("bench", sinks.begin(),
                                                 sinks.end());
      logger_->set_level(level);
      logger_->flush_on(level);

      if (!spdlog::get("bench")) {
        spdlog::register_logger(logger_);
      }
    } catch (const spdlog::spdlog_ex &ex) {
      fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
    }
  }

  // Drop the logger so a later init() recreates the sinks (used by tests)
  void shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::drop("bench");
    logger_.reset();
  }

  bool initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logger_ != nullptr;
  }

  template <typename... Args>
  void trace(const std::string &component, const std::string &id,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, component, id, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &component, const std::string &id,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, component, id, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &component, const std::string &id,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, component, id, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &component, const std::string &id,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, component, id, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &component, const std::string &id,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, component, id, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  InstrumentLogger() = default;

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &component,
           const std::string &id, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_)
      return;

    // Format:  [component] [id] message
    std::string prefix = fmt::format("[{}] [{}] ", component, id);
    std::string full_msg = prefix + fmt::format(fmt::runtime(fmt_str),
                                                std::forward<Args>(args)...);
    logger_->log(level, full_msg);
  }

  std::shared_ptr<spdlog::logger> logger_;
  mutable std::mutex mutex_;
};

/// Parse "trace", "debug", "info", "warn", "error" (default info)
INSTRUMENT_BENCH_API spdlog::level::level_enum
parse_log_level(const std::string &level);

// Convenience macros
#define LOG_TRACE(component, id, ...)                                          \
  instbench::InstrumentLogger::instance().trace(component, id, __VA_ARGS__)
#define LOG_DEBUG(component, id, ...)                                          \
  instbench::InstrumentLogger::instance().debug(component, id, __VA_ARGS__)
#define LOG_INFO(component, id, ...)                                           \
  instbench::InstrumentLogger::instance().info(component, id, __VA_ARGS__)
#define LOG_WARN(component, id, ...)                                           \
  instbench::InstrumentLogger::instance().warn(component, id, __VA_ARGS__)
#define LOG_ERROR(component, id, ...)                                          \
  instbench::InstrumentLogger::instance().error(component, id, __VA_ARGS__)

} // namespace instbench
