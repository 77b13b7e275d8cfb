#include "instrument-bench/Logger.hpp"

namespace instbench {

// DLL-safe singleton implementation
InstrumentLogger &InstrumentLogger::instance() {
  static InstrumentLogger logger;
  return logger;
}

spdlog::level::level_enum parse_log_level(const std::string &level) {
  if (level == "trace")
    return spdlog::level::trace;
  if (level == "debug")
    return spdlog::level::debug;
  if (level == "warn" || level == "warning")
    return spdlog::level::warn;
  if (level == "error")
    return spdlog::level::err;
  if (level == "off")
    return spdlog::level::off;
  return spdlog::level::info;
}

} // namespace instbench
