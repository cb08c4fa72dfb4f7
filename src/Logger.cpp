#include "oscquery-server/Logger.hpp"

namespace oscquery {

// DLL-safe singleton implementation
OscQueryLogger &OscQueryLogger::instance() {
  static OscQueryLogger logger;
  return logger;
}

spdlog::level::level_enum parse_log_level(const std::string &level) {
  if (level == "trace")
    return spdlog::level::trace;
  if (level == "debug")
    return spdlog::level::debug;
  if (level == "warn")
    return spdlog::level::warn;
  if (level == "error")
    return spdlog::level::err;
  return spdlog::level::info;
}

} // namespace oscquery
