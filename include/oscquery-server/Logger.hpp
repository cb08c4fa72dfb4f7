#pragma once
#include "oscquery-server/export.h"

#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace oscquery {

/// Centralized logging with component and request context
class OSCQUERY_SERVER_API OscQueryLogger {
public:
  static OscQueryLogger &instance();

  // Initialize with file and console sinks
  void init(const std::string &log_file = "oscquery_server.log",
            spdlog::level::level_enum level = spdlog::level::info) {
    std::lock_guard<std::mutex> lock(mutex_);

    // If already initialized, just update level
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
          log_file, 1024 * 1024 * 10, 3); // 10MB, 3 files
      file_sink->set_level(spdlog::level::trace);

      std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
      logger_ = std::make_shared<spdlog::logger>("oscquery", sinks.begin(),
                                                 sinks.end());
      logger_->set_level(level);
      logger_->flush_on(level);

      if (!spdlog::get("oscquery")) {
        spdlog::register_logger(logger_);
      }
    } catch (const spdlog::spdlog_ex &ex) {
      if (std::string(ex.what()).find("already exists") == std::string::npos) {
        fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
      }
    }
  }

  // Drop the logger from the spdlog registry so a later init() recreates the
  // sinks (tests switch log files this way).
  void shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::drop("oscquery");
    logger_.reset();
  }

  bool is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logger_ != nullptr;
  }

  template <typename... Args>
  void trace(const std::string &component, const std::string &context,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, component, context, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &component, const std::string &context,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, component, context, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &component, const std::string &context,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, component, context, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &component, const std::string &context,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, component, context, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &component, const std::string &context,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, component, context, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  OscQueryLogger() = default;

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &component,
           const std::string &context, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_)
      return;

    // Format:  [component] [context] message
    std::string prefix = fmt::format("[{}] [{}] ", component, context);
    std::string full_msg = prefix + fmt::format(fmt::runtime(fmt_str),
                                                std::forward<Args>(args)...);
    logger_->log(level, full_msg);
  }

  std::shared_ptr<spdlog::logger> logger_;
  mutable std::mutex mutex_;
};

/// Map a CLI/config level name to a spdlog level ("info" when unknown)
OSCQUERY_SERVER_API spdlog::level::level_enum
parse_log_level(const std::string &level);

// Convenience macros
#define LOG_TRACE(component, ctx, ...)                                         \
  oscquery::OscQueryLogger::instance().trace(component, ctx, __VA_ARGS__)
#define LOG_DEBUG(component, ctx, ...)                                         \
  oscquery::OscQueryLogger::instance().debug(component, ctx, __VA_ARGS__)
#define LOG_INFO(component, ctx, ...)                                          \
  oscquery::OscQueryLogger::instance().info(component, ctx, __VA_ARGS__)
#define LOG_WARN(component, ctx, ...)                                          \
  oscquery::OscQueryLogger::instance().warn(component, ctx, __VA_ARGS__)
#define LOG_ERROR(component, ctx, ...)                                         \
  oscquery::OscQueryLogger::instance().error(component, ctx, __VA_ARGS__)

} // namespace oscquery
