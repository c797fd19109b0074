#pragma once
#include "board-ident/export.h"

#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace boardident {

/// Centralized logging with component and subject (usually a port) context.
/// Logging is a no-op until init() has been called.
class BOARD_IDENT_API EngineLogger {
public:
  static EngineLogger &instance();

  // Initialize with file and console sinks
  void init(const std::string &log_file = "board_ident.log",
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
      logger_ = std::make_shared<spdlog::logger>("board-ident", sinks.begin(),
                                                 sinks.end());
      logger_->set_level(level);
      logger_->flush_on(spdlog::level::warn);

      if (!spdlog::get("board-ident")) {
        spdlog::register_logger(logger_);
      }
    } catch (const spdlog::spdlog_ex &ex) {
      fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
    }
  }

  // Drop the logger so a later init() recreates the sinks (used by tests).
  void shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::drop("board-ident");
    logger_.reset();
  }

  bool is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logger_ != nullptr;
  }

  template <typename... Args>
  void trace(const std::string &component, const std::string &subject,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, component, subject, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &component, const std::string &subject,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, component, subject, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &component, const std::string &subject,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, component, subject, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &component, const std::string &subject,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, component, subject, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &component, const std::string &subject,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, component, subject, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  EngineLogger() = default;

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &component,
           const std::string &subject, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_ || !logger_->should_log(level))
      return;

    // Format:  [component] [subject] message
    std::string prefix = fmt::format("[{}] [{}] ", component, subject);
    std::string full_msg = prefix + fmt::format(fmt::runtime(fmt_str),
                                                std::forward<Args>(args)...);
    logger_->log(level, full_msg);
  }

  std::shared_ptr<spdlog::logger> logger_;
  mutable std::mutex mutex_;
};

/// Map a textual level ("trace", "debug", "info", "warn", "error") to spdlog.
/// Unknown values map to info.
BOARD_IDENT_API spdlog::level::level_enum
parse_log_level(const std::string &level);

// Convenience macros
#define LOG_TRACE(component, subject, ...)                                     \
  boardident::EngineLogger::instance().trace(component, subject, __VA_ARGS__)
#define LOG_DEBUG(component, subject, ...)                                     \
  boardident::EngineLogger::instance().debug(component, subject, __VA_ARGS__)
#define LOG_INFO(component, subject, ...)                                      \
  boardident::EngineLogger::instance().info(component, subject, __VA_ARGS__)
#define LOG_WARN(component, subject, ...)                                      \
  boardident::EngineLogger::instance().warn(component, subject, __VA_ARGS__)
#define LOG_ERROR(component, subject, ...)                                     \
  boardident::EngineLogger::instance().error(component, subject, __VA_ARGS__)

} // namespace boardident
