#pragma once

#ifdef KERIDOC_ENABLE_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace keridoc {
namespace logging {

enum class LogLevel {
  TRACE = 0,
  DEBUG = 1,
  INFO = 2,
  WARN = 3,
  ERROR = 4,
  CRITICAL = 5,
  OFF = 6
};

/// Environment variable read when the logger is first used
constexpr const char* LOG_LEVEL_ENV = "KERIDOC_LOG_LEVEL";

/// Level for a lower-case spdlog level name, nullopt when unrecognized
inline std::optional<LogLevel> parseLogLevel(std::string_view name) {
  if (name == "trace") return LogLevel::TRACE;
  if (name == "debug") return LogLevel::DEBUG;
  if (name == "info") return LogLevel::INFO;
  if (name == "warn") return LogLevel::WARN;
  if (name == "error") return LogLevel::ERROR;
  if (name == "critical") return LogLevel::CRITICAL;
  if (name == "off") return LogLevel::OFF;
  return std::nullopt;
}

/**
 * @brief Process-wide "keridoc" spdlog logger
 *
 * A logger already registered under "keridoc" by the host application is
 * reused as is. Otherwise a colored stdout logger is created at info level,
 * or at the level named by KERIDOC_LOG_LEVEL.
 */
class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }

  void setLevel(LogLevel level) {
    level_ = level;
    if (logger_) {
      logger_->set_level(toSpdlog(level));
    }
  }

  LogLevel level() const { return level_; }

  std::shared_ptr<spdlog::logger> getLogger() const { return logger_; }

  /// Unknown names fall back to info
  void setLogLevel(const std::string& level_str) {
    setLevel(parseLogLevel(level_str).value_or(LogLevel::INFO));
  }

  /**
   * @brief Apply the level named by an environment variable
   * @return false when the variable is unset or names no level; the current
   * level is then kept
   */
  bool configureFromEnvironment(const char* variable = LOG_LEVEL_ENV) {
    const char* value = std::getenv(variable);
    if (value == nullptr) {
      return false;
    }
    auto level = parseLogLevel(value);
    if (!level) {
      logger_->warn("Ignoring {}={}: expected trace, debug, info, warn, "
                    "error, critical or off",
                    variable, value);
      return false;
    }
    setLevel(*level);
    return true;
  }

 private:
  Logger() {
    logger_ = spdlog::get("keridoc");
    if (logger_) {
      level_ = fromSpdlog(logger_->level());
      return;
    }
    logger_ = spdlog::stdout_color_mt("keridoc");
    logger_->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");
    setLevel(LogLevel::INFO);
    configureFromEnvironment();
  }

  static spdlog::level::level_enum toSpdlog(LogLevel level) {
    switch (level) {
      case LogLevel::TRACE:
        return spdlog::level::trace;
      case LogLevel::DEBUG:
        return spdlog::level::debug;
      case LogLevel::INFO:
        return spdlog::level::info;
      case LogLevel::WARN:
        return spdlog::level::warn;
      case LogLevel::ERROR:
        return spdlog::level::err;
      case LogLevel::CRITICAL:
        return spdlog::level::critical;
      case LogLevel::OFF:
        return spdlog::level::off;
    }
    return spdlog::level::info;
  }

  static LogLevel fromSpdlog(spdlog::level::level_enum level) {
    switch (level) {
      case spdlog::level::trace:
        return LogLevel::TRACE;
      case spdlog::level::debug:
        return LogLevel::DEBUG;
      case spdlog::level::warn:
        return LogLevel::WARN;
      case spdlog::level::err:
        return LogLevel::ERROR;
      case spdlog::level::critical:
        return LogLevel::CRITICAL;
      case spdlog::level::off:
        return LogLevel::OFF;
      default:
        return LogLevel::INFO;
    }
  }

  std::shared_ptr<spdlog::logger> logger_;
  LogLevel level_ = LogLevel::INFO;
};

}  // namespace logging
}  // namespace keridoc

#define KDOC_LOG_TRACE(...) \
  keridoc::logging::Logger::getInstance().getLogger()->trace(__VA_ARGS__)
#define KDOC_LOG_DEBUG(...) \
  keridoc::logging::Logger::getInstance().getLogger()->debug(__VA_ARGS__)
#define KDOC_LOG_INFO(...) \
  keridoc::logging::Logger::getInstance().getLogger()->info(__VA_ARGS__)
#define KDOC_LOG_WARN(...) \
  keridoc::logging::Logger::getInstance().getLogger()->warn(__VA_ARGS__)
#define KDOC_LOG_ERROR(...) \
  keridoc::logging::Logger::getInstance().getLogger()->error(__VA_ARGS__)
#define KDOC_LOG_CRITICAL(...) \
  keridoc::logging::Logger::getInstance().getLogger()->critical(__VA_ARGS__)

#else
// No-op macros when logging is disabled
#define KDOC_LOG_TRACE(...)
#define KDOC_LOG_DEBUG(...)
#define KDOC_LOG_INFO(...)
#define KDOC_LOG_WARN(...)
#define KDOC_LOG_ERROR(...)
#define KDOC_LOG_CRITICAL(...)

#include <string>

namespace keridoc {
namespace logging {
enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL, OFF };
constexpr const char* LOG_LEVEL_ENV = "KERIDOC_LOG_LEVEL";
class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }
  void setLevel(LogLevel) {}
  LogLevel level() const { return LogLevel::OFF; }
  void setLogLevel(const std::string&) {}
  bool configureFromEnvironment(const char* = LOG_LEVEL_ENV) { return false; }
};
}  // namespace logging
}  // namespace keridoc

#endif
