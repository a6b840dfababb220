#pragma once

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace common {

enum class LogLevel : uint8_t {
  ERROR = 0,
  WARN = 1,
  INFO = 2,
  DEBUG = 3,
  TRACE = 4
};

std::optional<LogLevel> parseLogLevel(std::string_view name);

class Logger {
public:
  static void setLevel(LogLevel level) noexcept;
  static LogLevel level() noexcept;
  static bool enabled(LogLevel level) noexcept;

  // Writes one line to stderr: "<timestamp> [<level>] [<module>] <message>"
  static void log(LogLevel level, std::string_view module, const std::string& message) noexcept;
};

} // namespace common

#define MEDIA_LOG(level, module, expr)                                          \
  do {                                                                          \
    if (::common::Logger::enabled(::common::LogLevel::level)) {                 \
      std::ostringstream media_log_oss__;                                       \
      media_log_oss__ << expr;                                                  \
      ::common::Logger::log(::common::LogLevel::level, module, media_log_oss__.str()); \
    }                                                                           \
  } while (false)

#define LOG_ERROR(module, expr) MEDIA_LOG(ERROR, module, expr)
#define LOG_WARN(module, expr)  MEDIA_LOG(WARN, module, expr)
#define LOG_INFO(module, expr)  MEDIA_LOG(INFO, module, expr)
#define LOG_DEBUG(module, expr) MEDIA_LOG(DEBUG, module, expr)
#define LOG_TRACE(module, expr) MEDIA_LOG(TRACE, module, expr)
