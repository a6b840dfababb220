#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <thread>

namespace common {

namespace {
std::atomic<LogLevel> g_level{LogLevel::INFO};
std::mutex g_output_mutex;

const char* levelToString(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::TRACE: return "TRACE";
  }
  return "?";
}
} // namespace

std::optional<LogLevel> parseLogLevel(std::string_view name) {
  if (name == "error") return LogLevel::ERROR;
  if (name == "warn" || name == "warning") return LogLevel::WARN;
  if (name == "info") return LogLevel::INFO;
  if (name == "debug") return LogLevel::DEBUG;
  if (name == "trace") return LogLevel::TRACE;
  return std::nullopt;
}

void Logger::setLevel(LogLevel level) noexcept {
  g_level.store(level, std::memory_order_relaxed);
}

LogLevel Logger::level() noexcept {
  return g_level.load(std::memory_order_relaxed);
}

bool Logger::enabled(LogLevel level) noexcept {
  return static_cast<uint8_t>(level) <= static_cast<uint8_t>(Logger::level());
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message) noexcept {
  try {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream line;
    line << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "."
         << std::setfill('0') << std::setw(3) << ms.count()
         << " [" << levelToString(level) << "]"
         << " [" << module << "]"
         << " [" << std::this_thread::get_id() << "] "
         << message << '\n';

    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cerr << line.str();
  } catch (const std::exception& e) {
    std::fputs("logger failure: ", stderr);
    std::fputs(e.what(), stderr);
    std::fputc('\n', stderr);
  }
}

} // namespace common
