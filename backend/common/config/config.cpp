#include "config.hpp"
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <system_error>
#include <stdexcept>

namespace config {

namespace {

void overrideString(const char* name, std::string& target) {
  if (const char* value = std::getenv(name); value && *value) {
    target = value;
  }
}

template <typename Integer>
void overrideInteger(const char* name, Integer& target) {
  const char* value = std::getenv(name);
  if (!value || !*value) {
    return;
  }
  const char* end = value + std::strlen(value);
  unsigned long long parsed{0};
  auto [ptr, ec] = std::from_chars(value, end, parsed);
  if (ec != std::errc{} || ptr != end) {
    throw std::invalid_argument(std::string("Invalid numeric value for ") + name + ": " + value);
  }
  if (parsed > static_cast<unsigned long long>(std::numeric_limits<Integer>::max())) {
    throw std::invalid_argument(std::string("Value out of range for ") + name + ": " + value);
  }
  target = static_cast<Integer>(parsed);
}

void overrideSeconds(const char* name, std::chrono::seconds& target) {
  auto seconds = static_cast<std::uint32_t>(target.count());
  overrideInteger(name, seconds);
  target = std::chrono::seconds(seconds);
}

} // namespace

  Config::Config() {
    reload();
  }

  void Config::reload() {
    loadDefaults();
    applyEnvironment();
  }

  void Config::loadDefaults() {
    db_cp_ = {
      .min_connections = 4,
      .max_connections = 16,
      .timeout = std::chrono::milliseconds(5000),
      .idle_timeout = std::chrono::seconds(600)
    };

    database_ = {
      .host = "localhost",
      .port = 3306,
      .user = "media",
      .password = "",
      .db_name = "media_service",
      .charset = "utf8mb4",
    };

    http_ = {
      .host = "0.0.0.0",
      .port = 8090
    };

    transcode_ = {
      .ffmpeg_path = "ffmpeg",
      .audio_bitrate = "128k",
      .workers = 4
    };

    storage_ = {
      .backend = "memory"
    };

    jobs_ = {
      .history_limit = 1024
    };

    cleanup_ = {
      .interval = std::chrono::hours(1),
      .max_age = std::chrono::hours(1)
    };

    logging_ = {
      .level = "info"
    };
  }

  void Config::applyEnvironment() {
    overrideString("MEDIA_SERVICE_HTTP_HOST", http_.host);
    overrideInteger("MEDIA_SERVICE_HTTP_PORT", http_.port);

    overrideString("MEDIA_SERVICE_FFMPEG", transcode_.ffmpeg_path);
    overrideString("MEDIA_SERVICE_AUDIO_BITRATE", transcode_.audio_bitrate);
    overrideInteger("MEDIA_SERVICE_TRANSCODE_WORKERS", transcode_.workers);
    if (transcode_.workers == 0) {
      transcode_.workers = 1;
    }

    overrideString("MEDIA_SERVICE_STORAGE", storage_.backend);

    overrideString("MEDIA_SERVICE_DB_HOST", database_.host);
    overrideInteger("MEDIA_SERVICE_DB_PORT", database_.port);
    overrideString("MEDIA_SERVICE_DB_USER", database_.user);
    overrideString("MEDIA_SERVICE_DB_PASSWORD", database_.password);
    overrideString("MEDIA_SERVICE_DB_NAME", database_.db_name);

    overrideInteger("MEDIA_SERVICE_JOB_HISTORY", jobs_.history_limit);
    overrideSeconds("MEDIA_SERVICE_CLEANUP_INTERVAL", cleanup_.interval);
    overrideSeconds("MEDIA_SERVICE_CLEANUP_MAX_AGE", cleanup_.max_age);
    overrideString("MEDIA_SERVICE_LOG_LEVEL", logging_.level);
  }
}
