#pragma once

#include <cstddef>
#include <string>
#include <chrono>

namespace config {

struct ConnectionPoolConfig{
  size_t min_connections;
  size_t max_connections;
  std::chrono::milliseconds timeout;
  std::chrono::seconds idle_timeout;
};

struct DatabaseConfig {
  std::string host;
  unsigned int port;
  std::string user;
  std::string password;
  std::string db_name;
  std::string charset;
};

struct HttpConfig {
  std::string host;
  unsigned short port;
};

struct TranscodeConfig {
  std::string ffmpeg_path;     // absolute path, or a name looked up in PATH
  std::string audio_bitrate;   // audio bitrate kept when re-encoding video
  size_t workers;
};

struct StorageConfig {
  std::string backend;         // "memory" or "mysql"
};

struct JobsConfig {
  size_t history_limit;        // finished job records kept for GET /jobs/{id}
};

struct CleanupConfig {
  std::chrono::seconds interval;   // between sweeps, zero disables the sweeper
  std::chrono::seconds max_age;    // leftovers untouched for longer are removed
};

struct LoggingConfig {
  std::string level;
};

class Config {
public:
static Config& getInstance() {
  static Config instance;
  return instance;
}

// Delete copy/move constructors and assign operators
Config(const Config&) = delete;
Config& operator=(const Config&) = delete;
Config(Config&&) = delete;
Config& operator=(Config&&) = delete;

// Re-applies defaults then MEDIA_SERVICE_* environment overrides
void reload();

// Getters
const DatabaseConfig& getDatabase() const { return database_; }
const ConnectionPoolConfig& getDBCntPool() const { return db_cp_; }
const HttpConfig& getHttp() const { return http_; }
const TranscodeConfig& getTranscode() const { return transcode_; }
const StorageConfig& getStorage() const { return storage_; }
const JobsConfig& getJobs() const { return jobs_; }
const CleanupConfig& getCleanup() const { return cleanup_; }
const LoggingConfig& getLogging() const { return logging_; }
std::string getHttpIpPort() const { return http_.host+":"+std::to_string(http_.port);}

private:
  Config();

  void loadDefaults();
  void applyEnvironment();

  DatabaseConfig database_;
  ConnectionPoolConfig db_cp_;
  HttpConfig http_;
  TranscodeConfig transcode_;
  StorageConfig storage_;
  JobsConfig jobs_;
  CleanupConfig cleanup_;
  LoggingConfig logging_;
};

} // namespace config
