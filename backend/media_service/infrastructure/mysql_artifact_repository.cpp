#include "mysql_artifact_repository.hpp"
#include "common/logger.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace media_service {

namespace {

constexpr const char* kCreateTable =
  "CREATE TABLE IF NOT EXISTS media_artifacts ("
  "  id BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY,"
  "  filename VARCHAR(512) NOT NULL,"
  "  source_path VARCHAR(4096) NOT NULL,"
  "  size BIGINT UNSIGNED NOT NULL DEFAULT 0,"
  "  media_type VARCHAR(8) NOT NULL DEFAULT 'video',"
  "  specs MEDIUMTEXT NULL,"
  "  created_at BIGINT NOT NULL DEFAULT 0,"
  "  re_encoded_path VARCHAR(4096) NULL,"
  "  re_encoded_size BIGINT UNSIGNED NULL,"
  "  re_encoded_bitrate VARCHAR(32) NULL,"
  "  failure_job_id VARCHAR(64) NULL,"
  "  failure_message TEXT NULL,"
  "  INDEX idx_media_artifacts_created (created_at)"
  ")";

constexpr const char* kSelectColumns =
  "SELECT id, filename, source_path, size, media_type, specs, created_at,"
  " re_encoded_path, re_encoded_size, re_encoded_bitrate, failure_job_id, failure_message"
  " FROM media_artifacts";

using ResultPtr = std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)>;

std::string quoted(const common::MySQLConnection& conn, const std::string& value) {
  return "'" + conn.escape(value) + "'";
}

std::int64_t toEpochMillis(std::chrono::system_clock::time_point time) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

} // namespace

MysqlArtifactRepository::MysqlArtifactRepository(common::MySQLConnectionPool& pool)
  : pool_(pool) {
  if (auto ready = ensureSchema(); !ready) {
    throw std::runtime_error("Cannot prepare media_artifacts table: " + ready.error());
  }
}

std::expected<bool, std::string> MysqlArtifactRepository::ensureSchema() {
  try {
    common::MySQLConnectionGuard guard(pool_);
    if (!guard.valid()) {
      return std::unexpected("No database connection available");
    }
    if (mysql_query(guard.get(), kCreateTable)) {
      return std::unexpected(mysql_error(guard.get()));
    }
    return true;
  } catch (const std::exception& e) {
    return std::unexpected(e.what());
  }
}

std::expected<bool, std::string> MysqlArtifactRepository::exists(MYSQL* conn, ArtifactId id) {
  auto query = "SELECT 1 FROM media_artifacts WHERE id = " + std::to_string(id);
  if (mysql_query(conn, query.c_str())) {
    return std::unexpected(mysql_error(conn));
  }
  ResultPtr result(mysql_store_result(conn), mysql_free_result);
  if (!result) {
    return std::unexpected("No result set");
  }
  return mysql_num_rows(result.get()) > 0;
}

MediaArtifact MysqlArtifactRepository::fromRow(const char* const* row) {
  MediaArtifact artifact;
  artifact.id = std::stoll(row[0]);
  artifact.filename = row[1];
  artifact.source_path = row[2];
  artifact.size = std::stoull(row[3]);
  artifact.media_type = parseStreamType(row[4]).value_or(StreamType::Video);
  if (row[5] && *row[5]) {
    artifact.specs = nlohmann::json::parse(row[5]).get<MediaSpecs>();
  }
  artifact.created_at = std::chrono::system_clock::time_point{std::chrono::milliseconds{std::stoll(row[6])}};
  // the three re_encoded columns are written together
  if (row[7] && row[8] && row[9]) {
    artifact.re_encoded = ReEncodedOutput{row[7], std::stoull(row[8]), row[9]};
  }
  if (row[10]) {
    artifact.last_failure = TranscodeFailureRecord{row[10], row[11] ? row[11] : ""};
  }
  return artifact;
}

std::expected<MediaArtifact, std::string> MysqlArtifactRepository::create(const NewArtifact& fresh) {
  try {
    common::MySQLConnectionGuard guard(pool_);
    if (!guard.valid()) {
      return std::unexpected("No database connection available");
    }
    auto& conn = guard.connection();
    auto query = "INSERT INTO media_artifacts (filename, source_path, size, media_type, specs, created_at)"
                 " VALUES (" + quoted(conn, fresh.filename) +
                 ", " + quoted(conn, fresh.source_path) +
                 ", " + std::to_string(fresh.size) +
                 ", " + quoted(conn, std::string(toString(fresh.media_type))) +
                 ", " + quoted(conn, nlohmann::json(fresh.specs).dump()) +
                 ", " + std::to_string(toEpochMillis(fresh.created_at)) + ")";
    if (mysql_query(guard.get(), query.c_str())) {
      return std::unexpected(mysql_error(guard.get()));
    }

    MediaArtifact artifact;
    artifact.id = static_cast<ArtifactId>(mysql_insert_id(guard.get()));
    artifact.filename = fresh.filename;
    artifact.source_path = fresh.source_path;
    artifact.size = fresh.size;
    artifact.media_type = fresh.media_type;
    artifact.specs = fresh.specs;
    artifact.created_at = fresh.created_at;
    return artifact;
  } catch (const std::exception& e) {
    return std::unexpected(e.what());
  }
}

std::expected<std::vector<MediaArtifact>, std::string> MysqlArtifactRepository::list() {
  try {
    common::MySQLConnectionGuard guard(pool_);
    if (!guard.valid()) {
      return std::unexpected("No database connection available");
    }
    auto query = std::string(kSelectColumns) + " ORDER BY created_at DESC, id DESC";
    if (mysql_query(guard.get(), query.c_str())) {
      return std::unexpected(mysql_error(guard.get()));
    }

    ResultPtr result(mysql_store_result(guard.get()), mysql_free_result);
    if (!result) {
      return std::unexpected("No result set");
    }

    std::vector<MediaArtifact> artifacts;
    artifacts.reserve(mysql_num_rows(result.get()));
    while (MYSQL_ROW row = mysql_fetch_row(result.get())) {
      artifacts.push_back(fromRow(row));
    }
    return artifacts;
  } catch (const std::exception& e) {
    return std::unexpected(e.what());
  }
}

std::expected<std::optional<MediaArtifact>, std::string> MysqlArtifactRepository::findById(ArtifactId id) {
  try {
    common::MySQLConnectionGuard guard(pool_);
    if (!guard.valid()) {
      return std::unexpected("No database connection available");
    }
    auto query = std::string(kSelectColumns) + " WHERE id = " + std::to_string(id);
    if (mysql_query(guard.get(), query.c_str())) {
      return std::unexpected(mysql_error(guard.get()));
    }

    ResultPtr result(mysql_store_result(guard.get()), mysql_free_result);
    if (!result) {
      return std::unexpected("No result set");
    }

    MYSQL_ROW row = mysql_fetch_row(result.get());
    if (!row) {
      return std::optional<MediaArtifact>{};
    }
    return std::optional<MediaArtifact>{fromRow(row)};
  } catch (const std::exception& e) {
    return std::unexpected(e.what());
  }
}

std::expected<bool, std::string> MysqlArtifactRepository::commitReEncoded(ArtifactId id,
                                                                          const ReEncodedOutput& output) {
  try {
    common::MySQLConnectionGuard guard(pool_);
    if (!guard.valid()) {
      return std::unexpected("No database connection available");
    }
    auto& conn = guard.connection();
    auto query = "UPDATE media_artifacts SET"
                 " re_encoded_path = " + quoted(conn, output.path) +
                 ", re_encoded_size = " + std::to_string(output.size) +
                 ", re_encoded_bitrate = " + quoted(conn, output.bitrate) +
                 ", failure_job_id = NULL, failure_message = NULL"
                 " WHERE id = " + std::to_string(id);
    if (mysql_query(guard.get(), query.c_str())) {
      return std::unexpected(mysql_error(guard.get()));
    }
    if (mysql_affected_rows(guard.get()) > 0) {
      return true;
    }
    // same values written twice leave affected rows at zero
    return exists(guard.get(), id);
  } catch (const std::exception& e) {
    return std::unexpected(e.what());
  }
}

std::expected<bool, std::string> MysqlArtifactRepository::recordFailure(ArtifactId id,
                                                                        const TranscodeFailureRecord& failure) {
  try {
    common::MySQLConnectionGuard guard(pool_);
    if (!guard.valid()) {
      return std::unexpected("No database connection available");
    }
    auto& conn = guard.connection();
    auto query = "UPDATE media_artifacts SET"
                 " failure_job_id = " + quoted(conn, failure.job_id) +
                 ", failure_message = " + quoted(conn, failure.message) +
                 " WHERE id = " + std::to_string(id);
    if (mysql_query(guard.get(), query.c_str())) {
      return std::unexpected(mysql_error(guard.get()));
    }
    if (mysql_affected_rows(guard.get()) > 0) {
      return true;
    }
    return exists(guard.get(), id);
  } catch (const std::exception& e) {
    LOG_ERROR("mysql", "recordFailure(" << id << "): " << e.what());
    return std::unexpected(e.what());
  }
}

} // namespace media_service
