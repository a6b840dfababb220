#pragma once

// project
#include "common/connection_pool/mysql_connection_pool.hpp"
#include "domain/artifact_repository.hpp"

// std
#include <string>
#include <vector>

namespace media_service {

// Artifacts in the `media_artifacts` table, reached through the shared pool.
// The table is created on construction when missing.
class MysqlArtifactRepository : public ArtifactRepository {
public:
  explicit MysqlArtifactRepository(common::MySQLConnectionPool& pool);

  std::expected<MediaArtifact, std::string> create(const NewArtifact& artifact) override;
  std::expected<std::vector<MediaArtifact>, std::string> list() override;
  std::expected<std::optional<MediaArtifact>, std::string> findById(ArtifactId id) override;
  std::expected<bool, std::string> commitReEncoded(ArtifactId id, const ReEncodedOutput& output) override;
  std::expected<bool, std::string> recordFailure(ArtifactId id, const TranscodeFailureRecord& failure) override;

  // Row layout: id, filename, source_path, size, media_type, specs, created_at,
  // re_encoded_path, re_encoded_size, re_encoded_bitrate, failure_job_id, failure_message.
  // Throws on malformed numbers or specs JSON.
  static MediaArtifact fromRow(const char* const* row);

private:
  std::expected<bool, std::string> ensureSchema();
  // true when the row exists, used when an UPDATE changed nothing
  std::expected<bool, std::string> exists(MYSQL* conn, ArtifactId id);

  common::MySQLConnectionPool& pool_;
};

} // namespace media_service
