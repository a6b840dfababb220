#pragma once

// project
#include "media_artifact.hpp"

// std
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace media_service {

class ArtifactRepository {
public:
  virtual ~ArtifactRepository() = default;
  virtual std::expected<MediaArtifact, std::string> create(const NewArtifact& artifact) = 0;
  // newest first
  virtual std::expected<std::vector<MediaArtifact>, std::string> list() = 0;
  // nullopt when no artifact has this id
  virtual std::expected<std::optional<MediaArtifact>, std::string> findById(ArtifactId id) = 0;
  // Sets every re-encoded field in one step and clears last_failure.
  // Returns false when the artifact no longer exists.
  virtual std::expected<bool, std::string> commitReEncoded(ArtifactId id, const ReEncodedOutput& output) = 0;
  virtual std::expected<bool, std::string> recordFailure(ArtifactId id, const TranscodeFailureRecord& failure) = 0;
};

} // namespace media_service
