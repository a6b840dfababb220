#pragma once

// project
#include "domain/artifact_repository.hpp"

// std
#include <map>
#include <mutex>

namespace media_service {

// Process-local store, ids assigned from 1 upwards
class MemoryArtifactRepository : public ArtifactRepository {
public:
  std::expected<MediaArtifact, std::string> create(const NewArtifact& artifact) override;
  std::expected<std::vector<MediaArtifact>, std::string> list() override;
  std::expected<std::optional<MediaArtifact>, std::string> findById(ArtifactId id) override;
  std::expected<bool, std::string> commitReEncoded(ArtifactId id, const ReEncodedOutput& output) override;
  std::expected<bool, std::string> recordFailure(ArtifactId id, const TranscodeFailureRecord& failure) override;

private:
  std::mutex mutex_;
  std::map<ArtifactId, MediaArtifact> artifacts_;
  ArtifactId next_id_{1};
};

} // namespace media_service
