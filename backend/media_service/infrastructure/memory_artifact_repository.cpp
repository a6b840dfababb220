#include "memory_artifact_repository.hpp"

#include <algorithm>

namespace media_service {

std::expected<MediaArtifact, std::string> MemoryArtifactRepository::create(const NewArtifact& fresh) {
  std::lock_guard<std::mutex> lock(mutex_);
  MediaArtifact artifact;
  artifact.id = next_id_++;
  artifact.filename = fresh.filename;
  artifact.source_path = fresh.source_path;
  artifact.size = fresh.size;
  artifact.media_type = fresh.media_type;
  artifact.specs = fresh.specs;
  artifact.created_at = fresh.created_at;
  artifacts_.emplace(artifact.id, artifact);
  return artifact;
}

std::expected<std::vector<MediaArtifact>, std::string> MemoryArtifactRepository::list() {
  std::vector<MediaArtifact> artifacts;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    artifacts.reserve(artifacts_.size());
    for (const auto& [id, artifact] : artifacts_) {
      artifacts.push_back(artifact);
    }
  }
  std::stable_sort(artifacts.begin(), artifacts.end(), [](const MediaArtifact& a, const MediaArtifact& b) {
    if (a.created_at != b.created_at) {
      return a.created_at > b.created_at;
    }
    return a.id > b.id;
  });
  return artifacts;
}

std::expected<std::optional<MediaArtifact>, std::string> MemoryArtifactRepository::findById(ArtifactId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = artifacts_.find(id);
  if (it == artifacts_.end()) {
    return std::optional<MediaArtifact>{};
  }
  return std::optional<MediaArtifact>{it->second};
}

std::expected<bool, std::string> MemoryArtifactRepository::commitReEncoded(ArtifactId id,
                                                                           const ReEncodedOutput& output) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = artifacts_.find(id);
  if (it == artifacts_.end()) {
    return false;
  }
  it->second.re_encoded = output;
  it->second.last_failure.reset();
  return true;
}

std::expected<bool, std::string> MemoryArtifactRepository::recordFailure(ArtifactId id,
                                                                         const TranscodeFailureRecord& failure) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = artifacts_.find(id);
  if (it == artifacts_.end()) {
    return false;
  }
  it->second.last_failure = failure;
  return true;
}

} // namespace media_service
