#include "artifact_catalog.hpp"

#include "common/logger.hpp"

#include <chrono>
#include <filesystem>
#include <system_error>

namespace media_service {

ArtifactCatalog::ArtifactCatalog(std::shared_ptr<ArtifactRepository> repository,
                                 std::shared_ptr<MediaProbe> probe)
  : repository_(repository), probe_(probe) {}

std::expected<MediaArtifact, ServiceError> ArtifactCatalog::registerArtifact(const std::string& path,
                                                                             const std::string& filename) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return makeError(ErrorKind::NotFound, "Source file not found: " + path);
  }
  auto absolute = std::filesystem::absolute(path, ec);
  if (ec) {
    return makeError(ErrorKind::Internal, "Cannot resolve " + path + ": " + ec.message());
  }
  auto size = std::filesystem::file_size(absolute, ec);
  if (ec) {
    return makeError(ErrorKind::Internal, "Cannot stat " + path + ": " + ec.message());
  }

  auto media = probe_->probe(absolute.string());
  if (!media) {
    LOG_WARN("catalog", "Rejected " << absolute << ": " << media.error());
    return makeError(ErrorKind::Validation, "Error analyzing media file: " + media.error());
  }

  auto artifact = repository_->create(NewArtifact{
    .filename = filename.empty() ? absolute.filename().string() : filename,
    .source_path = absolute.string(),
    .size = size,
    .media_type = media->has_video ? StreamType::Video : StreamType::Audio,
    .specs = std::move(media->specs),
    .created_at = std::chrono::system_clock::now(),
  });
  if (!artifact) {
    return makeError(ErrorKind::Internal, artifact.error());
  }

  LOG_INFO("catalog", "Registered artifact " << artifact->id << ": " << artifact->source_path
                      << " (" << toString(artifact->media_type) << ", " << size << " bytes)");
  return *artifact;
}

std::expected<std::vector<MediaArtifact>, ServiceError> ArtifactCatalog::list() const {
  auto artifacts = repository_->list();
  if (!artifacts) {
    return makeError(ErrorKind::Internal, artifacts.error());
  }
  return std::move(*artifacts);
}

} // namespace media_service
