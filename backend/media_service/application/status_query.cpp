#include "status_query.hpp"

#include <filesystem>
#include <system_error>

namespace media_service {

StatusQuery::StatusQuery(std::shared_ptr<ArtifactRepository> repository,
                         std::shared_ptr<ProgressTracker> tracker,
                         std::shared_ptr<JobRegistry> registry)
  : repository_(repository), tracker_(tracker), registry_(registry) {}

int StatusQuery::progressOf(const std::string& job_id) const {
  return tracker_->progressOf(job_id);
}

std::expected<MediaArtifact, ServiceError> StatusQuery::artifactOf(ArtifactId artifact_id) const {
  auto artifact = repository_->findById(artifact_id);
  if (!artifact) {
    return makeError(ErrorKind::Internal, artifact.error());
  }
  if (!*artifact) {
    return makeError(ErrorKind::NotFound, "Media file not found");
  }
  return std::move(**artifact);
}

std::expected<ArtifactStatus, ServiceError> StatusQuery::statusOf(ArtifactId artifact_id) const {
  auto artifact = artifactOf(artifact_id);
  if (!artifact) {
    return std::unexpected(artifact.error());
  }

  ArtifactStatus status;
  status.last_failure = artifact->last_failure;
  if (artifact->isReEncoded()) {
    const auto& output = *artifact->re_encoded;
    std::error_code ec;
    status.is_re_encoded = true;
    status.re_encoded_bitrate = output.bitrate;
    status.size = output.size;
    status.artifact_exists = std::filesystem::is_regular_file(output.path, ec);
  }
  return status;
}

std::expected<JobRecord, ServiceError> StatusQuery::jobOf(const std::string& job_id) const {
  auto record = registry_->find(job_id);
  if (!record) {
    return makeError(ErrorKind::NotFound, "Job not found");
  }
  return *record;
}

} // namespace media_service
