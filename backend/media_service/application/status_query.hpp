#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>

#include "application/job_registry.hpp"
#include "application/progress_tracker.hpp"
#include "domain/artifact_repository.hpp"
#include "domain/service_error.hpp"

namespace media_service {

struct ArtifactStatus {
  bool is_re_encoded{false};
  std::optional<std::string> re_encoded_bitrate;
  std::optional<std::uint64_t> size;
  std::optional<bool> artifact_exists;   // output still on disk at query time
  std::optional<TranscodeFailureRecord> last_failure;
};

class StatusQuery {
public:
  StatusQuery(std::shared_ptr<ArtifactRepository> repository,
              std::shared_ptr<ProgressTracker> tracker,
              std::shared_ptr<JobRegistry> registry);

  int progressOf(const std::string& job_id) const;
  std::expected<ArtifactStatus, ServiceError> statusOf(ArtifactId artifact_id) const;
  std::expected<JobRecord, ServiceError> jobOf(const std::string& job_id) const;
  std::expected<MediaArtifact, ServiceError> artifactOf(ArtifactId artifact_id) const;

private:
  std::shared_ptr<ArtifactRepository> repository_;
  std::shared_ptr<ProgressTracker> tracker_;
  std::shared_ptr<JobRegistry> registry_;
};

} // namespace media_service
