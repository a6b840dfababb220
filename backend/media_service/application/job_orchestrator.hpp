#pragma once

#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include "application/job_registry.hpp"
#include "domain/artifact_repository.hpp"
#include "domain/service_error.hpp"
#include "domain/transcoding_service.hpp"

namespace media_service {

class JobOrchestrator {
public:
  JobOrchestrator(std::shared_ptr<ArtifactRepository> repository,
                  std::shared_ptr<TranscodingService> transcoding_service,
                  std::shared_ptr<JobRegistry> registry);

  // Validates the request, starts the transcode and returns its job id
  // without waiting for it. Later failures are only visible by polling.
  std::expected<std::string, ServiceError> submit(
    ArtifactId artifact_id,
    std::string_view target_bitrate,
    StreamType stream_type
  );

  static std::string generateJobId();

private:
  std::shared_ptr<ArtifactRepository> repository_;
  std::shared_ptr<TranscodingService> transcoding_service_;
  std::shared_ptr<JobRegistry> registry_;
};

} // namespace media_service
