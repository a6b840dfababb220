#include "job_orchestrator.hpp"

#include "application/bitrate_validator.hpp"
#include "common/logger.hpp"
#include "common/thread_pool.hpp"

#include <uuid/uuid.h>

namespace media_service {

namespace {

// Applies a finished transcode to the artifact and the job record
void commitOutcome(const std::shared_ptr<ArtifactRepository>& repository,
                   const std::shared_ptr<JobRegistry>& registry,
                   ArtifactId artifact_id,
                   const std::string& job_id,
                   const std::string& bitrate,
                   const TranscodeResult& result) {
  if (!result) {
    const auto& message = result.error().message;
    LOG_WARN("jobs", "Job " << job_id << " failed: " << message);
    auto recorded = repository->recordFailure(artifact_id, TranscodeFailureRecord{job_id, message});
    if (!recorded) {
      LOG_ERROR("jobs", "Cannot record failure of job " << job_id << ": " << recorded.error());
    }
    registry->markFailed(job_id, message);
    return;
  }

  ReEncodedOutput output{result->path, result->size, bitrate};
  auto committed = repository->commitReEncoded(artifact_id, output);
  if (!committed) {
    LOG_ERROR("jobs", "Cannot commit job " << job_id << ": " << committed.error());
    registry->markFailed(job_id, "Failed to persist re-encoded output: " + committed.error());
    return;
  }
  if (!*committed) {
    LOG_WARN("jobs", "Artifact " << artifact_id << " vanished before job " << job_id << " completed");
    registry->markFailed(job_id, "Media artifact no longer exists");
    return;
  }

  LOG_INFO("jobs", "Job " << job_id << " done: " << output.path << " (" << output.size << " bytes)");
  registry->markSucceeded(job_id);
}

} // namespace

JobOrchestrator::JobOrchestrator(std::shared_ptr<ArtifactRepository> repository,
                                 std::shared_ptr<TranscodingService> transcoding_service,
                                 std::shared_ptr<JobRegistry> registry)
  : repository_(repository),
    transcoding_service_(transcoding_service),
    registry_(registry) {}

std::string JobOrchestrator::generateJobId() {
  uuid_t uuid;
  uuid_generate(uuid);
  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);
  return uuid_str;
}

std::expected<std::string, ServiceError> JobOrchestrator::submit(
  ArtifactId artifact_id,
  std::string_view target_bitrate,
  StreamType stream_type
) {
  auto bitrate = validateBitrate(target_bitrate);
  if (!bitrate) {
    return makeError(ErrorKind::Validation, bitrate.error());
  }

  auto artifact = repository_->findById(artifact_id);
  if (!artifact) {
    return makeError(ErrorKind::Internal, artifact.error());
  }
  if (!*artifact) {
    return makeError(ErrorKind::NotFound, "Media file not found");
  }

  auto job_id = generateJobId();
  auto literal = bitrate->literal();

  // registered before starting so a fast completion always finds its record
  registry_->add(JobRecord{
    .job_id = job_id,
    .artifact_id = artifact_id,
    .target_bitrate = literal,
    .stream_type = stream_type,
  });

  // the result already exists when this runs, pool threads never wait on a transcode
  auto on_complete = [repository = repository_, registry = registry_, artifact_id, job_id,
                      literal](const TranscodeResult& result) {
    try {
      common::ThreadPool::getInstance().commit([repository, registry, artifact_id, job_id, literal, result] {
        commitOutcome(repository, registry, artifact_id, job_id, literal, result);
      });
    } catch (const std::exception& e) {
      LOG_WARN("jobs", "Committing job " << job_id << " inline: " << e.what());
      commitOutcome(repository, registry, artifact_id, job_id, literal, result);
    }
  };

  auto job = transcoding_service_->start(TranscodeRequest{
    .job_id = job_id,
    .source_path = (*artifact)->source_path,
    .target_bitrate = literal,
    .stream_type = stream_type,
  }, on_complete);
  if (!job) {
    registry_->erase(job_id);
    return std::unexpected(job.error());
  }

  LOG_INFO("jobs", "Job " << job_id << " started: artifact " << artifact_id
                   << ", " << toString(stream_type) << " @ " << literal);

  return job_id;
}

} // namespace media_service
