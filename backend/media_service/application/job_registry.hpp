#pragma once
#include "domain/media_artifact.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace media_service {

enum class JobState { Running, Succeeded, Failed };

constexpr std::string_view toString(JobState state) {
  switch (state) {
    case JobState::Running: return "running";
    case JobState::Succeeded: return "succeeded";
    case JobState::Failed: return "failed";
  }
  return "running";
}

struct JobRecord {
  std::string job_id;
  ArtifactId artifact_id{0};
  std::string target_bitrate;
  StreamType stream_type{StreamType::Video};
  JobState state{JobState::Running};
  std::string error;            // set when state == Failed
};

// In-memory job states. Running jobs are always kept; at most
// `history_limit` finished jobs are remembered, oldest evicted first.
class JobRegistry {
public:
  explicit JobRegistry(std::size_t history_limit);

  void add(JobRecord record);
  // Drops a job that never started
  void erase(const std::string& job_id);
  // Terminal transitions happen once; later calls return false
  bool markSucceeded(const std::string& job_id);
  bool markFailed(const std::string& job_id, const std::string& error);

  std::optional<JobRecord> find(const std::string& job_id) const;
  std::size_t runningCount() const;

private:
  bool finish(const std::string& job_id, JobState state, const std::string& error);

  const std::size_t history_limit_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, JobRecord> jobs_;
  std::deque<std::string> finished_order_;
};

} // namespace media_service
