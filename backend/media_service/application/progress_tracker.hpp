#pragma once
#include <cstddef>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace media_service {

// jobId -> latest progress percentage, shared by every request thread.
// Only the transcoder that owns a job writes its entry.
class ProgressTracker {
public:
  void start(const std::string& job_id);
  // Raises the stored value; lower values and unknown jobs are ignored
  void update(const std::string& job_id, int percent);
  void remove(const std::string& job_id);

  // 0 for unknown jobs, including jobs already removed
  int progressOf(const std::string& job_id) const;
  bool contains(const std::string& job_id) const;
  std::size_t size() const;

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, int> progress_;
};

} // namespace media_service
