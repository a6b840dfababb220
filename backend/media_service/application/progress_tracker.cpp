#include "progress_tracker.hpp"

#include <algorithm>
#include <mutex>

namespace media_service {

void ProgressTracker::start(const std::string& job_id) {
  std::unique_lock lock(mutex_);
  progress_.try_emplace(job_id, 0);
}

void ProgressTracker::update(const std::string& job_id, int percent) {
  percent = std::clamp(percent, 0, 100);
  std::unique_lock lock(mutex_);
  auto it = progress_.find(job_id);
  if (it != progress_.end() && percent > it->second) {
    it->second = percent;
  }
}

void ProgressTracker::remove(const std::string& job_id) {
  std::unique_lock lock(mutex_);
  progress_.erase(job_id);
}

int ProgressTracker::progressOf(const std::string& job_id) const {
  std::shared_lock lock(mutex_);
  auto it = progress_.find(job_id);
  return it == progress_.end() ? 0 : it->second;
}

bool ProgressTracker::contains(const std::string& job_id) const {
  std::shared_lock lock(mutex_);
  return progress_.count(job_id) != 0;
}

std::size_t ProgressTracker::size() const {
  std::shared_lock lock(mutex_);
  return progress_.size();
}

} // namespace media_service
