#include "job_registry.hpp"

#include <algorithm>

namespace media_service {

JobRegistry::JobRegistry(std::size_t history_limit)
  : history_limit_(history_limit) {}

void JobRegistry::add(JobRecord record) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto id = record.job_id;
  jobs_.insert_or_assign(std::move(id), std::move(record));
}

void JobRegistry::erase(const std::string& job_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  jobs_.erase(job_id);
  finished_order_.erase(std::remove(finished_order_.begin(), finished_order_.end(), job_id),
                        finished_order_.end());
}

bool JobRegistry::markSucceeded(const std::string& job_id) {
  return finish(job_id, JobState::Succeeded, {});
}

bool JobRegistry::markFailed(const std::string& job_id, const std::string& error) {
  return finish(job_id, JobState::Failed, error);
}

bool JobRegistry::finish(const std::string& job_id, JobState state, const std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(job_id);
  if (it == jobs_.end() || it->second.state != JobState::Running) {
    return false;
  }
  it->second.state = state;
  it->second.error = error;

  finished_order_.push_back(job_id);
  while (finished_order_.size() > history_limit_) {
    jobs_.erase(finished_order_.front());
    finished_order_.pop_front();
  }
  return true;
}

std::optional<JobRecord> JobRegistry::find(const std::string& job_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(job_id);
  if (it == jobs_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t JobRegistry::runningCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(std::count_if(jobs_.begin(), jobs_.end(), [](const auto& entry) {
    return entry.second.state == JobState::Running;
  }));
}

} // namespace media_service
