#include "thread_pool.hpp"

#include <algorithm>

namespace common {

ThreadPool& ThreadPool::getInstance() {
  static ThreadPool instance{std::max(1u, std::thread::hardware_concurrency())};
  return instance;
}

ThreadPool::ThreadPool(size_t size) : pool_size_(std::max<size_t>(size, 1)) {
  threads_.reserve(pool_size_);
  for (size_t i = 0; i < pool_size_; ++i) {
    threads_.emplace_back([this](std::stop_token stop) { workerLoop(stop); });
  }
}

ThreadPool::~ThreadPool() {
  shutdown();
}

void ThreadPool::workerLoop(std::stop_token stop) {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock{mtx_};
      cv_.wait(lock, stop, [this] { return !tasks_.empty(); });
      if (tasks_.empty()) {
        return;   // stop requested and nothing left to run
      }
      task = std::move(tasks_.front());
      tasks_.pop();
    }
    task();
  }
}

void ThreadPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock{mtx_};
    stopping_ = true;
  }
  for (auto& thread : threads_) {
    thread.request_stop();
  }
  threads_.clear();
}

size_t ThreadPool::pending() const {
  std::lock_guard<std::mutex> lock{mtx_};
  return tasks_.size();
}

} // namespace common
