#pragma once

#include <condition_variable>
#include <cstddef>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace common {

// Fixed set of workers running tasks in FIFO order. Tasks already queued
// still run after shutdown(); new ones are refused.
class ThreadPool {
public:
  static ThreadPool& getInstance();

  explicit ThreadPool(size_t size);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  // Accepts move-only callables (e.g. lambdas owning a std::future)
  template <typename Func>
  auto commit(Func&& func) -> std::future<std::invoke_result_t<std::decay_t<Func>&>> {
    using ReturnType = std::invoke_result_t<std::decay_t<Func>&>;

    std::packaged_task<ReturnType()> task(std::forward<Func>(func));
    auto ret = task.get_future();
    {
      std::lock_guard<std::mutex> lock{mtx_};
      if (stopping_) {
        throw std::runtime_error("ThreadPool is stopped");
      }
      tasks_.emplace([task = std::move(task)]() mutable { task(); });
    }
    cv_.notify_one();
    return ret;
  }

  // Refuses new work, runs what is queued and joins the workers
  void shutdown();

  size_t size() const { return pool_size_; }
  size_t pending() const;

private:
  using Task = std::packaged_task<void()>;

  void workerLoop(std::stop_token stop);

  mutable std::mutex mtx_;
  std::condition_variable_any cv_;
  std::queue<Task> tasks_;
  bool stopping_{false};
  size_t pool_size_{0};
  std::vector<std::jthread> threads_;
};

} // namespace common
