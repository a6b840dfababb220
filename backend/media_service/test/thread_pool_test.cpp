#include <gtest/gtest.h>

#include "common/thread_pool.hpp"

#include <atomic>
#include <chrono>
#include <memory>

namespace media_service::test {

TEST(ThreadPool, returnsTaskResults) {
  common::ThreadPool pool{2};

  auto answer = pool.commit([] { return 42; });
  EXPECT_EQ(answer.get(), 42);
  EXPECT_EQ(pool.size(), 2u);
}

TEST(ThreadPool, acceptsMoveOnlyTasks) {
  common::ThreadPool pool{1};
  auto value = std::make_unique<int>(7);

  auto result = pool.commit([value = std::move(value)]() mutable { return *value * 6; });
  EXPECT_EQ(result.get(), 42);
}

TEST(ThreadPool, propagatesExceptionsThroughFuture) {
  common::ThreadPool pool{1};

  auto result = pool.commit([]() -> int { throw std::runtime_error("task failed"); });
  EXPECT_THROW(result.get(), std::runtime_error);
}

TEST(ThreadPool, shutdownRunsQueuedTasksThenRefusesNewOnes) {
  common::ThreadPool pool{1};
  std::atomic<int> ran{0};
  std::promise<void> started;
  std::promise<void> gate;
  auto opened = gate.get_future().share();

  // occupies the only worker until the gate opens
  pool.commit([&started, opened] {
    started.set_value();
    opened.wait();
  });
  started.get_future().wait();
  for (int i = 0; i < 5; ++i) {
    pool.commit([&ran] { ++ran; });
  }
  EXPECT_EQ(pool.pending(), 5u);

  gate.set_value();
  pool.shutdown();

  EXPECT_EQ(ran.load(), 5);
  EXPECT_THROW(pool.commit([] {}), std::runtime_error);
}

} // namespace media_service::test
