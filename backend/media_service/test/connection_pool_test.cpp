#include <gtest/gtest.h>

#include "common/connection_pool/connection_pool.hpp"

#include <atomic>
#include <stdexcept>

namespace media_service::test {

namespace {

class FakeConnection : public common::Connection {
public:
  explicit FakeConnection(std::shared_ptr<std::atomic<bool>> healthy) : healthy_(healthy) {}
  bool isValid() const override { return healthy_->load(); }

private:
  std::shared_ptr<std::atomic<bool>> healthy_;
};

class FakeConnectionPool : public common::ConnectionPool {
public:
  explicit FakeConnectionPool(const config::ConnectionPoolConfig& cfg, bool warm = false)
    : ConnectionPool(cfg) {
    if (warm) {
      warmUp();
    }
  }

  std::unique_ptr<common::Connection> createConnection() override {
    ++created;
    if (refuse) {
      return nullptr;
    }
    return std::make_unique<FakeConnection>(healthy);
  }

  std::shared_ptr<std::atomic<bool>> healthy = std::make_shared<std::atomic<bool>>(true);
  std::atomic<int> created{0};
  bool refuse{false};
};

config::ConnectionPoolConfig poolConfig(std::chrono::seconds idle_timeout = std::chrono::seconds(60)) {
  return config::ConnectionPoolConfig{
    .min_connections = 1,
    .max_connections = 2,
    .timeout = std::chrono::milliseconds(50),
    .idle_timeout = idle_timeout,
  };
}

} // namespace

TEST(ConnectionPool, reusesReturnedConnections) {
  FakeConnectionPool pool(poolConfig());
  {
    common::ConnectionGuard guard(pool);
    EXPECT_TRUE(guard.valid());
    EXPECT_EQ(pool.activeConnections(), 1u);
    EXPECT_EQ(pool.availableConnections(), 1u);
  }
  EXPECT_EQ(pool.activeConnections(), 0u);
  EXPECT_EQ(pool.idleConnections(), 1u);

  {
    common::ConnectionGuard guard(pool);
    EXPECT_TRUE(guard.valid());
  }
  EXPECT_EQ(pool.created.load(), 1);
}

TEST(ConnectionPool, timesOutWhenExhausted) {
  FakeConnectionPool pool(poolConfig());
  common::ConnectionGuard first(pool);
  common::ConnectionGuard second(pool);
  EXPECT_EQ(pool.availableConnections(), 0u);

  EXPECT_THROW(pool.getConnectionFromPool(), std::runtime_error);
}

TEST(ConnectionPool, warmUpOpensMinimum) {
  FakeConnectionPool pool(poolConfig(), true);

  EXPECT_EQ(pool.idleConnections(), 1u);
  EXPECT_EQ(pool.stats().created, 1u);
}

TEST(ConnectionPool, keepsReturnedConnectionsUntilTheyExpire) {
  FakeConnectionPool fresh(poolConfig());
  {
    common::ConnectionGuard first(fresh);
    common::ConnectionGuard second(fresh);
  }
  EXPECT_EQ(fresh.idleConnections(), 2u);
  EXPECT_EQ(fresh.cleanupIdleConnections(), 0u);

  FakeConnectionPool expiring(poolConfig(std::chrono::seconds(0)));
  {
    common::ConnectionGuard first(expiring);
    common::ConnectionGuard second(expiring);
  }
  EXPECT_EQ(expiring.cleanupIdleConnections(), 1u);
  EXPECT_EQ(expiring.idleConnections(), 1u);   // never below min_connections

  auto stats = expiring.stats();
  EXPECT_EQ(stats.created, 2u);
  EXPECT_EQ(stats.discarded, 1u);
  EXPECT_EQ(stats.active, 0u);
}

TEST(ConnectionPool, dropsStaleConnections) {
  FakeConnectionPool pool(poolConfig());
  {
    common::ConnectionGuard guard(pool);
  }
  ASSERT_EQ(pool.idleConnections(), 1u);

  pool.healthy->store(false);
  pool.healthy = std::make_shared<std::atomic<bool>>(true);
  {
    common::ConnectionGuard guard(pool);
    EXPECT_TRUE(guard.valid());
    EXPECT_TRUE(guard->isValid());
  }
  EXPECT_EQ(pool.created.load(), 2);
  EXPECT_EQ(pool.stats().discarded, 1u);
}

TEST(ConnectionPool, reportsConnectFailure) {
  FakeConnectionPool pool(poolConfig());
  pool.refuse = true;

  EXPECT_THROW(pool.getConnectionFromPool(), std::runtime_error);
  EXPECT_EQ(pool.activeConnections(), 0u);
}

} // namespace media_service::test
