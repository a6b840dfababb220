#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>

#include "common/config/config.hpp"

namespace common {

// RAII: a live connection, closed on destruction
class Connection {
public:
  virtual ~Connection() = default;
  virtual bool isValid() const = 0;

  Connection() = default;
  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;
  Connection(Connection&&) = default;
  Connection& operator=(Connection&&) = default;
};

struct PoolStats {
  size_t active{0};      // handed out right now
  size_t idle{0};        // parked, ready for reuse
  size_t created{0};     // opened over the pool's lifetime
  size_t discarded{0};   // closed because stale, expired or surplus
};

/*
  active + idle <= max_connections.
  Returned connections are parked; those idle longer than idle_timeout are
  closed on the next acquire or cleanup, down to min_connections.
*/
class ConnectionPool {
public:
  virtual ~ConnectionPool();

  // Blocks up to `timeout` for a free slot; throws std::runtime_error on
  // timeout, shutdown, or when a new connection cannot be opened
  std::unique_ptr<Connection> getConnectionFromPool();
  void returnConnection(std::unique_ptr<Connection> conn);

  size_t activeConnections() const;
  size_t availableConnections() const;
  size_t idleConnections() const;
  PoolStats stats() const;

  // Returns how many expired connections were closed
  size_t cleanupIdleConnections();

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

protected:
  explicit ConnectionPool(const config::ConnectionPoolConfig& cfg) : cp_config_(cfg) {}

  virtual std::unique_ptr<Connection> createConnection() = 0;

  // Opens min_connections ahead of the first request. Call from the derived
  // constructor, createConnection is not usable before that.
  void warmUp();

  const config::ConnectionPoolConfig cp_config_;

private:
  struct IdleConnection {
    std::unique_ptr<Connection> conn;
    std::chrono::steady_clock::time_point since;
  };

  size_t evictExpired(std::chrono::steady_clock::time_point now);

  std::deque<IdleConnection> idle_;   // oldest first
  size_t active_{0};
  size_t created_{0};
  size_t discarded_{0};
  bool shutdown_{false};
  mutable std::mutex mutex_;
  std::condition_variable available_;
};

// RAII: borrows a connection on construction, hands it back on destruction
class ConnectionGuard {
public:
  explicit ConnectionGuard(ConnectionPool& pool) : pool_(pool), conn_(pool.getConnectionFromPool()) {}
  ~ConnectionGuard() { if (conn_) pool_.returnConnection(std::move(conn_)); }

  Connection* operator->() const { return conn_.get(); }
  Connection& operator*() const { return *conn_; }

  bool valid() const { return conn_ != nullptr; }

  ConnectionGuard(const ConnectionGuard&) = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;

protected:
  ConnectionPool& pool_;
  std::unique_ptr<Connection> conn_;
};

} // namespace common
