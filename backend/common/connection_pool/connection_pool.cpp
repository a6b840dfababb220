#include "connection_pool.hpp"
#include "common/logger.hpp"

#include <stdexcept>

namespace common {

ConnectionPool::~ConnectionPool() {
  std::lock_guard<std::mutex> lock(mutex_);
  shutdown_ = true;
  idle_.clear();
  available_.notify_all();
}

void ConnectionPool::warmUp() {
  for (size_t i = 0; i < cp_config_.min_connections; ++i) {
    auto conn = createConnection();
    if (!conn) {
      LOG_WARN("pool", "Warm-up stopped after " << i << " of " << cp_config_.min_connections
                       << " connection(s)");
      break;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    ++created_;
    idle_.push_back(IdleConnection{std::move(conn), std::chrono::steady_clock::now()});
  }
}

size_t ConnectionPool::evictExpired(std::chrono::steady_clock::time_point now) {
  size_t evicted = 0;
  while (idle_.size() > cp_config_.min_connections &&
         now - idle_.front().since >= cp_config_.idle_timeout) {
    idle_.pop_front();
    ++evicted;
  }
  discarded_ += evicted;
  return evicted;
}

std::unique_ptr<Connection> ConnectionPool::getConnectionFromPool() {
  std::unique_lock<std::mutex> lock(mutex_);

  const auto deadline = std::chrono::steady_clock::now() + cp_config_.timeout;
  const bool ready = available_.wait_until(lock, deadline, [this] {
    return shutdown_ || !idle_.empty() || active_ < cp_config_.max_connections;
  });
  if (!ready) {
    throw std::runtime_error("Connection pool timeout");
  }
  if (shutdown_) {
    throw std::runtime_error("Connection pool is shutting down");
  }

  evictExpired(std::chrono::steady_clock::now());

  // most recently returned first
  while (!idle_.empty()) {
    auto entry = std::move(idle_.back());
    idle_.pop_back();
    if (entry.conn->isValid()) {
      ++active_;
      return std::move(entry.conn);
    }
    ++discarded_;
    LOG_DEBUG("pool", "Dropping stale pooled connection");
  }

  // slot reserved before connecting outside the lock
  ++active_;
  lock.unlock();

  std::unique_ptr<Connection> conn;
  try {
    conn = createConnection();
  } catch (const std::exception&) {
    lock.lock();
    --active_;
    available_.notify_one();
    throw;
  }

  lock.lock();
  if (!conn) {
    --active_;
    available_.notify_one();
    throw std::runtime_error("Failed to create database connection");
  }
  ++created_;
  return conn;
}

void ConnectionPool::returnConnection(std::unique_ptr<Connection> conn) {
  if (!conn) return;
  std::lock_guard<std::mutex> lock(mutex_);

  --active_;
  if (shutdown_ || !conn->isValid()) {
    ++discarded_;
  } else {
    idle_.push_back(IdleConnection{std::move(conn), std::chrono::steady_clock::now()});
  }
  available_.notify_one();
}

size_t ConnectionPool::activeConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

size_t ConnectionPool::availableConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cp_config_.max_connections - active_;
}

size_t ConnectionPool::idleConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

PoolStats ConnectionPool::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return PoolStats{
    .active = active_,
    .idle = idle_.size(),
    .created = created_,
    .discarded = discarded_,
  };
}

size_t ConnectionPool::cleanupIdleConnections() {
  std::lock_guard<std::mutex> lock(mutex_);
  return evictExpired(std::chrono::steady_clock::now());
}

} // namespace common
