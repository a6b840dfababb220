#pragma once

#include "common/config/config.hpp"
#include "common/connection_pool/connection_pool.hpp"
#include <mysql/mysql.h>
#include <memory>
#include <string>

namespace common {

// RAII: owns one MYSQL handle, closed on destruction
class MySQLConnection : public Connection {
public:
  explicit MySQLConnection(MYSQL* conn) : conn_(conn) {}
  ~MySQLConnection() override { if (conn_) mysql_close(conn_); }

  MySQLConnection(MySQLConnection&& other) noexcept : conn_(other.conn_) { other.conn_ = nullptr; }
  MySQLConnection& operator=(MySQLConnection&& other) noexcept;

  MYSQL* get() const { return conn_; }
  bool isValid() const override;

  // Escapes a value for use inside a single-quoted SQL literal
  std::string escape(const std::string& value) const;

private:
  MYSQL* conn_ = nullptr;
};

// Process-wide pool configured from config::Config (database + pool sections)
class MySQLConnectionPool final : public ConnectionPool {
public:
  static MySQLConnectionPool& getInstance() {
    static MySQLConnectionPool instance;
    return instance;
  }

protected:
  std::unique_ptr<Connection> createConnection() override;

private:
  MySQLConnectionPool();

  config::DatabaseConfig db_config_;
};

class MySQLConnectionGuard final : public ConnectionGuard {
public:
  using ConnectionGuard::ConnectionGuard;

  MYSQL* get() const { return connection().get(); }

  MySQLConnection& connection() const {
    return *static_cast<MySQLConnection*>(conn_.get());
  }
};

} // namespace common
