#include "mysql_connection_pool.hpp"
#include "common/logger.hpp"

#include <chrono>
#include <utility>
#include <vector>

namespace common {

namespace {

struct MysqlCloser {
  void operator()(MYSQL* conn) const { mysql_close(conn); }
};

} // namespace

MySQLConnection& MySQLConnection::operator=(MySQLConnection&& other) noexcept {
  if (this != &other) {
    if (conn_) {
      mysql_close(conn_);
    }
    conn_ = std::exchange(other.conn_, nullptr);
  }
  return *this;
}

bool MySQLConnection::isValid() const {
  return conn_ && mysql_ping(conn_) == 0;
}

std::string MySQLConnection::escape(const std::string& value) const {
  std::vector<char> buffer(value.size() * 2 + 1);
  auto length = mysql_real_escape_string(conn_, buffer.data(), value.c_str(),
                                         static_cast<unsigned long>(value.size()));
  return std::string(buffer.data(), length);
}

MySQLConnectionPool::MySQLConnectionPool()
  : ConnectionPool(config::Config::getInstance().getDBCntPool()),
    db_config_(config::Config::getInstance().getDatabase()) {
  warmUp();
  const auto current = stats();
  LOG_INFO("mysql", "Connection pool ready: " << current.idle << " idle connection(s) to "
                    << db_config_.user << "@" << db_config_.host << ":" << db_config_.port
                    << "/" << db_config_.db_name);
}

std::unique_ptr<Connection> MySQLConnectionPool::createConnection() {
  std::unique_ptr<MYSQL, MysqlCloser> conn(mysql_init(nullptr));
  if (!conn) {
    LOG_ERROR("mysql", "mysql_init failed: out of memory");
    return nullptr;
  }

  // same bound for connecting and for each round trip
  unsigned int timeout = static_cast<unsigned int>(
    std::chrono::duration_cast<std::chrono::seconds>(cp_config_.timeout).count());
  if (timeout == 0) {
    timeout = 1;
  }
  mysql_options(conn.get(), MYSQL_SET_CHARSET_NAME, db_config_.charset.c_str());
  mysql_options(conn.get(), MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
  mysql_options(conn.get(), MYSQL_OPT_READ_TIMEOUT, &timeout);
  mysql_options(conn.get(), MYSQL_OPT_WRITE_TIMEOUT, &timeout);

  if (!mysql_real_connect(conn.get(), db_config_.host.c_str(), db_config_.user.c_str(),
                          db_config_.password.c_str(), db_config_.db_name.c_str(),
                          db_config_.port, nullptr, 0)) {
    LOG_WARN("mysql", "Connect to " << db_config_.host << ":" << db_config_.port
                      << " failed: " << mysql_error(conn.get()));
    return nullptr;
  }

  return std::make_unique<MySQLConnection>(conn.release());
}

} // namespace common
