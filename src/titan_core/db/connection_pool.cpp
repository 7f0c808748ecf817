#include "titan_core/db/connection_pool.hpp"

#include <stdexcept>

namespace titan_core {

std::unique_ptr<sqlite::database> ConnectionPool::open(const std::string &db_path, OpenMode mode) {
  sqlite::sqlite_config config;
  config.flags = mode == OpenMode::ReadOnly
                     ? sqlite::OpenFlags::READONLY
                     : sqlite::OpenFlags::READWRITE | sqlite::OpenFlags::CREATE;
  auto db = std::make_unique<sqlite::database>(db_path, config);

  // Touch the schema so a file that is not a database fails here, not on first query
  *db << "SELECT count(*) FROM sqlite_master;";
  *db << "PRAGMA busy_timeout = 5000;";
  if (mode == OpenMode::ReadWrite) {
    *db << "PRAGMA journal_mode = WAL;";
  }
  return db;
}

ConnectionPool::ConnectionPool(const std::string &db_path, OpenMode mode, int pool_size)
    : db_path_(db_path) {
  if (pool_size <= 0) {
    throw std::invalid_argument("Connection pool size must be positive");
  }
  for (int i = 0; i < pool_size; ++i) {
    pool_.push(open(db_path_, mode));
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  // Wait until a connection is available or shutdown is requested
  cv_.wait(lock, [this] { return shutting_down_ || !pool_.empty(); });

  if (shutting_down_) {
    throw std::runtime_error("Connection pool is shut down");
  }

  std::unique_ptr<sqlite::database> conn = std::move(pool_.front());
  pool_.pop();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!shutting_down_) {
    pool_.push(std::move(conn));
  }
  cv_.notify_one();
}

void ConnectionPool::shutdown() {
  std::lock_guard<std::mutex> lock(mtx_);
  shutting_down_ = true;
  while (!pool_.empty()) {
    pool_.pop();
  }
  cv_.notify_all();
}

}  // namespace titan_core
