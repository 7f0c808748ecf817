#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "titan_core/db/connection_pool.hpp"

namespace titan_core {

// Owns the knowledge database: schema setup plus the connection pool.
// One instance per process, created in main and passed down by reference.
class DatabaseManager {
 public:
  // ReadOnly requires an existing file. ReadWrite creates the file and schema if needed.
  DatabaseManager(const std::filesystem::path &db_path, OpenMode mode, int pool_size);
  ~DatabaseManager();

  DatabaseManager(const DatabaseManager &) = delete;
  DatabaseManager &operator=(const DatabaseManager &) = delete;

  // These methods are used by the PooledConnection guard
  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);

  void shutdown();

  const std::filesystem::path &path() const { return db_path_; }
  OpenMode mode() const { return mode_; }

 private:
  void setup_schema();

  std::filesystem::path db_path_;
  OpenMode mode_;
  std::unique_ptr<ConnectionPool> pool_;
  bool is_shut_down_ = false;
};

}  // namespace titan_core
