#pragma once

#include <sqlite_modern_cpp.h>

#include <memory>

#include "titan_core/db/database_manager.hpp"

namespace titan_core {

// Borrows a connection for the guard's lifetime. The pool throws if it is shut down.
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager &manager)
      : manager_(manager), conn_(manager.get_connection()) {}

  ~PooledConnection() {
    if (conn_) {
      manager_.return_connection(std::move(conn_));
    }
  }

  sqlite::database *operator->() const { return conn_.get(); }
  sqlite::database &operator*() const { return *conn_; }

  PooledConnection(const PooledConnection &) = delete;
  PooledConnection &operator=(const PooledConnection &) = delete;

 private:
  DatabaseManager &manager_;
  std::unique_ptr<sqlite::database> conn_;
};

}  // namespace titan_core
