#pragma once

#include <sqlite_modern_cpp.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace titan_core {

enum class OpenMode { ReadOnly, ReadWrite };

// Fixed-size pool of SQLite connections shared by query threads.
class ConnectionPool {
 public:
  ConnectionPool(const std::string &db_path, OpenMode mode, int pool_size);

  // Blocks until a connection is free. Throws once the pool is shut down.
  std::unique_ptr<sqlite::database> get_connection();

  void return_connection(std::unique_ptr<sqlite::database> conn);
  void shutdown();

  static std::unique_ptr<sqlite::database> open(const std::string &db_path, OpenMode mode);

 private:
  bool shutting_down_ = false;
  std::string db_path_;
  std::queue<std::unique_ptr<sqlite::database>> pool_;
  std::mutex mtx_;
  std::condition_variable cv_;
};

}  // namespace titan_core
