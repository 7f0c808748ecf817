#include "titan_core/db/database_manager.hpp"

#include <stdexcept>

namespace titan_core {

DatabaseManager::DatabaseManager(const std::filesystem::path &db_path, OpenMode mode, int pool_size)
    : db_path_(db_path), mode_(mode) {
  if (mode_ == OpenMode::ReadOnly) {
    if (!std::filesystem::exists(db_path_)) {
      throw std::runtime_error("Knowledge database not found: " + db_path_.string());
    }
  } else {
    if (db_path_.has_parent_path()) {
      std::filesystem::create_directories(db_path_.parent_path());
    }
    // One-time schema setup before the pool opens its connections
    setup_schema();
  }

  pool_ = std::make_unique<ConnectionPool>(db_path_.string(), mode_, pool_size);
}

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::shutdown() {
  if (is_shut_down_ || !pool_) {
    return;
  }
  pool_->shutdown();
  is_shut_down_ = true;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (is_shut_down_) {
    throw std::runtime_error("DatabaseManager has been shut down.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (is_shut_down_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema() {
  // Use a temporary, single-use connection just for schema setup.
  auto db = ConnectionPool::open(db_path_.string(), OpenMode::ReadWrite);

  // ordinal is the position shared by the lexical and vector indices
  *db << R"(
      CREATE TABLE IF NOT EXISTS chunks (
          ordinal INTEGER PRIMARY KEY,
          chunk_id TEXT UNIQUE NOT NULL,
          source TEXT NOT NULL,
          doc_type TEXT NOT NULL,
          valid_from INTEGER NOT NULL,
          valid_until INTEGER NOT NULL,
          region TEXT NOT NULL DEFAULT 'ALL',
          content BLOB NOT NULL,
          vector_blob BLOB
      )
    )";

  *db << R"(
      CREATE TABLE IF NOT EXISTS safety_vectors (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          label TEXT NOT NULL,
          vector_blob BLOB NOT NULL
      )
    )";

  *db << R"(
      CREATE INDEX IF NOT EXISTS idx_chunks_doc_type ON chunks(doc_type)
    )";
}

}  // namespace titan_core
