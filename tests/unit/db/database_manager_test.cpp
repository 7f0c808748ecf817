#include <gtest/gtest.h>
#include <sqlite_modern_cpp.h>
#include <string>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "titan_core/db/pooled_connection.hpp"
#include "titan_core/db/transaction.hpp"

namespace titan_core {

class DatabaseManagerTest : public titan_tests::KnowledgeDbTestBase {};

TEST_F(DatabaseManagerTest, CreatesSchema_OnInitialization) {
  std::vector<std::string> required_tables = {"chunks", "safety_vectors"};

  PooledConnection conn(*db_manager_);
  for (const auto& table : required_tables) {
    int count = 0;
    *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?" << table >> count;
    EXPECT_EQ(count, 1) << "Missing table: " << table;
  }

  int idx_count = 0;
  *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='index' AND name='idx_chunks_doc_type'" >> idx_count;
  EXPECT_EQ(idx_count, 1);
}

TEST_F(DatabaseManagerTest, ReadOnlyOpen_MissingFileThrows) {
  auto missing = titan_tests::TestUtilities::create_temp_test_db();
  EXPECT_THROW(DatabaseManager(missing, OpenMode::ReadOnly, 1), std::runtime_error);
}

TEST_F(DatabaseManagerTest, ReadOnlyOpen_RejectsWrites) {
  db_manager_->shutdown();
  DatabaseManager read_only(temp_db_path_, OpenMode::ReadOnly, 1);
  PooledConnection conn(read_only);
  EXPECT_THROW(*conn << "DELETE FROM chunks", sqlite::sqlite_exception);
}

TEST_F(DatabaseManagerTest, ShutdownRejectsFurtherBorrowing) {
  db_manager_->shutdown();
  EXPECT_THROW(db_manager_->get_connection(), std::runtime_error);
}

TEST_F(DatabaseManagerTest, TransactionRollsBackWithoutCommit) {
  {
    PooledConnection conn(*db_manager_);
    Transaction tx(*conn);
    *conn << "INSERT INTO safety_vectors (label, vector_blob) VALUES (?, ?)" << "tmp"
          << std::vector<char>{1, 2, 3, 4};
  }
  PooledConnection conn(*db_manager_);
  int count = -1;
  *conn << "SELECT COUNT(*) FROM safety_vectors" >> count;
  EXPECT_EQ(count, 0);
}

}  // namespace titan_core
