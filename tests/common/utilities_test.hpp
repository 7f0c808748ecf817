#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "titan_core/db/database_manager.hpp"
#include "titan_core/store/indexed_knowledge_store.hpp"
#include "titan_core/types/chunk.hpp"
#include "titan_core/types/question.hpp"

namespace titan_tests {

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Database utilities
  static std::filesystem::path create_temp_test_db();
  static void cleanup_temp_db(const std::filesystem::path& db_path);

  // Test data creation
  static titan_core::Chunk create_test_chunk(const std::string& id,
                                             const std::string& text,
                                             titan_core::DocType doc_type = titan_core::DocType::General,
                                             int valid_from = titan_core::EARLIEST_VALID_YEAR,
                                             int valid_until = titan_core::NO_EXPIRY_YEAR);

  // Unit vector along `axis`
  static std::vector<float> axis_vector(std::size_t axis, std::size_t dimension = 4);

  // Deterministic pseudo-random vector derived from the seed text
  static std::vector<float> create_test_vector(const std::string& seed_text, std::size_t dimension = 4);

  // In-memory store over the given chunks; vectors are row-major, one per chunk
  static std::shared_ptr<const titan_core::IndexedKnowledgeStore> build_store(
      std::vector<titan_core::Chunk> chunks,
      const std::vector<std::vector<float>>& vectors,
      std::size_t dimension = 4);

  static titan_core::Question create_test_question(const std::string& id,
                                                   const std::string& text,
                                                   const std::vector<std::string>& options);

  // Small Vietnamese corpus used by retrieval tests: land law versions, history, culture
  static std::vector<titan_core::Chunk> create_land_law_corpus();
};

/**
 * Base test fixture that owns a fresh read-write knowledge database per test
 */
class KnowledgeDbTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_db_path_ = TestUtilities::create_temp_test_db();
    db_manager_ = std::make_unique<titan_core::DatabaseManager>(
        temp_db_path_, titan_core::OpenMode::ReadWrite, /*pool_size*/ 2);
  }

  void TearDown() override {
    if (db_manager_) {
      db_manager_->shutdown();
      db_manager_.reset();
    }
    TestUtilities::cleanup_temp_db(temp_db_path_);
  }

  std::filesystem::path temp_db_path_;
  std::unique_ptr<titan_core::DatabaseManager> db_manager_;
};

}  // namespace titan_tests
