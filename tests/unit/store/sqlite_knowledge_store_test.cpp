#include <gtest/gtest.h>
#include <sqlite_modern_cpp.h>

#include <filesystem>

#include "../../common/utilities_test.hpp"
#include "titan_core/db/pooled_connection.hpp"
#include "titan_core/store/sqlite_knowledge_store.hpp"

namespace titan_core {

using titan_tests::TestUtilities;

class SqliteKnowledgeStoreTest : public titan_tests::KnowledgeDbTestBase {
 protected:
  void SetUp() override {
    KnowledgeDbTestBase::SetUp();
    store_ = std::make_unique<SqliteKnowledgeStore>(*db_manager_, 4);
  }

  void TearDown() override {
    store_.reset();
    KnowledgeDbTestBase::TearDown();
  }

  std::vector<ChunkRecord> corpus_records() {
    std::vector<ChunkRecord> records;
    auto corpus = TestUtilities::create_land_law_corpus();
    for (std::size_t i = 0; i < corpus.size(); ++i) {
      records.push_back(ChunkRecord{corpus[i], TestUtilities::axis_vector(i)});
    }
    return records;
  }

  std::unique_ptr<SqliteKnowledgeStore> store_;
};

TEST_F(SqliteKnowledgeStoreTest, WriteChunks_RoundTripsThroughLoadIndex) {
  auto records = corpus_records();
  records[0].chunk.region = "HN";
  store_->write_chunks(records);

  EXPECT_EQ(store_->chunk_count(), 4u);

  auto index = store_->load_index();
  ASSERT_EQ(index->size(), 4u);
  for (std::size_t i = 0; i < records.size(); ++i) {
    const Chunk &loaded = index->get_chunk(i);
    const Chunk &expected = records[i].chunk;
    EXPECT_EQ(loaded.id, expected.id);
    EXPECT_EQ(loaded.text, expected.text);
    EXPECT_EQ(loaded.source, expected.source);
    EXPECT_EQ(loaded.doc_type, expected.doc_type);
    EXPECT_EQ(loaded.valid_from, expected.valid_from);
    EXPECT_EQ(loaded.valid_until, expected.valid_until);
    EXPECT_EQ(loaded.region, expected.region);
  }

  auto hits = index->vector_search(TestUtilities::axis_vector(1), CandidateFilter{}, 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(index->get_chunk(hits[0].ordinal).id, "land_2024");
}

TEST_F(SqliteKnowledgeStoreTest, WriteChunks_StoresCompressedContent) {
  store_->write_chunks(corpus_records());

  PooledConnection conn(*db_manager_);
  std::vector<char> content;
  *conn << "SELECT content FROM chunks WHERE chunk_id = 'land_2024'" >> content;
  // zstd frame magic number, little-endian
  ASSERT_GE(content.size(), 4u);
  EXPECT_EQ(static_cast<unsigned char>(content[0]), 0x28);
  EXPECT_EQ(static_cast<unsigned char>(content[1]), 0xB5);
  EXPECT_EQ(static_cast<unsigned char>(content[2]), 0x2F);
  EXPECT_EQ(static_cast<unsigned char>(content[3]), 0xFD);
}

TEST_F(SqliteKnowledgeStoreTest, WriteChunks_AppendsAfterLastOrdinal) {
  auto records = corpus_records();
  std::vector<ChunkRecord> first(records.begin(), records.begin() + 2);
  std::vector<ChunkRecord> second(records.begin() + 2, records.end());

  store_->write_chunks(first);
  store_->write_chunks(second);

  auto index = store_->load_index();
  ASSERT_EQ(index->size(), 4u);
  EXPECT_EQ(index->get_chunk(3).id, "culture_tet");
}

TEST_F(SqliteKnowledgeStoreTest, WriteChunks_RejectsWrongDimension) {
  std::vector<ChunkRecord> records = {
      ChunkRecord{TestUtilities::create_test_chunk("c1", "một"), {1.0f, 0.0f}}};

  EXPECT_THROW(store_->write_chunks(records), KnowledgeStoreError);
  EXPECT_EQ(store_->chunk_count(), 0u);
}

TEST_F(SqliteKnowledgeStoreTest, WriteChunks_DuplicateIdRollsBack) {
  std::vector<ChunkRecord> records = {
      ChunkRecord{TestUtilities::create_test_chunk("c1", "một"), TestUtilities::axis_vector(0)},
      ChunkRecord{TestUtilities::create_test_chunk("c1", "hai"), TestUtilities::axis_vector(1)}};

  EXPECT_THROW(store_->write_chunks(records), KnowledgeStoreError);
  EXPECT_EQ(store_->chunk_count(), 0u);
}

TEST_F(SqliteKnowledgeStoreTest, LoadIndex_MissingVectorBlobIsInconsistent) {
  store_->write_chunks(corpus_records());
  {
    PooledConnection conn(*db_manager_);
    *conn << "UPDATE chunks SET vector_blob = NULL WHERE ordinal = 2";
  }

  EXPECT_THROW(store_->load_index(), ConfigurationError);
}

TEST_F(SqliteKnowledgeStoreTest, LoadIndex_MissingIndexFileThrows) {
  store_->write_chunks(corpus_records());
  EXPECT_THROW(store_->load_index("/nonexistent/titan/vectors.faiss"), ConfigurationError);
}

TEST_F(SqliteKnowledgeStoreTest, ExportVectorIndex_IsReadBackAligned) {
  store_->write_chunks(corpus_records());
  auto index_path = temp_db_path_.string() + ".faiss";

  store_->export_vector_index(index_path);
  auto index = store_->load_index(index_path);

  EXPECT_EQ(index->size(), 4u);
  EXPECT_EQ(index->vector_index().ntotal, 4);
  auto hits = index->vector_search(TestUtilities::axis_vector(3), CandidateFilter{}, 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(index->get_chunk(hits[0].ordinal).id, "culture_tet");

  std::error_code ec;
  std::filesystem::remove(index_path, ec);
}

TEST_F(SqliteKnowledgeStoreTest, SafetyVectors_LoadIntoMatrix) {
  store_->write_safety_vectors({SafetyVectorRecord{"trốn thuế", TestUtilities::axis_vector(0)},
                                SafetyVectorRecord{"lừa đảo", {0.0f, 3.0f, 4.0f, 0.0f}}});

  EXPECT_EQ(store_->safety_vector_count(), 2u);
  auto matrix = store_->load_unsafe_intent_matrix();
  ASSERT_EQ(matrix->row_count(), 2u);
  EXPECT_EQ(matrix->label(0), "trốn thuế");
  EXPECT_EQ(matrix->label(1), "lừa đảo");
  EXPECT_NEAR(matrix->row(1)[1], 0.6f, 1e-6);
  EXPECT_NEAR(matrix->row(1)[2], 0.8f, 1e-6);
}

TEST_F(SqliteKnowledgeStoreTest, SafetyVectors_RejectWrongDimension) {
  EXPECT_THROW(store_->write_safety_vectors({SafetyVectorRecord{"x", {1.0f}}}), KnowledgeStoreError);
  EXPECT_EQ(store_->safety_vector_count(), 0u);
}

TEST_F(SqliteKnowledgeStoreTest, Clear_RemovesEverything) {
  store_->write_chunks(corpus_records());
  store_->write_safety_vectors({SafetyVectorRecord{"x", TestUtilities::axis_vector(0)}});

  store_->clear();

  EXPECT_EQ(store_->chunk_count(), 0u);
  EXPECT_EQ(store_->safety_vector_count(), 0u);
  EXPECT_EQ(store_->load_index()->size(), 0u);
}

TEST(SqliteKnowledgeStoreConstructionTest, ZeroDimensionThrows) {
  auto path = TestUtilities::create_temp_test_db();
  {
    DatabaseManager db(path, OpenMode::ReadWrite, 1);
    EXPECT_THROW(SqliteKnowledgeStore(db, 0), ConfigurationError);
    db.shutdown();
  }
  TestUtilities::cleanup_temp_db(path);
}

}  // namespace titan_core
