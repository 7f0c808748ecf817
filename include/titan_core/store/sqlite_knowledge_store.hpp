#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "titan_core/db/database_manager.hpp"
#include "titan_core/safety/unsafe_intent_matrix.hpp"
#include "titan_core/store/indexed_knowledge_store.hpp"
#include "titan_core/types/chunk.hpp"

namespace titan_core {

struct ChunkRecord {
  Chunk chunk;
  std::vector<float> embedding;
};

struct SafetyVectorRecord {
  std::string label;
  std::vector<float> embedding;
};

/**
 * @class SqliteKnowledgeStore
 * @brief Persistence for the knowledge base.
 *
 * The indexer writes chunks and harmful-intent vectors through this class; the
 * server reads them back once at startup into an IndexedKnowledgeStore and an
 * UnsafeIntentMatrix. Chunk bodies are stored zstd-compressed.
 */
class SqliteKnowledgeStore {
 public:
  SqliteKnowledgeStore(DatabaseManager &db_manager, std::size_t dimension);

  SqliteKnowledgeStore(const SqliteKnowledgeStore &) = delete;
  SqliteKnowledgeStore &operator=(const SqliteKnowledgeStore &) = delete;

  // Appends after the current last ordinal in one transaction
  void write_chunks(const std::vector<ChunkRecord> &records);
  void write_safety_vectors(const std::vector<SafetyVectorRecord> &records);

  // Removes every chunk and safety vector
  void clear();

  std::size_t chunk_count();
  std::size_t safety_vector_count();

  // Rebuilds the vector index from the stored blobs, or reads `vector_index_path` when
  // it is non-empty. Throws ConfigurationError if the result is not aligned.
  std::shared_ptr<const IndexedKnowledgeStore> load_index(const std::string &vector_index_path = "",
                                                          Bm25Params bm25_params = Bm25Params{});

  std::shared_ptr<const UnsafeIntentMatrix> load_unsafe_intent_matrix();

  // Writes the rebuilt vector index so later startups can skip the rebuild
  void export_vector_index(const std::string &vector_index_path);

 private:
  DatabaseManager &db_manager_;
  std::size_t dimension_;

  std::vector<char> vector_to_blob(const std::vector<float> &vector) const;
  std::vector<Chunk> read_chunks(std::vector<float> *flat_vectors);
};

}  // namespace titan_core
