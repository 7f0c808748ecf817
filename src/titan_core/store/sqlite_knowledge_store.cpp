#include "titan_core/store/sqlite_knowledge_store.hpp"

#include <faiss/impl/FaissException.h>
#include <faiss/index_io.h>

#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>

#include "titan_core/db/pooled_connection.hpp"
#include "titan_core/db/sqlite_error_utils.hpp"
#include "titan_core/db/transaction.hpp"
#include "titan_core/services/compression_service.hpp"

namespace titan_core {

SqliteKnowledgeStore::SqliteKnowledgeStore(DatabaseManager &db_manager, std::size_t dimension)
    : db_manager_(db_manager), dimension_(dimension) {
  if (dimension_ == 0) {
    throw ConfigurationError("Embedding dimension must be greater than 0");
  }
}

std::vector<char> SqliteKnowledgeStore::vector_to_blob(const std::vector<float> &vector) const {
  std::vector<char> blob(vector.size() * sizeof(float));
  std::memcpy(blob.data(), vector.data(), blob.size());
  return blob;
}

void SqliteKnowledgeStore::write_chunks(const std::vector<ChunkRecord> &records) {
  if (records.empty())
    return;

  for (const auto &record : records) {
    if (record.embedding.size() != dimension_) {
      throw KnowledgeStoreError("Vector embedding size mismatch for chunk " + record.chunk.id +
                                ". Expected " + std::to_string(dimension_) + " dimensions, got " +
                                std::to_string(record.embedding.size()) + ".");
    }
  }

  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, /*immediate*/ true);

    long long next_ordinal = 0;
    *conn << "SELECT COALESCE(MAX(ordinal) + 1, 0) FROM chunks" >> next_ordinal;

    for (const auto &record : records) {
      const Chunk &chunk = record.chunk;
      *conn << "INSERT INTO chunks (ordinal, chunk_id, source, doc_type, valid_from, valid_until, "
               "region, content, vector_blob) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)"
            << next_ordinal++ << chunk.id << chunk.source << to_string(chunk.doc_type)
            << chunk.valid_from << chunk.valid_until << chunk.region
            << CompressionService::compress(chunk.text) << vector_to_blob(record.embedding);
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeStoreError(format_db_error("write_chunks", e));
  }
}

void SqliteKnowledgeStore::write_safety_vectors(const std::vector<SafetyVectorRecord> &records) {
  if (records.empty())
    return;

  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);
    for (const auto &record : records) {
      if (record.embedding.size() != dimension_) {
        throw KnowledgeStoreError("Safety vector '" + record.label + "' has dimension " +
                                  std::to_string(record.embedding.size()) + ", expected " +
                                  std::to_string(dimension_));
      }
      *conn << "INSERT INTO safety_vectors (label, vector_blob) VALUES (?, ?)" << record.label
            << vector_to_blob(record.embedding);
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeStoreError(format_db_error("write_safety_vectors", e));
  }
}

void SqliteKnowledgeStore::clear() {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);
    *conn << "DELETE FROM chunks";
    *conn << "DELETE FROM safety_vectors";
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeStoreError(format_db_error("clear", e));
  }
}

std::size_t SqliteKnowledgeStore::chunk_count() {
  try {
    PooledConnection conn(db_manager_);
    long long count = 0;
    *conn << "SELECT COUNT(*) FROM chunks" >> count;
    return static_cast<std::size_t>(count);
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeStoreError(format_db_error("chunk_count", e));
  }
}

std::size_t SqliteKnowledgeStore::safety_vector_count() {
  try {
    PooledConnection conn(db_manager_);
    long long count = 0;
    *conn << "SELECT COUNT(*) FROM safety_vectors" >> count;
    return static_cast<std::size_t>(count);
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeStoreError(format_db_error("safety_vector_count", e));
  }
}

// Reads chunks in ordinal order. When `flat_vectors` is given every chunk must carry a
// vector of the configured dimension.
std::vector<Chunk> SqliteKnowledgeStore::read_chunks(std::vector<float> *flat_vectors) {
  std::vector<Chunk> chunks;
  std::string problem;

  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT ordinal, chunk_id, source, doc_type, valid_from, valid_until, region, "
             "content, vector_blob FROM chunks ORDER BY ordinal" >>
        [&](long long ordinal, std::string chunk_id, std::string source, std::string doc_type,
            int valid_from, int valid_until, std::optional<std::string> region,
            std::vector<char> content, std::optional<std::vector<char>> vector_blob) {
          if (!problem.empty()) {
            return;
          }
          if (ordinal != static_cast<long long>(chunks.size())) {
            problem = "chunk ordinals are not contiguous: expected " +
                      std::to_string(chunks.size()) + ", found " + std::to_string(ordinal);
            return;
          }

          Chunk chunk;
          chunk.id = std::move(chunk_id);
          chunk.source = std::move(source);
          chunk.doc_type = doc_type_from_string(doc_type);
          chunk.valid_from = valid_from;
          chunk.valid_until = valid_until;
          chunk.region = region && !region->empty() ? *region : UNSCOPED_REGION;
          try {
            chunk.text = CompressionService::decompress(content);
          } catch (const CompressionError &e) {
            problem = "chunk " + chunk.id + " has unreadable content: " + e.what();
            return;
          }

          if (flat_vectors) {
            if (!vector_blob || vector_blob->size() != dimension_ * sizeof(float)) {
              problem = "chunk " + chunk.id + " has no " + std::to_string(dimension_) +
                        "-dimensional vector (got " +
                        std::to_string(vector_blob ? vector_blob->size() : 0) + " bytes)";
              return;
            }
            const float *vec_ptr = reinterpret_cast<const float *>(vector_blob->data());
            flat_vectors->insert(flat_vectors->end(), vec_ptr, vec_ptr + dimension_);
          }
          chunks.push_back(std::move(chunk));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeStoreError(format_db_error("read_chunks", e));
  }

  if (!problem.empty()) {
    throw ConfigurationError("Knowledge database is inconsistent: " + problem);
  }
  return chunks;
}

std::shared_ptr<const IndexedKnowledgeStore> SqliteKnowledgeStore::load_index(
    const std::string &vector_index_path, Bm25Params bm25_params) {
  if (vector_index_path.empty()) {
    std::vector<float> flat_vectors;
    auto chunks = read_chunks(&flat_vectors);
    std::cout << "[KnowledgeStore] Loaded " << chunks.size()
              << " chunks, rebuilding vector index from stored embeddings" << std::endl;
    return IndexedKnowledgeStore::from_vectors(std::move(chunks), std::move(flat_vectors),
                                               dimension_, bm25_params);
  }

  if (!std::filesystem::exists(vector_index_path)) {
    throw ConfigurationError("Vector index file not found: " + vector_index_path);
  }

  auto chunks = read_chunks(nullptr);
  std::unique_ptr<faiss::Index> index;
  try {
    index.reset(faiss::read_index(vector_index_path.c_str()));
  } catch (const faiss::FaissException &e) {
    throw ConfigurationError("Failed to read vector index " + vector_index_path + ": " + e.what());
  }
  std::cout << "[KnowledgeStore] Loaded " << chunks.size() << " chunks and " << index->ntotal
            << " vectors from " << vector_index_path << std::endl;

  return std::make_shared<const IndexedKnowledgeStore>(std::move(chunks), std::move(index),
                                                       dimension_, bm25_params);
}

std::shared_ptr<const UnsafeIntentMatrix> SqliteKnowledgeStore::load_unsafe_intent_matrix() {
  auto matrix = std::make_shared<UnsafeIntentMatrix>(dimension_);
  std::size_t skipped = 0;

  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT label, vector_blob FROM safety_vectors ORDER BY id" >>
        [&](std::string label, std::vector<char> vector_blob) {
          if (vector_blob.size() != dimension_ * sizeof(float)) {
            std::cerr << "[KnowledgeStore] Warning: skipping safety vector '" << label
                      << "' with " << vector_blob.size() << " bytes, expected "
                      << dimension_ * sizeof(float) << std::endl;
            ++skipped;
            return;
          }
          const float *vec_ptr = reinterpret_cast<const float *>(vector_blob.data());
          matrix->add_row(label, std::vector<float>(vec_ptr, vec_ptr + dimension_));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeStoreError(format_db_error("load_unsafe_intent_matrix", e));
  }

  std::cout << "[KnowledgeStore] Loaded " << matrix->row_count() << " unsafe intent vectors";
  if (skipped > 0) {
    std::cout << " (" << skipped << " skipped)";
  }
  std::cout << std::endl;
  return matrix;
}

void SqliteKnowledgeStore::export_vector_index(const std::string &vector_index_path) {
  auto store = load_index();
  try {
    faiss::write_index(&store->vector_index(), vector_index_path.c_str());
  } catch (const faiss::FaissException &e) {
    throw KnowledgeStoreError("Failed to write vector index " + vector_index_path + ": " + e.what());
  }
}

}  // namespace titan_core
