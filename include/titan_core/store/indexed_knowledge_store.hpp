#pragma once

#include <faiss/Index.h>

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "titan_core/store/bm25_index.hpp"
#include "titan_core/store/knowledge_store.hpp"

namespace titan_core {

/**
 * @class IndexedKnowledgeStore
 * @brief In-memory KnowledgeStore: chunk records, a BM25 index and a faiss
 * inner-product index over L2-normalised embeddings.
 *
 * The constructor verifies that all three structures hold the same number of
 * entries and throws ConfigurationError otherwise. Never mutated after construction.
 */
class IndexedKnowledgeStore : public KnowledgeStore {
 public:
  IndexedKnowledgeStore(std::vector<Chunk> chunks,
                        std::unique_ptr<faiss::Index> vector_index,
                        std::size_t dimension,
                        Bm25Params bm25_params = Bm25Params{});

  // Builds an IndexFlatIP from row-major vectors, normalising each row
  static std::shared_ptr<const IndexedKnowledgeStore> from_vectors(std::vector<Chunk> chunks,
                                                                   std::vector<float> flat_vectors,
                                                                   std::size_t dimension,
                                                                   Bm25Params bm25_params = Bm25Params{});

  IndexedKnowledgeStore(const IndexedKnowledgeStore &) = delete;
  IndexedKnowledgeStore &operator=(const IndexedKnowledgeStore &) = delete;

  std::size_t size() const override { return chunks_.size(); }
  std::size_t dimension() const override { return dimension_; }

  std::vector<LegHit> lexical_search(const std::string &query_text,
                                     const CandidateFilter &filter,
                                     std::size_t limit,
                                     const async::CancellationToken &cancel) const override;

  std::vector<LegHit> vector_search(const std::vector<float> &query_vector,
                                    const CandidateFilter &filter,
                                    std::size_t limit) const override;

  const Chunk &get_chunk(std::size_t ordinal) const override;
  const Chunk *find_chunk(const std::string &chunk_id) const override;

  const Bm25Index &lexical_index() const { return bm25_; }
  const faiss::Index &vector_index() const { return *vector_index_; }

 private:
  std::vector<Chunk> chunks_;
  std::unique_ptr<faiss::Index> vector_index_;
  std::size_t dimension_;
  Bm25Index bm25_;
  std::unordered_map<std::string, std::size_t> ordinal_by_id_;

  void verify_alignment() const;
  std::vector<bool> lexical_universe(const CandidateFilter &filter) const;
};

}  // namespace titan_core
