#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

#include "titan_core/async/cancellation.hpp"
#include "titan_core/errors.hpp"
#include "titan_core/types/chunk.hpp"

namespace titan_core {

// Restricts the search universe of one leg
struct CandidateFilter {
  // Empty means every doc type is allowed
  std::vector<DocType> doc_types;
  // Lexical leg only: a chunk must contain at least one of these phrases.
  // Empty means no term requirement.
  std::vector<std::string> required_terms;

  bool is_unrestricted() const {
    return doc_types.empty() && required_terms.empty();
  }

  bool allows_doc_type(DocType type) const {
    return doc_types.empty() ||
           std::find(doc_types.begin(), doc_types.end(), type) != doc_types.end();
  }

  // Same filter with the term requirement dropped
  CandidateFilter category_only() const {
    return CandidateFilter{doc_types, {}};
  }
};

// Position of a chunk in the aligned indices plus the leg's raw score
struct LegHit {
  std::size_t ordinal = 0;
  double score = 0.0;
};

/**
 * @class KnowledgeStore
 * @brief Read-only chunk corpus with aligned lexical and vector indices.
 *
 * Ordinal i names the same chunk in get_chunk(), lexical_search() and
 * vector_search(). Implementations must be safe for concurrent readers.
 */
class KnowledgeStore {
 public:
  virtual ~KnowledgeStore() = default;

  virtual std::size_t size() const = 0;
  virtual std::size_t dimension() const = 0;

  // BM25 hits in descending score order, at most `limit`
  virtual std::vector<LegHit> lexical_search(const std::string &query_text,
                                             const CandidateFilter &filter,
                                             std::size_t limit,
                                             const async::CancellationToken &cancel) const = 0;

  // Cosine hits in descending score order, at most `limit`. required_terms is ignored.
  virtual std::vector<LegHit> vector_search(const std::vector<float> &query_vector,
                                            const CandidateFilter &filter,
                                            std::size_t limit) const = 0;

  // Throws std::out_of_range for an unknown ordinal
  virtual const Chunk &get_chunk(std::size_t ordinal) const = 0;
  virtual const Chunk *find_chunk(const std::string &chunk_id) const = 0;
};

}  // namespace titan_core
