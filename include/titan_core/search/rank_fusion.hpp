#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "titan_core/store/knowledge_store.hpp"
#include "titan_core/types/chunk.hpp"

namespace titan_core {

struct FusionParams {
  double k = 60.0;
  double lexical_weight = 1.0;
  double semantic_weight = 1.0;
};

// weight / (k + rank) for a 1-based rank; 0 when the rank is 0 (absent from the leg)
double rrf_term(double weight, double k, std::size_t rank);

// Drops hits with NaN or -inf scores and, when a target year is given, hits whose chunk
// is not temporally valid. Order is preserved so positions become the leg's ranks.
std::vector<LegHit> sanitize_leg(const std::vector<LegHit> &hits,
                                 const KnowledgeStore &store,
                                 std::optional<int> target_year);

/**
 * Reciprocal Rank Fusion of two sanitised legs.
 *
 * Sorted by fused score descending, then temporal rank descending, then chunk id
 * ascending, and truncated to `top_k`. A chunk found by both legs is tagged FUSED,
 * otherwise it keeps the tag of the leg that found it.
 */
std::vector<ScoredChunk> fuse_rankings(const std::vector<LegHit> &lexical,
                                       const std::vector<LegHit> &semantic,
                                       const KnowledgeStore &store,
                                       const FusionParams &params,
                                       std::optional<int> target_year,
                                       std::size_t top_k);

}  // namespace titan_core
