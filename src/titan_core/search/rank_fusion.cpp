#include "titan_core/search/rank_fusion.hpp"

#include <algorithm>
#include <cmath>
#include <map>

#include "titan_core/search/temporal_filter.hpp"

namespace titan_core {

double rrf_term(double weight, double k, std::size_t rank) {
  if (rank == 0) {
    return 0.0;
  }
  return weight / (k + static_cast<double>(rank));
}

std::vector<LegHit> sanitize_leg(const std::vector<LegHit> &hits,
                                 const KnowledgeStore &store,
                                 std::optional<int> target_year) {
  std::vector<LegHit> kept;
  kept.reserve(hits.size());
  for (const auto &hit : hits) {
    if (std::isnan(hit.score) || (std::isinf(hit.score) && hit.score < 0)) {
      continue;
    }
    if (hit.ordinal >= store.size()) {
      continue;
    }
    if (target_year && !TemporalFilter::is_valid(store.get_chunk(hit.ordinal), target_year)) {
      continue;
    }
    kept.push_back(hit);
  }
  return kept;
}

std::vector<ScoredChunk> fuse_rankings(const std::vector<LegHit> &lexical,
                                       const std::vector<LegHit> &semantic,
                                       const KnowledgeStore &store,
                                       const FusionParams &params,
                                       std::optional<int> target_year,
                                       std::size_t top_k) {
  // Keyed by ordinal; std::map keeps accumulation order independent of hashing
  std::map<std::size_t, ScoredChunk> fused;

  for (std::size_t i = 0; i < lexical.size(); ++i) {
    auto &entry = fused[lexical[i].ordinal];
    if (entry.lexical_rank != 0) {
      continue;  // duplicate ordinal in one leg, first rank wins
    }
    entry.chunk = &store.get_chunk(lexical[i].ordinal);
    entry.lexical_rank = i + 1;
    entry.lexical_score = lexical[i].score;
  }
  for (std::size_t i = 0; i < semantic.size(); ++i) {
    auto &entry = fused[semantic[i].ordinal];
    if (entry.semantic_rank != 0) {
      continue;
    }
    entry.chunk = &store.get_chunk(semantic[i].ordinal);
    entry.semantic_rank = i + 1;
    entry.semantic_score = semantic[i].score;
  }

  std::vector<std::pair<double, ScoredChunk>> ranked;
  ranked.reserve(fused.size());
  for (auto &item : fused) {
    ScoredChunk &entry = item.second;
    entry.score = rrf_term(params.lexical_weight, params.k, entry.lexical_rank) +
                  rrf_term(params.semantic_weight, params.k, entry.semantic_rank);
    if (entry.lexical_rank != 0 && entry.semantic_rank != 0) {
      entry.source = RetrievalSource::Fused;
    } else if (entry.lexical_rank != 0) {
      entry.source = RetrievalSource::Lexical;
    } else {
      entry.source = RetrievalSource::Semantic;
    }
    ranked.emplace_back(TemporalFilter::rank(*entry.chunk, target_year), entry);
  }

  std::sort(ranked.begin(), ranked.end(), [](const auto &a, const auto &b) {
    if (a.second.score != b.second.score) {
      return a.second.score > b.second.score;
    }
    if (a.first != b.first) {
      return a.first > b.first;
    }
    return a.second.chunk->id < b.second.chunk->id;
  });

  std::vector<ScoredChunk> results;
  results.reserve(std::min(top_k, ranked.size()));
  for (std::size_t i = 0; i < ranked.size() && i < top_k; ++i) {
    results.push_back(ranked[i].second);
  }
  return results;
}

}  // namespace titan_core
