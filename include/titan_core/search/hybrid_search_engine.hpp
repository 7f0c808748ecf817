#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "titan_core/async/cancellation.hpp"
#include "titan_core/llm/embedding_client.hpp"
#include "titan_core/search/rank_fusion.hpp"
#include "titan_core/store/knowledge_store.hpp"
#include "titan_core/types/chunk.hpp"

namespace titan_core {

struct SearchConfig {
  std::size_t top_k = 5;
  std::size_t lexical_fanout = 20;
  std::size_t semantic_fanout = 20;
  double rrf_k = 60.0;
  double lexical_weight = 1.0;
  double semantic_weight = 1.0;
  std::chrono::milliseconds embedding_timeout{10000};
  // Used when the caller does not pass its own deadline
  std::chrono::milliseconds default_deadline{30000};
};

struct SearchOutcome {
  std::vector<ScoredChunk> chunks;
  // Semantic leg missing: embedding failed, timed out or returned an unusable vector
  bool semantic_degraded = false;
  // Entity restriction matched nothing and the lexical leg ran on the category universe
  bool lexical_widened = false;
  // Deadline expired; at least one leg was abandoned
  bool cancelled = false;
  std::optional<DependencyError> semantic_error;
};

/**
 * @class HybridSearchEngine
 * @brief BM25 leg plus vector leg, temporally filtered and merged with RRF.
 *
 * Both legs run as separate tasks and are joined before fusion. When the deadline
 * passes the shared cancellation token is cancelled and fusion uses only the legs
 * that had already finished. Stateless between calls and safe to share across threads.
 */
class HybridSearchEngine {
 public:
  HybridSearchEngine(std::shared_ptr<const KnowledgeStore> store,
                     std::shared_ptr<EmbeddingClient> embedding_client,
                     const SearchConfig &config);

  SearchOutcome search(const std::string &query_text,
                       std::optional<int> target_year,
                       const std::vector<std::string> &entities,
                       std::size_t top_k,
                       std::optional<DocType> category_hint,
                       async::Clock::time_point deadline,
                       const async::CancellationToken &cancel) const;

  SearchOutcome search(const std::string &query_text,
                       std::optional<int> target_year,
                       const std::vector<std::string> &entities,
                       std::size_t top_k,
                       std::optional<DocType> category_hint = std::nullopt) const;

  const SearchConfig &config() const { return config_; }

 private:
  struct SemanticLeg {
    std::vector<LegHit> hits;
    std::optional<DependencyError> error;
  };

  struct LexicalLeg {
    std::vector<LegHit> hits;
    bool widened = false;
  };

  std::shared_ptr<const KnowledgeStore> store_;
  std::shared_ptr<EmbeddingClient> embedding_client_;
  SearchConfig config_;

  LexicalLeg run_lexical(const std::string &query_text,
                         const CandidateFilter &filter,
                         const async::CancellationToken &cancel) const;

  SemanticLeg run_semantic(const std::string &query_text,
                           const CandidateFilter &filter,
                           async::Clock::time_point deadline,
                           const async::CancellationToken &cancel) const;
};

}  // namespace titan_core
