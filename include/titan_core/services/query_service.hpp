#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "titan_core/async/cancellation.hpp"
#include "titan_core/routing/router.hpp"
#include "titan_core/safety/safety_guard.hpp"
#include "titan_core/safety/safety_selector.hpp"
#include "titan_core/search/hybrid_search_engine.hpp"
#include "titan_core/types/query.hpp"
#include "titan_core/types/question.hpp"

namespace titan_core {

struct QueryServiceConfig {
  std::chrono::milliseconds query_deadline{30000};
  std::size_t top_k = 5;
};

struct QueryResult {
  SafetyVerdict verdict;
  // Left at its default when the query was short-circuited as unsafe
  RouteDecision route;
  // Retrieved context, only filled in RAG mode
  std::vector<ScoredChunk> chunks;
  // Set only for unsafe queries
  std::optional<SelectionResult> selected_option;

  bool semantic_degraded = false;
  bool lexical_widened = false;
  bool deadline_expired = false;
  // Year actually used for temporal filtering
  std::optional<int> effective_year;

  bool is_degraded() const {
    return verdict.degraded || semantic_degraded || deadline_expired ||
           (selected_option && selected_option->degraded);
  }
};

/**
 * @class QueryService
 * @brief Per-question orchestration: safety check, then refusal selection or
 * routing and (for RAG) hybrid retrieval.
 *
 * Never throws for dependency failures. Every degradation is reported through
 * the flags on QueryResult.
 */
class QueryService {
 public:
  QueryService(std::shared_ptr<SafetyGuard> safety_guard,
               std::shared_ptr<SafetySelector> safety_selector,
               std::shared_ptr<Router> router,
               std::shared_ptr<HybridSearchEngine> search_engine,
               const QueryServiceConfig &config);

  // `target_year` overrides the year the router extracts from the text
  QueryResult process_query(const Question &question,
                            std::optional<int> target_year,
                            async::Clock::time_point deadline,
                            const async::CancellationToken &cancel) const;

  QueryResult process_query(const Question &question,
                            std::optional<int> target_year = std::nullopt) const;

  const QueryServiceConfig &config() const { return config_; }

 private:
  std::shared_ptr<SafetyGuard> safety_guard_;
  std::shared_ptr<SafetySelector> safety_selector_;
  std::shared_ptr<Router> router_;
  std::shared_ptr<HybridSearchEngine> search_engine_;
  QueryServiceConfig config_;
};

}  // namespace titan_core
