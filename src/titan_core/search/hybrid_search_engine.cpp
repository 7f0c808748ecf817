#include "titan_core/search/hybrid_search_engine.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <iostream>
#include <stdexcept>

namespace titan_core {

HybridSearchEngine::HybridSearchEngine(std::shared_ptr<const KnowledgeStore> store,
                                       std::shared_ptr<EmbeddingClient> embedding_client,
                                       const SearchConfig &config)
    : store_(std::move(store)), embedding_client_(std::move(embedding_client)), config_(config) {
  if (!store_) {
    throw std::invalid_argument("HybridSearchEngine requires a knowledge store");
  }
  if (!embedding_client_) {
    throw std::invalid_argument("HybridSearchEngine requires an embedding client");
  }
}

HybridSearchEngine::LexicalLeg HybridSearchEngine::run_lexical(
    const std::string &query_text, const CandidateFilter &filter,
    const async::CancellationToken &cancel) const {
  LexicalLeg leg;
  leg.hits = store_->lexical_search(query_text, filter, config_.lexical_fanout, cancel);

  if (leg.hits.empty() && !filter.required_terms.empty() && !cancel.is_cancelled()) {
    leg.hits = store_->lexical_search(query_text, filter.category_only(), config_.lexical_fanout,
                                      cancel);
    leg.widened = true;
  }
  return leg;
}

HybridSearchEngine::SemanticLeg HybridSearchEngine::run_semantic(
    const std::string &query_text, const CandidateFilter &filter,
    async::Clock::time_point deadline, const async::CancellationToken &cancel) const {
  SemanticLeg leg;

  auto timeout = std::min(config_.embedding_timeout, async::remaining_until(deadline));
  auto embedding = embedding_client_->embed(query_text, timeout, cancel);
  if (!embedding.ok()) {
    leg.error = embedding.error();
    return leg;
  }

  const auto &vector = embedding.value();
  if (vector.size() != store_->dimension()) {
    leg.error = DependencyError{DependencyErrorKind::BadResponse,
                                "embedding has dimension " + std::to_string(vector.size()) +
                                    ", index expects " + std::to_string(store_->dimension())};
    return leg;
  }
  if (std::any_of(vector.begin(), vector.end(), [](float v) { return !std::isfinite(v); })) {
    leg.error = DependencyError{DependencyErrorKind::BadResponse, "embedding contains non-finite values"};
    return leg;
  }

  CandidateFilter vector_filter = filter.category_only();
  leg.hits = store_->vector_search(vector, vector_filter, config_.semantic_fanout);
  return leg;
}

SearchOutcome HybridSearchEngine::search(const std::string &query_text,
                                         std::optional<int> target_year,
                                         const std::vector<std::string> &entities,
                                         std::size_t top_k,
                                         std::optional<DocType> category_hint) const {
  async::CancellationToken cancel;
  return search(query_text, target_year, entities, top_k, category_hint,
                async::Clock::now() + config_.default_deadline, cancel);
}

SearchOutcome HybridSearchEngine::search(const std::string &query_text,
                                         std::optional<int> target_year,
                                         const std::vector<std::string> &entities,
                                         std::size_t top_k,
                                         std::optional<DocType> category_hint,
                                         async::Clock::time_point deadline,
                                         const async::CancellationToken &cancel) const {
  SearchOutcome outcome;
  if (top_k == 0 || store_->size() == 0) {
    return outcome;
  }

  CandidateFilter filter;
  if (category_hint) {
    filter.doc_types.push_back(*category_hint);
  }
  filter.required_terms = entities;

  auto lexical_future = std::async(std::launch::async, [this, &query_text, &filter, cancel]() {
    return run_lexical(query_text, filter, cancel);
  });
  auto semantic_future =
      std::async(std::launch::async, [this, &query_text, &filter, deadline, cancel]() {
        return run_semantic(query_text, filter, deadline, cancel);
      });

  // Join barrier. A leg still running at the deadline is cancelled and left out of fusion.
  bool lexical_on_time = lexical_future.wait_until(deadline) == std::future_status::ready;
  bool semantic_on_time = semantic_future.wait_until(deadline) == std::future_status::ready;
  if (!lexical_on_time || !semantic_on_time) {
    cancel.cancel();
    outcome.cancelled = true;
    std::cerr << "[HybridSearchEngine] Deadline expired, fusing "
              << (lexical_on_time ? "lexical" : semantic_on_time ? "semantic" : "no")
              << " results only" << std::endl;
  }

  // Both futures are drained so no task outlives the references it captured
  LexicalLeg lexical = lexical_future.get();
  SemanticLeg semantic = semantic_future.get();

  std::vector<LegHit> lexical_hits;
  if (lexical_on_time) {
    lexical_hits = sanitize_leg(lexical.hits, *store_, target_year);
    outcome.lexical_widened = lexical.widened;
  }

  std::vector<LegHit> semantic_hits;
  if (!semantic_on_time) {
    outcome.semantic_degraded = true;
    outcome.semantic_error =
        DependencyError{DependencyErrorKind::Timeout, "semantic leg missed the query deadline"};
  } else if (semantic.error) {
    outcome.semantic_degraded = true;
    outcome.semantic_error = semantic.error;
    std::cerr << "[HybridSearchEngine] Semantic leg degraded to lexical-only: "
              << semantic.error->describe() << std::endl;
  } else {
    semantic_hits = sanitize_leg(semantic.hits, *store_, target_year);
  }

  FusionParams params{config_.rrf_k, config_.lexical_weight, config_.semantic_weight};
  outcome.chunks = fuse_rankings(lexical_hits, semantic_hits, *store_, params, target_year, top_k);
  return outcome;
}

}  // namespace titan_core
