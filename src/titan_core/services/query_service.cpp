#include "titan_core/services/query_service.hpp"

#include <iostream>
#include <stdexcept>

namespace titan_core {

QueryService::QueryService(std::shared_ptr<SafetyGuard> safety_guard,
                           std::shared_ptr<SafetySelector> safety_selector,
                           std::shared_ptr<Router> router,
                           std::shared_ptr<HybridSearchEngine> search_engine,
                           const QueryServiceConfig &config)
    : safety_guard_(std::move(safety_guard)),
      safety_selector_(std::move(safety_selector)),
      router_(std::move(router)),
      search_engine_(std::move(search_engine)),
      config_(config) {
  if (!safety_guard_ || !safety_selector_ || !router_ || !search_engine_) {
    throw std::invalid_argument("QueryService requires guard, selector, router and search engine");
  }
}

QueryResult QueryService::process_query(const Question &question,
                                         std::optional<int> target_year) const {
  async::CancellationToken cancel;
  return process_query(question, target_year, async::Clock::now() + config_.query_deadline, cancel);
}

QueryResult QueryService::process_query(const Question &question,
                                         std::optional<int> target_year,
                                         async::Clock::time_point deadline,
                                         const async::CancellationToken &cancel) const {
  QueryResult result;

  result.verdict = safety_guard_->check(question.text, deadline, cancel);
  if (result.verdict.is_unsafe) {
    std::cout << "[QueryService] Question " << question.id << " flagged unsafe (similarity "
              << result.verdict.similarity << ")" << std::endl;
    result.selected_option = safety_selector_->select_refusal_option(question, deadline, cancel);
    return result;
  }

  result.route = router_->route(question.text);
  if (result.route.mode != RouteMode::Rag) {
    return result;
  }

  result.effective_year = target_year ? target_year : result.route.extracted_year;
  auto outcome = search_engine_->search(question.text, result.effective_year,
                                        result.route.extracted_entities, config_.top_k,
                                        result.route.category_hint, deadline, cancel);
  result.chunks = std::move(outcome.chunks);
  result.semantic_degraded = outcome.semantic_degraded;
  result.lexical_widened = outcome.lexical_widened;
  result.deadline_expired = outcome.cancelled;
  if (result.chunks.empty()) {
    std::cout << "[QueryService] No context retrieved for " << question.id << std::endl;
  }
  return result;
}

}  // namespace titan_core
