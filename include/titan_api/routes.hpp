#pragma once
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "server.hpp"
#include "titan_core/types/chunk.hpp"
#include "titan_core/types/query.hpp"

// Forward declarations
namespace titan_core {
class AnswerService;
class Router;
class SafetyGuard;
class HybridSearchEngine;
class KnowledgeStore;
}  // namespace titan_core

namespace titan_api {

class Routes {
 public:
  Routes(std::shared_ptr<titan_core::AnswerService> answer_service,
         std::shared_ptr<titan_core::SafetyGuard> safety_guard,
         std::shared_ptr<titan_core::Router> router,
         std::shared_ptr<titan_core::HybridSearchEngine> search_engine,
         std::shared_ptr<const titan_core::KnowledgeStore> knowledge_store);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Allow move constructor and assignment
  Routes(Routes &&) noexcept = default;
  Routes &operator=(Routes &&) noexcept = default;

  // Register all routes with the server
  void register_routes(Server &server);

  // Body of /search: safety check first, retrieval only for safe queries
  nlohmann::json run_search(const std::string &query, std::optional<int> year, std::size_t top_k) const;

  // JSON shapes used in responses
  static nlohmann::json scored_chunk_to_json(const titan_core::ScoredChunk &scored);
  static nlohmann::json route_to_json(const titan_core::RouteDecision &route);
  static nlohmann::json safety_verdict_to_json(const titan_core::SafetyVerdict &verdict);

 private:
  std::shared_ptr<titan_core::AnswerService> answer_service_;
  std::shared_ptr<titan_core::SafetyGuard> safety_guard_;
  std::shared_ptr<titan_core::Router> router_;
  std::shared_ptr<titan_core::HybridSearchEngine> search_engine_;
  std::shared_ptr<const titan_core::KnowledgeStore> knowledge_store_;

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_answer(const crow::request &req);
  crow::response handle_route(const crow::request &req);
  crow::response handle_search(const crow::request &req);

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  std::optional<int> extract_year(const nlohmann::json &json_body);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace titan_api
