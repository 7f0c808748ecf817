#include "titan_api/routes.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "titan_core/routing/router.hpp"
#include "titan_core/safety/safety_guard.hpp"
#include "titan_core/search/hybrid_search_engine.hpp"
#include "titan_core/services/answer_service.hpp"
#include "titan_core/store/knowledge_store.hpp"

namespace titan_api {
Routes::Routes(std::shared_ptr<titan_core::AnswerService> answer_service,
               std::shared_ptr<titan_core::SafetyGuard> safety_guard,
               std::shared_ptr<titan_core::Router> router,
               std::shared_ptr<titan_core::HybridSearchEngine> search_engine,
               std::shared_ptr<const titan_core::KnowledgeStore> knowledge_store)
    : answer_service_(answer_service),
      safety_guard_(safety_guard),
      router_(router),
      search_engine_(search_engine),
      knowledge_store_(knowledge_store) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  // Full pipeline: safety, routing, retrieval and answer selection
  CROW_ROUTE(app, "/answer").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_answer(req);
  });

  // Routing decision only
  CROW_ROUTE(app, "/route").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_route(req);
  });

  // Hybrid retrieval only
  CROW_ROUTE(app, "/search").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_search(req);
  });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("Titan Shield API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  response["chunks"] = knowledge_store_->size();
  return create_json_response(response);
}

crow::response Routes::handle_answer(const crow::request &req) {
  titan_core::Question question;
  std::optional<int> year;
  try {
    auto json_body = parse_json_body(req.body);
    question = titan_core::question_from_json(json_body);
    year = extract_year(json_body);
  } catch (const std::exception &e) {
    return create_json_response(create_error_response(e.what()), 400);
  }

  try {
    std::cout << "Answering question: " << question.id << std::endl;
    titan_core::QueryResult query_result;
    auto prediction = answer_service_->answer(question, year, query_result);

    nlohmann::json data;
    data["qid"] = prediction.question_id;
    data["answer"] = prediction.answer;
    data["mode"] = titan_core::to_string(prediction.mode);
    data["unsafe"] = prediction.unsafe;
    data["degraded"] = prediction.degraded;
    data["similarity"] = query_result.verdict.similarity;
    data["context"] = nlohmann::json::array();
    for (const auto &scored : query_result.chunks) {
      data["context"].push_back(scored_chunk_to_json(scored));
    }
    return create_json_response(create_success_response("Answer generated", data));
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_answer: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_route(const crow::request &req) {
  try {
    auto json_body = parse_json_body(req.body);
    std::string query = json_body.value("query", "");
    auto decision = router_->route(query);
    return create_json_response(create_success_response("Query routed", route_to_json(decision)));
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_route: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_search(const crow::request &req) {
  std::string query;
  std::optional<int> year;
  std::size_t top_k = search_engine_->config().top_k;
  try {
    auto json_body = parse_json_body(req.body);
    query = json_body.value("query", "");
    year = extract_year(json_body);
    if (json_body.contains("top_k")) {
      int requested = json_body.at("top_k").get<int>();
      if (requested <= 0) {
        return create_json_response(create_error_response("top_k must be greater than 0"), 400);
      }
      top_k = static_cast<std::size_t>(requested);
    }
  } catch (const std::exception &e) {
    return create_json_response(create_error_response(e.what()), 400);
  }

  try {
    std::cout << "Hybrid search for: " << query << " with top_k: " << top_k << std::endl;
    return create_json_response(create_success_response("Search completed", run_search(query, year, top_k)));
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_search: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

nlohmann::json Routes::run_search(const std::string &query, std::optional<int> year, std::size_t top_k) const {
  nlohmann::json data;
  data["results"] = nlohmann::json::array();

  // Screened like every other query; a flagged query is answered without retrieval
  auto verdict = safety_guard_->check(query);
  data["safety"] = safety_verdict_to_json(verdict);
  if (verdict.is_unsafe) {
    std::cout << "[Routes] Search refused by safety guard" << std::endl;
    data["blocked"] = true;
    return data;
  }
  data["blocked"] = false;

  auto decision = router_->route(query);
  if (!year) {
    year = decision.extracted_year;
  }
  auto outcome = search_engine_->search(query, year, decision.extracted_entities, top_k, decision.category_hint);

  for (const auto &scored : outcome.chunks) {
    data["results"].push_back(scored_chunk_to_json(scored));
  }
  data["semantic_degraded"] = outcome.semantic_degraded;
  data["lexical_widened"] = outcome.lexical_widened;
  data["cancelled"] = outcome.cancelled;
  if (year) {
    data["year"] = *year;
  }
  return data;
}

nlohmann::json Routes::safety_verdict_to_json(const titan_core::SafetyVerdict &verdict) {
  nlohmann::json out;
  out["is_unsafe"] = verdict.is_unsafe;
  out["similarity"] = verdict.similarity;
  out["matched_keyword"] = verdict.matched_keyword ? nlohmann::json(*verdict.matched_keyword) : nlohmann::json();
  out["degraded"] = verdict.degraded;
  return out;
}

nlohmann::json Routes::scored_chunk_to_json(const titan_core::ScoredChunk &scored) {
  nlohmann::json out;
  if (scored.chunk) {
    out["id"] = scored.chunk->id;
    out["text"] = scored.chunk->text;
    out["source"] = scored.chunk->source;
    out["doc_type"] = titan_core::to_string(scored.chunk->doc_type);
    out["valid_from"] = scored.chunk->valid_from;
    out["valid_until"] = scored.chunk->valid_until;
  }
  out["score"] = scored.score;
  out["retrieval"] = titan_core::to_string(scored.source);
  out["lexical_rank"] = scored.lexical_rank;
  out["semantic_rank"] = scored.semantic_rank;
  return out;
}

nlohmann::json Routes::route_to_json(const titan_core::RouteDecision &route) {
  nlohmann::json out;
  out["mode"] = titan_core::to_string(route.mode);
  out["matched_pattern"] = route.matched_pattern ? nlohmann::json(*route.matched_pattern) : nlohmann::json();
  out["year"] = route.extracted_year ? nlohmann::json(*route.extracted_year) : nlohmann::json();
  out["entities"] = route.extracted_entities;
  out["category_hint"] =
      route.category_hint ? nlohmann::json(titan_core::to_string(*route.category_hint)) : nlohmann::json();
  return out;
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

std::optional<int> Routes::extract_year(const nlohmann::json &json_body) {
  if (!json_body.contains("year") || json_body["year"].is_null()) {
    return std::nullopt;
  }
  return json_body.at("year").get<int>();
}

}  // namespace titan_api
