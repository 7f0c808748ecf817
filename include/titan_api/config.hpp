#pragma once

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "titan_core/llm/llm_provider.hpp"
#include "titan_core/routing/router.hpp"
#include "titan_core/safety/safety_guard.hpp"
#include "titan_core/search/hybrid_search_engine.hpp"
#include "titan_core/services/answer_service.hpp"
#include "titan_core/services/query_service.hpp"

inline constexpr const char *DEFAULT_CONFIG_FILE = "titanrc.json";
inline constexpr const char *CONFIG_ENV_VAR = "TITAN_CONFIG";

class Config {
 public:
  std::string api_base_url;
  std::string knowledge_db_path;
  // Optional faiss file; empty means rebuild the vector index from the database blobs
  std::string vector_index_path;
  int num_workers;

  int request_timeout_ms;
  int query_deadline_ms;

  titan_core::ProviderSettings providers;
  titan_core::SafetyConfig safety;
  titan_core::RouterConfig router;
  titan_core::SearchConfig search;

  // TITAN_CONFIG when set, otherwise ./titanrc.json
  static std::string default_path() {
    const char *env = std::getenv(CONFIG_ENV_VAR);
    if (env && *env) {
      return env;
    }
    return DEFAULT_CONFIG_FILE;
  }

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
      config.knowledge_db_path = json_config.value("knowledge_db_path", std::string("./data/knowledge.db"));
      config.vector_index_path = json_config.value("vector_index_path", std::string());
      config.num_workers = json_config.value("num_workers", 4);
      config.request_timeout_ms = json_config.value("request_timeout_ms", 10000);
      config.query_deadline_ms = json_config.value("query_deadline_ms", 30000);

      parse_providers(json_config, config.providers);
      parse_safety(json_config.value("safety", nlohmann::json::object()), config.safety);
      parse_router(json_config.value("router", nlohmann::json::object()), config.router);
      parse_search(json_config.value("search", nlohmann::json::object()), config.search);
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid configuration value: ") + e.what());
    } catch (const std::invalid_argument& e) {
      throw std::runtime_error(std::string("Invalid configuration value: ") + e.what());
    }

    // One timeout for every outbound call, one deadline per query
    auto request_timeout = std::chrono::milliseconds(config.request_timeout_ms);
    config.safety.embedding_timeout = request_timeout;
    config.safety.llm_timeout = request_timeout;
    config.search.embedding_timeout = request_timeout;
    config.search.default_deadline = std::chrono::milliseconds(config.query_deadline_ms);

    config.validate();
    return config;
  }

  titan_core::QueryServiceConfig query_service_config() const {
    titan_core::QueryServiceConfig out;
    out.query_deadline = std::chrono::milliseconds(query_deadline_ms);
    out.top_k = search.top_k;
    return out;
  }

  titan_core::AnswerConfig answer_config() const {
    titan_core::AnswerConfig out;
    out.llm_timeout = std::chrono::milliseconds(request_timeout_ms);
    return out;
  }

 private:
  static void parse_credential(const nlohmann::json& json, titan_core::VnptCredential& credential) {
    credential.authorization = json.value("authorization", std::string());
    credential.token_id = json.value("token_id", std::string());
    credential.token_key = json.value("token_key", std::string());
  }

  static void parse_providers(const nlohmann::json& json_config, titan_core::ProviderSettings& providers) {
    providers.provider = titan_core::llm_provider_from_string(json_config.value("llm_provider", std::string("ollama")));
    providers.ollama_url = json_config.value("ollama_url", providers.ollama_url);
    providers.embedding_model = json_config.value("embedding_model", providers.embedding_model);
    providers.chat_model = json_config.value("chat_model", providers.chat_model);
    providers.embedding_dimension = json_config.value("embedding_dimension", providers.embedding_dimension);
    providers.max_concurrent_requests = json_config.value("max_concurrent_requests", providers.max_concurrent_requests);

    if (json_config.contains("vnpt")) {
      const auto& vnpt = json_config.at("vnpt");
      providers.vnpt_base_url = vnpt.value("base_url", providers.vnpt_base_url);
      providers.vnpt_model_size = titan_core::vnpt_model_size_from_string(vnpt.value("model_size", std::string("small")));
      if (vnpt.contains("credentials")) {
        const auto& credentials = vnpt.at("credentials");
        parse_credential(credentials.value("embedding", nlohmann::json::object()), providers.vnpt_credentials.embedding);
        parse_credential(credentials.value("small", nlohmann::json::object()), providers.vnpt_credentials.small);
        parse_credential(credentials.value("large", nlohmann::json::object()), providers.vnpt_credentials.large);
      }
    }

    if (json_config.contains("azure")) {
      const auto& azure = json_config.at("azure");
      providers.azure.endpoint = azure.value("endpoint", providers.azure.endpoint);
      providers.azure.api_key = azure.value("api_key", providers.azure.api_key);
      providers.azure.api_version = azure.value("api_version", providers.azure.api_version);
      providers.azure.deployment = azure.value("deployment", providers.azure.deployment);
    }

    // "retry": {"max_retries": 3, "backoff_ms": [1000, 2000, 4000]}
    if (json_config.contains("retry")) {
      const auto& retry = json_config.at("retry");
      providers.retry.max_retries = retry.value("max_retries", providers.retry.max_retries);
      if (retry.contains("backoff_ms")) {
        providers.retry.backoff.clear();
        for (int ms : retry.at("backoff_ms").get<std::vector<int>>()) {
          providers.retry.backoff.push_back(std::chrono::milliseconds(ms));
        }
      }
    }
  }

  static void parse_safety(const nlohmann::json& json, titan_core::SafetyConfig& safety) {
    safety.threshold = json.value("threshold", 0.85f);
    safety.unsafe_keywords = json.value("unsafe_keywords", titan_core::SafetyConfig::default_unsafe_keywords());
    safety.refusal_phrases = json.value("refusal_phrases", titan_core::SafetyConfig::default_refusal_phrases());
  }

  static void parse_router(const nlohmann::json& json, titan_core::RouterConfig& router) {
    router = titan_core::RouterConfig::defaults();
    router.reading_patterns = json.value("reading_patterns", router.reading_patterns);
    router.stem_patterns = json.value("stem_patterns", router.stem_patterns);
    router.max_entities = json.value("max_entities", router.max_entities);

    // {"phrase": "LAW"}; object order is not preserved, so markers are matched longest phrase first
    if (json.contains("domain_markers")) {
      const auto& markers = json.at("domain_markers");
      if (!markers.is_object()) {
        throw std::runtime_error("router.domain_markers must be an object of phrase -> doc type");
      }
      router.domain_markers.clear();
      for (auto it = markers.begin(); it != markers.end(); ++it) {
        auto type_name = it.value().get<std::string>();
        auto type = titan_core::doc_type_from_string(type_name);
        if (type == titan_core::DocType::General && type_name != "GENERAL") {
          throw std::runtime_error("Unknown doc type '" + type_name + "' for domain marker '" + it.key() + "'");
        }
        router.domain_markers.push_back({it.key(), type});
      }
      std::stable_sort(router.domain_markers.begin(), router.domain_markers.end(),
                       [](const titan_core::DomainMarker& a, const titan_core::DomainMarker& b) {
                         return a.phrase.size() > b.phrase.size();
                       });
    }
  }

  static void parse_search(const nlohmann::json& json, titan_core::SearchConfig& search) {
    search.top_k = json.value("top_k", search.top_k);
    search.lexical_fanout = json.value("lexical_fanout", search.lexical_fanout);
    search.semantic_fanout = json.value("semantic_fanout", search.semantic_fanout);
    search.rrf_k = json.value("rrf_k", search.rrf_k);
    search.lexical_weight = json.value("lexical_weight", search.lexical_weight);
    search.semantic_weight = json.value("semantic_weight", search.semantic_weight);
  }

  void validate() const {
    if (api_base_url.empty()) {
      throw std::runtime_error("api_base_url cannot be empty");
    }
    if (knowledge_db_path.empty()) {
      throw std::runtime_error("knowledge_db_path cannot be empty");
    }
    if (num_workers <= 0) {
      throw std::runtime_error("num_workers must be greater than 0");
    }
    if (request_timeout_ms <= 0) {
      throw std::runtime_error("request_timeout_ms must be greater than 0");
    }
    if (query_deadline_ms <= 0) {
      throw std::runtime_error("query_deadline_ms must be greater than 0");
    }
    if (providers.embedding_dimension == 0) {
      throw std::runtime_error("embedding_dimension must be greater than 0");
    }
    if (providers.max_concurrent_requests <= 0) {
      throw std::runtime_error("max_concurrent_requests must be greater than 0");
    }
    if (providers.provider == titan_core::LlmProvider::Vnpt) {
      if (providers.vnpt_base_url.empty()) {
        throw std::runtime_error("vnpt.base_url cannot be empty");
      }
    } else {
      // ollama serves embeddings for both the ollama and azure providers
      if (providers.ollama_url.empty()) {
        throw std::runtime_error("ollama_url cannot be empty");
      }
      if (providers.embedding_model.empty() || providers.chat_model.empty()) {
        throw std::runtime_error("embedding_model and chat_model cannot be empty");
      }
    }
    if (providers.provider == titan_core::LlmProvider::Azure &&
        (providers.azure.endpoint.empty() || providers.azure.deployment.empty())) {
      throw std::runtime_error("azure.endpoint and azure.deployment cannot be empty");
    }
    if (providers.retry.max_retries < 0) {
      throw std::runtime_error("retry.max_retries cannot be negative");
    }
    for (const auto& wait : providers.retry.backoff) {
      if (wait.count() < 0) {
        throw std::runtime_error("retry.backoff_ms entries cannot be negative");
      }
    }
    if (!(safety.threshold > 0.0f && safety.threshold <= 1.0f)) {
      throw std::runtime_error("safety.threshold must be in (0, 1]");
    }
    if (search.top_k == 0) {
      throw std::runtime_error("search.top_k must be greater than 0");
    }
    if (search.lexical_fanout == 0 || search.semantic_fanout == 0) {
      throw std::runtime_error("search fanouts must be greater than 0");
    }
    if (search.rrf_k <= 0.0) {
      throw std::runtime_error("search.rrf_k must be greater than 0");
    }
    if (search.lexical_weight < 0.0 || search.semantic_weight < 0.0) {
      throw std::runtime_error("search weights cannot be negative");
    }
  }
};
