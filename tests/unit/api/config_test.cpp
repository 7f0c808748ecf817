#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cstdio>
#include <cstdlib>
#include <unistd.h>

#include "titan_api/config.hpp"

namespace {

std::string write_temp_file(const std::string& contents) {
  char filename_template[] = "/tmp/titan_config_test_XXXXXX.json";
  int fd = mkstemps(filename_template, 5); // 5 for ".json"
  if (fd == -1) {
    throw std::runtime_error("Failed to create temporary file");
  }
  FILE* file = fdopen(fd, "w");
  if (!file) {
    close(fd);
    throw std::runtime_error("Failed to open temporary file stream");
  }
  fwrite(contents.data(), 1, contents.size(), file);
  fclose(file);
  return std::string(filename_template);
}

void remove_file(const std::string& path) {
  std::remove(path.c_str());
}

} // namespace

TEST(ConfigTest, LoadsFromJsonWithDefaults) {
  nlohmann::json j = {
      {"api_base_url", "0.0.0.0:8080"},
      {"knowledge_db_path", "./data/kb.db"},
      {"ollama_url", "http://localhost:11434"},
      {"embedding_model", "bge-m3"},
      {"embedding_dimension", 1024},
      {"num_workers", 8}
  };

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.api_base_url, "0.0.0.0:8080");
  EXPECT_EQ(cfg.knowledge_db_path, "./data/kb.db");
  EXPECT_EQ(cfg.providers.ollama_url, "http://localhost:11434");
  EXPECT_EQ(cfg.providers.embedding_model, "bge-m3");
  EXPECT_EQ(cfg.providers.embedding_dimension, 1024u);
  EXPECT_EQ(cfg.num_workers, 8);
}

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  nlohmann::json j = nlohmann::json::object();

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.api_base_url, "127.0.0.1:3030");
  EXPECT_EQ(cfg.knowledge_db_path, "./data/knowledge.db");
  EXPECT_TRUE(cfg.vector_index_path.empty());
  EXPECT_EQ(cfg.num_workers, 4);
  EXPECT_EQ(cfg.providers.provider, titan_core::LlmProvider::Ollama);
  EXPECT_FLOAT_EQ(cfg.safety.threshold, 0.85f);
  EXPECT_FALSE(cfg.safety.unsafe_keywords.empty());
  EXPECT_FALSE(cfg.safety.refusal_phrases.empty());
  EXPECT_FALSE(cfg.router.reading_patterns.empty());
  EXPECT_EQ(cfg.search.top_k, 5u);
  EXPECT_DOUBLE_EQ(cfg.search.rrf_k, 60.0);
  EXPECT_DOUBLE_EQ(cfg.search.lexical_weight, 1.0);
  EXPECT_DOUBLE_EQ(cfg.search.semantic_weight, 1.0);
}

TEST(ConfigTest, TimeoutsFlowIntoComponentConfigs) {
  nlohmann::json j = {{"request_timeout_ms", 2500}, {"query_deadline_ms", 9000},
                      {"search", {{"top_k", 3}}}};

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.safety.embedding_timeout, std::chrono::milliseconds(2500));
  EXPECT_EQ(cfg.safety.llm_timeout, std::chrono::milliseconds(2500));
  EXPECT_EQ(cfg.search.embedding_timeout, std::chrono::milliseconds(2500));
  EXPECT_EQ(cfg.search.default_deadline, std::chrono::milliseconds(9000));
  EXPECT_EQ(cfg.query_service_config().query_deadline, std::chrono::milliseconds(9000));
  EXPECT_EQ(cfg.query_service_config().top_k, 3u);
  EXPECT_EQ(cfg.answer_config().llm_timeout, std::chrono::milliseconds(2500));
}

TEST(ConfigTest, ParsesVnptSection) {
  nlohmann::json j = {
      {"llm_provider", "vnpt"},
      {"vnpt", {
          {"base_url", "https://api.example.vn"},
          {"model_size", "large"},
          {"credentials", {
              {"embedding", {{"authorization", "Bearer e"}, {"token_id", "ei"}, {"token_key", "ek"}}},
              {"large", {{"authorization", "Bearer l"}, {"token_id", "li"}, {"token_key", "lk"}}}
          }}
      }}
  };

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.providers.provider, titan_core::LlmProvider::Vnpt);
  EXPECT_EQ(cfg.providers.vnpt_base_url, "https://api.example.vn");
  EXPECT_EQ(cfg.providers.vnpt_model_size, titan_core::VnptModelSize::Large);
  EXPECT_EQ(cfg.providers.vnpt_credentials.embedding.token_id, "ei");
  EXPECT_EQ(cfg.providers.vnpt_credentials.large.authorization, "Bearer l");
  EXPECT_TRUE(cfg.providers.vnpt_credentials.small.token_key.empty());
}

TEST(ConfigTest, DomainMarkersAreMatchedLongestFirst) {
  nlohmann::json j = {{"router", {{"domain_markers", {{"luật", "LAW"}, {"lịch sử", "HISTORY"}}}}}};

  Config cfg = Config::from_json(j);

  ASSERT_EQ(cfg.router.domain_markers.size(), 2u);
  EXPECT_EQ(cfg.router.domain_markers[0].phrase, "lịch sử");
  EXPECT_EQ(cfg.router.domain_markers[0].doc_type, titan_core::DocType::History);
  EXPECT_EQ(cfg.router.domain_markers[1].doc_type, titan_core::DocType::Law);
}

TEST(ConfigTest, UnknownDomainMarkerTypeThrows) {
  nlohmann::json j = {{"router", {{"domain_markers", {{"thiên văn", "ASTRONOMY"}}}}}};
  EXPECT_THROW({ (void)Config::from_json(j); }, std::runtime_error);
}

TEST(ConfigTest, FromFileParsesAndValidates) {
  std::string contents = R"JSON({
    "api_base_url": "127.0.0.1:4000",
    "knowledge_db_path": "./db/knowledge.db",
    "vector_index_path": "./db/vectors.faiss",
    "num_workers": 2,
    "safety": {"threshold": 0.9, "unsafe_keywords": ["cách làm bom"]}
  })JSON";

  std::string path = write_temp_file(contents);
  Config cfg;
  try {
    cfg = Config::from_file(path);
  } catch (...) {
    remove_file(path);
    throw;
  }
  remove_file(path);

  EXPECT_EQ(cfg.api_base_url, "127.0.0.1:4000");
  EXPECT_EQ(cfg.knowledge_db_path, "./db/knowledge.db");
  EXPECT_EQ(cfg.vector_index_path, "./db/vectors.faiss");
  EXPECT_EQ(cfg.num_workers, 2);
  EXPECT_FLOAT_EQ(cfg.safety.threshold, 0.9f);
  EXPECT_EQ(cfg.safety.unsafe_keywords, (std::vector<std::string>{"cách làm bom"}));
}

TEST(ConfigTest, InvalidPathThrows) {
  EXPECT_THROW({
    (void)Config::from_file("/nonexistent/path/config.json");
  }, std::runtime_error);
}

TEST(ConfigTest, MalformedFileThrows) {
  std::string path = write_temp_file("{ not json");
  EXPECT_THROW({ (void)Config::from_file(path); }, std::runtime_error);
  remove_file(path);
}

TEST(ConfigTest, EmptyRequiredFieldThrows) {
  nlohmann::json j = {
      {"api_base_url", ""},
      {"knowledge_db_path", "./data/knowledge.db"}
  };

  EXPECT_THROW({ (void)Config::from_json(j); }, std::runtime_error);
}

TEST(ConfigTest, NonPositiveWorkersDefaultsAndValidates) {
  nlohmann::json j = {{"num_workers", 0}};

  // from_json will accept 0 then validate() should throw
  EXPECT_THROW({ (void)Config::from_json(j); }, std::runtime_error);
}

TEST(ConfigTest, InvalidValuesThrow) {
  EXPECT_THROW({ (void)Config::from_json({{"safety", {{"threshold", 0.0}}}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"safety", {{"threshold", 1.5}}}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"llm_provider", "openai"}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"search", {{"top_k", 0}}}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"search", {{"semantic_weight", -1.0}}}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"request_timeout_ms", 0}}); }, std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"num_workers", "four"}}); }, std::runtime_error);
}

TEST(ConfigTest, AzureProviderReadsItsSection) {
  nlohmann::json j = {
      {"llm_provider", "azure"},
      {"azure", {{"endpoint", "https://titan.openai.azure.com/"}, {"api_key", "k"}, {"deployment", "gpt-4o"}}}
  };

  Config cfg = Config::from_json(j);
  EXPECT_EQ(cfg.providers.provider, titan_core::LlmProvider::Azure);
  EXPECT_EQ(cfg.providers.azure.endpoint, "https://titan.openai.azure.com/");
  EXPECT_EQ(cfg.providers.azure.deployment, "gpt-4o");
  EXPECT_EQ(cfg.providers.azure.api_version, "2024-02-15-preview");
}

TEST(ConfigTest, AzureWithoutEndpointThrows) {
  EXPECT_THROW({ (void)Config::from_json({{"llm_provider", "azure"}}); }, std::runtime_error);
}

TEST(ConfigTest, RetrySectionOverridesDefaults) {
  Config defaults = Config::from_json(nlohmann::json::object());
  EXPECT_EQ(defaults.providers.retry.max_retries, 3);
  ASSERT_EQ(defaults.providers.retry.backoff.size(), 3u);
  EXPECT_EQ(defaults.providers.retry.backoff[2], std::chrono::milliseconds(4000));

  Config cfg = Config::from_json({{"retry", {{"max_retries", 1}, {"backoff_ms", nlohmann::json::array({250})}}}});
  EXPECT_EQ(cfg.providers.retry.max_retries, 1);
  ASSERT_EQ(cfg.providers.retry.backoff.size(), 1u);
  EXPECT_EQ(cfg.providers.retry.backoff[0], std::chrono::milliseconds(250));

  EXPECT_THROW({ (void)Config::from_json({{"retry", {{"max_retries", -1}}}}); }, std::runtime_error);
}
