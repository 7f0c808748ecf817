#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "titan_core/llm/embedding_client.hpp"
#include "titan_core/llm/llm_client.hpp"

namespace titan_core {

// Local development provider. Embeddings and chat both go through ollama-hpp.
class OllamaClient : public EmbeddingClient, public LlmClient {
 public:
  OllamaClient(const std::string &ollama_url,
               const std::string &embedding_model,
               const std::string &chat_model,
               std::size_t embedding_dimension);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  using EmbeddingClient::embed;
  using LlmClient::complete;

  CallResult<std::vector<float>> embed(const std::string &text,
                                       std::chrono::milliseconds timeout,
                                       const async::CancellationToken &cancel) override;

  CallResult<std::string> complete(const CompletionRequest &request,
                                   std::chrono::milliseconds timeout,
                                   const async::CancellationToken &cancel) override;

  virtual bool is_server_available();

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  std::string chat_model_;
  std::size_t embedding_dimension_;

  static int to_read_timeout_seconds(std::chrono::milliseconds timeout);
};

}  // namespace titan_core
