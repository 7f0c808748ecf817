#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "titan_core/llm/azure_client.hpp"
#include "titan_core/llm/embedding_client.hpp"
#include "titan_core/llm/http_transport.hpp"
#include "titan_core/llm/llm_client.hpp"
#include "titan_core/llm/vnpt_client.hpp"

namespace titan_core {

enum class LlmProvider { Ollama, Vnpt, Azure };

std::string to_string(LlmProvider provider);
// Throws std::invalid_argument for unknown names
LlmProvider llm_provider_from_string(const std::string &str);

struct ProviderSettings {
  LlmProvider provider = LlmProvider::Ollama;
  std::size_t embedding_dimension = 1024;
  int max_concurrent_requests = 4;

  // ollama
  std::string ollama_url = "http://localhost:11434";
  std::string embedding_model = "mxbai-embed-large";
  std::string chat_model = "qwen2.5:7b";

  // vnpt
  std::string vnpt_base_url = "https://api.idg.vnpt.vn";
  VnptModelSize vnpt_model_size = VnptModelSize::Small;
  VnptCredentials vnpt_credentials;

  // azure: chat only, embeddings come from ollama
  AzureSettings azure;

  // Applies to the hosted providers (vnpt, azure)
  RetryPolicy retry;
};

struct ProviderClients {
  std::shared_ptr<EmbeddingClient> embedding;
  std::shared_ptr<LlmClient> llm;
};

// Builds the clients for the configured provider once at startup, both wrapped
// in a shared admission gate.
ProviderClients make_provider_clients(const ProviderSettings &settings);

}  // namespace titan_core
