#include "titan_core/llm/llm_provider.hpp"

#include <iostream>
#include <stdexcept>

#include "titan_core/async/admission_gate.hpp"
#include "titan_core/llm/ollama_client.hpp"

namespace titan_core {

std::string to_string(LlmProvider provider) {
  switch (provider) {
    case LlmProvider::Ollama:
      return "ollama";
    case LlmProvider::Vnpt:
      return "vnpt";
    case LlmProvider::Azure:
      return "azure";
    default:
      return "unknown";
  }
}

LlmProvider llm_provider_from_string(const std::string &str) {
  if (str == "ollama")
    return LlmProvider::Ollama;
  if (str == "vnpt")
    return LlmProvider::Vnpt;
  if (str == "azure")
    return LlmProvider::Azure;
  throw std::invalid_argument("Unknown llm_provider: " + str);
}

ProviderClients make_provider_clients(const ProviderSettings &settings) {
  std::shared_ptr<EmbeddingClient> embedding;
  std::shared_ptr<LlmClient> llm;

  switch (settings.provider) {
    case LlmProvider::Ollama: {
      auto client = std::make_shared<OllamaClient>(settings.ollama_url, settings.embedding_model,
                                                   settings.chat_model,
                                                   settings.embedding_dimension);
      embedding = client;
      llm = client;
      break;
    }
    case LlmProvider::Vnpt: {
      auto client = std::make_shared<VnptClient>(settings.vnpt_base_url, settings.vnpt_model_size,
                                                 settings.vnpt_credentials,
                                                 settings.embedding_dimension, settings.retry);
      embedding = client;
      llm = client;
      break;
    }
    case LlmProvider::Azure: {
      embedding = std::make_shared<OllamaClient>(settings.ollama_url, settings.embedding_model,
                                                 settings.chat_model, settings.embedding_dimension);
      llm = std::make_shared<AzureClient>(settings.azure, settings.retry);
      break;
    }
  }

  auto gate = std::make_shared<async::AdmissionGate>(settings.max_concurrent_requests);
  std::cout << "[Provider] Using " << to_string(settings.provider) << " with "
            << settings.max_concurrent_requests << " concurrent request(s)" << std::endl;

  return ProviderClients{std::make_shared<async::GatedEmbeddingClient>(embedding, gate),
                         std::make_shared<async::GatedLlmClient>(llm, gate)};
}

}  // namespace titan_core
