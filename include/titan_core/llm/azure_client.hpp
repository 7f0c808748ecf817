#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "titan_core/llm/http_transport.hpp"
#include "titan_core/llm/llm_client.hpp"

namespace titan_core {

struct AzureSettings {
  std::string endpoint;
  std::string api_key;
  std::string api_version = "2024-02-15-preview";
  std::string deployment = "gpt-4.1";
};

// Azure OpenAI chat deployment. Chat only; embeddings stay on the local provider.
class AzureClient : public LlmClient {
 public:
  explicit AzureClient(const AzureSettings &settings,
                       RetryPolicy retry_policy = RetryPolicy{},
                       std::shared_ptr<HttpTransport> transport = std::make_shared<CurlHttpTransport>());

  AzureClient(const AzureClient &) = delete;
  AzureClient &operator=(const AzureClient &) = delete;

  using LlmClient::complete;

  CallResult<std::string> complete(const CompletionRequest &request,
                                   std::chrono::milliseconds timeout,
                                   const async::CancellationToken &cancel) override;

  // {endpoint}/openai/deployments/{deployment}/chat/completions?api-version={version}
  std::string chat_url() const;

  static nlohmann::json build_payload(const CompletionRequest &request);

 private:
  AzureSettings settings_;
  RetryPolicy retry_policy_;
  std::shared_ptr<HttpTransport> transport_;
};

}  // namespace titan_core
