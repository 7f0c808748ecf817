#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "titan_core/llm/embedding_client.hpp"
#include "titan_core/llm/http_transport.hpp"
#include "titan_core/llm/llm_client.hpp"

namespace titan_core {

struct VnptCredential {
  std::string authorization;
  std::string token_id;
  std::string token_key;
};

// Each VNPT endpoint is billed against its own key set
struct VnptCredentials {
  VnptCredential embedding;
  VnptCredential small;
  VnptCredential large;
};

enum class VnptModelSize { Small, Large };

std::string to_string(VnptModelSize size);
VnptModelSize vnpt_model_size_from_string(const std::string &str);

/**
 * @class VnptClient
 * @brief Hosted provider used for the competition runs.
 *
 * Talks to the VNPT AI data-service over HTTPS. Transient failures (connection errors,
 * 429, 5xx) are retried with backoff inside the caller's timeout. Both the timeout and
 * the cancellation token abort the transfer in flight.
 */
class VnptClient : public EmbeddingClient, public LlmClient {
 public:
  static constexpr const char *EMBEDDING_MODEL = "vnptai_hackathon_embedding";
  static constexpr const char *EMBEDDING_PATH = "/data-service/vnptai-hackathon-embedding";
  static constexpr const char *CHAT_PATH_PREFIX = "/data-service/v1/chat/completions/";

  VnptClient(const std::string &base_url,
             VnptModelSize model_size,
             const VnptCredentials &credentials,
             std::size_t embedding_dimension,
             RetryPolicy retry_policy = RetryPolicy{},
             std::shared_ptr<HttpTransport> transport = std::make_shared<CurlHttpTransport>());

  VnptClient(const VnptClient &) = delete;
  VnptClient &operator=(const VnptClient &) = delete;

  using EmbeddingClient::embed;
  using LlmClient::complete;

  CallResult<std::vector<float>> embed(const std::string &text,
                                       std::chrono::milliseconds timeout,
                                       const async::CancellationToken &cancel) override;

  CallResult<std::string> complete(const CompletionRequest &request,
                                   std::chrono::milliseconds timeout,
                                   const async::CancellationToken &cancel) override;

  // "vnptai-hackathon-small" or "vnptai-hackathon-large"; the request body uses underscores
  std::string chat_model_path_name() const;

  // Response parsing is separated from the transport so it can be tested offline
  static CallResult<std::vector<float>> parse_embedding_response(const nlohmann::json &body,
                                                                 std::size_t expected_dimension);
  static CallResult<std::string> parse_chat_response(const nlohmann::json &body);

 private:
  std::string base_url_;
  VnptModelSize model_size_;
  VnptCredentials credentials_;
  std::size_t embedding_dimension_;
  RetryPolicy retry_policy_;
  std::shared_ptr<HttpTransport> transport_;

  CallResult<nlohmann::json> post_json(const std::string &path,
                                       const VnptCredential &credential,
                                       const nlohmann::json &payload,
                                       std::chrono::milliseconds timeout,
                                       const async::CancellationToken &cancel);
};

}  // namespace titan_core
