#include "titan_core/llm/azure_client.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

namespace titan_core {

AzureClient::AzureClient(const AzureSettings &settings,
                         RetryPolicy retry_policy,
                         std::shared_ptr<HttpTransport> transport)
    : settings_(settings), retry_policy_(std::move(retry_policy)), transport_(std::move(transport)) {
  if (!transport_) {
    throw std::invalid_argument("AzureClient requires an HTTP transport");
  }
  while (!settings_.endpoint.empty() && settings_.endpoint.back() == '/') {
    settings_.endpoint.pop_back();
  }
}

std::string AzureClient::chat_url() const {
  return settings_.endpoint + "/openai/deployments/" + settings_.deployment +
         "/chat/completions?api-version=" + settings_.api_version;
}

nlohmann::json AzureClient::build_payload(const CompletionRequest &request) {
  nlohmann::json messages = nlohmann::json::array();
  if (!request.system_prompt.empty()) {
    messages.push_back({{"role", "system"}, {"content", request.system_prompt}});
  }
  messages.push_back({{"role", "user"}, {"content", request.user_prompt}});

  return {
      {"messages", messages},
      {"temperature", request.temperature},
      {"max_tokens", request.max_tokens},
  };
}

CallResult<std::string> AzureClient::complete(const CompletionRequest &request,
                                              std::chrono::milliseconds timeout,
                                              const async::CancellationToken &cancel) {
  std::vector<std::string> headers = {
      "Content-Type: application/json",
      "api-key: " + settings_.api_key,
  };
  auto response = post_json_with_retry(*transport_, chat_url(), headers, build_payload(request), timeout,
                                       cancel, retry_policy_, "Azure");
  if (!response.ok()) {
    return CallResult<std::string>::failure(response.error().kind, response.error().message);
  }
  return parse_chat_completion(response.value());
}

}  // namespace titan_core
