#include "titan_core/llm/vnpt_client.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace titan_core {

namespace {

std::string authorization_header(const std::string &authorization) {
  if (authorization.rfind("Bearer ", 0) == 0) {
    return "Authorization: " + authorization;
  }
  return "Authorization: Bearer " + authorization;
}

}  // namespace

std::string to_string(VnptModelSize size) {
  return size == VnptModelSize::Large ? "large" : "small";
}

VnptModelSize vnpt_model_size_from_string(const std::string &str) {
  if (str == "small")
    return VnptModelSize::Small;
  if (str == "large")
    return VnptModelSize::Large;
  throw std::invalid_argument("Unknown VNPT model size: " + str);
}

VnptClient::VnptClient(const std::string &base_url,
                       VnptModelSize model_size,
                       const VnptCredentials &credentials,
                       std::size_t embedding_dimension,
                       RetryPolicy retry_policy,
                       std::shared_ptr<HttpTransport> transport)
    : base_url_(base_url),
      model_size_(model_size),
      credentials_(credentials),
      embedding_dimension_(embedding_dimension),
      retry_policy_(std::move(retry_policy)),
      transport_(std::move(transport)) {
  if (!transport_) {
    throw std::invalid_argument("VnptClient requires an HTTP transport");
  }
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string VnptClient::chat_model_path_name() const {
  return "vnptai-hackathon-" + to_string(model_size_);
}

CallResult<nlohmann::json> VnptClient::post_json(const std::string &path,
                                                 const VnptCredential &credential,
                                                 const nlohmann::json &payload,
                                                 std::chrono::milliseconds timeout,
                                                 const async::CancellationToken &cancel) {
  std::vector<std::string> headers = {
      "Content-Type: application/json",
      authorization_header(credential.authorization),
      "Token-id: " + credential.token_id,
      "Token-key: " + credential.token_key,
  };
  return post_json_with_retry(*transport_, base_url_ + path, headers, payload, timeout, cancel,
                              retry_policy_, "VNPT");
}

CallResult<std::vector<float>> VnptClient::parse_embedding_response(const nlohmann::json &body,
                                                                    std::size_t expected_dimension) {
  if (!body.contains("data") || !body["data"].is_array() || body["data"].empty() ||
      !body["data"][0].contains("embedding") || !body["data"][0]["embedding"].is_array()) {
    return CallResult<std::vector<float>>::failure(DependencyErrorKind::BadResponse,
                                                   "Response does not contain data[0].embedding");
  }

  std::vector<float> vector;
  vector.reserve(body["data"][0]["embedding"].size());
  for (const auto &value : body["data"][0]["embedding"]) {
    if (!value.is_number()) {
      return CallResult<std::vector<float>>::failure(DependencyErrorKind::BadResponse,
                                                     "Embedding contains a non-numeric value");
    }
    float component = value.get<float>();
    if (!std::isfinite(component)) {
      return CallResult<std::vector<float>>::failure(DependencyErrorKind::BadResponse,
                                                     "Embedding contains a non-finite value");
    }
    vector.push_back(component);
  }

  if (vector.size() != expected_dimension) {
    return CallResult<std::vector<float>>::failure(
        DependencyErrorKind::BadResponse,
        "Embedding dimension mismatch. Expected " + std::to_string(expected_dimension) + ", got " +
            std::to_string(vector.size()));
  }
  return CallResult<std::vector<float>>::success(std::move(vector));
}

CallResult<std::string> VnptClient::parse_chat_response(const nlohmann::json &body) {
  return parse_chat_completion(body);
}

CallResult<std::vector<float>> VnptClient::embed(const std::string &text,
                                                 std::chrono::milliseconds timeout,
                                                 const async::CancellationToken &cancel) {
  nlohmann::json payload = {
      {"model", EMBEDDING_MODEL},
      {"input", text},
      {"encoding_format", "float"},
  };

  auto response = post_json(EMBEDDING_PATH, credentials_.embedding, payload, timeout, cancel);
  if (!response.ok()) {
    return CallResult<std::vector<float>>::failure(response.error().kind, response.error().message);
  }
  return parse_embedding_response(response.value(), embedding_dimension_);
}

CallResult<std::string> VnptClient::complete(const CompletionRequest &request,
                                             std::chrono::milliseconds timeout,
                                             const async::CancellationToken &cancel) {
  nlohmann::json messages = nlohmann::json::array();
  if (!request.system_prompt.empty()) {
    messages.push_back({{"role", "system"}, {"content", request.system_prompt}});
  }
  messages.push_back({{"role", "user"}, {"content", request.user_prompt}});

  std::string model_path = chat_model_path_name();
  std::string model_name = model_path;
  for (auto &c : model_name) {
    if (c == '-')
      c = '_';
  }

  nlohmann::json payload = {
      {"model", model_name},
      {"messages", messages},
      {"temperature", request.temperature},
      {"top_p", 1.0},
      {"n", 1},
      {"max_completion_tokens", request.max_tokens},
  };

  const VnptCredential &credential =
      model_size_ == VnptModelSize::Large ? credentials_.large : credentials_.small;
  auto response = post_json(CHAT_PATH_PREFIX + model_path, credential, payload, timeout, cancel);
  if (!response.ok()) {
    return CallResult<std::string>::failure(response.error().kind, response.error().message);
  }
  return parse_chat_response(response.value());
}

}  // namespace titan_core
