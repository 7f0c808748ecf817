#include "titan_core/llm/ollama_client.hpp"

#include <cmath>

#include "ollama.hpp"

namespace titan_core {

OllamaClient::OllamaClient(const std::string &ollama_url,
                           const std::string &embedding_model,
                           const std::string &chat_model,
                           std::size_t embedding_dimension)
    : ollama_url_(ollama_url),
      embedding_model_(embedding_model),
      chat_model_(chat_model),
      embedding_dimension_(embedding_dimension) {}

int OllamaClient::to_read_timeout_seconds(std::chrono::milliseconds timeout) {
  // ollama-hpp only takes whole seconds
  auto seconds = (timeout.count() + 999) / 1000;
  return seconds < 1 ? 1 : static_cast<int>(seconds);
}

// The server instance is created per call: ollama-hpp keeps connection state per instance
// and calls arrive from many query threads.
CallResult<std::vector<float>> OllamaClient::embed(const std::string &text,
                                                   std::chrono::milliseconds timeout,
                                                   const async::CancellationToken &cancel) {
  if (cancel.is_cancelled()) {
    return CallResult<std::vector<float>>::failure(DependencyErrorKind::Cancelled,
                                                   "embedding cancelled before dispatch");
  }
  if (timeout.count() <= 0) {
    return CallResult<std::vector<float>>::failure(DependencyErrorKind::Timeout,
                                                   "no time left for embedding call");
  }

  auto started = async::Clock::now();
  try {
    Ollama server(ollama_url_);
    server.setReadTimeout(to_read_timeout_seconds(timeout));
    ollama::response response = server.generate_embeddings(embedding_model_, text);

    // Get the JSON structure
    auto json_response = response.as_json();
    if (!json_response.contains("embeddings")) {
      return CallResult<std::vector<float>>::failure(
          DependencyErrorKind::BadResponse, "Response does not contain embedding field");
    }

    // Handle different embedding response formats
    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array() || embeddings.empty()) {
      return CallResult<std::vector<float>>::failure(DependencyErrorKind::BadResponse,
                                                     "Embeddings field is not an array");
    }
    std::vector<float> vector = embeddings[0].is_array()
                                    ? embeddings[0].get<std::vector<float>>()
                                    : embeddings.get<std::vector<float>>();

    if (vector.size() != embedding_dimension_) {
      return CallResult<std::vector<float>>::failure(
          DependencyErrorKind::BadResponse,
          "Embedding dimension mismatch. Expected " + std::to_string(embedding_dimension_) +
              ", got " + std::to_string(vector.size()));
    }
    return CallResult<std::vector<float>>::success(std::move(vector));
  } catch (const ollama::exception &e) {
    auto kind = (async::Clock::now() - started) >= timeout ? DependencyErrorKind::Timeout
                                                           : DependencyErrorKind::Transport;
    return CallResult<std::vector<float>>::failure(
        kind, "Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    return CallResult<std::vector<float>>::failure(
        DependencyErrorKind::BadResponse, "Embedding payload malformed: " + std::string(e.what()));
  }
}

CallResult<std::string> OllamaClient::complete(const CompletionRequest &request,
                                               std::chrono::milliseconds timeout,
                                               const async::CancellationToken &cancel) {
  if (cancel.is_cancelled()) {
    return CallResult<std::string>::failure(DependencyErrorKind::Cancelled,
                                            "completion cancelled before dispatch");
  }

  auto started = async::Clock::now();
  try {
    Ollama server(ollama_url_);
    server.setReadTimeout(to_read_timeout_seconds(timeout));

    ollama::messages messages;
    if (!request.system_prompt.empty()) {
      messages.push_back(ollama::message("system", request.system_prompt));
    }
    messages.push_back(ollama::message("user", request.user_prompt));

    ollama::options options;
    options["temperature"] = request.temperature;
    options["num_predict"] = request.max_tokens;

    ollama::response response = server.chat(chat_model_, messages, options);
    return CallResult<std::string>::success(response.as_simple_string());
  } catch (const ollama::exception &e) {
    auto kind = (async::Clock::now() - started) >= timeout ? DependencyErrorKind::Timeout
                                                           : DependencyErrorKind::Transport;
    return CallResult<std::string>::failure(kind, "Chat completion failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    return CallResult<std::string>::failure(DependencyErrorKind::BadResponse,
                                            "Chat payload malformed: " + std::string(e.what()));
  }
}

bool OllamaClient::is_server_available() {
  Ollama server(ollama_url_);
  return server.is_running();
}

}  // namespace titan_core
