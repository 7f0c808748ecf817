#pragma once

#include <gmock/gmock.h>

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include "titan_core/async/cancellation.hpp"
#include "titan_core/llm/embedding_client.hpp"
#include "titan_core/llm/http_transport.hpp"
#include "titan_core/llm/llm_client.hpp"
#include "titan_core/store/knowledge_store.hpp"

namespace titan_tests {

/**
 * Mock embedding provider. By default every text embeds to the first unit axis.
 */
class MockEmbeddingClient : public titan_core::EmbeddingClient {
 public:
  explicit MockEmbeddingClient(std::size_t dimension = 4) {
    std::vector<float> default_embedding(dimension, 0.0f);
    default_embedding[0] = 1.0f;
    ON_CALL(*this, embed(testing::_, testing::_, testing::_))
        .WillByDefault(testing::Return(
            titan_core::CallResult<std::vector<float>>::success(default_embedding)));
  }

  using titan_core::EmbeddingClient::embed;

  MOCK_METHOD(titan_core::CallResult<std::vector<float>>, embed,
              (const std::string& text, std::chrono::milliseconds timeout,
               const titan_core::async::CancellationToken& cancel),
              (override));
};

/**
 * Mock chat provider. By default it answers "Đáp án: A".
 */
class MockLlmClient : public titan_core::LlmClient {
 public:
  MockLlmClient() {
    ON_CALL(*this, complete(testing::_, testing::_, testing::_))
        .WillByDefault(testing::Return(titan_core::CallResult<std::string>::success("Đáp án: A")));
  }

  using titan_core::LlmClient::complete;

  MOCK_METHOD(titan_core::CallResult<std::string>, complete,
              (const titan_core::CompletionRequest& request, std::chrono::milliseconds timeout,
               const titan_core::async::CancellationToken& cancel),
              (override));
};

/**
 * Mock HTTP transport for the hosted providers' retry and request shape
 */
class MockHttpTransport : public titan_core::HttpTransport {
 public:
  MOCK_METHOD(titan_core::CallResult<titan_core::HttpResponse>, post,
              (const std::string& url, const std::vector<std::string>& headers, const std::string& body,
               std::chrono::milliseconds timeout, const titan_core::async::CancellationToken& cancel),
              (override));
};

/**
 * Mock knowledge store for exercising the search engine's control flow
 */
class MockKnowledgeStore : public titan_core::KnowledgeStore {
 public:
  MOCK_METHOD(std::size_t, size, (), (const, override));
  MOCK_METHOD(std::size_t, dimension, (), (const, override));
  MOCK_METHOD(std::vector<titan_core::LegHit>, lexical_search,
              (const std::string& query_text, const titan_core::CandidateFilter& filter,
               std::size_t limit, const titan_core::async::CancellationToken& cancel),
              (const, override));
  MOCK_METHOD(std::vector<titan_core::LegHit>, vector_search,
              (const std::vector<float>& query_vector, const titan_core::CandidateFilter& filter,
               std::size_t limit),
              (const, override));
  MOCK_METHOD(const titan_core::Chunk&, get_chunk, (std::size_t ordinal), (const, override));
  MOCK_METHOD(const titan_core::Chunk*, find_chunk, (const std::string& chunk_id), (const, override));
};

namespace MockUtilities {

inline titan_core::CallResult<titan_core::HttpResponse> http_reply(long status, std::string body) {
  return titan_core::CallResult<titan_core::HttpResponse>::success(
      titan_core::HttpResponse{status, std::move(body)});
}

inline titan_core::CallResult<titan_core::HttpResponse> http_connect_failure() {
  return titan_core::CallResult<titan_core::HttpResponse>::failure(
      titan_core::DependencyErrorKind::Transport, "CURL request failed: Couldn't connect to server");
}

inline titan_core::CallResult<std::vector<float>> embedding_ok(std::vector<float> vector) {
  return titan_core::CallResult<std::vector<float>>::success(std::move(vector));
}

inline titan_core::CallResult<std::vector<float>> embedding_timeout() {
  return titan_core::CallResult<std::vector<float>>::failure(
      titan_core::DependencyErrorKind::Timeout, "simulated timeout");
}

inline titan_core::CallResult<std::string> reply_ok(const std::string& text) {
  return titan_core::CallResult<std::string>::success(text);
}

inline titan_core::CallResult<std::string> reply_failure() {
  return titan_core::CallResult<std::string>::failure(titan_core::DependencyErrorKind::Transport,
                                                      "simulated connection refused");
}

}  // namespace MockUtilities

}  // namespace titan_tests
