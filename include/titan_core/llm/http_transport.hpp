#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "titan_core/async/cancellation.hpp"
#include "titan_core/llm/call_result.hpp"

namespace titan_core {

struct HttpResponse {
  long status = 0;
  std::string body;
};

// Single POST attempt. Connection-level failures come back as Transport, any HTTP
// status (including 4xx/5xx) comes back as a successful HttpResponse.
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  virtual CallResult<HttpResponse> post(const std::string &url,
                                        const std::vector<std::string> &headers,
                                        const std::string &body,
                                        std::chrono::milliseconds timeout,
                                        const async::CancellationToken &cancel) = 0;
};

// libcurl easy handle per call, so one instance can be shared between query threads
class CurlHttpTransport : public HttpTransport {
 public:
  CallResult<HttpResponse> post(const std::string &url,
                                const std::vector<std::string> &headers,
                                const std::string &body,
                                std::chrono::milliseconds timeout,
                                const async::CancellationToken &cancel) override;
};

struct RetryPolicy {
  // Attempts after the first one
  int max_retries = 3;
  // Wait before retry i; the last entry repeats when there are more retries than entries
  std::vector<std::chrono::milliseconds> backoff = {std::chrono::milliseconds(1000),
                                                    std::chrono::milliseconds(2000),
                                                    std::chrono::milliseconds(4000)};

  std::chrono::milliseconds backoff_for(int retry) const;
};

// 429 and 5xx are worth another attempt; other statuses are final
bool is_retryable_status(long status);

/**
 * @brief POSTs a JSON payload, retrying transient failures with backoff.
 *
 * `timeout` bounds the whole exchange: every attempt gets only the time left, and a
 * retry whose backoff would overrun it is not started. A cancelled token stops the
 * loop before the next attempt and interrupts the backoff wait.
 */
CallResult<nlohmann::json> post_json_with_retry(HttpTransport &transport,
                                                const std::string &url,
                                                const std::vector<std::string> &headers,
                                                const nlohmann::json &payload,
                                                std::chrono::milliseconds timeout,
                                                const async::CancellationToken &cancel,
                                                const RetryPolicy &policy,
                                                const std::string &component);

// choices[0].message.content of an OpenAI-style chat completion body
CallResult<std::string> parse_chat_completion(const nlohmann::json &body);

}  // namespace titan_core
