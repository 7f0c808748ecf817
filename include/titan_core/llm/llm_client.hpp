#pragma once

#include <chrono>
#include <string>

#include "titan_core/async/cancellation.hpp"
#include "titan_core/llm/call_result.hpp"

namespace titan_core {

struct CompletionRequest {
  std::string system_prompt;
  std::string user_prompt;
  double temperature = 0.3;
  int max_tokens = 256;
};

class LlmClient {
 public:
  virtual ~LlmClient() = default;

  virtual CallResult<std::string> complete(const CompletionRequest &request,
                                           std::chrono::milliseconds timeout,
                                           const async::CancellationToken &cancel) = 0;

  CallResult<std::string> complete(const CompletionRequest &request,
                                   std::chrono::milliseconds timeout) {
    return complete(request, timeout, async::CancellationToken{});
  }
};

}  // namespace titan_core
