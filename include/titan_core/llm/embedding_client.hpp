#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "titan_core/async/cancellation.hpp"
#include "titan_core/llm/call_result.hpp"

namespace titan_core {

class EmbeddingClient {
 public:
  virtual ~EmbeddingClient() = default;

  // Never throws. Timeouts and transport problems come back as a failed CallResult.
  virtual CallResult<std::vector<float>> embed(const std::string &text,
                                               std::chrono::milliseconds timeout,
                                               const async::CancellationToken &cancel) = 0;

  CallResult<std::vector<float>> embed(const std::string &text, std::chrono::milliseconds timeout) {
    return embed(text, timeout, async::CancellationToken{});
  }
};

}  // namespace titan_core
