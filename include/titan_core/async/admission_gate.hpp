#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "titan_core/llm/embedding_client.hpp"
#include "titan_core/llm/llm_client.hpp"

namespace titan_core::async {

/**
 * @class AdmissionGate
 * @brief Counting semaphore bounding in-flight calls to the external API.
 *
 * Waiting for a permit counts against the caller's timeout, so a saturated gate
 * surfaces as a Timeout failure rather than an unbounded stall.
 */
class AdmissionGate {
 public:
  explicit AdmissionGate(int max_concurrent);

  AdmissionGate(const AdmissionGate &) = delete;
  AdmissionGate &operator=(const AdmissionGate &) = delete;

  // False when no permit became free within `timeout` or the token was cancelled
  bool acquire(std::chrono::milliseconds timeout, const CancellationToken &cancel);
  void release();

  int in_flight() const;
  int capacity() const { return capacity_; }

 private:
  const int capacity_;
  int in_flight_ = 0;
  mutable std::mutex mtx_;
  std::condition_variable cv_;
};

// Holds one permit for its lifetime
class AdmissionPermit {
 public:
  AdmissionPermit(AdmissionGate &gate, std::chrono::milliseconds timeout,
                  const CancellationToken &cancel)
      : gate_(gate), held_(gate.acquire(timeout, cancel)) {}
  ~AdmissionPermit() {
    if (held_) {
      gate_.release();
    }
  }

  AdmissionPermit(const AdmissionPermit &) = delete;
  AdmissionPermit &operator=(const AdmissionPermit &) = delete;

  bool held() const { return held_; }

 private:
  AdmissionGate &gate_;
  bool held_;
};

// EmbeddingClient decorator that takes a permit before delegating
class GatedEmbeddingClient : public EmbeddingClient {
 public:
  GatedEmbeddingClient(std::shared_ptr<EmbeddingClient> inner, std::shared_ptr<AdmissionGate> gate);

  using EmbeddingClient::embed;
  CallResult<std::vector<float>> embed(const std::string &text,
                                       std::chrono::milliseconds timeout,
                                       const CancellationToken &cancel) override;

 private:
  std::shared_ptr<EmbeddingClient> inner_;
  std::shared_ptr<AdmissionGate> gate_;
};

// LlmClient decorator that takes a permit before delegating
class GatedLlmClient : public LlmClient {
 public:
  GatedLlmClient(std::shared_ptr<LlmClient> inner, std::shared_ptr<AdmissionGate> gate);

  using LlmClient::complete;
  CallResult<std::string> complete(const CompletionRequest &request,
                                   std::chrono::milliseconds timeout,
                                   const CancellationToken &cancel) override;

 private:
  std::shared_ptr<LlmClient> inner_;
  std::shared_ptr<AdmissionGate> gate_;
};

}  // namespace titan_core::async
