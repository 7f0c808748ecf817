#include "titan_core/async/admission_gate.hpp"

#include <algorithm>
#include <stdexcept>

namespace titan_core::async {

namespace {
// Cancellation is polled while waiting for a permit
constexpr std::chrono::milliseconds CANCEL_POLL_INTERVAL(20);
}  // namespace

AdmissionGate::AdmissionGate(int max_concurrent) : capacity_(max_concurrent) {
  if (max_concurrent <= 0) {
    throw std::invalid_argument("max_concurrent_requests must be greater than 0");
  }
}

bool AdmissionGate::acquire(std::chrono::milliseconds timeout, const CancellationToken &cancel) {
  auto deadline = Clock::now() + timeout;
  std::unique_lock<std::mutex> lock(mtx_);
  while (in_flight_ >= capacity_) {
    if (cancel.is_cancelled() || Clock::now() >= deadline) {
      return false;
    }
    auto wake = std::min(deadline, Clock::now() + CANCEL_POLL_INTERVAL);
    cv_.wait_until(lock, wake);
  }
  if (cancel.is_cancelled()) {
    return false;
  }
  ++in_flight_;
  return true;
}

void AdmissionGate::release() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    --in_flight_;
  }
  cv_.notify_one();
}

int AdmissionGate::in_flight() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return in_flight_;
}

GatedEmbeddingClient::GatedEmbeddingClient(std::shared_ptr<EmbeddingClient> inner,
                                           std::shared_ptr<AdmissionGate> gate)
    : inner_(std::move(inner)), gate_(std::move(gate)) {}

CallResult<std::vector<float>> GatedEmbeddingClient::embed(const std::string &text,
                                                           std::chrono::milliseconds timeout,
                                                           const CancellationToken &cancel) {
  auto started = Clock::now();
  AdmissionPermit permit(*gate_, timeout, cancel);
  if (!permit.held()) {
    return CallResult<std::vector<float>>::failure(
        cancel.is_cancelled() ? DependencyErrorKind::Cancelled : DependencyErrorKind::Timeout,
        "no admission permit for embedding call");
  }
  auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
  return inner_->embed(text, timeout - waited, cancel);
}

GatedLlmClient::GatedLlmClient(std::shared_ptr<LlmClient> inner, std::shared_ptr<AdmissionGate> gate)
    : inner_(std::move(inner)), gate_(std::move(gate)) {}

CallResult<std::string> GatedLlmClient::complete(const CompletionRequest &request,
                                                 std::chrono::milliseconds timeout,
                                                 const CancellationToken &cancel) {
  auto started = Clock::now();
  AdmissionPermit permit(*gate_, timeout, cancel);
  if (!permit.held()) {
    return CallResult<std::string>::failure(
        cancel.is_cancelled() ? DependencyErrorKind::Cancelled : DependencyErrorKind::Timeout,
        "no admission permit for completion call");
  }
  auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
  return inner_->complete(request, timeout - waited, cancel);
}

}  // namespace titan_core::async
