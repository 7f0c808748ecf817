#pragma once

#include <atomic>
#include <chrono>
#include <memory>

namespace titan_core::async {

/**
 * @class CancellationToken
 * @brief Shared, copyable cancellation flag for one query.
 *
 * Copies observe the same flag, so a token handed to a retrieval leg sees a
 * cancel() issued by the orchestrator after the leg was launched.
 */
class CancellationToken {
 public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const {
    flag_->store(true, std::memory_order_release);
  }

  bool is_cancelled() const {
    return flag_->load(std::memory_order_acquire);
  }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

using Clock = std::chrono::steady_clock;

// Time left until `deadline`, never negative
inline std::chrono::milliseconds remaining_until(Clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
  return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

}  // namespace titan_core::async
