#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "titan_core/async/cancellation.hpp"
#include "titan_core/llm/embedding_client.hpp"
#include "titan_core/safety/unsafe_intent_matrix.hpp"
#include "titan_core/types/query.hpp"

namespace titan_core {

struct SafetyConfig {
  float threshold = 0.85f;
  // Literal phrases that make a query unsafe on their own
  std::vector<std::string> unsafe_keywords;
  // Phrases that mark an option as the refusal answer
  std::vector<std::string> refusal_phrases;
  std::chrono::milliseconds embedding_timeout{10000};
  std::chrono::milliseconds llm_timeout{20000};

  static std::vector<std::string> default_unsafe_keywords();
  static std::vector<std::string> default_refusal_phrases();
};

/**
 * @class SafetyGuard
 * @brief Pre-inference firewall: embedding similarity against the unsafe-intent
 * matrix OR a literal keyword hit.
 *
 * The keyword scan always runs, so an embedding outage never lets a query through
 * unchecked. In that case the verdict is marked degraded.
 */
class SafetyGuard {
 public:
  SafetyGuard(std::shared_ptr<const UnsafeIntentMatrix> matrix,
              std::shared_ptr<EmbeddingClient> embedding_client,
              const SafetyConfig &config);

  SafetyVerdict check(const std::string &query_text,
                      async::Clock::time_point deadline,
                      const async::CancellationToken &cancel) const;
  SafetyVerdict check(const std::string &query_text) const;

  // Unsafe iff similarity >= threshold or a keyword matched
  SafetyVerdict decide(float similarity, std::optional<std::string> matched_keyword,
                       bool degraded) const;

  // Maximum cosine similarity of `vector` against every row, clamped to [0, 1]. 0 for an empty matrix.
  static float max_similarity(const UnsafeIntentMatrix &matrix, const std::vector<float> &vector);

  std::optional<std::string> match_keyword(const std::string &query_text) const;

 private:
  std::shared_ptr<const UnsafeIntentMatrix> matrix_;
  std::shared_ptr<EmbeddingClient> embedding_client_;
  SafetyConfig config_;
};

}  // namespace titan_core
