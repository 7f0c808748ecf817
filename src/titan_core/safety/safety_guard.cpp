#include "titan_core/safety/safety_guard.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include "titan_core/text/vietnamese_text.hpp"

namespace titan_core {

std::vector<std::string> SafetyConfig::default_unsafe_keywords() {
  return {
      "cách chế tạo bom",  "cách chế tạo vũ khí", "cách làm bom",      "cách mua ma túy",
      "cách sản xuất ma túy", "cách làm giả giấy tờ", "cách rửa tiền",   "cách trốn thuế",
      "cách hack",         "cách giết người",     "how to make a bomb", "how to launder money",
  };
}

std::vector<std::string> SafetyConfig::default_refusal_phrases() {
  return {
      "không được phép", "bị nghiêm cấm", "vi phạm pháp luật", "vi phạm", "từ chối",
      "cấm",             "illegal",       "unlawful",          "prohibited",
  };
}

SafetyGuard::SafetyGuard(std::shared_ptr<const UnsafeIntentMatrix> matrix,
                         std::shared_ptr<EmbeddingClient> embedding_client,
                         const SafetyConfig &config)
    : matrix_(std::move(matrix)), embedding_client_(std::move(embedding_client)), config_(config) {
  if (!matrix_) {
    throw std::invalid_argument("SafetyGuard requires an unsafe intent matrix");
  }
  if (!embedding_client_) {
    throw std::invalid_argument("SafetyGuard requires an embedding client");
  }
  if (matrix_->empty()) {
    std::cerr << "[SafetyGuard] Warning: unsafe intent matrix is empty, only keywords will trigger"
              << std::endl;
  }
}

float SafetyGuard::max_similarity(const UnsafeIntentMatrix &matrix, const std::vector<float> &vector) {
  if (matrix.empty() || vector.size() != matrix.dimension()) {
    return 0.0f;
  }

  double norm = 0.0;
  for (float v : vector) {
    norm += static_cast<double>(v) * v;
  }
  norm = std::sqrt(norm);
  if (norm == 0.0) {
    return 0.0f;
  }

  double best = 0.0;
  for (std::size_t r = 0; r < matrix.row_count(); ++r) {
    const float *row = matrix.row(r);
    double dot = 0.0;
    for (std::size_t i = 0; i < matrix.dimension(); ++i) {
      dot += static_cast<double>(row[i]) * vector[i];
    }
    best = std::max(best, dot / norm);
  }
  return static_cast<float>(std::clamp(best, 0.0, 1.0));
}

std::optional<std::string> SafetyGuard::match_keyword(const std::string &query_text) const {
  const auto tokens = text::tokenize(query_text);
  for (const auto &keyword : config_.unsafe_keywords) {
    if (text::contains_token_sequence(tokens, text::tokenize(keyword))) {
      return keyword;
    }
  }
  return std::nullopt;
}

SafetyVerdict SafetyGuard::decide(float similarity, std::optional<std::string> matched_keyword,
                                  bool degraded) const {
  SafetyVerdict verdict;
  verdict.similarity = similarity;
  verdict.matched_keyword = std::move(matched_keyword);
  verdict.degraded = degraded;
  verdict.is_unsafe = similarity >= config_.threshold || verdict.matched_keyword.has_value();
  return verdict;
}

SafetyVerdict SafetyGuard::check(const std::string &query_text) const {
  async::CancellationToken cancel;
  return check(query_text, async::Clock::now() + config_.embedding_timeout, cancel);
}

SafetyVerdict SafetyGuard::check(const std::string &query_text,
                                 async::Clock::time_point deadline,
                                 const async::CancellationToken &cancel) const {
  auto keyword = match_keyword(query_text);

  if (matrix_->empty()) {
    return decide(0.0f, std::move(keyword), false);
  }

  auto timeout = std::min(config_.embedding_timeout, async::remaining_until(deadline));
  auto embedding = embedding_client_->embed(query_text, timeout, cancel);

  std::optional<std::string> failure;
  if (!embedding.ok()) {
    failure = embedding.error().describe();
  } else if (embedding.value().size() != matrix_->dimension()) {
    failure = "embedding has dimension " + std::to_string(embedding.value().size()) + ", expected " +
              std::to_string(matrix_->dimension());
  } else if (std::any_of(embedding.value().begin(), embedding.value().end(),
                         [](float v) { return !std::isfinite(v); })) {
    failure = "embedding contains non-finite values";
  }

  if (failure) {
    std::cerr << "[SafetyGuard] Similarity check unavailable, keyword-only verdict: " << *failure
              << std::endl;
    return decide(0.0f, std::move(keyword), true);
  }

  return decide(max_similarity(*matrix_, embedding.value()), std::move(keyword), false);
}

}  // namespace titan_core
