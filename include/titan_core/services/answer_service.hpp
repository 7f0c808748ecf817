#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "titan_core/llm/llm_client.hpp"
#include "titan_core/services/query_service.hpp"
#include "titan_core/types/query.hpp"
#include "titan_core/types/question.hpp"

namespace titan_core {

inline constexpr const char *DEFAULT_ANSWER_LETTER = "A";

struct AnswerConfig {
  std::chrono::milliseconds llm_timeout{20000};
};

struct Prediction {
  std::string question_id;
  std::string answer = DEFAULT_ANSWER_LETTER;
  RouteMode mode = RouteMode::Rag;
  bool unsafe = false;
  bool degraded = false;
  std::size_t context_chunks = 0;
};

struct EvaluationReport {
  std::size_t total = 0;
  // Questions that carried a gold answer
  std::size_t graded = 0;
  std::size_t correct = 0;
  std::vector<std::string> incorrect_ids;

  double accuracy() const {
    return graded == 0 ? 0.0 : static_cast<double>(correct) / static_cast<double>(graded);
  }
};

class QuestionFormatError : public std::exception {
 public:
  QuestionFormatError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class AnswerService
 * @brief Produces the final answer letter for a question.
 *
 * Unsafe questions take the refusal option picked by the selector. Everything
 * else goes through a mode-specific prompt and the LLM. Any failure yields "A"
 * with degraded set.
 */
class AnswerService {
 public:
  AnswerService(std::shared_ptr<QueryService> query_service,
                std::shared_ptr<LlmClient> llm_client,
                const AnswerConfig &config);

  Prediction answer(const Question &question, std::optional<int> target_year = std::nullopt) const;

  // Same as answer() but also hands back the retrieval result for callers that report it
  Prediction answer(const Question &question,
                    std::optional<int> target_year,
                    QueryResult &query_result) const;

 private:
  std::shared_ptr<QueryService> query_service_;
  std::shared_ptr<LlmClient> llm_client_;
  AnswerConfig config_;
};

// {"qid", "question", "choices", "answer"?}
Question question_from_json(const nlohmann::json &json);
std::vector<Question> questions_from_json(const nlohmann::json &json);

// [{"qid", "answer"}]
nlohmann::json predictions_to_json(const std::vector<Prediction> &predictions);

EvaluationReport evaluate(const std::vector<Question> &questions,
                          const std::vector<Prediction> &predictions);

}  // namespace titan_core
