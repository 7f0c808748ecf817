#include "titan_core/services/answer_service.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

#include "titan_core/llm/answer_parser.hpp"
#include "titan_core/services/prompt_builder.hpp"

namespace titan_core {

AnswerService::AnswerService(std::shared_ptr<QueryService> query_service,
                             std::shared_ptr<LlmClient> llm_client,
                             const AnswerConfig &config)
    : query_service_(std::move(query_service)), llm_client_(std::move(llm_client)), config_(config) {
  if (!query_service_ || !llm_client_) {
    throw std::invalid_argument("AnswerService requires a query service and an LLM client");
  }
}

Prediction AnswerService::answer(const Question &question, std::optional<int> target_year) const {
  QueryResult ignored;
  return answer(question, target_year, ignored);
}

Prediction AnswerService::answer(const Question &question,
                                 std::optional<int> target_year,
                                 QueryResult &query_result) const {
  Prediction prediction;
  prediction.question_id = question.id;

  auto deadline = async::Clock::now() + query_service_->config().query_deadline;
  async::CancellationToken cancel;
  query_result = query_service_->process_query(question, target_year, deadline, cancel);

  prediction.unsafe = query_result.verdict.is_unsafe;
  prediction.mode = query_result.route.mode;
  prediction.context_chunks = query_result.chunks.size();
  prediction.degraded = query_result.is_degraded();

  if (query_result.selected_option) {
    prediction.answer = option_letter(query_result.selected_option->option_index);
    return prediction;
  }

  if (question.options.empty()) {
    std::cerr << "[AnswerService] Warning: question " << question.id
              << " has no options, answering " << DEFAULT_ANSWER_LETTER << std::endl;
    prediction.degraded = true;
    return prediction;
  }

  auto request = PromptBuilder::build(question, query_result.route.mode, query_result.chunks);
  auto timeout = std::min(config_.llm_timeout, async::remaining_until(deadline));
  auto reply = llm_client_->complete(request, timeout, cancel);
  if (!reply.ok()) {
    std::cerr << "[AnswerService] LLM call failed for " << question.id << ": "
              << reply.error().describe() << std::endl;
    prediction.degraded = true;
    return prediction;
  }

  auto letter = AnswerParser::parse_letter(reply.value(), question.options.size());
  if (!letter) {
    std::cerr << "[AnswerService] Could not parse an answer for " << question.id << ", answering "
              << DEFAULT_ANSWER_LETTER << std::endl;
    prediction.degraded = true;
    return prediction;
  }
  prediction.answer = *letter;
  return prediction;
}

Question question_from_json(const nlohmann::json &json) {
  if (!json.is_object()) {
    throw QuestionFormatError("Question entry must be a JSON object");
  }
  if (!json.contains("qid") || !json["qid"].is_string()) {
    throw QuestionFormatError("Question entry is missing a string 'qid'");
  }
  if (!json.contains("question") || !json["question"].is_string()) {
    throw QuestionFormatError("Question " + json["qid"].get<std::string>() +
                              " is missing a string 'question'");
  }

  Question question;
  question.id = json["qid"].get<std::string>();
  question.text = json["question"].get<std::string>();
  if (json.contains("choices")) {
    if (!json["choices"].is_array()) {
      throw QuestionFormatError("Question " + question.id + " has non-array 'choices'");
    }
    for (const auto &choice : json["choices"]) {
      if (!choice.is_string()) {
        throw QuestionFormatError("Question " + question.id + " has a non-string choice");
      }
      question.options.push_back(choice.get<std::string>());
    }
  }
  if (json.contains("answer") && json["answer"].is_string()) {
    question.answer = json["answer"].get<std::string>();
  }
  return question;
}

std::vector<Question> questions_from_json(const nlohmann::json &json) {
  if (!json.is_array()) {
    throw QuestionFormatError("Question file must contain a JSON array");
  }
  std::vector<Question> questions;
  questions.reserve(json.size());
  for (const auto &entry : json) {
    questions.push_back(question_from_json(entry));
  }
  return questions;
}

nlohmann::json predictions_to_json(const std::vector<Prediction> &predictions) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto &prediction : predictions) {
    out.push_back({{"qid", prediction.question_id}, {"answer", prediction.answer}});
  }
  return out;
}

EvaluationReport evaluate(const std::vector<Question> &questions,
                          const std::vector<Prediction> &predictions) {
  std::unordered_map<std::string, std::string> predicted;
  for (const auto &prediction : predictions) {
    predicted[prediction.question_id] = prediction.answer;
  }

  EvaluationReport report;
  report.total = questions.size();
  for (const auto &question : questions) {
    if (!question.answer || question.answer->empty()) {
      continue;
    }
    ++report.graded;
    auto it = predicted.find(question.id);
    if (it != predicted.end() && it->second.size() == 1 &&
        std::toupper(static_cast<unsigned char>(it->second[0])) ==
            std::toupper(static_cast<unsigned char>((*question.answer)[0]))) {
      ++report.correct;
    } else {
      report.incorrect_ids.push_back(question.id);
    }
  }
  return report;
}

}  // namespace titan_core
