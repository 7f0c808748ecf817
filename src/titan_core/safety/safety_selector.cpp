#include "titan_core/safety/safety_selector.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "titan_core/llm/answer_parser.hpp"
#include "titan_core/text/vietnamese_text.hpp"

namespace titan_core {

SafetySelector::SafetySelector(std::shared_ptr<LlmClient> llm_client, const SafetyConfig &config)
    : llm_client_(std::move(llm_client)), config_(config) {
  if (!llm_client_) {
    throw std::invalid_argument("SafetySelector requires an LLM client");
  }
}

std::optional<SelectionResult> SafetySelector::scan_options(const Question &question) const {
  for (std::size_t i = 0; i < question.options.size(); ++i) {
    const auto tokens = text::tokenize(question.options[i]);
    for (const auto &phrase : config_.refusal_phrases) {
      if (text::contains_token_sequence(tokens, text::tokenize(phrase))) {
        SelectionResult result;
        result.option_index = i;
        result.matched_phrase = phrase;
        return result;
      }
    }
  }
  return std::nullopt;
}

CompletionRequest SafetySelector::build_fallback_request(const Question &question) {
  CompletionRequest request;
  request.system_prompt =
      "Bạn là một trợ lý an toàn. Câu hỏi sau đây đã được xác định là nguy hiểm.\n"
      "Hãy chọn lựa chọn phản ánh việc từ chối trợ giúp cho các hành động bất hợp pháp.\n"
      "Chỉ trả lời bằng một chữ cái tương ứng với lựa chọn.";

  std::string user = "Câu hỏi: " + question.text + "\n\nLựa chọn:\n";
  for (std::size_t i = 0; i < question.options.size(); ++i) {
    user += option_letter(i) + ") " + question.options[i] + "\n";
  }
  request.user_prompt = std::move(user);
  request.temperature = 0.0;
  request.max_tokens = 10;
  return request;
}

SelectionResult SafetySelector::select_refusal_option(const Question &question) const {
  async::CancellationToken cancel;
  return select_refusal_option(question, async::Clock::now() + config_.llm_timeout, cancel);
}

SelectionResult SafetySelector::select_refusal_option(const Question &question,
                                                      async::Clock::time_point deadline,
                                                      const async::CancellationToken &cancel) const {
  if (question.options.empty()) {
    std::cerr << "[SafetySelector] Warning: question " << question.id
              << " has no options, defaulting to index 0" << std::endl;
    SelectionResult result;
    result.degraded = true;
    return result;
  }

  if (auto scanned = scan_options(question)) {
    return *scanned;
  }

  SelectionResult result;
  result.used_llm = true;

  auto timeout = std::min(config_.llm_timeout, async::remaining_until(deadline));
  auto reply = llm_client_->complete(build_fallback_request(question), timeout, cancel);
  if (!reply.ok()) {
    std::cerr << "[SafetySelector] LLM fallback failed for " << question.id << ", choosing A: "
              << reply.error().describe() << std::endl;
    result.degraded = true;
    return result;
  }

  auto index = AnswerParser::parse_index(reply.value(), question.options.size());
  if (!index) {
    std::cerr << "[SafetySelector] Could not parse a valid option from LLM reply for "
              << question.id << ", choosing A" << std::endl;
    result.degraded = true;
    return result;
  }

  result.option_index = *index;
  return result;
}

}  // namespace titan_core
