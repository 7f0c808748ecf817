#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "titan_core/async/cancellation.hpp"
#include "titan_core/llm/llm_client.hpp"
#include "titan_core/safety/safety_guard.hpp"
#include "titan_core/types/question.hpp"

namespace titan_core {

struct SelectionResult {
  std::size_t option_index = 0;
  // Refusal phrase that picked the option, when the keyword scan decided
  std::optional<std::string> matched_phrase;
  bool used_llm = false;
  // Fell back to option 0 after an LLM failure, unparsable reply or malformed question
  bool degraded = false;
};

/**
 * @class SafetySelector
 * @brief Picks the refusal option for a question the guard flagged as unsafe.
 *
 * Never throws: every failure resolves to option 0 with degraded set.
 */
class SafetySelector {
 public:
  SafetySelector(std::shared_ptr<LlmClient> llm_client, const SafetyConfig &config);

  SelectionResult select_refusal_option(const Question &question,
                                        async::Clock::time_point deadline,
                                        const async::CancellationToken &cancel) const;
  SelectionResult select_refusal_option(const Question &question) const;

  // First option (in option order) containing a refusal phrase
  std::optional<SelectionResult> scan_options(const Question &question) const;

  static CompletionRequest build_fallback_request(const Question &question);

 private:
  std::shared_ptr<LlmClient> llm_client_;
  SafetyConfig config_;
};

}  // namespace titan_core
