#pragma once

#include <string>
#include <vector>

#include "titan_core/llm/llm_client.hpp"
#include "titan_core/types/chunk.hpp"
#include "titan_core/types/query.hpp"
#include "titan_core/types/question.hpp"

namespace titan_core {

// Mode-specific answer prompts. Options are listed as "A) ...", "B) ...".
class PromptBuilder {
 public:
  static CompletionRequest build(const Question &question,
                                 RouteMode mode,
                                 const std::vector<ScoredChunk> &context);

  static CompletionRequest build_reading(const Question &question);
  static CompletionRequest build_stem(const Question &question);
  // Numbered context block; falls back to the no-context prompt when `context` is empty
  static CompletionRequest build_rag(const Question &question, const std::vector<ScoredChunk> &context);
  static CompletionRequest build_rag_without_context(const Question &question);

  static std::string format_options(const std::vector<std::string> &options);
  static std::string format_context(const std::vector<ScoredChunk> &context);

  // "A, B, C hoặc D" for four options
  static std::string letter_range(std::size_t option_count);
};

}  // namespace titan_core
