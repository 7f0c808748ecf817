#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace titan_core {

// Extracts the chosen option from free-form model output
class AnswerParser {
 public:
  /**
   * Returns the zero-based option index or nullopt.
   *
   * A reply consisting of a single letter is accepted in either case. Otherwise
   * tried in order: an explicit marker ("Đáp án: X", "Answer: X", "Lựa chọn: X"),
   * a bold "**X)**", a leading "X)" and then the first standalone capital letter.
   * Letters outside the first `option_count` are skipped.
   */
  static std::optional<std::size_t> parse_index(const std::string &response, std::size_t option_count);

  // Same as parse_index but returns the letter
  static std::optional<std::string> parse_letter(const std::string &response, std::size_t option_count);
};

}  // namespace titan_core
