#include "titan_core/llm/answer_parser.hpp"

#include <regex>
#include <vector>

#include "titan_core/text/vietnamese_text.hpp"
#include "titan_core/types/question.hpp"

namespace titan_core {

namespace {

// Patterns run on case-folded text, group 1 is the letter
const std::vector<std::regex> &marker_patterns() {
  static const std::vector<std::regex> patterns = {
      std::regex(R"((?:đáp án|answer|lựa chọn)[^:\n]{0,40}:\s*\**\(?([a-z])(?![a-z0-9]))"),
      std::regex(R"(\*+\(?([a-z])\)\*+)"),
      std::regex(R"(^\s*\**\(?([a-z])[\).:](?![a-z0-9]))"),
      std::regex(R"((?:^|[^a-z0-9])([a-z])\))"),
  };
  return patterns;
}

std::optional<std::size_t> first_in_range(const std::string &folded, const std::regex &pattern,
                                          std::size_t option_count) {
  for (auto it = std::sregex_iterator(folded.begin(), folded.end(), pattern);
       it != std::sregex_iterator(); ++it) {
    const std::string letter = (*it)[1].str();
    if (letter.size() == 1) {
      if (auto index = option_index(letter[0], option_count)) {
        return index;
      }
    }
  }
  return std::nullopt;
}

}  // namespace

std::optional<std::size_t> AnswerParser::parse_index(const std::string &response,
                                                     std::size_t option_count) {
  if (option_count == 0 || response.empty()) {
    return std::nullopt;
  }

  // A reply that is nothing but one letter, in either case ("b", " C ", "d.")
  const auto words = text::split_words(response);
  if (words.size() == 1 && words[0].size() == 1) {
    char letter = words[0][0];
    if (letter >= 'a' && letter <= 'z') {
      letter = static_cast<char>(letter - 'a' + 'A');
    }
    if (letter >= 'A' && letter <= 'Z') {
      return option_index(letter, option_count);
    }
  }

  const std::string folded = text::fold_case(response);
  for (const auto &pattern : marker_patterns()) {
    if (auto index = first_in_range(folded, pattern, option_count)) {
      return index;
    }
  }

  // Standalone capital letter, judged on the original casing so the article-like
  // lower-case "a" in running text is not mistaken for an answer
  for (const auto &word : words) {
    if (word.size() == 1 && word[0] >= 'A' && word[0] <= 'Z') {
      if (auto index = option_index(word[0], option_count)) {
        return index;
      }
    }
  }
  return std::nullopt;
}

std::optional<std::string> AnswerParser::parse_letter(const std::string &response,
                                                      std::size_t option_count) {
  auto index = parse_index(response, option_count);
  if (!index) {
    return std::nullopt;
  }
  return option_letter(*index);
}

}  // namespace titan_core
