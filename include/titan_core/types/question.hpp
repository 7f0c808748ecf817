#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace titan_core {

struct Question {
  std::string id;
  std::string text;
  std::vector<std::string> options;
  // Gold answer letter, only present in evaluation sets
  std::optional<std::string> answer;
};

// 0 -> "A", 1 -> "B", ... Options beyond 26 are not addressable by a letter.
std::string option_letter(std::size_t index);

// Inverse of option_letter for the first `option_count` letters (case-insensitive).
std::optional<std::size_t> option_index(char letter, std::size_t option_count);

}  // namespace titan_core
