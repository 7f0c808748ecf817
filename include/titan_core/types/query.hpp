#pragma once

#include <optional>
#include <string>
#include <vector>

#include "titan_core/types/chunk.hpp"

namespace titan_core {

enum class RouteMode { Reading, Stem, Rag };

std::string to_string(RouteMode mode);

struct SafetyVerdict {
  bool is_unsafe = false;
  float similarity = 0.0f;
  std::optional<std::string> matched_keyword;
  // True when the similarity leg could not run and only keywords were checked
  bool degraded = false;
};

struct RouteDecision {
  RouteMode mode = RouteMode::Rag;
  std::optional<std::string> matched_pattern;
  std::optional<int> extracted_year;
  std::vector<std::string> extracted_entities;
  std::optional<DocType> category_hint;
};

}  // namespace titan_core
