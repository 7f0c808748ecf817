#include "titan_core/types.hpp"

#include <cctype>

namespace titan_core {

std::string to_string(DocType type) {
  switch (type) {
    case DocType::Law:
      return "LAW";
    case DocType::History:
      return "HISTORY";
    case DocType::Geography:
      return "GEOGRAPHY";
    case DocType::Culture:
      return "CULTURE";
    case DocType::Politics:
      return "POLITICS";
    case DocType::Math:
      return "MATH";
    default:
      return "GENERAL";
  }
}

DocType doc_type_from_string(const std::string &str) {
  if (str == "LAW")
    return DocType::Law;
  if (str == "HISTORY")
    return DocType::History;
  if (str == "GEOGRAPHY")
    return DocType::Geography;
  if (str == "CULTURE")
    return DocType::Culture;
  if (str == "POLITICS")
    return DocType::Politics;
  if (str == "MATH")
    return DocType::Math;
  return DocType::General;
}

std::string to_string(RetrievalSource source) {
  switch (source) {
    case RetrievalSource::Lexical:
      return "LEXICAL";
    case RetrievalSource::Semantic:
      return "SEMANTIC";
    default:
      return "FUSED";
  }
}

std::string to_string(RouteMode mode) {
  switch (mode) {
    case RouteMode::Reading:
      return "READING";
    case RouteMode::Stem:
      return "STEM";
    default:
      return "RAG";
  }
}

std::string option_letter(std::size_t index) {
  if (index >= 26) {
    return "?";
  }
  return std::string(1, static_cast<char>('A' + index));
}

std::optional<std::size_t> option_index(char letter, std::size_t option_count) {
  char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(letter)));
  if (upper < 'A' || upper > 'Z') {
    return std::nullopt;
  }
  std::size_t index = static_cast<std::size_t>(upper - 'A');
  if (index >= option_count) {
    return std::nullopt;
  }
  return index;
}

}  // namespace titan_core
