#pragma once

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

#include "titan_core/types/chunk.hpp"
#include "titan_core/types/query.hpp"

namespace titan_core {

struct DomainMarker {
  std::string phrase;
  DocType doc_type;
};

struct RouterConfig {
  // ECMAScript regexes, matched against the case-folded query
  std::vector<std::string> reading_patterns;
  std::vector<std::string> stem_patterns;
  // Checked in order; the first hit supplies the category hint
  std::vector<DomainMarker> domain_markers;
  std::size_t max_entities = 5;

  static RouterConfig defaults();
};

inline constexpr int MIN_QUERY_YEAR = 1900;
inline constexpr int MAX_QUERY_YEAR = 2100;

/**
 * @class Router
 * @brief Rule-based mode classification: READING patterns, then STEM patterns,
 * otherwise RAG.
 *
 * route() is a pure function of the query text and the rule table fixed at
 * construction. For RAG queries it also extracts the target year, salient entities
 * and a category hint for the search engine.
 */
class Router {
 public:
  // Throws ConfigurationError if a pattern does not compile
  explicit Router(const RouterConfig &config);

  RouteDecision route(const std::string &query_text) const;

  // "năm YYYY" first, then any standalone four-digit token, within [1900, 2100]
  static std::optional<int> extract_year(const std::string &query_text);

  std::vector<std::string> extract_entities(const std::string &query_text) const;
  std::optional<DocType> category_hint(const std::string &query_text) const;

 private:
  struct CompiledRule {
    std::string source;
    std::regex pattern;
  };

  std::vector<CompiledRule> reading_rules_;
  std::vector<CompiledRule> stem_rules_;
  std::vector<DomainMarker> domain_markers_;
  std::size_t max_entities_;

  static std::vector<CompiledRule> compile(const std::vector<std::string> &patterns);
  static std::optional<std::string> first_match(const std::vector<CompiledRule> &rules,
                                                const std::string &folded);
};

}  // namespace titan_core
