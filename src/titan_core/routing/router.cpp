#include "titan_core/routing/router.hpp"

#include <algorithm>
#include <cctype>

#include "titan_core/errors.hpp"
#include "titan_core/text/vietnamese_text.hpp"

namespace titan_core {

RouterConfig RouterConfig::defaults() {
  RouterConfig config;
  config.reading_patterns = {
      R"(đoạn văn)", R"(bài đọc)", R"(đoạn thông tin)", R"(dựa vào thông tin)",
      R"(context:)", R"(\[1\])",   R"(passage:)",       R"(text:)",
  };
  config.stem_patterns = {
      R"(\\int)",       R"(\\sum)",    R"(\\frac)",   R"(tính)",      R"(giá trị)",  R"(hàm số)",
      R"(phương trình)", R"(tích phân)", R"(đạo hàm)", R"(\blim\b)", R"(\^)",       R"(√)",
  };
  config.domain_markers = {
      {"bộ luật", DocType::Law},        {"luật", DocType::Law},
      {"nghị định", DocType::Law},      {"hiến pháp", DocType::Law},
      {"thông tư", DocType::Law},       {"lịch sử", DocType::History},
      {"triều đại", DocType::History},  {"chiến tranh", DocType::History},
      {"địa lý", DocType::Geography},   {"văn hóa", DocType::Culture},
      {"lễ hội", DocType::Culture},     {"chính trị", DocType::Politics},
      {"quốc hội", DocType::Politics},
  };
  config.max_entities = 5;
  return config;
}

std::vector<Router::CompiledRule> Router::compile(const std::vector<std::string> &patterns) {
  std::vector<CompiledRule> rules;
  rules.reserve(patterns.size());
  for (const auto &pattern : patterns) {
    try {
      rules.push_back(CompiledRule{pattern, std::regex(pattern, std::regex::ECMAScript)});
    } catch (const std::regex_error &e) {
      throw ConfigurationError("Invalid router pattern '" + pattern + "': " + e.what());
    }
  }
  return rules;
}

Router::Router(const RouterConfig &config)
    : reading_rules_(compile(config.reading_patterns)),
      stem_rules_(compile(config.stem_patterns)),
      domain_markers_(config.domain_markers),
      max_entities_(config.max_entities) {}

std::optional<std::string> Router::first_match(const std::vector<CompiledRule> &rules,
                                               const std::string &folded) {
  for (const auto &rule : rules) {
    if (std::regex_search(folded, rule.pattern)) {
      return rule.source;
    }
  }
  return std::nullopt;
}

std::optional<int> Router::extract_year(const std::string &query_text) {
  static const std::regex explicit_year(R"(năm\s+(\d{4})(?![0-9]))");
  static const std::regex any_year(R"((?:^|[^0-9])(\d{4})(?![0-9]))");

  const std::string folded = text::fold_case(query_text);
  for (const auto *pattern : {&explicit_year, &any_year}) {
    for (auto it = std::sregex_iterator(folded.begin(), folded.end(), *pattern);
         it != std::sregex_iterator(); ++it) {
      int year = std::stoi((*it)[1].str());
      if (year >= MIN_QUERY_YEAR && year <= MAX_QUERY_YEAR) {
        return year;
      }
    }
  }
  return std::nullopt;
}

std::vector<std::string> Router::extract_entities(const std::string &query_text) const {
  std::vector<std::string> entities;
  auto add = [&](const std::string &entity) {
    if (entities.size() < max_entities_ &&
        std::find(entities.begin(), entities.end(), entity) == entities.end()) {
      entities.push_back(entity);
    }
  };

  // Capitalised words other than the sentence-initial one
  const auto words = text::split_words(query_text);
  for (std::size_t i = 1; i < words.size(); ++i) {
    const auto &word = words[i];
    bool numeric = std::all_of(word.begin(), word.end(),
                               [](unsigned char c) { return std::isdigit(c); });
    if (!numeric && text::starts_with_uppercase(word)) {
      add(text::fold_case(word));
    }
  }

  const auto tokens = text::tokenize(query_text);
  for (const auto &marker : domain_markers_) {
    if (text::contains_token_sequence(tokens, text::tokenize(marker.phrase))) {
      add(text::fold_case(marker.phrase));
    }
  }
  return entities;
}

std::optional<DocType> Router::category_hint(const std::string &query_text) const {
  const auto tokens = text::tokenize(query_text);
  for (const auto &marker : domain_markers_) {
    if (text::contains_token_sequence(tokens, text::tokenize(marker.phrase))) {
      return marker.doc_type;
    }
  }
  return std::nullopt;
}

RouteDecision Router::route(const std::string &query_text) const {
  RouteDecision decision;
  decision.mode = RouteMode::Rag;

  bool blank = std::all_of(query_text.begin(), query_text.end(),
                           [](unsigned char c) { return std::isspace(c); });
  if (blank) {
    return decision;
  }

  const std::string folded = text::fold_case(query_text);
  if (auto pattern = first_match(reading_rules_, folded)) {
    decision.mode = RouteMode::Reading;
    decision.matched_pattern = pattern;
    return decision;
  }
  if (auto pattern = first_match(stem_rules_, folded)) {
    decision.mode = RouteMode::Stem;
    decision.matched_pattern = pattern;
    return decision;
  }

  decision.extracted_year = extract_year(query_text);
  decision.extracted_entities = extract_entities(query_text);
  decision.category_hint = category_hint(query_text);
  return decision;
}

}  // namespace titan_core
