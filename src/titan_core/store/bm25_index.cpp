#include "titan_core/store/bm25_index.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_set>

#include "titan_core/text/vietnamese_text.hpp"

namespace titan_core {

namespace {
// Cancellation is checked once per this many postings
constexpr std::size_t CANCEL_CHECK_STRIDE = 512;
}  // namespace

Bm25Index::Bm25Index(Bm25Params params) : params_(params) {}

void Bm25Index::add_document(std::size_t ordinal, const std::string &text) {
  if (ordinal != doc_lengths_.size()) {
    throw std::invalid_argument("Bm25Index: expected ordinal " + std::to_string(doc_lengths_.size()) +
                                ", got " + std::to_string(ordinal));
  }

  auto tokens = text::tokenize(text);
  std::unordered_map<std::string, std::uint32_t> term_counts;
  for (const auto &token : tokens) {
    ++term_counts[token];
  }
  for (const auto &entry : term_counts) {
    postings_[entry.first].push_back(
        Posting{static_cast<std::uint32_t>(ordinal), entry.second});
  }

  doc_lengths_.push_back(static_cast<std::uint32_t>(tokens.size()));
  total_tokens_ += tokens.size();
}

double Bm25Index::average_document_length() const {
  if (doc_lengths_.empty()) {
    return 0.0;
  }
  return static_cast<double>(total_tokens_) / static_cast<double>(doc_lengths_.size());
}

double Bm25Index::idf(const std::string &folded_term) const {
  auto it = postings_.find(folded_term);
  double df = it == postings_.end() ? 0.0 : static_cast<double>(it->second.size());
  double n = static_cast<double>(doc_lengths_.size());
  return std::log(1.0 + (n - df + 0.5) / (df + 0.5));
}

std::vector<LegHit> Bm25Index::search(const std::string &query_text,
                                      const std::vector<bool> &allowed,
                                      std::size_t limit,
                                      const async::CancellationToken &cancel) const {
  if (limit == 0 || doc_lengths_.empty()) {
    return {};
  }

  // Each distinct query term counts once
  std::vector<std::string> terms;
  std::unordered_set<std::string> seen;
  for (auto &token : text::tokenize(query_text)) {
    if (seen.insert(token).second) {
      terms.push_back(std::move(token));
    }
  }

  const double avgdl = average_document_length();
  std::unordered_map<std::uint32_t, double> scores;
  std::size_t visited = 0;

  for (const auto &term : terms) {
    auto it = postings_.find(term);
    if (it == postings_.end()) {
      continue;
    }
    const double term_idf = idf(term);
    for (const auto &posting : it->second) {
      if (++visited % CANCEL_CHECK_STRIDE == 0 && cancel.is_cancelled()) {
        return {};
      }
      if (!allowed.empty() && !allowed[posting.ordinal]) {
        continue;
      }
      const double tf = posting.term_frequency;
      const double dl = doc_lengths_[posting.ordinal];
      const double norm = avgdl > 0.0 ? (1.0 - params_.b + params_.b * dl / avgdl) : 1.0;
      scores[posting.ordinal] += term_idf * (tf * (params_.k1 + 1.0)) / (tf + params_.k1 * norm);
    }
  }

  if (cancel.is_cancelled()) {
    return {};
  }

  std::vector<LegHit> hits;
  hits.reserve(scores.size());
  for (const auto &entry : scores) {
    hits.push_back(LegHit{entry.first, entry.second});
  }

  auto by_score = [](const LegHit &a, const LegHit &b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.ordinal < b.ordinal;
  };
  if (hits.size() > limit) {
    std::partial_sort(hits.begin(), hits.begin() + static_cast<std::ptrdiff_t>(limit), hits.end(),
                      by_score);
    hits.resize(limit);
  } else {
    std::sort(hits.begin(), hits.end(), by_score);
  }
  return hits;
}

std::vector<std::size_t> Bm25Index::documents_containing(const std::string &phrase) const {
  auto tokens = text::tokenize(phrase);
  if (tokens.empty()) {
    return {};
  }

  // Intersect postings, starting from the rarest token
  std::vector<const std::vector<Posting> *> lists;
  for (const auto &token : tokens) {
    auto it = postings_.find(token);
    if (it == postings_.end()) {
      return {};
    }
    lists.push_back(&it->second);
  }
  std::sort(lists.begin(), lists.end(),
            [](const auto *a, const auto *b) { return a->size() < b->size(); });

  std::vector<bool> present(doc_lengths_.size(), false);
  for (const auto &posting : *lists.front()) {
    present[posting.ordinal] = true;
  }
  for (std::size_t i = 1; i < lists.size(); ++i) {
    std::vector<bool> next(doc_lengths_.size(), false);
    for (const auto &posting : *lists[i]) {
      if (present[posting.ordinal]) {
        next[posting.ordinal] = true;
      }
    }
    present.swap(next);
  }

  std::vector<std::size_t> ordinals;
  for (std::size_t ordinal = 0; ordinal < present.size(); ++ordinal) {
    if (present[ordinal]) {
      ordinals.push_back(ordinal);
    }
  }
  return ordinals;
}

}  // namespace titan_core
