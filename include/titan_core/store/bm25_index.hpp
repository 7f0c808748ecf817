#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "titan_core/async/cancellation.hpp"
#include "titan_core/store/knowledge_store.hpp"

namespace titan_core {

struct Bm25Params {
  double k1 = 1.5;
  double b = 0.75;
};

/**
 * @class Bm25Index
 * @brief In-memory inverted index over folded tokens, addressed by ordinal.
 *
 * Built once at load time and read concurrently afterwards. Scores use
 * idf = ln(1 + (N - df + 0.5) / (df + 0.5)), so every matching term contributes
 * a positive amount.
 */
class Bm25Index {
 public:
  explicit Bm25Index(Bm25Params params = Bm25Params{});

  // Documents must be added with consecutive ordinals starting at 0
  void add_document(std::size_t ordinal, const std::string &text);

  std::size_t document_count() const { return doc_lengths_.size(); }
  std::size_t vocabulary_size() const { return postings_.size(); }
  double average_document_length() const;

  // `allowed` is indexed by ordinal. Empty means every document is allowed.
  std::vector<LegHit> search(const std::string &query_text,
                             const std::vector<bool> &allowed,
                             std::size_t limit,
                             const async::CancellationToken &cancel) const;

  // Ordinals whose token stream contains every token of `phrase`
  std::vector<std::size_t> documents_containing(const std::string &phrase) const;

  double idf(const std::string &folded_term) const;

 private:
  struct Posting {
    std::uint32_t ordinal;
    std::uint32_t term_frequency;
  };

  Bm25Params params_;
  std::unordered_map<std::string, std::vector<Posting>> postings_;
  std::vector<std::uint32_t> doc_lengths_;
  std::uint64_t total_tokens_ = 0;
};

}  // namespace titan_core
