#include "titan_core/store/indexed_knowledge_store.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/impl/IDSelector.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace titan_core {

IndexedKnowledgeStore::IndexedKnowledgeStore(std::vector<Chunk> chunks,
                                             std::unique_ptr<faiss::Index> vector_index,
                                             std::size_t dimension,
                                             Bm25Params bm25_params)
    : chunks_(std::move(chunks)),
      vector_index_(std::move(vector_index)),
      dimension_(dimension),
      bm25_(bm25_params) {
  if (!vector_index_) {
    throw ConfigurationError("Vector index is missing");
  }

  for (std::size_t ordinal = 0; ordinal < chunks_.size(); ++ordinal) {
    const Chunk &chunk = chunks_[ordinal];
    if (!ordinal_by_id_.emplace(chunk.id, ordinal).second) {
      throw ConfigurationError("Duplicate chunk id in knowledge base: " + chunk.id);
    }
    if (chunk.has_corrupt_window()) {
      std::cerr << "[KnowledgeStore] Warning: chunk " << chunk.id << " has valid_from "
                << chunk.valid_from << " > valid_until " << chunk.valid_until
                << ", treating it as unconstrained" << std::endl;
    }
    bm25_.add_document(ordinal, chunk.text);
  }

  verify_alignment();
}

std::shared_ptr<const IndexedKnowledgeStore> IndexedKnowledgeStore::from_vectors(
    std::vector<Chunk> chunks, std::vector<float> flat_vectors, std::size_t dimension,
    Bm25Params bm25_params) {
  if (dimension == 0) {
    throw ConfigurationError("Embedding dimension must be greater than 0");
  }
  if (flat_vectors.size() % dimension != 0) {
    throw ConfigurationError("Vector data is not a whole number of " + std::to_string(dimension) +
                             "-dimensional rows");
  }

  const std::size_t rows = flat_vectors.size() / dimension;
  if (rows > 0) {
    faiss::fvec_renorm_L2(dimension, rows, flat_vectors.data());
  }
  auto index = std::make_unique<faiss::IndexFlatIP>(static_cast<faiss::idx_t>(dimension));
  if (rows > 0) {
    index->add(static_cast<faiss::idx_t>(rows), flat_vectors.data());
  }

  return std::make_shared<const IndexedKnowledgeStore>(std::move(chunks), std::move(index), dimension,
                                                       bm25_params);
}

void IndexedKnowledgeStore::verify_alignment() const {
  const auto vector_count = static_cast<std::size_t>(vector_index_->ntotal);
  if (chunks_.size() != vector_count || chunks_.size() != bm25_.document_count()) {
    throw ConfigurationError("Knowledge indices are misaligned: " + std::to_string(chunks_.size()) +
                             " chunks, " + std::to_string(vector_count) + " vectors, " +
                             std::to_string(bm25_.document_count()) + " lexical documents");
  }
  if (static_cast<std::size_t>(vector_index_->d) != dimension_) {
    throw ConfigurationError("Vector index dimension " + std::to_string(vector_index_->d) +
                             " does not match embedding dimension " + std::to_string(dimension_));
  }
  if (vector_index_->metric_type != faiss::METRIC_INNER_PRODUCT) {
    throw ConfigurationError("Vector index must use the inner-product metric");
  }
}

std::vector<bool> IndexedKnowledgeStore::lexical_universe(const CandidateFilter &filter) const {
  if (filter.is_unrestricted()) {
    return {};
  }

  std::vector<bool> allowed(chunks_.size(), filter.required_terms.empty());
  for (const auto &term : filter.required_terms) {
    for (std::size_t ordinal : bm25_.documents_containing(term)) {
      allowed[ordinal] = true;
    }
  }
  if (!filter.doc_types.empty()) {
    for (std::size_t ordinal = 0; ordinal < chunks_.size(); ++ordinal) {
      if (allowed[ordinal] && !filter.allows_doc_type(chunks_[ordinal].doc_type)) {
        allowed[ordinal] = false;
      }
    }
  }
  return allowed;
}

std::vector<LegHit> IndexedKnowledgeStore::lexical_search(const std::string &query_text,
                                                          const CandidateFilter &filter,
                                                          std::size_t limit,
                                                          const async::CancellationToken &cancel) const {
  std::vector<bool> allowed = lexical_universe(filter);
  if (!allowed.empty() && std::none_of(allowed.begin(), allowed.end(), [](bool b) { return b; })) {
    return {};
  }
  return bm25_.search(query_text, allowed, limit, cancel);
}

std::vector<LegHit> IndexedKnowledgeStore::vector_search(const std::vector<float> &query_vector,
                                                         const CandidateFilter &filter,
                                                         std::size_t limit) const {
  if (limit == 0 || vector_index_->ntotal == 0) {
    return {};
  }
  if (query_vector.size() != dimension_) {
    std::cerr << "[KnowledgeStore] Query vector dimension mismatch. Expected " << dimension_
              << ", got " << query_vector.size() << std::endl;
    return {};
  }

  std::vector<faiss::idx_t> allowed_ids;
  if (!filter.doc_types.empty()) {
    for (std::size_t ordinal = 0; ordinal < chunks_.size(); ++ordinal) {
      if (filter.allows_doc_type(chunks_[ordinal].doc_type)) {
        allowed_ids.push_back(static_cast<faiss::idx_t>(ordinal));
      }
    }
    if (allowed_ids.empty()) {
      return {};
    }
  }

  std::vector<float> query(query_vector);
  faiss::fvec_renorm_L2(dimension_, 1, query.data());

  std::size_t universe = filter.doc_types.empty() ? static_cast<std::size_t>(vector_index_->ntotal)
                                                  : allowed_ids.size();
  auto k = static_cast<faiss::idx_t>(std::min(limit, universe));
  std::vector<float> distances(static_cast<std::size_t>(k));
  std::vector<faiss::idx_t> labels(static_cast<std::size_t>(k), -1);

  if (allowed_ids.empty()) {
    vector_index_->search(1, query.data(), k, distances.data(), labels.data());
  } else {
    faiss::IDSelectorBatch selector(allowed_ids.size(), allowed_ids.data());
    faiss::SearchParameters params;
    params.sel = &selector;
    vector_index_->search(1, query.data(), k, distances.data(), labels.data(), &params);
  }

  std::vector<LegHit> hits;
  hits.reserve(labels.size());
  for (std::size_t i = 0; i < labels.size(); ++i) {
    if (labels[i] < 0 || static_cast<std::size_t>(labels[i]) >= chunks_.size()) {
      continue;
    }
    hits.push_back(LegHit{static_cast<std::size_t>(labels[i]), static_cast<double>(distances[i])});
  }
  return hits;
}

const Chunk &IndexedKnowledgeStore::get_chunk(std::size_t ordinal) const {
  if (ordinal >= chunks_.size()) {
    throw std::out_of_range("Chunk ordinal " + std::to_string(ordinal) + " out of range");
  }
  return chunks_[ordinal];
}

const Chunk *IndexedKnowledgeStore::find_chunk(const std::string &chunk_id) const {
  auto it = ordinal_by_id_.find(chunk_id);
  return it == ordinal_by_id_.end() ? nullptr : &chunks_[it->second];
}

}  // namespace titan_core
