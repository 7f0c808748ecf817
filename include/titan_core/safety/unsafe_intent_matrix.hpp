#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace titan_core {

// K x dimension matrix of harmful-intent embeddings, rows L2-normalised on insert.
// Loaded once at startup and shared read-only.
class UnsafeIntentMatrix {
 public:
  explicit UnsafeIntentMatrix(std::size_t dimension) : dimension_(dimension) {}

  // Throws std::invalid_argument on a dimension mismatch
  void add_row(const std::string &label, const std::vector<float> &vector);

  std::size_t dimension() const { return dimension_; }
  std::size_t row_count() const { return labels_.size(); }
  bool empty() const { return labels_.empty(); }

  const float *row(std::size_t index) const { return rows_.data() + index * dimension_; }
  const std::string &label(std::size_t index) const { return labels_.at(index); }

 private:
  std::size_t dimension_;
  std::vector<float> rows_;
  std::vector<std::string> labels_;
};

}  // namespace titan_core
