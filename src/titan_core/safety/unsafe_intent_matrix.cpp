#include "titan_core/safety/unsafe_intent_matrix.hpp"

#include <cmath>

namespace titan_core {

void UnsafeIntentMatrix::add_row(const std::string &label, const std::vector<float> &vector) {
  if (vector.size() != dimension_) {
    throw std::invalid_argument("Unsafe intent vector '" + label + "' has dimension " +
                                std::to_string(vector.size()) + ", expected " +
                                std::to_string(dimension_));
  }

  double norm = 0.0;
  for (float v : vector) {
    norm += static_cast<double>(v) * v;
  }
  norm = std::sqrt(norm);

  for (float v : vector) {
    rows_.push_back(norm > 0.0 ? static_cast<float>(v / norm) : 0.0f);
  }
  labels_.push_back(label);
}

}  // namespace titan_core
