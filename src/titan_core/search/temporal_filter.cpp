#include "titan_core/search/temporal_filter.hpp"

#include <cstdlib>

namespace titan_core {

bool TemporalFilter::is_valid(const Chunk &chunk, std::optional<int> target_year) {
  if (!target_year || chunk.has_corrupt_window()) {
    return true;
  }
  return chunk.valid_from <= *target_year && *target_year <= chunk.valid_until;
}

double TemporalFilter::rank(const Chunk &chunk, std::optional<int> target_year) {
  if (!target_year) {
    return 0.0;
  }
  const long distance = std::labs(static_cast<long>(chunk.valid_from) - *target_year);
  return 1.0 / (1.0 + static_cast<double>(distance));
}

}  // namespace titan_core
