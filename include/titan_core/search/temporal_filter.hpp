#pragma once

#include <optional>

#include "titan_core/types/chunk.hpp"

namespace titan_core {

// Validity-window checks against a query's implied year
class TemporalFilter {
 public:
  // valid_from <= target_year <= valid_until. No target year, or a chunk whose window is
  // inverted (corrupt metadata), is always valid.
  static bool is_valid(const Chunk &chunk, std::optional<int> target_year);

  // 1 / (1 + |valid_from - target_year|), strictly decreasing with distance; 0 without a year
  static double rank(const Chunk &chunk, std::optional<int> target_year);
};

}  // namespace titan_core
