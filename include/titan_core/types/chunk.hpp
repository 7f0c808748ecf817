#pragma once

#include <cstddef>
#include <string>

namespace titan_core {

// Knowledge domain of a chunk
enum class DocType { Law, History, Geography, Culture, Politics, Math, General };

std::string to_string(DocType type);
// Unknown strings map to General
DocType doc_type_from_string(const std::string &str);

inline constexpr int NO_EXPIRY_YEAR = 9999;
inline constexpr int EARLIEST_VALID_YEAR = 1900;
inline constexpr const char *UNSCOPED_REGION = "ALL";

struct Chunk {
  std::string id;
  std::string text;
  std::string source;
  DocType doc_type = DocType::General;
  int valid_from = EARLIEST_VALID_YEAR;
  int valid_until = NO_EXPIRY_YEAR;
  std::string region = UNSCOPED_REGION;

  bool has_corrupt_window() const {
    return valid_from > valid_until;
  }
};

enum class RetrievalSource { Lexical, Semantic, Fused };

std::string to_string(RetrievalSource source);

struct ScoredChunk {
  const Chunk *chunk = nullptr;
  double score = 0.0;
  RetrievalSource source = RetrievalSource::Fused;

  // Populated for fused entries. Ranks are 1-based, 0 means absent from that leg.
  std::size_t lexical_rank = 0;
  std::size_t semantic_rank = 0;
  double lexical_score = 0.0;
  double semantic_score = 0.0;
};

}  // namespace titan_core
