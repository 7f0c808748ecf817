#pragma once

#include <istream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "titan_core/types/chunk.hpp"

namespace titan_core {

class ChunkFormatError : public std::exception {
 public:
  ChunkFormatError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * Parses one chunk record:
 * {"id", "text", "source"?, "type"?, "valid_from"?, "valid_until"|"expire_at"?, "region"|"province"?}
 *
 * Missing metadata takes the unscoped defaults (GENERAL, 1900-9999, ALL).
 * Throws ChunkFormatError when id or text is missing or empty.
 */
Chunk chunk_from_json(const nlohmann::json &json);

// One JSON object per line. Malformed lines and duplicate ids are skipped with a warning.
std::vector<Chunk> read_chunk_jsonl(std::istream &input, const std::string &source_name);

// Non-empty lines, '#' comments skipped
std::vector<std::string> read_text_lines(std::istream &input);

// Seed harmful-intent questions used when no list is supplied to the indexer
std::vector<std::string> default_harmful_questions();

}  // namespace titan_core
