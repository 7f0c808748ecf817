#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace titan_core {

class CompressionError : public std::runtime_error {
 public:
  explicit CompressionError(const std::string &message) : std::runtime_error(message) {}
};

// zstd framing for chunk bodies stored in the knowledge database
class CompressionService {
 public:
  /**
   * @brief Compresses a block of data using Zstandard.
   * @param data The data to compress.
   * @param compression_level The zstd compression level (default is 3).
   * @return A vector of chars containing the compressed binary data.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = 3);

  /**
   * @brief Decompresses a single Zstandard frame.
   * @throws CompressionError if the data is not a zstd frame with a known content size.
   */
  static std::string decompress(const std::vector<char> &compressed_data);
};

}  // namespace titan_core
