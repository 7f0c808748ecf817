#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "titan_core/services/compression_service.hpp"

namespace titan_core {

class CompressionServiceTest : public ::testing::Test {
 protected:
  // Helper to generate repetitive data (good for compression)
  std::string generate_repetitive_data(size_t size) {
    std::string pattern = "Luật Đất đai 2024 quy định về quyền sử dụng đất. ";
    std::string data;
    while (data.size() < size) {
      data += pattern;
    }
    return data;
  }

  void verify_round_trip(const std::string& original_data, int compression_level = 3) {
    std::vector<char> compressed = CompressionService::compress(original_data, compression_level);
    std::string decompressed = CompressionService::decompress(compressed);
    EXPECT_EQ(decompressed, original_data);
  }
};

TEST_F(CompressionServiceTest, CompressDecompress_EmptyString) {
  EXPECT_TRUE(CompressionService::compress("").empty());
  EXPECT_EQ(CompressionService::decompress({}), "");
}

TEST_F(CompressionServiceTest, CompressDecompress_VietnameseText) {
  verify_round_trip("Cách mạng tháng Tám năm 1945 thành công. Ơ Ư Đ ạ ỹ");
}

TEST_F(CompressionServiceTest, CompressDecompress_RepetitiveDataShrinks) {
  std::string data = generate_repetitive_data(20000);
  std::vector<char> compressed = CompressionService::compress(data);
  EXPECT_LT(compressed.size(), data.size() / 4);
  EXPECT_EQ(CompressionService::decompress(compressed), data);
}

TEST_F(CompressionServiceTest, CompressDecompress_DifferentCompressionLevels) {
  std::string data = generate_repetitive_data(4096);
  for (int level : {1, 3, 9, 19}) {
    verify_round_trip(data, level);
  }
}

TEST_F(CompressionServiceTest, Decompress_GarbageThrows) {
  std::vector<char> garbage = {'n', 'o', 't', ' ', 'z', 's', 't', 'd'};
  EXPECT_THROW(CompressionService::decompress(garbage), CompressionError);
}

}  // namespace titan_core
