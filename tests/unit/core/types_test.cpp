#include <gtest/gtest.h>

#include "titan_core/types.hpp"

namespace titan_core {

TEST(TypesTest, DocType_StringConversion) {
  EXPECT_EQ(to_string(DocType::Law), "LAW");
  EXPECT_EQ(doc_type_from_string("HISTORY"), DocType::History);
  EXPECT_EQ(doc_type_from_string("something-else"), DocType::General);
}

TEST(TypesTest, Chunk_DefaultsAreUnscoped) {
  Chunk chunk;
  EXPECT_EQ(chunk.valid_from, EARLIEST_VALID_YEAR);
  EXPECT_EQ(chunk.valid_until, NO_EXPIRY_YEAR);
  EXPECT_EQ(chunk.region, "ALL");
  EXPECT_FALSE(chunk.has_corrupt_window());

  chunk.valid_from = 2030;
  chunk.valid_until = 2020;
  EXPECT_TRUE(chunk.has_corrupt_window());
}

TEST(TypesTest, OptionLetter_AndIndex) {
  EXPECT_EQ(option_letter(0), "A");
  EXPECT_EQ(option_letter(3), "D");
  EXPECT_EQ(option_letter(9), "J");

  EXPECT_EQ(option_index('b', 4), 1u);
  EXPECT_EQ(option_index('D', 4), 3u);
  EXPECT_FALSE(option_index('E', 4).has_value());
  EXPECT_FALSE(option_index('?', 4).has_value());
}

TEST(TypesTest, RouteMode_ToString) {
  EXPECT_EQ(to_string(RouteMode::Reading), "READING");
  EXPECT_EQ(to_string(RouteMode::Stem), "STEM");
  EXPECT_EQ(to_string(RouteMode::Rag), "RAG");
}

}  // namespace titan_core
