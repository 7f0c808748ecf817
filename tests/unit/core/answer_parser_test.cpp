#include <gtest/gtest.h>

#include "titan_core/llm/answer_parser.hpp"

namespace titan_core {

TEST(AnswerParserTest, ExplicitVietnameseMarker) {
  EXPECT_EQ(AnswerParser::parse_letter("Phân tích... Vậy Đáp án: C", 4), "C");
  EXPECT_EQ(AnswerParser::parse_letter("đáp án đúng là: b", 4), "B");
}

TEST(AnswerParserTest, EnglishAndChoiceMarkers) {
  EXPECT_EQ(AnswerParser::parse_letter("Answer: D", 4), "D");
  EXPECT_EQ(AnswerParser::parse_letter("Lựa chọn: A vì ...", 4), "A");
}

TEST(AnswerParserTest, MarkerWinsOverEarlierLetters) {
  EXPECT_EQ(AnswerParser::parse_letter("A) sai, B) sai. Đáp án: C", 4), "C");
}

TEST(AnswerParserTest, BoldAndParenthesisedForms) {
  EXPECT_EQ(AnswerParser::parse_letter("Tôi chọn **B)** vì hợp lý nhất", 4), "B");
  EXPECT_EQ(AnswerParser::parse_letter("C) Hà Nội", 4), "C");
}

TEST(AnswerParserTest, StandaloneCapitalLetter) {
  EXPECT_EQ(AnswerParser::parse_letter("B", 4), "B");
  EXPECT_EQ(AnswerParser::parse_letter("Kết luận là D.", 4), "D");
}

TEST(AnswerParserTest, BareLetterInAnyCase) {
  EXPECT_EQ(AnswerParser::parse_letter("b", 4), "B");
  EXPECT_EQ(AnswerParser::parse_letter("  d\n", 4), "D");
  EXPECT_EQ(AnswerParser::parse_letter("c.", 4), "C");
  EXPECT_FALSE(AnswerParser::parse_letter("e", 4).has_value());
}

TEST(AnswerParserTest, LettersOutOfRangeAreSkipped) {
  EXPECT_FALSE(AnswerParser::parse_letter("Đáp án: F", 4).has_value());
  EXPECT_EQ(AnswerParser::parse_letter("Đáp án: F", 6), "F");
}

TEST(AnswerParserTest, NothingToParse) {
  EXPECT_FALSE(AnswerParser::parse_index("", 4).has_value());
  EXPECT_FALSE(AnswerParser::parse_index("không biết", 4).has_value());
  EXPECT_FALSE(AnswerParser::parse_index("Đáp án: A", 0).has_value());
}

}  // namespace titan_core
