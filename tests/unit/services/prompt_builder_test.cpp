#include <gtest/gtest.h>

#include "../../common/utilities_test.hpp"
#include "titan_core/services/prompt_builder.hpp"

namespace titan_core {

using titan_tests::TestUtilities;

class PromptBuilderTest : public ::testing::Test {
 protected:
  Question question_ = TestUtilities::create_test_question(
      "q1", "Luật Đất đai 2024 có hiệu lực từ năm nào?", {"2023", "2024", "2025", "2026"});
  Chunk chunk_ = TestUtilities::create_test_chunk(
      "land_2024", "Luật Đất đai 2024 có hiệu lực từ ngày 01/8/2024.", DocType::Law, 2024);
};

TEST_F(PromptBuilderTest, LetterRange) {
  EXPECT_EQ(PromptBuilder::letter_range(4), "A, B, C hoặc D");
  EXPECT_EQ(PromptBuilder::letter_range(2), "A hoặc B");
  EXPECT_EQ(PromptBuilder::letter_range(1), "A");
  EXPECT_EQ(PromptBuilder::letter_range(0), "A");
}

TEST_F(PromptBuilderTest, FormatOptions) {
  EXPECT_EQ(PromptBuilder::format_options({"Một", "Hai"}), "A) Một\nB) Hai\n");
  EXPECT_EQ(PromptBuilder::format_options({}), "");
}

TEST_F(PromptBuilderTest, FormatContext_NumbersChunksWithSource) {
  Chunk other = TestUtilities::create_test_chunk("culture_tet", "Tết Nguyên Đán.");
  std::vector<ScoredChunk> context(3);
  context[0].chunk = &chunk_;
  context[2].chunk = &other;

  auto text = PromptBuilder::format_context(context);

  EXPECT_EQ(text,
            "[1] (test/land_2024) Luật Đất đai 2024 có hiệu lực từ ngày 01/8/2024.\n\n"
            "[2] (test/culture_tet) Tết Nguyên Đán.");
}

TEST_F(PromptBuilderTest, Rag_IncludesContextQuestionAndOptions) {
  std::vector<ScoredChunk> context(1);
  context[0].chunk = &chunk_;

  auto request = PromptBuilder::build(question_, RouteMode::Rag, context);

  EXPECT_NE(request.user_prompt.find("NGỮ CẢNH"), std::string::npos);
  EXPECT_NE(request.user_prompt.find("[1] (test/land_2024)"), std::string::npos);
  EXPECT_NE(request.user_prompt.find(question_.text), std::string::npos);
  EXPECT_NE(request.user_prompt.find("D) 2026"), std::string::npos);
  EXPECT_NE(request.user_prompt.find("Đáp án: X"), std::string::npos);
  EXPECT_DOUBLE_EQ(request.temperature, 0.1);
  EXPECT_EQ(request.max_tokens, 512);
}

TEST_F(PromptBuilderTest, Rag_EmptyContextUsesKnowledgePrompt) {
  auto request = PromptBuilder::build(question_, RouteMode::Rag, {});
  auto expected = PromptBuilder::build_rag_without_context(question_);

  EXPECT_EQ(request.system_prompt, expected.system_prompt);
  EXPECT_EQ(request.user_prompt, expected.user_prompt);
  EXPECT_EQ(request.user_prompt.find("NGỮ CẢNH"), std::string::npos);
}

TEST_F(PromptBuilderTest, ModesUseDistinctPrompts) {
  std::vector<ScoredChunk> context(1);
  context[0].chunk = &chunk_;

  auto reading = PromptBuilder::build(question_, RouteMode::Reading, context);
  auto stem = PromptBuilder::build(question_, RouteMode::Stem, context);
  auto rag = PromptBuilder::build(question_, RouteMode::Rag, context);

  EXPECT_NE(reading.system_prompt, stem.system_prompt);
  EXPECT_NE(stem.system_prompt, rag.system_prompt);
  EXPECT_EQ(reading.user_prompt.find("NGỮ CẢNH"), std::string::npos);
  EXPECT_EQ(stem.user_prompt.find("NGỮ CẢNH"), std::string::npos);
  EXPECT_NE(stem.user_prompt.find("A, B, C hoặc D"), std::string::npos);
}

}  // namespace titan_core
