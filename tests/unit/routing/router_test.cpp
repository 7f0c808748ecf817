#include <gtest/gtest.h>

#include <algorithm>

#include "titan_core/errors.hpp"
#include "titan_core/routing/router.hpp"

namespace titan_core {

class RouterTest : public ::testing::Test {
 protected:
  Router router_{RouterConfig::defaults()};

  static bool contains(const std::vector<std::string> &values, const std::string &value) {
    return std::find(values.begin(), values.end(), value) != values.end();
  }
};

TEST_F(RouterTest, ReadingPassageRoutesToReading) {
  auto decision = router_.route("Đọc đoạn văn sau và cho biết tác giả muốn nói gì?");

  EXPECT_EQ(decision.mode, RouteMode::Reading);
  ASSERT_TRUE(decision.matched_pattern.has_value());
  EXPECT_EQ(*decision.matched_pattern, "đoạn văn");
  EXPECT_FALSE(decision.extracted_year.has_value());
  EXPECT_TRUE(decision.extracted_entities.empty());
}

TEST_F(RouterTest, NumberedContextRoutesToReading) {
  auto decision = router_.route("[1] Hà Nội là thủ đô. Câu hỏi: thủ đô của Việt Nam là gì?");
  EXPECT_EQ(decision.mode, RouteMode::Reading);
}

TEST_F(RouterTest, DerivativeRoutesToStem) {
  auto decision = router_.route("Tính đạo hàm của hàm số f(x) = x^2 + 3x");

  EXPECT_EQ(decision.mode, RouteMode::Stem);
  ASSERT_TRUE(decision.matched_pattern.has_value());
}

TEST_F(RouterTest, LatexRoutesToStem) {
  EXPECT_EQ(router_.route(R"(Cho \int_0^1 x dx. Kết quả bằng bao nhiêu?)").mode, RouteMode::Stem);
  EXPECT_EQ(router_.route("Giới hạn lim của dãy số khi n tiến tới vô cùng").mode, RouteMode::Stem);
}

TEST_F(RouterTest, ReadingTakesPrecedenceOverStem) {
  auto decision = router_.route("Dựa vào thông tin sau, hãy tính giá trị của biểu thức");
  EXPECT_EQ(decision.mode, RouteMode::Reading);
}

TEST_F(RouterTest, FactualLawQuestionRoutesToRag) {
  auto decision = router_.route("Luật Đất đai 2024 có hiệu lực từ năm nào?");

  EXPECT_EQ(decision.mode, RouteMode::Rag);
  EXPECT_FALSE(decision.matched_pattern.has_value());
  ASSERT_TRUE(decision.extracted_year.has_value());
  EXPECT_EQ(*decision.extracted_year, 2024);
  EXPECT_TRUE(contains(decision.extracted_entities, "đất"));
  EXPECT_TRUE(contains(decision.extracted_entities, "luật"));
  ASSERT_TRUE(decision.category_hint.has_value());
  EXPECT_EQ(*decision.category_hint, DocType::Law);
}

TEST_F(RouterTest, BlankQueryRoutesToRag) {
  auto decision = router_.route("   \t\n");

  EXPECT_EQ(decision.mode, RouteMode::Rag);
  EXPECT_FALSE(decision.extracted_year.has_value());
  EXPECT_TRUE(decision.extracted_entities.empty());
  EXPECT_FALSE(decision.category_hint.has_value());
}

TEST_F(RouterTest, RoutingIsDeterministic) {
  const std::string query = "Chiến tranh Điện Biên Phủ kết thúc năm 1954 như thế nào?";
  auto first = router_.route(query);
  auto second = router_.route(query);

  EXPECT_EQ(first.mode, second.mode);
  EXPECT_EQ(first.extracted_year, second.extracted_year);
  EXPECT_EQ(first.extracted_entities, second.extracted_entities);
  EXPECT_EQ(first.category_hint, second.category_hint);
  EXPECT_EQ(*first.category_hint, DocType::History);
}

TEST_F(RouterTest, ExtractYear_PrefersExplicitYearWithinRange) {
  EXPECT_EQ(Router::extract_year("Sự kiện 2024 liên quan gì đến năm 1945?"), 1945);
  EXPECT_EQ(Router::extract_year("Quy định áp dụng từ 2025"), 2025);
  EXPECT_FALSE(Router::extract_year("Năm 1850 có gì?").has_value());
  EXPECT_FALSE(Router::extract_year("Năm 2200 sẽ ra sao?").has_value());
  EXPECT_FALSE(Router::extract_year("Mã số 123456 là gì?").has_value());
  EXPECT_EQ(Router::extract_year("Năm 1800 hay năm 1900?"), 1900);
}

TEST_F(RouterTest, ExtractEntities_CapsAndDeduplicates) {
  RouterConfig config = RouterConfig::defaults();
  config.max_entities = 2;
  Router capped(config);

  auto entities = capped.extract_entities("Vì sao Hà Nội Hà Nội được chọn làm Thủ đô?");

  EXPECT_EQ(entities, (std::vector<std::string>{"hà", "nội"}));
}

TEST_F(RouterTest, CategoryHint_FirstMarkerWins) {
  EXPECT_EQ(router_.category_hint("Bộ luật Dân sự quy định gì về lễ hội?"), DocType::Law);
  EXPECT_EQ(router_.category_hint("Lễ hội Đền Hùng diễn ra khi nào?"), DocType::Culture);
  EXPECT_FALSE(router_.category_hint("Con mèo có mấy chân?").has_value());
}

TEST_F(RouterTest, InvalidPatternThrows) {
  RouterConfig config = RouterConfig::defaults();
  config.stem_patterns.push_back("(unclosed");
  EXPECT_THROW(Router{config}, ConfigurationError);
}

}  // namespace titan_core
