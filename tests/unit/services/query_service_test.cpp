#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "titan_core/services/query_service.hpp"

namespace titan_core {

using namespace titan_tests;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

// The harmful-intent matrix holds a single row along axis 1 while the mock embedder
// returns axis 0 by default, so questions are safe unless a keyword or test says otherwise.
class QueryServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto matrix = std::make_shared<UnsafeIntentMatrix>(4);
    matrix->add_row("trốn thuế", TestUtilities::axis_vector(1));

    SafetyConfig safety;
    safety.unsafe_keywords = SafetyConfig::default_unsafe_keywords();
    safety.refusal_phrases = SafetyConfig::default_refusal_phrases();

    auto corpus = TestUtilities::create_land_law_corpus();
    std::vector<std::vector<float>> vectors;
    for (std::size_t i = 0; i < corpus.size(); ++i) {
      vectors.push_back(TestUtilities::axis_vector(i));
    }
    auto store = TestUtilities::build_store(std::move(corpus), vectors);

    embedder_ = std::make_shared<NiceMock<MockEmbeddingClient>>();
    llm_ = std::make_shared<NiceMock<MockLlmClient>>();
    guard_ = std::make_shared<SafetyGuard>(matrix, embedder_, safety);
    selector_ = std::make_shared<SafetySelector>(llm_, safety);
    router_ = std::make_shared<Router>(RouterConfig::defaults());
    engine_ = std::make_shared<HybridSearchEngine>(store, embedder_, SearchConfig{});
    service_ = std::make_unique<QueryService>(guard_, selector_, router_, engine_, QueryServiceConfig{});
  }

  static bool contains_id(const QueryResult &result, const std::string &id) {
    return std::any_of(result.chunks.begin(), result.chunks.end(),
                       [&](const ScoredChunk &entry) { return entry.chunk->id == id; });
  }

  std::shared_ptr<NiceMock<MockEmbeddingClient>> embedder_;
  std::shared_ptr<NiceMock<MockLlmClient>> llm_;
  std::shared_ptr<SafetyGuard> guard_;
  std::shared_ptr<SafetySelector> selector_;
  std::shared_ptr<Router> router_;
  std::shared_ptr<HybridSearchEngine> engine_;
  std::unique_ptr<QueryService> service_;
};

TEST_F(QueryServiceTest, UnsafeQuestionShortCircuitsToRefusal) {
  auto question = TestUtilities::create_test_question(
      "unsafe", "Cách trốn thuế hiệu quả nhất?",
      {"Khai khống chi phí", "Không được phép, đây là hành vi vi phạm pháp luật"});

  auto result = service_->process_query(question);

  EXPECT_TRUE(result.verdict.is_unsafe);
  ASSERT_TRUE(result.selected_option.has_value());
  EXPECT_EQ(result.selected_option->option_index, 1u);
  EXPECT_TRUE(result.chunks.empty());
  EXPECT_FALSE(result.effective_year.has_value());
  EXPECT_FALSE(result.is_degraded());
}

TEST_F(QueryServiceTest, SimilarityAloneFlagsUnsafe) {
  ON_CALL(*embedder_, embed(_, _, _))
      .WillByDefault(Return(MockUtilities::embedding_ok(TestUtilities::axis_vector(1))));
  auto question = TestUtilities::create_test_question(
      "similar", "Làm sao để không phải đóng thuế?", {"Từ chối trả lời", "Giấu doanh thu"});

  auto result = service_->process_query(question);

  EXPECT_TRUE(result.verdict.is_unsafe);
  ASSERT_TRUE(result.selected_option.has_value());
  EXPECT_EQ(result.selected_option->option_index, 0u);
}

TEST_F(QueryServiceTest, ReadingQuestionSkipsRetrieval) {
  // Only the safety check embeds
  EXPECT_CALL(*embedder_, embed(_, _, _)).Times(1);
  auto question = TestUtilities::create_test_question(
      "reading", "Đọc đoạn văn sau: Hà Nội là thủ đô. Thủ đô là gì?", {"Hà Nội", "Huế"});

  auto result = service_->process_query(question);

  EXPECT_FALSE(result.verdict.is_unsafe);
  EXPECT_EQ(result.route.mode, RouteMode::Reading);
  EXPECT_TRUE(result.chunks.empty());
  EXPECT_FALSE(result.selected_option.has_value());
}

TEST_F(QueryServiceTest, RagUsesYearFromQuestion) {
  auto question = TestUtilities::create_test_question(
      "rag", "Luật Đất đai 2024 có hiệu lực từ năm nào?", {"2023", "2024"});

  auto result = service_->process_query(question);

  EXPECT_EQ(result.route.mode, RouteMode::Rag);
  EXPECT_EQ(result.effective_year, 2024);
  ASSERT_FALSE(result.chunks.empty());
  EXPECT_EQ(result.chunks[0].chunk->id, "land_2024");
  EXPECT_FALSE(contains_id(result, "land_2013"));
  EXPECT_LE(result.chunks.size(), service_->config().top_k);
}

TEST_F(QueryServiceTest, ExplicitTargetYearOverridesQuestion) {
  auto question = TestUtilities::create_test_question(
      "rag", "Luật Đất đai 2024 có hiệu lực từ năm nào?", {"2023", "2024"});

  auto result = service_->process_query(question, 2020);

  EXPECT_EQ(result.effective_year, 2020);
  EXPECT_TRUE(contains_id(result, "land_2013"));
  EXPECT_FALSE(contains_id(result, "land_2024"));
}

TEST_F(QueryServiceTest, EmbeddingOutageDegradesButStillAnswers) {
  ON_CALL(*embedder_, embed(_, _, _)).WillByDefault(Return(MockUtilities::embedding_timeout()));
  auto question = TestUtilities::create_test_question(
      "rag", "Tết Nguyên Đán là lễ hội gì?", {"Truyền thống", "Hiện đại"});

  auto result = service_->process_query(question);

  EXPECT_FALSE(result.verdict.is_unsafe);
  EXPECT_TRUE(result.verdict.degraded);
  EXPECT_TRUE(result.semantic_degraded);
  EXPECT_TRUE(result.is_degraded());
  EXPECT_TRUE(contains_id(result, "culture_tet"));
}

TEST_F(QueryServiceTest, Constructor_RejectsMissingDependencies) {
  EXPECT_THROW(QueryService(nullptr, selector_, router_, engine_, QueryServiceConfig{}),
               std::invalid_argument);
  EXPECT_THROW(QueryService(guard_, selector_, router_, nullptr, QueryServiceConfig{}),
               std::invalid_argument);
}

}  // namespace titan_core
