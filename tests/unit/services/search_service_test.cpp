#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "docqa_core/db/chunk_store.hpp"
#include "docqa_core/embedding/embedder.hpp"
#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/services/search_service.hpp"
#include "mocks_test.hpp"
#include "utilities_test.hpp"

namespace docqa_tests {

using namespace docqa_core;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class SearchServiceTest : public DatabaseTestBase {
 protected:
  static constexpr size_t DIMENSION = 8;

  void SetUp() override {
    DatabaseTestBase::SetUp();
    index_dir_ = TestUtilities::create_temp_dir("docqa_search_tests");
    chunk_store_ = std::make_unique<ChunkStore>(*db_manager_);
    index_ = std::make_unique<VectorIndex>(VectorIndexOptions{DIMENSION, IndexType::Flat, 100, 10}, index_dir_,
                                           "search_index");
    ollama_ = std::make_unique<NiceMock<MockOllamaClient>>(DIMENSION);
    EmbedderOptions embedder_options;
    embedder_options.dimension = DIMENSION;
    embedder_ = std::make_unique<Embedder>(*ollama_, embedder_options);
    service_ = std::make_unique<SearchService>(*embedder_, *index_, *chunk_store_);
  }

  void TearDown() override {
    service_.reset();
    embedder_.reset();
    ollama_.reset();
    index_.reset();
    chunk_store_.reset();
    TestUtilities::cleanup_temp_dir(index_dir_);
    DatabaseTestBase::TearDown();
  }

  // Stores a chunk, embeds it under `seed` and indexes it.
  long long add_chunk(const std::string& content, const std::string& source_file, const std::string& seed) {
    auto chunk = TestUtilities::create_test_chunk(content, source_file);
    long long id = chunk_store_->save_chunk(chunk);
    auto vector = TestUtilities::create_test_vector(seed, DIMENSION);
    chunk_store_->attach_embeddings({{id, vector}});
    index_->add({vector}, {id});
    return id;
  }

  std::filesystem::path index_dir_;
  std::unique_ptr<ChunkStore> chunk_store_;
  std::unique_ptr<VectorIndex> index_;
  std::unique_ptr<NiceMock<MockOllamaClient>> ollama_;
  std::unique_ptr<Embedder> embedder_;
  std::unique_ptr<SearchService> service_;
};

TEST_F(SearchServiceTest, RankKeepsOnlyCandidatesNearTheBestScore) {
  std::vector<RetrievalResult> candidates = {
      TestUtilities::create_test_result("Employees accrue 20 days of annual leave.", 0.8f, "/docs/leave.txt"),
      TestUtilities::create_test_result("The cafeteria opens at 8am.", 0.3f, "/docs/facilities.txt"),
  };

  auto results = service_->rank(candidates, 5, {});

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].chunk.source_file, "/docs/leave.txt");
  EXPECT_FLOAT_EQ(results[0].score, 0.8f);
}

TEST_F(SearchServiceTest, RankRelaxesToStaticFloorWhenTooFewSurvive) {
  // Threshold is 0.95 * 0.7 = 0.665: only one survives, so the floor (0.45) applies.
  std::vector<RetrievalResult> candidates = {
      TestUtilities::create_test_result("a", 0.95f),
      TestUtilities::create_test_result("b", 0.6f),
      TestUtilities::create_test_result("c", 0.5f),
      TestUtilities::create_test_result("d", 0.2f),
  };

  auto results = service_->rank(candidates, 5, {});

  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0].chunk.content, "a");
  EXPECT_EQ(results[2].chunk.content, "c");
}

TEST_F(SearchServiceTest, RaisingBestScoreNeverAddsAdaptiveSurvivors) {
  const std::vector<float> others = {0.6f, 0.57f, 0.5f, 0.46f, 0.3f};
  size_t previous = std::numeric_limits<size_t>::max();

  for (float best = 0.62f; best <= 1.0f; best += 0.02f) {
    std::vector<RetrievalResult> candidates = {TestUtilities::create_test_result("best", best)};
    for (float score : others) {
      candidates.push_back(TestUtilities::create_test_result("other", score));
    }

    const size_t survivors = service_->adaptive_filter(candidates).size();
    EXPECT_LE(survivors, previous) << "best score " << best;
    EXPECT_GE(survivors, 1u);
    previous = survivors;
  }
  // At 1.0 the cut is 0.7, so only the best candidate is left.
  EXPECT_EQ(previous, 1u);
}

TEST_F(SearchServiceTest, RankIsSortedAndTruncatedToTopK) {
  std::vector<RetrievalResult> candidates = {
      TestUtilities::create_test_result("low", 0.7f),
      TestUtilities::create_test_result("high", 0.9f),
      TestUtilities::create_test_result("mid", 0.8f),
  };

  auto results = service_->rank(candidates, 2, {});

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].chunk.content, "high");
  EXPECT_EQ(results[1].chunk.content, "mid");
}

TEST_F(SearchServiceTest, RankBoostsPrioritizedFilesCappedAtOne) {
  std::vector<RetrievalResult> candidates = {
      TestUtilities::create_test_result("general", 0.9f, "/docs/handbook.txt"),
      TestUtilities::create_test_result("attached", 0.85f, "/uploads/my_contract.pdf"),
  };

  auto results = service_->rank(candidates, 5, {"my_contract.pdf"});

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].chunk.content, "attached");
  EXPECT_TRUE(results[0].prioritized);
  EXPECT_LE(results[0].score, 1.0f);
  EXPECT_FALSE(results[1].prioritized);
}

TEST_F(SearchServiceTest, RankOfNothingIsEmpty) {
  EXPECT_TRUE(service_->rank({}, 5, {}).empty());
  EXPECT_TRUE(service_->rank({TestUtilities::create_test_result("a", 0.9f)}, 0, {}).empty());
}

TEST_F(SearchServiceTest, SearchOnEmptyIndexReturnsNothing) {
  EXPECT_TRUE(service_->search("How many vacation days do I get?", 5).empty());
}

TEST_F(SearchServiceTest, SearchReturnsStoredChunkForMatchingQuery) {
  long long leave_id = add_chunk("Employees accrue 20 days of annual leave.", "/docs/leave.txt", "leave");
  add_chunk("Parking permits are issued by facilities.", "/docs/parking.txt", "parking");

  EXPECT_CALL(*ollama_, get_embedding(_))
      .WillOnce(Return(TestUtilities::create_test_vector("leave", DIMENSION)));

  auto results = service_->search("How many vacation days do I get?", 3);

  ASSERT_FALSE(results.empty());
  EXPECT_EQ(results[0].chunk.id, leave_id);
  EXPECT_EQ(results[0].chunk.content, "Employees accrue 20 days of annual leave.");
  EXPECT_NEAR(results[0].score, 1.0f, 1e-4);
}

TEST_F(SearchServiceTest, SearchSkipsIndexEntriesWithoutStoredChunk) {
  long long id = add_chunk("Employees accrue 20 days of annual leave.", "/docs/leave.txt", "leave");
  chunk_store_->delete_by_source("/docs/leave.txt");

  EXPECT_CALL(*ollama_, get_embedding(_))
      .WillOnce(Return(TestUtilities::create_test_vector("leave", DIMENSION)));

  auto results = service_->search("leave", 3);
  for (const auto& result : results) {
    EXPECT_NE(result.chunk.id, id);
  }
}

}  // namespace docqa_tests
