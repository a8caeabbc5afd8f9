#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "docqa_core/embedding/embedder.hpp"
#include "docqa_core/embedding/tokenizer.hpp"
#include "mocks_test.hpp"
#include "utilities_test.hpp"

namespace docqa_tests {

using namespace docqa_core;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StrictMock;
using ::testing::Throw;

namespace {

double norm_of(const std::vector<float>& vector) {
  double sum = 0.0;
  for (float v : vector) sum += static_cast<double>(v) * v;
  return std::sqrt(sum);
}

EmbedderOptions options_with_dimension(size_t dimension) {
  EmbedderOptions options;
  options.dimension = dimension;
  return options;
}

}  // namespace

class EmbedderTest : public ::testing::Test {
 protected:
  StrictMock<MockOllamaClient> ollama_{4};
};

TEST_F(EmbedderTest, EmbedNormalizesEveryVector) {
  EXPECT_CALL(ollama_, get_embeddings(_))
      .WillOnce(Return(std::vector<std::vector<float>>{{3.0f, 4.0f, 0.0f, 0.0f}, {1.0f, 1.0f, 1.0f, 1.0f}}));
  Embedder embedder(ollama_, options_with_dimension(4));

  auto vectors = embedder.embed({"first", "second"});

  ASSERT_EQ(vectors.size(), 2u);
  EXPECT_NEAR(vectors[0][0], 0.6f, 1e-6);
  EXPECT_NEAR(vectors[0][1], 0.8f, 1e-6);
  EXPECT_NEAR(norm_of(vectors[1]), 1.0, 1e-6);
}

TEST_F(EmbedderTest, EmbedRejectsWrongDimension) {
  EXPECT_CALL(ollama_, get_embeddings(_))
      .WillOnce(Return(std::vector<std::vector<float>>{{1.0f, 2.0f, 3.0f}}));
  Embedder embedder(ollama_, options_with_dimension(4));

  try {
    embedder.embed({"text"});
    FAIL() << "Expected EmbeddingDimensionMismatch";
  } catch (const EmbeddingDimensionMismatch& e) {
    EXPECT_EQ(e.expected(), 4u);
    EXPECT_EQ(e.actual(), 3u);
  }
}

TEST_F(EmbedderTest, EmbedWrapsModelFailure) {
  EXPECT_CALL(ollama_, get_embeddings(_)).WillOnce(Throw(OllamaError("connection refused")));
  Embedder embedder(ollama_, options_with_dimension(4));
  EXPECT_THROW(embedder.embed({"text"}), EmbedderError);
}

TEST_F(EmbedderTest, EmbedSplitsIntoBatches) {
  // 40 short texts: batches of 32 and 8.
  std::vector<std::string> texts(40, "short text");
  EXPECT_CALL(ollama_, get_embeddings(_))
      .Times(2)
      .WillRepeatedly([](const std::vector<std::string>& batch) {
        return std::vector<std::vector<float>>(batch.size(), std::vector<float>{1.0f, 0.0f, 0.0f, 0.0f});
      });
  Embedder embedder(ollama_, options_with_dimension(4));

  EXPECT_EQ(embedder.embed(texts).size(), 40u);
}

TEST_F(EmbedderTest, BatchSizeDependsOnAverageLength) {
  EXPECT_EQ(Embedder::batch_size_for({std::string(100, 'a')}), 32u);
  EXPECT_EQ(Embedder::batch_size_for({std::string(700, 'a')}), 16u);
  EXPECT_EQ(Embedder::batch_size_for({std::string(1500, 'a')}), 8u);
}

TEST_F(EmbedderTest, EmbedQueryFailureYieldsZeroVector) {
  EXPECT_CALL(ollama_, get_embedding(_)).WillOnce(Throw(OllamaError("timeout")));
  Embedder embedder(ollama_, options_with_dimension(4));

  auto vector = embedder.embed_query("How many vacation days?");
  EXPECT_EQ(vector, std::vector<float>(4, 0.0f));
}

TEST_F(EmbedderTest, EmbedQueryWrongDimensionYieldsZeroVector) {
  EXPECT_CALL(ollama_, get_embedding(_)).WillOnce(Return(std::vector<float>{1.0f, 2.0f}));
  Embedder embedder(ollama_, options_with_dimension(4));

  EXPECT_EQ(embedder.embed_query("q"), std::vector<float>(4, 0.0f));
}

TEST_F(EmbedderTest, EmbedQueryIsServedFromCacheOnSecondCall) {
  FakeKeyValueCache cache;
  EXPECT_CALL(ollama_, get_embedding(_)).WillOnce(Return(std::vector<float>{0.0f, 2.0f, 0.0f, 0.0f}));
  Embedder embedder(ollama_, options_with_dimension(4), &cache);

  auto first = embedder.embed_query("How many vacation days?");
  auto second = embedder.embed_query("  how many VACATION days?");

  EXPECT_EQ(first, second);
  EXPECT_NEAR(first[1], 1.0f, 1e-6);
  EXPECT_EQ(cache.size(), 1u);
  EXPECT_EQ(cache.ttl_of(make_cache_key("docqa", CacheKind::Embedding, "how many vacation days?")),
            std::chrono::seconds(86400));
}

TEST_F(EmbedderTest, CacheFailuresDoNotBreakQueries) {
  NiceMock<MockKeyValueCache> cache;
  ON_CALL(cache, get(_)).WillByDefault(Throw(CacheError("database is locked")));
  ON_CALL(cache, set(_, _, _)).WillByDefault(Throw(CacheError("database is locked")));
  EXPECT_CALL(ollama_, get_embedding(_)).WillOnce(Return(std::vector<float>{1.0f, 0.0f, 0.0f, 0.0f}));
  Embedder embedder(ollama_, options_with_dimension(4), &cache);

  EXPECT_EQ(embedder.embed_query("q"), (std::vector<float>{1.0f, 0.0f, 0.0f, 0.0f}));
}

TEST(TokenizerTest, WhitespaceTokenizerSplitsOnWhitespace) {
  WhitespaceTokenizer tokenizer;
  EXPECT_EQ(tokenizer.tokenize("  How many\tvacation\ndays? "),
            (std::vector<std::string>{"How", "many", "vacation", "days?"}));
  EXPECT_TRUE(tokenizer.tokenize("   ").empty());
}

TEST(TokenizerTest, EstimateFallsBackWhenTokenizerReturnsNothing) {
  class SilentTokenizer : public Tokenizer {
   public:
    std::vector<std::string> tokenize(const std::string&) const override { return {}; }
  };
  EXPECT_EQ(estimate_chars_per_token(SilentTokenizer()), 4);
}

}  // namespace docqa_tests
