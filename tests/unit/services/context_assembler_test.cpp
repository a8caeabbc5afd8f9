#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "docqa_core/db/chunk_store.hpp"
#include "docqa_core/embedding/embedder.hpp"
#include "docqa_core/embedding/tokenizer.hpp"
#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/services/context_assembler.hpp"
#include "mocks_test.hpp"
#include "utilities_test.hpp"

namespace docqa_tests {

using namespace docqa_core;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StartsWith;
using ::testing::Throw;

class ContextAssemblerTest : public DatabaseTestBase {
 protected:
  void SetUp() override {
    DatabaseTestBase::SetUp();
    index_dir_ = TestUtilities::create_temp_dir("docqa_context_tests");
    chunk_store_ = std::make_unique<ChunkStore>(*db_manager_);
    index_ = std::make_unique<VectorIndex>(VectorIndexOptions{8, IndexType::Flat, 100, 10}, index_dir_, "ctx");
    ollama_ = std::make_unique<NiceMock<MockOllamaClient>>(8);
    embedder_ = std::make_unique<Embedder>(*ollama_, EmbedderOptions{8, "docqa", std::chrono::seconds(60)});
    search_ = std::make_unique<NiceMock<MockSearchService>>(*embedder_, *index_, *chunk_store_);

    ContextOptions options;
    options.retry_attempts = 2;
    options.retry_delay = std::chrono::milliseconds(0);
    assembler_ = std::make_unique<ContextAssembler>(*search_, tokenizer_, options);
  }

  void TearDown() override {
    assembler_.reset();
    search_.reset();
    embedder_.reset();
    ollama_.reset();
    index_.reset();
    chunk_store_.reset();
    TestUtilities::cleanup_temp_dir(index_dir_);
    DatabaseTestBase::TearDown();
  }

  std::filesystem::path index_dir_;
  WhitespaceTokenizer tokenizer_;
  std::unique_ptr<ChunkStore> chunk_store_;
  std::unique_ptr<VectorIndex> index_;
  std::unique_ptr<NiceMock<MockOllamaClient>> ollama_;
  std::unique_ptr<Embedder> embedder_;
  std::unique_ptr<NiceMock<MockSearchService>> search_;
  std::unique_ptr<ContextAssembler> assembler_;
};

TEST_F(ContextAssemblerTest, TopKScalesWithTokenBudget) {
  EXPECT_EQ(ContextAssembler::top_k_for(100), 3);
  EXPECT_EQ(ContextAssembler::top_k_for(1500), 5);
  EXPECT_EQ(ContextAssembler::top_k_for(10000), 10);
}

TEST_F(ContextAssemblerTest, CharBudgetUsesTokenizerEstimate) {
  // The sample sentence is 51 characters in 9 whitespace tokens.
  EXPECT_EQ(estimate_chars_per_token(tokenizer_), 5);
  EXPECT_EQ(assembler_->char_budget(100), 500u);
  EXPECT_EQ(assembler_->char_budget(0), 0u);
}

TEST_F(ContextAssemblerTest, RewriteQueryPrefixesFirstMatchingPolicy) {
  EXPECT_EQ(assembler_->rewrite_query("How many vacation days do I get?"),
            "leave policy: How many vacation days do I get?");
  EXPECT_EQ(assembler_->rewrite_query("Is severance paid after a layoff during sick leave?"),
            "termination policy: Is severance paid after a layoff during sick leave?");
  EXPECT_EQ(assembler_->rewrite_query("Can I work from home on Fridays?"),
            "work from home policy: Can I work from home on Fridays?");
  EXPECT_EQ(assembler_->rewrite_query("Where is the cafeteria?"), "Where is the cafeteria?");
}

TEST_F(ContextAssemblerTest, BuildSendsRewrittenQueryAndAttachmentNames) {
  EXPECT_CALL(*search_, search("leave policy: How much vacation do I have?", 3,
                               ElementsAre("contract.pdf", "/tmp/notes.txt")))
      .WillOnce(Return(std::vector<RetrievalResult>{}));

  auto bundle = assembler_->build("How much vacation do I have?", 100,
                                  {{"contract.pdf", "/uploads/contract.pdf"}, {"", "/tmp/notes.txt"}});
  EXPECT_TRUE(bundle.empty());
}

TEST_F(ContextAssemblerTest, BuildPacksChunksWithinBudget) {
  const std::string a = TestUtilities::create_text_of_size(200, "x");
  const std::string b = TestUtilities::create_text_of_size(200, "y");
  const std::string c = TestUtilities::create_text_of_size(400, "z");
  EXPECT_CALL(*search_, search(_, _, _))
      .WillOnce(Return(std::vector<RetrievalResult>{
          TestUtilities::create_test_result(c, 0.7f, "/docs/c.txt", "C - Part 1"),
          TestUtilities::create_test_result(a, 0.9f, "/docs/a.txt", "A - Part 1"),
          TestUtilities::create_test_result(b, 0.8f, "/docs/b.txt", "B - Part 1"),
      }));

  auto bundle = assembler_->build("question", 100);

  // Budget is 500 characters: a and b fit, the 86 characters left for c are not viable.
  EXPECT_EQ(bundle.context, a + ContextAssembler::SEPARATOR + b);
  EXPECT_LE(bundle.context.size(), 500u);
  ASSERT_EQ(bundle.sources.size(), 2u);
  EXPECT_EQ(bundle.sources[0].title, "A - Part 1");
  EXPECT_EQ(bundle.sources[1].title, "B - Part 1");
}

TEST_F(ContextAssemblerTest, BuildTruncatesOverflowAtSentenceBoundary) {
  const std::string first = TestUtilities::create_text_of_size(500, "w");
  const std::string second = TestUtilities::create_text_of_size(800, "This is a sentence about leave. ");
  EXPECT_CALL(*search_, search(_, _, _))
      .WillOnce(Return(std::vector<RetrievalResult>{
          TestUtilities::create_test_result(first, 0.9f, "/docs/a.txt", "A - Part 1"),
          TestUtilities::create_test_result(second, 0.8f, "/docs/b.txt", "B - Part 1"),
      }));

  auto bundle = assembler_->build("question", 200);

  EXPECT_LE(bundle.context.size(), 1000u);
  EXPECT_GT(bundle.context.size(), 507u);
  EXPECT_EQ(bundle.context.back(), '.');
  EXPECT_EQ(bundle.sources.size(), 2u);
}

TEST_F(ContextAssemblerTest, DuplicateSourcesAreListedOnce) {
  EXPECT_CALL(*search_, search(_, _, _))
      .WillOnce(Return(std::vector<RetrievalResult>{
          TestUtilities::create_test_result("First fact.", 0.9f, "/docs/a.txt", "A - Part 1"),
          TestUtilities::create_test_result("Second fact.", 0.8f, "/docs/a.txt", "A - Part 1"),
      }));

  auto bundle = assembler_->build("question", 1500);

  EXPECT_THAT(bundle.context, HasSubstr("First fact."));
  EXPECT_THAT(bundle.context, HasSubstr("Second fact."));
  ASSERT_EQ(bundle.sources.size(), 1u);
  EXPECT_FLOAT_EQ(bundle.sources[0].score, 0.9f);
}

TEST_F(ContextAssemblerTest, RetrievalFailureAfterRetriesYieldsEmptyBundle) {
  EXPECT_CALL(*search_, search(_, _, _))
      .Times(2)
      .WillRepeatedly(Throw(std::runtime_error("index unavailable")));

  ContextBundle bundle;
  EXPECT_NO_THROW(bundle = assembler_->build("question", 1500));
  EXPECT_TRUE(bundle.empty());
  EXPECT_TRUE(bundle.sources.empty());
}

TEST_F(ContextAssemblerTest, RetrievalRecoversOnSecondAttempt) {
  EXPECT_CALL(*search_, search(_, _, _))
      .WillOnce(Throw(std::runtime_error("busy")))
      .WillOnce(Return(std::vector<RetrievalResult>{TestUtilities::create_test_result("Fact.", 0.9f)}));

  auto bundle = assembler_->build("question", 1500);
  EXPECT_EQ(bundle.context, "Fact.");
}

TEST_F(ContextAssemblerTest, SentenceCutoffPrefersPeriodThenSpace) {
  EXPECT_EQ(ContextAssembler::sentence_cutoff("One. Two three four", 12), 4u);
  EXPECT_EQ(ContextAssembler::sentence_cutoff("one two three", 9), 8u);
  EXPECT_EQ(ContextAssembler::sentence_cutoff("abcdefgh", 4), 4u);
}

TEST_F(ContextAssemblerTest, FormatWithSourcesNumbersSources) {
  ContextBundle bundle;
  bundle.context = "Employees accrue 20 days of leave.";
  bundle.sources = {{"Leave Policy - Part 1", "/docs/leave.txt", 0.87f},
                    {"Handbook - Part 3", "/docs/handbook.txt", 0.5f}};

  const std::string formatted = ContextAssembler::format_with_sources(bundle);

  EXPECT_THAT(formatted, StartsWith("Employees accrue 20 days of leave.\n\nSources:\n"));
  EXPECT_THAT(formatted, HasSubstr("1. Leave Policy - Part 1 (Relevance: 0.87)"));
  EXPECT_THAT(formatted, HasSubstr("2. Handbook - Part 3 (Relevance: 0.50)"));
  EXPECT_EQ(ContextAssembler::format_with_sources(ContextBundle{}), "");
}

}  // namespace docqa_tests
