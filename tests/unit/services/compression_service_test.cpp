#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "docqa_core/services/compression_service.hpp"
#include "utilities_test.hpp"

namespace docqa_core {

class CompressionServiceTest : public ::testing::Test {};

TEST_F(CompressionServiceTest, ChunkTextSurvivesCompression) {
  const std::string text =
      docqa_tests::TestUtilities::create_text_of_size(4000, "Employees accrue 1.5 days of leave per month. ");

  std::vector<char> compressed = CompressionService::compress(text);

  EXPECT_LT(compressed.size(), text.size());
  EXPECT_EQ(CompressionService::decompress(compressed), text);
}

TEST_F(CompressionServiceTest, MultiByteTextIsPreservedByteForByte) {
  const std::string text = "Política de vacaciones: 22 días hábiles. Urlaubsanspruch: 30 Tage. 休暇";
  EXPECT_EQ(CompressionService::decompress(CompressionService::compress(text, 19)), text);
}

TEST_F(CompressionServiceTest, EmptyInputYieldsEmptyBuffer) {
  EXPECT_TRUE(CompressionService::compress("").empty());
  EXPECT_EQ(CompressionService::decompress({}), "");
}

TEST_F(CompressionServiceTest, GarbageInputThrows) {
  std::vector<char> garbage = {'n', 'o', 't', ' ', 'z', 's', 't', 'd'};
  EXPECT_THROW(CompressionService::decompress(garbage), CompressionError);
}

TEST_F(CompressionServiceTest, TruncatedFrameThrows) {
  std::vector<char> compressed = CompressionService::compress(
      docqa_tests::TestUtilities::create_text_of_size(2000, "leave policy "));
  compressed.resize(compressed.size() / 2);
  EXPECT_THROW(CompressionService::decompress(compressed), CompressionError);
}

}  // namespace docqa_core
