#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "docqa_core/index/vector_index.hpp"
#include "utilities_test.hpp"

namespace docqa_core {

// Index whose next build can be made to fail.
class FailingBuildIndex : public VectorIndex {
 public:
  using VectorIndex::VectorIndex;
  bool fail_next_build = false;

 protected:
  std::unique_ptr<faiss::Index> create_index(const std::vector<float>& flat, size_t n) const override {
    if (fail_next_build) {
      throw VectorIndexError("index construction failed");
    }
    return VectorIndex::create_index(flat, n);
  }
};

class VectorIndexTest : public ::testing::Test {
 protected:
  void SetUp() override {
    index_dir_ = docqa_tests::TestUtilities::create_temp_dir("docqa_index_tests");
  }

  void TearDown() override {
    docqa_tests::TestUtilities::cleanup_temp_dir(index_dir_);
  }

  VectorIndex make_index(IndexType type = IndexType::Flat) {
    VectorIndexOptions options;
    options.dimension = DIMENSION;
    options.type = type;
    options.ivf_nlist = 4;
    options.ivf_nprobe = 4;
    return VectorIndex(options, index_dir_, "test_index");
  }

  static std::vector<std::vector<float>> vectors_for(const std::vector<std::string>& seeds) {
    std::vector<std::vector<float>> vectors;
    for (const auto& seed : seeds) {
      vectors.push_back(docqa_tests::TestUtilities::create_test_vector(seed, DIMENSION));
    }
    return vectors;
  }

  static constexpr size_t DIMENSION = 8;
  std::filesystem::path index_dir_;
};

TEST_F(VectorIndexTest, EmptyIndexReturnsNoHits) {
  VectorIndex index = make_index();
  EXPECT_EQ(index.state(), IndexState::Untrained);
  EXPECT_TRUE(index.search(docqa_tests::TestUtilities::create_test_vector("q", DIMENSION), 5).empty());
}

TEST_F(VectorIndexTest, AddThenSearchFindsExactVectorFirst) {
  VectorIndex index = make_index();
  auto vectors = vectors_for({"leave", "benefits", "payroll"});
  index.add(vectors, {11, 22, 33});

  auto hits = index.search(vectors[1], 3);

  ASSERT_EQ(hits.size(), 3u);
  EXPECT_EQ(hits[0].id, 22);
  EXPECT_NEAR(hits[0].score, 1.0f, 1e-4);
  EXPECT_GE(hits[0].score, hits[1].score);
  EXPECT_GE(hits[1].score, hits[2].score);
  EXPECT_EQ(index.state(), IndexState::Trained);
}

TEST_F(VectorIndexTest, CountAlwaysMatchesIdMapSize) {
  VectorIndex index = make_index();
  index.add(vectors_for({"a", "b"}), {1, 2});
  EXPECT_EQ(index.count(), index.id_map_size());
  index.add(vectors_for({"c"}), {3});
  EXPECT_EQ(index.count(), 3u);
  EXPECT_EQ(index.count(), index.id_map_size());
  index.remove_ids({2});
  EXPECT_EQ(index.count(), 2u);
  EXPECT_EQ(index.count(), index.id_map_size());
}

TEST_F(VectorIndexTest, AddRejectsMismatchedInput) {
  VectorIndex index = make_index();
  EXPECT_THROW(index.add(vectors_for({"a", "b"}), {1}), VectorIndexError);
  EXPECT_THROW(index.add({std::vector<float>(DIMENSION + 1, 0.1f)}, {1}), VectorIndexError);
  EXPECT_THROW(index.search(std::vector<float>(DIMENSION - 1, 0.1f), 1), VectorIndexError);
}

TEST_F(VectorIndexTest, RemoveIdsDropsOnlyThoseEntries) {
  VectorIndex index = make_index();
  auto vectors = vectors_for({"a", "b", "c"});
  index.add(vectors, {1, 2, 3});

  EXPECT_EQ(index.remove_ids({2, 99}), 1u);

  auto hits = index.search(vectors[1], 3);
  ASSERT_EQ(hits.size(), 2u);
  for (const auto& hit : hits) {
    EXPECT_NE(hit.id, 2);
  }
}

TEST_F(VectorIndexTest, SaveAndLoadRestoresIdsAndVectors) {
  auto vectors = vectors_for({"leave", "benefits", "payroll"});
  {
    VectorIndex index = make_index();
    index.add(vectors, {7, 8, 9});
    index.save();
  }
  VectorIndex restored = make_index();
  ASSERT_TRUE(std::filesystem::exists(restored.index_path()));
  ASSERT_TRUE(std::filesystem::exists(restored.id_map_path()));
  ASSERT_TRUE(restored.load());
  EXPECT_EQ(restored.count(), 3u);
  EXPECT_EQ(restored.id_map_size(), 3u);

  auto hits = restored.search(vectors[2], 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].id, 9);

  // Removal rebuilds from the vectors reconstructed at load time.
  EXPECT_EQ(restored.remove_ids({7}), 1u);
  EXPECT_EQ(restored.count(), 2u);
}

TEST_F(VectorIndexTest, FailedRebuildKeepsPreviousIndex) {
  VectorIndexOptions options;
  options.dimension = DIMENSION;
  FailingBuildIndex index(options, index_dir_, "test_index");
  auto vectors = vectors_for({"leave", "benefits", "payroll"});
  index.add(vectors, {1, 2, 3});
  index.save();

  index.fail_next_build = true;
  EXPECT_THROW(index.remove_ids({2}), VectorIndexError);

  EXPECT_EQ(index.state(), IndexState::Trained);
  EXPECT_EQ(index.count(), 3u);
  EXPECT_EQ(index.id_map_size(), 3u);
  auto hits = index.search(vectors[1], 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].id, 2);

  // Saving after the failure keeps the files on disk.
  index.save();
  EXPECT_TRUE(std::filesystem::exists(index.index_path()));
  EXPECT_TRUE(std::filesystem::exists(index.id_map_path()));

  index.fail_next_build = false;
  EXPECT_EQ(index.remove_ids({2}), 1u);
  EXPECT_EQ(index.count(), 2u);
}

TEST_F(VectorIndexTest, FailedFirstBuildLeavesIndexUntrained) {
  VectorIndexOptions options;
  options.dimension = DIMENSION;
  FailingBuildIndex index(options, index_dir_, "test_index");
  index.fail_next_build = true;

  EXPECT_THROW(index.add(vectors_for({"a"}), {1}), VectorIndexError);
  EXPECT_EQ(index.state(), IndexState::Untrained);
  EXPECT_EQ(index.id_map_size(), 0u);
}

TEST_F(VectorIndexTest, LoadWithoutSavedIndexReturnsFalse) {
  VectorIndex index = make_index();
  EXPECT_FALSE(index.load());
}

TEST_F(VectorIndexTest, LoadFailsWhenIdMapIsMissing) {
  {
    VectorIndex index = make_index();
    index.add(vectors_for({"a"}), {1});
    index.save();
  }
  VectorIndex index = make_index();
  std::filesystem::remove(index.id_map_path());
  EXPECT_THROW(index.load(), VectorIndexError);
}

TEST_F(VectorIndexTest, IvfTrainsOnFirstBatchWithClampedNlist) {
  VectorIndex index = make_index(IndexType::Ivf);
  auto vectors = vectors_for({"a", "b"});
  index.add(vectors, {1, 2});

  EXPECT_EQ(index.state(), IndexState::Trained);
  EXPECT_EQ(index.count(), 2u);
  auto hits = index.search(vectors[0], 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].id, 1);
}

TEST_F(VectorIndexTest, IndexTypeNamesRoundTrip) {
  EXPECT_EQ(index_type_from_string("flat"), IndexType::Flat);
  EXPECT_EQ(index_type_from_string(to_string(IndexType::Ivf)), IndexType::Ivf);
  EXPECT_THROW(index_type_from_string("hnsw"), std::invalid_argument);
}

}  // namespace docqa_core
