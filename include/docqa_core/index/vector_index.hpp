#pragma once

#include <faiss/Index.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace docqa_core {

class VectorIndexError : public std::exception {
 public:
  explicit VectorIndexError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

enum class IndexType { Flat, Ivf };

std::string to_string(IndexType type);
IndexType index_type_from_string(const std::string& name);

enum class IndexState { Untrained, Trained };

struct VectorIndexOptions {
  size_t dimension = 768;
  IndexType type = IndexType::Flat;
  int ivf_nlist = 100;
  int ivf_nprobe = 10;
};

struct IndexHit {
  long long id;
  float score;  // inner product of normalized vectors
};

// Inner-product faiss index over normalized vectors, with an id map that
// translates index slots to chunk ids. The index is built on the first
// non-empty add (IVF variants train on that batch with nlist clamped to its
// size). A parallel copy of every vector is held in memory so entries can be
// removed by rebuilding.
//
// Writers (add, remove, reset, load) are serialized; searches share a lock
// and see the last committed state.
class VectorIndex {
 public:
  VectorIndex(VectorIndexOptions options, std::filesystem::path directory, std::string name);
  virtual ~VectorIndex() = default;

  VectorIndex(const VectorIndex&) = delete;
  VectorIndex& operator=(const VectorIndex&) = delete;

  // Throws VectorIndexError on size or dimension mismatch.
  void add(const std::vector<std::vector<float>>& vectors, const std::vector<long long>& ids);

  // Best matches first. Empty when nothing has been added.
  std::vector<IndexHit> search(const std::vector<float>& query, int k) const;

  // Drops the given ids and rebuilds (retrains for IVF) from the remaining
  // vectors. If the rebuild throws, the previous index is left untouched.
  size_t remove_ids(const std::vector<long long>& ids);

  void reset();

  void save() const;

  // Returns false when no index has been saved yet. Throws VectorIndexError
  // when the index file exists without an id map or their counts differ.
  bool load();

  size_t count() const;
  size_t id_map_size() const;
  IndexState state() const;
  const VectorIndexOptions& options() const { return options_; }

  std::filesystem::path index_path() const;
  std::filesystem::path id_map_path() const;

 protected:
  // Returns a new index holding no vectors, trained on `flat` (n normalized
  // vectors) when the type needs training.
  virtual std::unique_ptr<faiss::Index> create_index(const std::vector<float>& flat, size_t n) const;

 private:
  // Builds a populated index from `flat`, leaving members alone.
  std::unique_ptr<faiss::Index> build_populated(const std::vector<float>& flat, size_t n) const;
  void check_dimension(const std::vector<float>& vector) const;

  VectorIndexOptions options_;
  std::filesystem::path directory_;
  std::string name_;

  mutable std::shared_mutex mutex_;
  std::unique_ptr<faiss::Index> index_;
  IndexState state_ = IndexState::Untrained;
  std::vector<int64_t> id_map_;
  std::vector<float> raw_vectors_;
};

}  // namespace docqa_core
