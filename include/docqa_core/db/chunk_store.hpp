#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "docqa_core/db/database_manager.hpp"
#include "docqa_core/types/chunk.hpp"

namespace docqa_core {

class ChunkStoreError : public std::exception {
 public:
  explicit ChunkStoreError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct StoredVector {
  long long id;
  std::vector<float> vector;
};

// Durable home of document chunks. Content is zstd-compressed on disk; the
// embedding of each chunk is kept alongside so the vector index can be rebuilt.
class ChunkStore {
 public:
  explicit ChunkStore(DatabaseManager& db_manager);
  virtual ~ChunkStore() = default;

  ChunkStore(const ChunkStore&) = delete;
  ChunkStore& operator=(const ChunkStore&) = delete;
  ChunkStore(ChunkStore&&) = delete;
  ChunkStore& operator=(ChunkStore&&) = delete;

  // Persists one chunk and returns its id. The chunk's id field is ignored.
  virtual long long save_chunk(const DocumentChunk& chunk);

  virtual void attach_embeddings(const std::vector<std::pair<long long, std::vector<float>>>& embeddings);

  virtual std::optional<DocumentChunk> get_chunk(long long id);

  // Missing ids are skipped; order follows the request.
  virtual std::vector<DocumentChunk> get_chunks(const std::vector<long long>& ids);

  std::vector<long long> chunk_ids_for_source(const std::string& source_file);

  // Returns the ids that were removed.
  virtual std::vector<long long> delete_by_source(const std::string& source_file);

  // Every chunk that has an embedding of the given dimension, ordered by id.
  std::vector<StoredVector> load_vectors(size_t dimension);

  size_t count();

 private:
  DatabaseManager& db_manager_;

  static std::string ids_to_comma_string(const std::vector<long long>& ids);
};

}  // namespace docqa_core
