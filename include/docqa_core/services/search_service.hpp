#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "docqa_core/db/chunk_store.hpp"
#include "docqa_core/embedding/embedder.hpp"
#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/types/retrieval.hpp"

namespace docqa_core {

struct RetrieverOptions {
  float similarity_threshold = 0.45f;  // static floor
  int max_candidates = 20;
  float relative_cutoff = 0.7f;  // fraction of the best score
  float priority_boost = 1.2f;
};

// Query -> ranked chunks. Over-fetches min(2 * top_k, max_candidates)
// candidates, keeps those above max(floor, best * relative_cutoff) (relaxing
// to the floor alone when fewer than two survive out of more than two),
// boosts chunks from prioritized files and truncates to top_k.
class SearchService {
 public:
  SearchService(Embedder& embedder, VectorIndex& index, ChunkStore& chunk_store,
                RetrieverOptions options = RetrieverOptions());
  virtual ~SearchService() = default;

  SearchService(const SearchService&) = delete;
  SearchService& operator=(const SearchService&) = delete;

  // prioritize_files entries match any source path that contains them.
  // Index and store failures propagate.
  virtual std::vector<RetrievalResult> search(const std::string& query, int top_k,
                                              const std::vector<std::string>& prioritize_files = {});

  // Candidates scoring above max(floor, best * relative_cutoff). Raising the
  // best score never lets more candidates through.
  std::vector<RetrievalResult> adaptive_filter(const std::vector<RetrievalResult>& candidates) const;

  // Filtering and boosting on already-scored candidates.
  std::vector<RetrievalResult> rank(std::vector<RetrievalResult> candidates, int top_k,
                                    const std::vector<std::string>& prioritize_files) const;

  const RetrieverOptions& options() const { return options_; }

 private:
  Embedder& embedder_;
  VectorIndex& index_;
  ChunkStore& chunk_store_;
  RetrieverOptions options_;
};

}  // namespace docqa_core
