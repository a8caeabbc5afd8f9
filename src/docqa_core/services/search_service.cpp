#include "docqa_core/services/search_service.hpp"

#include <algorithm>
#include <iostream>
#include <unordered_map>

namespace docqa_core {

SearchService::SearchService(Embedder& embedder, VectorIndex& index, ChunkStore& chunk_store,
                             RetrieverOptions options)
    : embedder_(embedder), index_(index), chunk_store_(chunk_store), options_(options) {}

namespace {

std::vector<RetrievalResult> scoring_above(const std::vector<RetrievalResult>& candidates, float cutoff) {
  std::vector<RetrievalResult> kept;
  for (const auto& candidate : candidates) {
    if (candidate.score > cutoff) kept.push_back(candidate);
  }
  return kept;
}

}  // namespace

std::vector<RetrievalResult> SearchService::adaptive_filter(const std::vector<RetrievalResult>& candidates) const {
  if (candidates.empty()) {
    return {};
  }
  float best = candidates.front().score;
  for (const auto& candidate : candidates) {
    best = std::max(best, candidate.score);
  }
  return scoring_above(candidates, std::max(options_.similarity_threshold, best * options_.relative_cutoff));
}

std::vector<RetrievalResult> SearchService::rank(std::vector<RetrievalResult> candidates, int top_k,
                                                 const std::vector<std::string>& prioritize_files) const {
  if (candidates.empty() || top_k <= 0) {
    return {};
  }

  std::vector<RetrievalResult> results = adaptive_filter(candidates);
  if (results.size() < 2 && candidates.size() > 2) {
    results = scoring_above(candidates, options_.similarity_threshold);
  }

  if (!prioritize_files.empty()) {
    for (auto& result : results) {
      const bool match = std::any_of(prioritize_files.begin(), prioritize_files.end(),
                                     [&result](const std::string& file) {
                                       return !file.empty() &&
                                              result.chunk.source_file.find(file) != std::string::npos;
                                     });
      result.prioritized = match;
      if (match) {
        result.score = std::min(1.0f, result.score * options_.priority_boost);
      }
    }
  }

  std::stable_sort(results.begin(), results.end(),
                   [](const RetrievalResult& a, const RetrievalResult& b) { return a.score > b.score; });
  if (results.size() > static_cast<size_t>(top_k)) {
    results.resize(static_cast<size_t>(top_k));
  }
  return results;
}

std::vector<RetrievalResult> SearchService::search(const std::string& query, int top_k,
                                                   const std::vector<std::string>& prioritize_files) {
  if (top_k <= 0) {
    return {};
  }
  const std::vector<float> query_vector = embedder_.embed_query(query);
  const int fetch = std::min(top_k * 2, options_.max_candidates);
  const auto hits = index_.search(query_vector, fetch);
  if (hits.empty()) {
    return {};
  }

  std::vector<long long> ids;
  ids.reserve(hits.size());
  for (const auto& hit : hits) {
    ids.push_back(hit.id);
  }
  std::unordered_map<long long, DocumentChunk> chunks;
  for (auto& chunk : chunk_store_.get_chunks(ids)) {
    chunks.emplace(chunk.id, std::move(chunk));
  }

  std::vector<RetrievalResult> candidates;
  candidates.reserve(hits.size());
  for (const auto& hit : hits) {
    auto it = chunks.find(hit.id);
    if (it == chunks.end()) {
      std::cerr << "[SearchService] Warning: index returned id " << hit.id
                << " but no corresponding chunk was found" << std::endl;
      continue;
    }
    candidates.push_back({it->second, hit.score, false});
  }

  auto results = rank(std::move(candidates), top_k, prioritize_files);
  std::cout << "[SearchService] Found " << results.size() << " relevant chunks (from " << hits.size()
            << " candidates)" << std::endl;
  return results;
}

}  // namespace docqa_core
