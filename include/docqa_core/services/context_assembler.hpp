#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include "docqa_core/embedding/tokenizer.hpp"
#include "docqa_core/services/search_service.hpp"
#include "docqa_core/types/conversation.hpp"
#include "docqa_core/types/retrieval.hpp"

namespace docqa_core {

// Ordered: the first topic whose keyword occurs in the query wins.
using PolicyKeywords = std::vector<std::pair<std::string, std::vector<std::string>>>;

PolicyKeywords default_policy_keywords();

struct ContextOptions {
  size_t min_viable_chars = 300;
  PolicyKeywords policy_keywords = default_policy_keywords();
  int retry_attempts = 3;
  std::chrono::milliseconds retry_delay{1000};
};

// Turns a query into a bounded evidence string. The budget is
// max_tokens * chars-per-token of the configured tokenizer, separators
// included. Chunks are packed by score; the first one that does not fit is
// cut at a sentence or word boundary when at least min_viable_chars remain,
// otherwise dropped.
class ContextAssembler {
 public:
  static constexpr const char* SEPARATOR = "\n\n---\n\n";

  ContextAssembler(SearchService& search, const Tokenizer& tokenizer,
                   ContextOptions options = ContextOptions());

  ContextAssembler(const ContextAssembler&) = delete;
  ContextAssembler& operator=(const ContextAssembler&) = delete;

  // Never throws; retrieval that keeps failing yields an empty bundle.
  ContextBundle build(const std::string& query, int max_tokens,
                      const std::vector<AttachedFile>& files = {}) const;

  // "leave policy: <query>" when a policy keyword occurs, else the query.
  std::string rewrite_query(const std::string& query) const;

  size_t char_budget(int max_tokens) const;

  // min(10, max(3, max_tokens / 300))
  static int top_k_for(int max_tokens);

  // Index just past the last '.' (or else ' ') before limit; limit if neither.
  static size_t sentence_cutoff(const std::string& text, size_t limit);

  // Context followed by a numbered "Sources:" list; empty for an empty bundle.
  static std::string format_with_sources(const ContextBundle& bundle);

 private:
  SearchService& search_;
  const Tokenizer& tokenizer_;
  ContextOptions options_;
};

}  // namespace docqa_core
