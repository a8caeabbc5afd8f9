#pragma once

#include <string>
#include <vector>

#include "docqa_core/types/chunk.hpp"

namespace docqa_core {

struct RetrievalResult {
  DocumentChunk chunk;
  float score = 0.0f;
  bool prioritized = false;
};

struct SourceRef {
  std::string title;
  std::string source_file;
  float score = 0.0f;
};

struct ContextBundle {
  std::string context;
  std::vector<SourceRef> sources;

  bool empty() const { return context.empty(); }
};

}  // namespace docqa_core
