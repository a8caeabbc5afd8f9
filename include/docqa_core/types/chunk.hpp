#pragma once

#include <chrono>
#include <string>

namespace docqa_core {

// A persisted chunk. Immutable once written; re-ingestion supersedes it.
struct DocumentChunk {
  long long id = 0;
  std::string title;
  std::string content;
  std::string source_file;
  int chunk_index = 0;
  std::chrono::system_clock::time_point created_at;
};

}  // namespace docqa_core
