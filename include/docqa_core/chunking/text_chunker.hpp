#pragma once

#include <string>
#include <vector>

#include "docqa_core/types/chunk.hpp"

namespace docqa_core {

struct ChunkingOptions {
  int chunk_size = 1200;
  int chunk_overlap = 300;
  bool include_overlap_in_chunk = true;
};

// Paragraph-aware splitter. Sizes are measured in Unicode code points, so
// multi-byte characters are never cut in half.
//
// Paragraphs (separated by blank lines) are whitespace-collapsed and packed
// greedily up to chunk_size. A paragraph longer than chunk_size is cut into
// chunk_size pieces at a stride of chunk_size - chunk_overlap. Every chunk
// after the first is then prefixed with the last chunk_overlap code points of
// its predecessor.
class TextChunker {
 public:
  // Throws std::invalid_argument unless 0 <= chunk_overlap < chunk_size.
  explicit TextChunker(ChunkingOptions options = ChunkingOptions());

  std::vector<std::string> chunk(const std::string& text) const;

  // Chunks titled "<title> - Part <n>" with 0-based chunk_index; ids unset.
  std::vector<DocumentChunk> chunk_document(const std::string& title,
                                            const std::string& source_file,
                                            const std::string& text) const;

  const ChunkingOptions& options() const { return options_; }

 private:
  ChunkingOptions options_;
};

}  // namespace docqa_core
