#pragma once

#include <string>

#include "content_extractor.hpp"
#include "text_decoder.hpp"

namespace docqa_core {

class MarkdownExtractor : public ContentExtractor {
 public:
  explicit MarkdownExtractor(TextDecoder decoder = TextDecoder());

  bool can_handle(const fs::path& file_path) const override;
  FileType get_file_type() const override { return FileType::Markdown; }

  // Drops front matter, comments, fence markers and inline markup while
  // keeping headings and paragraph breaks.
  static std::string strip_markup(const std::string& markdown);

 protected:
  ExtractionResult extract_content(const fs::path& file_path) const override;

 private:
  TextDecoder decoder_;
};

}  // namespace docqa_core
