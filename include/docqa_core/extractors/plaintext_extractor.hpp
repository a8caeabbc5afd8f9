#pragma once

#include "content_extractor.hpp"
#include "text_decoder.hpp"

namespace docqa_core {

// Handles .txt/.text/.log and serves as the fallback for unknown extensions.
class PlainTextExtractor : public ContentExtractor {
 public:
  explicit PlainTextExtractor(TextDecoder decoder = TextDecoder());

  bool can_handle(const fs::path& file_path) const override;
  FileType get_file_type() const override { return FileType::Text; }

 protected:
  ExtractionResult extract_content(const fs::path& file_path) const override;

 private:
  TextDecoder decoder_;
};

}  // namespace docqa_core
