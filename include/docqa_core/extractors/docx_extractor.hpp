#pragma once

#include "content_extractor.hpp"

namespace docqa_core {

// Word documents: paragraphs of word/document.xml, tables included.
class DocxExtractor : public ContentExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;
  FileType get_file_type() const override { return FileType::Word; }

  static bool decoder_available();

 protected:
  ExtractionResult extract_content(const fs::path& file_path) const override;
};

}  // namespace docqa_core
