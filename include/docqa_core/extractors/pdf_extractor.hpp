#pragma once

#include "content_extractor.hpp"

namespace docqa_core {

// Page text via poppler-cpp; reports DecoderUnavailable when built without it.
class PdfExtractor : public ContentExtractor {
 public:
  static constexpr int MAX_PAGES = 2000;

  bool can_handle(const fs::path& file_path) const override;
  FileType get_file_type() const override { return FileType::PDF; }

  static bool decoder_available();

 protected:
  ExtractionResult extract_content(const fs::path& file_path) const override;
};

}  // namespace docqa_core
