#pragma once

#include <string>

#include "content_extractor.hpp"

namespace docqa_core {

// OCR through tesseract + leptonica.
class ImageExtractor : public ContentExtractor {
 public:
  explicit ImageExtractor(std::string ocr_language = "eng");

  bool can_handle(const fs::path& file_path) const override;
  FileType get_file_type() const override { return FileType::Image; }

  static bool decoder_available();

 protected:
  ExtractionResult extract_content(const fs::path& file_path) const override;

 private:
  std::string ocr_language_;
};

}  // namespace docqa_core
