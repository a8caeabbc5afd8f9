#pragma once

#include "content_extractor.hpp"

namespace docqa_core {

// PowerPoint decks: one "Slide N:" block per slide in slide order.
class PresentationExtractor : public ContentExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;
  FileType get_file_type() const override { return FileType::Presentation; }

 protected:
  ExtractionResult extract_content(const fs::path& file_path) const override;
};

}  // namespace docqa_core
