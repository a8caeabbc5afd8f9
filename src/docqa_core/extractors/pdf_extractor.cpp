#include "docqa_core/extractors/pdf_extractor.hpp"

#include <algorithm>
#include <iostream>
#include <memory>

#ifdef DOCQA_HAVE_POPPLER
#include <poppler-document.h>
#include <poppler-page.h>
#endif

namespace docqa_core {

bool PdfExtractor::can_handle(const fs::path& file_path) const {
  return has_extension(file_path, {".pdf"});
}

bool PdfExtractor::decoder_available() {
#ifdef DOCQA_HAVE_POPPLER
  return true;
#else
  return false;
#endif
}

ExtractionResult PdfExtractor::extract_content(const fs::path& file_path) const {
#ifdef DOCQA_HAVE_POPPLER
  std::unique_ptr<poppler::document> doc(poppler::document::load_from_file(file_path.string()));
  if (!doc) {
    return ExtractionResult::failure(ExtractionStatus::Failed, "poppler could not open the PDF");
  }
  if (doc->is_locked()) {
    return ExtractionResult::failure(ExtractionStatus::Failed, "PDF is encrypted");
  }

  const int page_count = doc->pages();
  const int pages_to_process = std::min(page_count, MAX_PAGES);
  if (page_count > MAX_PAGES) {
    std::cout << "[PdfExtractor] " << file_path.filename() << " has " << page_count
              << " pages, reading the first " << MAX_PAGES << std::endl;
  }

  std::string text;
  for (int i = 0; i < pages_to_process; ++i) {
    std::unique_ptr<poppler::page> page(doc->create_page(i));
    if (!page) {
      continue;
    }
    const poppler::byte_array utf8_page = page->text().to_utf8();
    if (utf8_page.empty()) {
      continue;
    }
    if (!text.empty()) {
      text += "\n\n";
    }
    text.append(utf8_page.data(), utf8_page.size());
  }
  return ExtractionResult::success(std::move(text));
#else
  (void)file_path;
  return ExtractionResult::failure(ExtractionStatus::DecoderUnavailable,
                                   "built without poppler-cpp");
#endif
}

}  // namespace docqa_core
