#include "docqa_core/extractors/docx_extractor.hpp"

#ifdef DOCQA_HAVE_OOXML
#include "docqa_core/extractors/ooxml_archive.hpp"
#endif

namespace docqa_core {

bool DocxExtractor::can_handle(const fs::path& file_path) const {
  return has_extension(file_path, {".docx"});
}

bool DocxExtractor::decoder_available() {
#ifdef DOCQA_HAVE_OOXML
  return true;
#else
  return false;
#endif
}

ExtractionResult DocxExtractor::extract_content(const fs::path& file_path) const {
#ifdef DOCQA_HAVE_OOXML
  OoxmlArchive archive(file_path);
  XmlDocument body(archive.read_entry("word/document.xml"), "word/document.xml");

  std::string text;
  for (const auto& paragraph : collect_paragraphs(body.root())) {
    if (!text.empty()) {
      text += "\n\n";
    }
    text += paragraph;
  }
  return ExtractionResult::success(std::move(text));
#else
  (void)file_path;
  return ExtractionResult::failure(ExtractionStatus::DecoderUnavailable,
                                   "built without libzip/libxml2");
#endif
}

}  // namespace docqa_core
