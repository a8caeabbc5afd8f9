#include "docqa_core/extractors/presentation_extractor.hpp"

#ifdef DOCQA_HAVE_OOXML
#include "docqa_core/extractors/ooxml_archive.hpp"
#endif

namespace docqa_core {

bool PresentationExtractor::can_handle(const fs::path& file_path) const {
  return has_extension(file_path, {".pptx"});
}

ExtractionResult PresentationExtractor::extract_content(const fs::path& file_path) const {
#ifdef DOCQA_HAVE_OOXML
  OoxmlArchive archive(file_path);
  const auto slides = archive.numbered_entries("ppt/slides/slide", ".xml");

  std::string text;
  int slide_number = 0;
  for (const auto& slide_name : slides) {
    ++slide_number;
    XmlDocument slide(archive.read_entry(slide_name), slide_name);
    const auto paragraphs = collect_paragraphs(slide.root());
    if (paragraphs.empty()) {
      continue;
    }
    if (!text.empty()) {
      text += "\n\n";
    }
    text += "Slide " + std::to_string(slide_number) + ":";
    for (const auto& paragraph : paragraphs) {
      text += "\n" + paragraph;
    }
  }
  return ExtractionResult::success(std::move(text));
#else
  (void)file_path;
  return ExtractionResult::failure(ExtractionStatus::DecoderUnavailable,
                                   "built without libzip/libxml2");
#endif
}

}  // namespace docqa_core
