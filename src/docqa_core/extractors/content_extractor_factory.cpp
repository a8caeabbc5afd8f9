#include "docqa_core/extractors/content_extractor_factory.hpp"

#include <iostream>

#include "docqa_core/extractors/docx_extractor.hpp"
#include "docqa_core/extractors/email_extractor.hpp"
#include "docqa_core/extractors/image_extractor.hpp"
#include "docqa_core/extractors/markdown_extractor.hpp"
#include "docqa_core/extractors/pdf_extractor.hpp"
#include "docqa_core/extractors/plaintext_extractor.hpp"
#include "docqa_core/extractors/presentation_extractor.hpp"
#include "docqa_core/extractors/spreadsheet_extractor.hpp"
#include "docqa_core/types/file.hpp"

namespace docqa_core {

ContentExtractorFactory::ContentExtractorFactory(ExtractorOptions options)
    : options_(std::move(options)) {
  TextDecoder decoder(options_.text_encodings);
  extractors_.push_back(std::make_unique<MarkdownExtractor>(decoder));
  extractors_.push_back(std::make_unique<PdfExtractor>());
  extractors_.push_back(std::make_unique<DocxExtractor>());
  extractors_.push_back(std::make_unique<SpreadsheetExtractor>(decoder));
  extractors_.push_back(std::make_unique<PresentationExtractor>());
  extractors_.push_back(std::make_unique<ImageExtractor>(options_.ocr_language));
  extractors_.push_back(std::make_unique<EmailExtractor>(decoder));
  extractors_.push_back(std::make_unique<PlainTextExtractor>(decoder));
  fallback_ = std::make_unique<PlainTextExtractor>(decoder);
}

const ContentExtractor& ContentExtractorFactory::get_extractor_for(
    const std::filesystem::path& file_path) const {
  for (const auto& extractor : extractors_) {
    if (extractor->can_handle(file_path)) {
      return *extractor;
    }
  }
  return *fallback_;
}

ExtractionResult ContentExtractorFactory::extract(const std::filesystem::path& file_path) const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file_path, ec)) {
    std::cerr << "[ContentExtractorFactory] File not found: " << file_path << std::endl;
    ExtractionResult result = ExtractionResult::failure(ExtractionStatus::NotFound, "file not found");
    result.file_name = file_path.string();
    result.file_type = file_type_for_path(file_path);
    return result;
  }

  const auto size = std::filesystem::file_size(file_path, ec);
  if (!ec && size > options_.max_file_size_bytes) {
    std::cerr << "[ContentExtractorFactory] File too large: " << file_path << " (" << size
              << " bytes)" << std::endl;
    ExtractionResult result = ExtractionResult::failure(
        ExtractionStatus::TooLarge, "File size " + std::to_string(size) +
                                        " bytes exceeds the limit of " +
                                        std::to_string(options_.max_file_size_bytes) + " bytes");
    result.file_name = file_path.filename().string();
    result.file_type = file_type_for_path(file_path);
    return result;
  }

  return get_extractor_for(file_path).extract(file_path);
}

}  // namespace docqa_core
