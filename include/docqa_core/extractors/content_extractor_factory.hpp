#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "content_extractor.hpp"
#include "text_decoder.hpp"

namespace docqa_core {

struct ExtractorOptions {
  std::uintmax_t max_file_size_bytes = 50ull * 1024 * 1024;
  std::vector<TextEncoding> text_encodings = {TextEncoding::Utf8, TextEncoding::Windows1252,
                                              TextEncoding::Latin1};
  std::string ocr_language = "eng";
};

/**
 * @class ContentExtractorFactory
 * @brief Owns every registered ContentExtractor and picks one per file.
 *
 * Unknown extensions fall back to the plain text extractor, so selection never
 * fails. This class is non-copyable and non-movable.
 */
class ContentExtractorFactory {
 public:
  explicit ContentExtractorFactory(ExtractorOptions options = ExtractorOptions());

  /**
   * @brief Returns the first extractor that reports it can handle the file, or
   * the plain text fallback.
   */
  const ContentExtractor& get_extractor_for(const std::filesystem::path& file_path) const;

  /**
   * @brief Validates existence and size, then runs the selected extractor.
   *
   * Never throws for per-file problems: missing files yield NotFound (with the
   * full path as file name) and oversized files yield TooLarge.
   */
  ExtractionResult extract(const std::filesystem::path& file_path) const;

  const ExtractorOptions& options() const { return options_; }

  ContentExtractorFactory(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory& operator=(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory(ContentExtractorFactory&&) = delete;
  ContentExtractorFactory& operator=(ContentExtractorFactory&&) = delete;

 private:
  ExtractorOptions options_;
  std::vector<std::unique_ptr<ContentExtractor>> extractors_;
  std::unique_ptr<ContentExtractor> fallback_;
};

}  // namespace docqa_core
