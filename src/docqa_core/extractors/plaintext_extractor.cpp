#include "docqa_core/extractors/plaintext_extractor.hpp"

#include <iostream>

namespace docqa_core {

PlainTextExtractor::PlainTextExtractor(TextDecoder decoder) : decoder_(std::move(decoder)) {}

bool PlainTextExtractor::can_handle(const fs::path& file_path) const {
  return has_extension(file_path, {".txt", ".text", ".log"});
}

ExtractionResult PlainTextExtractor::extract_content(const fs::path& file_path) const {
  DecodedText decoded = decoder_.decode(read_file_bytes(file_path));
  if (!decoded.encoding) {
    std::cerr << "[PlainTextExtractor] Warning: no encoding matched " << file_path
              << ", invalid bytes replaced" << std::endl;
  }
  return ExtractionResult::success(std::move(decoded.text));
}

}  // namespace docqa_core
