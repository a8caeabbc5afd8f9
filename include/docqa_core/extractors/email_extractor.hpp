#pragma once

#include <string>

#include "content_extractor.hpp"
#include "text_decoder.hpp"

namespace docqa_core {

// RFC 822 / MIME messages (.eml). Emits the main headers followed by the
// text/plain body (HTML with tags stripped when no plain part exists) and a
// list of attachment names. Attachments themselves are not extracted.
class EmailExtractor : public ContentExtractor {
 public:
  explicit EmailExtractor(TextDecoder decoder = TextDecoder());

  bool can_handle(const fs::path& file_path) const override;
  FileType get_file_type() const override { return FileType::Email; }

  static std::string decode_base64(const std::string& encoded);
  static std::string decode_quoted_printable(const std::string& encoded);

  // Decodes RFC 2047 encoded words: "=?utf-8?B?...?=" and "=?utf-8?Q?...?=".
  std::string decode_header_value(const std::string& value) const;

  static std::string strip_html(const std::string& html);

 protected:
  ExtractionResult extract_content(const fs::path& file_path) const override;

 private:
  std::string decode_charset(const std::string& bytes, const std::string& charset) const;

  TextDecoder decoder_;
};

}  // namespace docqa_core
