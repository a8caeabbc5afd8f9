#pragma once

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "docqa_core/types/file.hpp"

namespace fs = std::filesystem;

namespace docqa_core {

class ContentExtractorError : public std::exception {
 public:
  explicit ContentExtractorError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

enum class ExtractionStatus {
  Success,
  Empty,
  NotFound,
  TooLarge,
  DecoderUnavailable,
  Failed
};

std::string to_string(ExtractionStatus status);

// Outcome of reading one source file. Extraction never throws for recoverable
// conditions; callers branch on `status` instead of sniffing the text.
struct ExtractionResult {
  ExtractionStatus status = ExtractionStatus::Failed;
  std::string content;
  std::string error_message;
  std::string file_name;
  FileType file_type = FileType::Unknown;

  bool ok() const { return status == ExtractionStatus::Success; }

  // The text handed to the chunker: the content on success, otherwise a
  // bracketed marker such as "[EMPTY CONTENT: notes.txt]".
  std::string to_document_text() const;

  static ExtractionResult success(std::string content);
  static ExtractionResult failure(ExtractionStatus status, std::string error_message);
};

class ContentExtractor {
 public:
  virtual ~ContentExtractor() = default;

  // Checks if this extractor can handle the given file extension
  virtual bool can_handle(const fs::path& file_path) const = 0;

  virtual FileType get_file_type() const = 0;

  // Reads and decodes the file. Exceptions raised by the format-specific step
  // are converted into a Failed result; blank output becomes Empty.
  virtual ExtractionResult extract(const fs::path& file_path) const;

 protected:
  // Format-specific step. May throw ContentExtractorError.
  virtual ExtractionResult extract_content(const fs::path& file_path) const = 0;

  // Raw bytes of the file.
  static std::string read_file_bytes(const fs::path& file_path);

  static bool has_extension(const fs::path& file_path, const std::vector<std::string>& extensions);
};

using ContentExtractorPtr = std::unique_ptr<ContentExtractor>;

}  // namespace docqa_core
