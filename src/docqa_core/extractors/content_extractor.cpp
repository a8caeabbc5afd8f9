#include "docqa_core/extractors/content_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>

namespace docqa_core {

std::string to_string(ExtractionStatus status) {
  switch (status) {
    case ExtractionStatus::Success:
      return "success";
    case ExtractionStatus::Empty:
      return "empty";
    case ExtractionStatus::NotFound:
      return "not_found";
    case ExtractionStatus::TooLarge:
      return "too_large";
    case ExtractionStatus::DecoderUnavailable:
      return "decoder_unavailable";
    case ExtractionStatus::Failed:
    default:
      return "failed";
  }
}

namespace {

std::string decoder_label(FileType type) {
  switch (type) {
    case FileType::PDF:
      return "PDF";
    case FileType::Word:
      return "DOCX";
    case FileType::Spreadsheet:
      return "SPREADSHEET";
    case FileType::Presentation:
      return "PRESENTATION";
    case FileType::Image:
      return "OCR";
    default:
      return "DOCUMENT";
  }
}

}  // namespace

std::string ExtractionResult::to_document_text() const {
  switch (status) {
    case ExtractionStatus::Success:
      return content;
    case ExtractionStatus::Empty:
      return "[EMPTY CONTENT: " + file_name + "]";
    case ExtractionStatus::NotFound:
      return "[FILE NOT FOUND: " + file_name + "]";
    case ExtractionStatus::TooLarge:
      return "[FILE TOO LARGE: " + file_name + "] - " + error_message;
    case ExtractionStatus::DecoderUnavailable:
      return "[" + decoder_label(file_type) + " PROCESSING NOT AVAILABLE - " + file_name + "]";
    case ExtractionStatus::Failed:
    default:
      return "[ERROR PROCESSING FILE: " + file_name + "] - " + error_message;
  }
}

ExtractionResult ExtractionResult::success(std::string content) {
  ExtractionResult result;
  result.status = ExtractionStatus::Success;
  result.content = std::move(content);
  return result;
}

ExtractionResult ExtractionResult::failure(ExtractionStatus status, std::string error_message) {
  ExtractionResult result;
  result.status = status;
  result.error_message = std::move(error_message);
  return result;
}

ExtractionResult ContentExtractor::extract(const fs::path& file_path) const {
  ExtractionResult result;
  try {
    result = extract_content(file_path);
  } catch (const std::exception& e) {
    std::cerr << "[ContentExtractor] Error extracting " << file_path << ": " << e.what()
              << std::endl;
    result = ExtractionResult::failure(ExtractionStatus::Failed, e.what());
  }

  if (result.ok()) {
    const bool blank = std::all_of(result.content.begin(), result.content.end(),
                                   [](unsigned char c) { return std::isspace(c); });
    if (blank) {
      result = ExtractionResult::failure(ExtractionStatus::Empty, "no text content");
    }
  }
  result.file_name = file_path.filename().string();
  result.file_type = get_file_type();
  return result;
}

std::string ContentExtractor::read_file_bytes(const fs::path& file_path) {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw ContentExtractorError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  return buffer.str();
}

bool ContentExtractor::has_extension(const fs::path& file_path,
                                     const std::vector<std::string>& extensions) {
  std::string extension = file_path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return std::find(extensions.begin(), extensions.end(), extension) != extensions.end();
}

}  // namespace docqa_core
