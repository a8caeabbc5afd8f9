#include "docqa_core/types/file.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

namespace docqa_core {

std::string to_string(FileType type) {
  switch (type) {
    case FileType::Text:
      return "Text";
    case FileType::Markdown:
      return "Markdown";
    case FileType::PDF:
      return "PDF";
    case FileType::Word:
      return "Word";
    case FileType::Spreadsheet:
      return "Spreadsheet";
    case FileType::Presentation:
      return "Presentation";
    case FileType::Image:
      return "Image";
    case FileType::Email:
      return "Email";
    case FileType::Unknown:
    default:
      return "Unknown";
  }
}

FileType file_type_from_string(const std::string& str) {
  static const std::unordered_map<std::string, FileType> lookup = {
      {"Text", FileType::Text},
      {"Markdown", FileType::Markdown},
      {"PDF", FileType::PDF},
      {"Word", FileType::Word},
      {"Spreadsheet", FileType::Spreadsheet},
      {"Presentation", FileType::Presentation},
      {"Image", FileType::Image},
      {"Email", FileType::Email},
      {"Unknown", FileType::Unknown},
  };
  auto it = lookup.find(str);
  if (it == lookup.end()) {
    throw std::invalid_argument("Unknown FileType: " + str);
  }
  return it->second;
}

FileType file_type_for_path(const std::filesystem::path& path) {
  static const std::unordered_map<std::string, FileType> by_extension = {
      {".txt", FileType::Text},          {".text", FileType::Text},
      {".log", FileType::Text},          {".md", FileType::Markdown},
      {".markdown", FileType::Markdown}, {".pdf", FileType::PDF},
      {".docx", FileType::Word},         {".csv", FileType::Spreadsheet},
      {".tsv", FileType::Spreadsheet},   {".xlsx", FileType::Spreadsheet},
      {".pptx", FileType::Presentation}, {".png", FileType::Image},
      {".jpg", FileType::Image},         {".jpeg", FileType::Image},
      {".tif", FileType::Image},         {".tiff", FileType::Image},
      {".bmp", FileType::Image},         {".eml", FileType::Email},
  };

  std::string extension = path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  auto it = by_extension.find(extension);
  return it == by_extension.end() ? FileType::Unknown : it->second;
}

std::string title_from_filename(const std::filesystem::path& path) {
  std::string stem = path.stem().string();
  std::replace(stem.begin(), stem.end(), '-', ' ');
  std::replace(stem.begin(), stem.end(), '_', ' ');

  std::string title;
  title.reserve(stem.size());
  bool at_word_start = true;
  for (char c : stem) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (std::isalpha(uc)) {
      title += at_word_start ? static_cast<char>(std::toupper(uc))
                             : static_cast<char>(std::tolower(uc));
      at_word_start = false;
    } else {
      title += c;
      at_word_start = !std::isdigit(uc);
    }
  }
  return title;
}

}  // namespace docqa_core
