#pragma once

#include <filesystem>
#include <string>

namespace docqa_core {

enum class FileType {
  Text,
  Markdown,
  PDF,
  Word,
  Spreadsheet,
  Presentation,
  Image,
  Email,
  Unknown
};

std::string to_string(FileType type);
FileType file_type_from_string(const std::string& str);

// Lower-cased extension lookup; unknown extensions map to FileType::Unknown.
FileType file_type_for_path(const std::filesystem::path& path);

// "employee-leave_policy.txt" -> "Employee Leave Policy"
std::string title_from_filename(const std::filesystem::path& path);

}  // namespace docqa_core
