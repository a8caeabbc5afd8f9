#pragma once

#include <string>
#include <vector>

#include "content_extractor.hpp"
#include "text_decoder.hpp"

namespace docqa_core {

using SheetRows = std::vector<std::vector<std::string>>;

// CSV/TSV and .xlsx workbooks. Rows are rendered as "Header: value | ..."
// lines so each row reads as a self-contained sentence after chunking.
class SpreadsheetExtractor : public ContentExtractor {
 public:
  static constexpr size_t ROWS_PER_PARAGRAPH = 25;

  explicit SpreadsheetExtractor(TextDecoder decoder = TextDecoder());

  bool can_handle(const fs::path& file_path) const override;
  FileType get_file_type() const override { return FileType::Spreadsheet; }

  // Quoted fields may contain the delimiter, doubled quotes and newlines.
  static SheetRows parse_delimited(const std::string& text, char delimiter);

  static std::string render_sheet(const std::string& sheet_name, const SheetRows& rows);

  // "B7" -> 1; "AA3" -> 26
  static size_t column_index(const std::string& cell_reference);

 protected:
  ExtractionResult extract_content(const fs::path& file_path) const override;

 private:
  ExtractionResult extract_workbook(const fs::path& file_path) const;

  TextDecoder decoder_;
};

}  // namespace docqa_core
