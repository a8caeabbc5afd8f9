#include "docqa_core/extractors/spreadsheet_extractor.hpp"

#include <algorithm>
#include <cctype>

#ifdef DOCQA_HAVE_OOXML
#include "docqa_core/extractors/ooxml_archive.hpp"
#endif

namespace docqa_core {

namespace {

std::string trim(const std::string& value) {
  auto begin = std::find_if_not(value.begin(), value.end(),
                                [](unsigned char c) { return std::isspace(c); });
  auto end = std::find_if_not(value.rbegin(), value.rend(),
                              [](unsigned char c) { return std::isspace(c); })
                 .base();
  return begin < end ? std::string(begin, end) : std::string();
}

bool row_is_blank(const std::vector<std::string>& row) {
  return std::all_of(row.begin(), row.end(), [](const std::string& cell) { return trim(cell).empty(); });
}

}  // namespace

SpreadsheetExtractor::SpreadsheetExtractor(TextDecoder decoder) : decoder_(std::move(decoder)) {}

bool SpreadsheetExtractor::can_handle(const fs::path& file_path) const {
  return has_extension(file_path, {".csv", ".tsv", ".xlsx"});
}

ExtractionResult SpreadsheetExtractor::extract_content(const fs::path& file_path) const {
  if (has_extension(file_path, {".xlsx"})) {
    return extract_workbook(file_path);
  }

  const char delimiter = has_extension(file_path, {".tsv"}) ? '\t' : ',';
  DecodedText decoded = decoder_.decode(read_file_bytes(file_path));
  return ExtractionResult::success(
      render_sheet(file_path.stem().string(), parse_delimited(decoded.text, delimiter)));
}

SheetRows SpreadsheetExtractor::parse_delimited(const std::string& text, char delimiter) {
  SheetRows rows;
  std::vector<std::string> row;
  std::string field;
  bool in_quotes = false;

  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field += '"';
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field += c;
      }
      continue;
    }

    if (c == '"') {
      in_quotes = true;
    } else if (c == delimiter) {
      row.push_back(std::move(field));
      field.clear();
    } else if (c == '\n' || c == '\r') {
      if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
      row.push_back(std::move(field));
      field.clear();
      rows.push_back(std::move(row));
      row.clear();
    } else {
      field += c;
    }
  }
  if (!field.empty() || !row.empty()) {
    row.push_back(std::move(field));
    rows.push_back(std::move(row));
  }

  rows.erase(std::remove_if(rows.begin(), rows.end(), row_is_blank), rows.end());
  return rows;
}

std::string SpreadsheetExtractor::render_sheet(const std::string& sheet_name, const SheetRows& rows) {
  if (rows.empty()) {
    return "";
  }

  const std::vector<std::string>& header = rows.front();
  std::string text = "Sheet: " + sheet_name;
  for (size_t r = 1; r < rows.size(); ++r) {
    text += (r - 1) % ROWS_PER_PARAGRAPH == 0 ? "\n\n" : "\n";

    std::string line;
    for (size_t c = 0; c < rows[r].size(); ++c) {
      std::string value = trim(rows[r][c]);
      if (value.empty()) continue;
      std::string column = c < header.size() ? trim(header[c]) : std::string();
      if (!line.empty()) line += " | ";
      line += column.empty() ? value : column + ": " + value;
    }
    text += line;
  }

  // A sheet with only a header row still carries its column names.
  if (rows.size() == 1) {
    std::string line;
    for (const auto& cell : header) {
      std::string value = trim(cell);
      if (value.empty()) continue;
      if (!line.empty()) line += " | ";
      line += value;
    }
    text += "\n\n" + line;
  }
  return text;
}

size_t SpreadsheetExtractor::column_index(const std::string& cell_reference) {
  size_t index = 0;
  for (char c : cell_reference) {
    if (!std::isalpha(static_cast<unsigned char>(c))) break;
    index = index * 26 + static_cast<size_t>(std::toupper(static_cast<unsigned char>(c)) - 'A' + 1);
  }
  return index == 0 ? 0 : index - 1;
}

ExtractionResult SpreadsheetExtractor::extract_workbook(const fs::path& file_path) const {
#ifdef DOCQA_HAVE_OOXML
  OoxmlArchive archive(file_path);

  std::vector<std::string> shared_strings;
  if (archive.has_entry("xl/sharedStrings.xml")) {
    XmlDocument strings(archive.read_entry("xl/sharedStrings.xml"), "xl/sharedStrings.xml");
    for (const xmlNode* si = strings.root() ? strings.root()->children : nullptr; si; si = si->next) {
      if (si->type == XML_ELEMENT_NODE && local_name(si) == "si") {
        shared_strings.push_back(text_runs(si));
      }
    }
  }

  std::vector<std::string> sheet_names;
  if (archive.has_entry("xl/workbook.xml")) {
    XmlDocument workbook(archive.read_entry("xl/workbook.xml"), "xl/workbook.xml");
    for (const xmlNode* section = workbook.root() ? workbook.root()->children : nullptr; section;
         section = section->next) {
      if (section->type != XML_ELEMENT_NODE || local_name(section) != "sheets") continue;
      for (const xmlNode* sheet = section->children; sheet; sheet = sheet->next) {
        if (sheet->type == XML_ELEMENT_NODE && local_name(sheet) == "sheet") {
          sheet_names.push_back(attribute(sheet, "name"));
        }
      }
    }
  }

  std::string text;
  const auto sheets = archive.numbered_entries("xl/worksheets/sheet", ".xml");
  for (size_t s = 0; s < sheets.size(); ++s) {
    XmlDocument sheet(archive.read_entry(sheets[s]), sheets[s]);

    SheetRows rows;
    for (const xmlNode* section = sheet.root() ? sheet.root()->children : nullptr; section;
         section = section->next) {
      if (section->type != XML_ELEMENT_NODE || local_name(section) != "sheetData") continue;
      for (const xmlNode* row = section->children; row; row = row->next) {
        if (row->type != XML_ELEMENT_NODE || local_name(row) != "row") continue;
        std::vector<std::string> cells;
        for (const xmlNode* cell = row->children; cell; cell = cell->next) {
          if (cell->type != XML_ELEMENT_NODE || local_name(cell) != "c") continue;
          const std::string type = attribute(cell, "t");
          std::string value;
          for (const xmlNode* part = cell->children; part; part = part->next) {
            if (part->type != XML_ELEMENT_NODE) continue;
            if (local_name(part) == "is") {
              value = text_runs(part);
            } else if (local_name(part) == "v") {
              xmlChar* raw = xmlNodeGetContent(part);
              value = raw ? reinterpret_cast<const char*>(raw) : "";
              xmlFree(raw);
            }
          }
          if (type == "s") {
            const size_t index = value.empty() ? shared_strings.size() : std::stoul(value);
            value = index < shared_strings.size() ? shared_strings[index] : "";
          } else if (type == "b") {
            value = value == "1" ? "TRUE" : "FALSE";
          }
          const std::string reference = attribute(cell, "r");
          const size_t column = reference.empty() ? cells.size() : column_index(reference);
          if (cells.size() <= column) cells.resize(column + 1);
          cells[column] = std::move(value);
        }
        rows.push_back(std::move(cells));
      }
    }
    rows.erase(std::remove_if(rows.begin(), rows.end(), row_is_blank), rows.end());

    const std::string name = s < sheet_names.size() && !sheet_names[s].empty()
                                 ? sheet_names[s]
                                 : "Sheet" + std::to_string(s + 1);
    std::string rendered = render_sheet(name, rows);
    if (rendered.empty()) continue;
    if (!text.empty()) text += "\n\n";
    text += rendered;
  }
  return ExtractionResult::success(std::move(text));
#else
  (void)file_path;
  return ExtractionResult::failure(ExtractionStatus::DecoderUnavailable,
                                   "built without libzip/libxml2");
#endif
}

}  // namespace docqa_core
