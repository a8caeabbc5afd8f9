#include "docqa_core/extractors/markdown_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace docqa_core {

MarkdownExtractor::MarkdownExtractor(TextDecoder decoder) : decoder_(std::move(decoder)) {}

bool MarkdownExtractor::can_handle(const fs::path& file_path) const {
  return has_extension(file_path, {".md", ".markdown"});
}

ExtractionResult MarkdownExtractor::extract_content(const fs::path& file_path) const {
  DecodedText decoded = decoder_.decode(read_file_bytes(file_path));
  return ExtractionResult::success(strip_markup(decoded.text));
}

namespace {

// Front matter is a leading "---" block closed by another "---" line.
std::string drop_front_matter(const std::string& text) {
  if (text.rfind("---\n", 0) != 0) {
    return text;
  }
  const size_t close = text.find("\n---\n", 3);
  if (close == std::string::npos) {
    return text;
  }
  return text.substr(close + 5);
}

// An unterminated comment is left in place.
std::string drop_html_comments(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  size_t position = 0;
  while (true) {
    const size_t open = text.find("<!--", position);
    const size_t close = open == std::string::npos ? std::string::npos : text.find("-->", open + 4);
    if (close == std::string::npos) {
      out.append(text, position, std::string::npos);
      return out;
    }
    out.append(text, position, open - position);
    position = close + 3;
  }
}

bool is_fence(const std::string& line) {
  const size_t begin = line.find_first_not_of(" \t");
  if (begin == std::string::npos) return false;
  return line.compare(begin, 3, "```") == 0 || line.compare(begin, 3, "~~~") == 0;
}

// "## Title" -> "Title"
std::string drop_heading_marker(const std::string& line) {
  size_t hashes = 0;
  while (hashes < line.size() && line[hashes] == '#') ++hashes;
  if (hashes == 0 || hashes > 6 || hashes == line.size() ||
      !std::isspace(static_cast<unsigned char>(line[hashes]))) {
    return line;
  }
  const size_t text = line.find_first_not_of(" \t", hashes);
  return text == std::string::npos ? "" : line.substr(text);
}

// "[label](target)" and "![alt](target)" keep only the label.
std::string drop_link_targets(const std::string& line) {
  std::string out;
  out.reserve(line.size());
  size_t position = 0;
  while (position < line.size()) {
    const size_t open = line.find('[', position);
    if (open == std::string::npos) break;
    const size_t label_end = line.find(']', open + 1);
    if (label_end == std::string::npos) break;
    if (label_end + 1 >= line.size() || line[label_end + 1] != '(') {
      out.append(line, position, label_end + 1 - position);
      position = label_end + 1;
      continue;
    }
    const size_t target_end = line.find(')', label_end + 2);
    if (target_end == std::string::npos) break;
    const bool is_image = open > position && line[open - 1] == '!';
    if (!is_image && label_end == open + 1) {
      out.append(line, position, target_end + 1 - position);
    } else {
      out.append(line, position, open - position - (is_image ? 1 : 0));
      out.append(line, open + 1, label_end - open - 1);
    }
    position = target_end + 1;
  }
  out.append(line, std::min(position, line.size()), std::string::npos);
  return out;
}

// "**bold**" and "__bold__" lose their markers.
std::string drop_emphasis(std::string line) {
  for (const std::string marker : {"**", "__"}) {
    size_t position = 0;
    while (true) {
      const size_t open = line.find(marker, position);
      if (open == std::string::npos) break;
      const size_t close = line.find(marker, open + 3);
      if (close == std::string::npos) break;
      line.erase(close, 2);
      line.erase(open, 2);
      position = close - 2;
    }
  }
  return line;
}

}  // namespace

std::string MarkdownExtractor::strip_markup(const std::string& markdown) {
  std::string text = markdown;
  text.erase(std::remove(text.begin(), text.end(), '\r'), text.end());
  text = drop_html_comments(drop_front_matter(text));

  std::istringstream lines(text);
  std::ostringstream out;
  std::string line;
  bool first = true;
  while (std::getline(lines, line)) {
    if (is_fence(line)) {
      continue;
    }
    line = drop_emphasis(drop_link_targets(drop_heading_marker(line)));
    if (!first) out << '\n';
    out << line;
    first = false;
  }
  return out.str();
}

}  // namespace docqa_core
