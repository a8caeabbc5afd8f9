#include "docqa_core/chunking/text_chunker.hpp"

#include <utf8.h>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace docqa_core {

namespace {

bool is_space(char32_t c) {
  switch (c) {
    case U' ':
    case U'\t':
    case U'\n':
    case U'\r':
    case U'\f':
    case U'\v':
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
      return true;
    default:
      return c >= 0x2000 && c <= 0x200A;
  }
}

std::u32string to_u32(const std::string& text) {
  std::string valid;
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(valid));
  std::u32string result;
  utf8::utf8to32(valid.begin(), valid.end(), std::back_inserter(result));
  return result;
}

std::string to_utf8(const std::u32string& text) {
  std::string result;
  utf8::utf32to8(text.begin(), text.end(), std::back_inserter(result));
  return result;
}

std::u32string strip(const std::u32string& text) {
  size_t begin = 0;
  while (begin < text.size() && is_space(text[begin])) ++begin;
  size_t end = text.size();
  while (end > begin && is_space(text[end - 1])) --end;
  return text.substr(begin, end - begin);
}

std::u32string rstrip(const std::u32string& text) {
  size_t end = text.size();
  while (end > 0 && is_space(text[end - 1])) --end;
  return text.substr(0, end);
}

// Splits on "\n\n", collapses internal whitespace runs to one space and drops
// blank paragraphs.
std::vector<std::u32string> split_paragraphs(const std::u32string& text) {
  std::vector<std::u32string> paragraphs;
  const std::u32string separator = U"\n\n";
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find(separator, start);
    std::u32string raw = text.substr(start, end == std::u32string::npos ? std::u32string::npos : end - start);

    std::u32string collapsed;
    bool in_space = false;
    for (char32_t c : raw) {
      if (is_space(c)) {
        in_space = true;
        continue;
      }
      if (in_space && !collapsed.empty()) collapsed += U' ';
      in_space = false;
      collapsed += c;
    }
    if (!collapsed.empty()) paragraphs.push_back(std::move(collapsed));

    if (end == std::u32string::npos) break;
    start = end + separator.size();
  }
  return paragraphs;
}

}  // namespace

TextChunker::TextChunker(ChunkingOptions options) : options_(options) {
  if (options_.chunk_size <= 0) {
    throw std::invalid_argument("chunk_size must be positive");
  }
  if (options_.chunk_overlap < 0 || options_.chunk_overlap >= options_.chunk_size) {
    throw std::invalid_argument("chunk_overlap must be in [0, chunk_size)");
  }
}

std::vector<std::string> TextChunker::chunk(const std::string& text) const {
  const size_t size = static_cast<size_t>(options_.chunk_size);
  const size_t overlap = static_cast<size_t>(options_.chunk_overlap);

  std::vector<std::u32string> primary;
  std::u32string current;

  for (const auto& paragraph : split_paragraphs(to_u32(text))) {
    if (current.size() + paragraph.size() + 2 <= size) {
      current += paragraph;
      current += U"\n\n";
      continue;
    }

    if (!current.empty()) {
      primary.push_back(strip(current));
    }

    if (paragraph.size() > size) {
      std::cout << "[TextChunker] Oversized paragraph of length " << paragraph.size()
                << ", force-splitting" << std::endl;
      for (size_t offset = 0; offset < paragraph.size(); offset += size - overlap) {
        std::u32string piece = strip(paragraph.substr(offset, size));
        if (!piece.empty()) primary.push_back(std::move(piece));
      }
      current.clear();
    } else {
      current = paragraph + U"\n\n";
    }
  }
  if (!current.empty()) {
    primary.push_back(strip(current));
  }

  std::vector<std::string> chunks;
  chunks.reserve(primary.size());
  for (size_t i = 0; i < primary.size(); ++i) {
    std::u32string piece = primary[i];
    if (i > 0 && overlap > 0 && options_.include_overlap_in_chunk) {
      const std::u32string& previous = primary[i - 1];
      const size_t take = std::min(overlap, previous.size());
      piece = previous.substr(previous.size() - take) + piece;
    }
    // Leading characters belong to the carried-over overlap and stay intact.
    chunks.push_back(to_utf8(rstrip(piece)));
  }
  return chunks;
}

std::vector<DocumentChunk> TextChunker::chunk_document(const std::string& title,
                                                       const std::string& source_file,
                                                       const std::string& text) const {
  std::vector<DocumentChunk> result;
  const auto pieces = chunk(text);
  const auto now = std::chrono::system_clock::now();
  for (size_t i = 0; i < pieces.size(); ++i) {
    DocumentChunk chunk{.id = 0,
                        .title = title + " - Part " + std::to_string(i + 1),
                        .content = pieces[i],
                        .source_file = source_file,
                        .chunk_index = static_cast<int>(i),
                        .created_at = now};
    result.push_back(std::move(chunk));
  }
  std::cout << "[TextChunker] Split document '" << title << "' into " << result.size()
            << " chunks" << std::endl;
  return result;
}

}  // namespace docqa_core
