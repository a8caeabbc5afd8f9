#include "docqa_core/extractors/email_extractor.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <functional>
#include <map>
#include <regex>
#include <vector>

namespace docqa_core {

namespace {

using HeaderMap = std::map<std::string, std::string>;

struct MimePart {
  HeaderMap headers;
  std::string body;
};

struct MessageText {
  std::vector<std::string> plain;
  std::vector<std::string> html;
  std::vector<std::string> attachments;
};

constexpr int MAX_MULTIPART_DEPTH = 10;

std::string lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string trim(const std::string& value) {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Headers end at the first empty line. Continuation lines are unfolded and
// only the first occurrence of a header is kept.
MimePart parse_part(const std::string& raw) {
  MimePart part;
  size_t split = raw.find("\n\n");
  const std::string header_block = split == std::string::npos ? raw : raw.substr(0, split);
  part.body = split == std::string::npos ? "" : raw.substr(split + 2);

  std::vector<std::string> lines;
  size_t start = 0;
  while (start <= header_block.size()) {
    size_t end = header_block.find('\n', start);
    std::string line = header_block.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (!line.empty() && (line[0] == ' ' || line[0] == '\t') && !lines.empty()) {
      lines.back() += " " + trim(line);
    } else if (!line.empty()) {
      lines.push_back(line);
    }
    if (end == std::string::npos) break;
    start = end + 1;
  }

  for (const auto& line : lines) {
    const size_t colon = line.find(':');
    if (colon == std::string::npos) continue;
    part.headers.emplace(lower(trim(line.substr(0, colon))), trim(line.substr(colon + 1)));
  }
  return part;
}

std::string header(const MimePart& part, const std::string& name) {
  auto it = part.headers.find(name);
  return it == part.headers.end() ? "" : it->second;
}

// Value of `name=` inside a structured header such as Content-Type.
std::string header_parameter(const std::string& value, const std::string& name) {
  std::regex pattern(";\\s*" + name + "\\s*=\\s*(\"([^\"]*)\"|([^;\\s]+))", std::regex::icase);
  std::smatch match;
  if (!std::regex_search(value, match, pattern)) return "";
  return match[2].matched ? match[2].str() : match[3].str();
}

std::string media_type(const MimePart& part) {
  std::string content_type = header(part, "content-type");
  if (content_type.empty()) return "text/plain";
  return lower(trim(content_type.substr(0, content_type.find(';'))));
}

std::vector<std::string> split_multipart(const std::string& body, const std::string& boundary) {
  std::vector<std::string> parts;
  const std::string delimiter = "--" + boundary;
  size_t position = body.find(delimiter);
  while (position != std::string::npos) {
    size_t content_start = position + delimiter.size();
    if (body.compare(content_start, 2, "--") == 0) break;
    content_start = body.find('\n', content_start);
    if (content_start == std::string::npos) break;
    ++content_start;

    size_t next = body.find("\n" + delimiter, content_start);
    if (next == std::string::npos) {
      parts.push_back(body.substr(content_start));
      break;
    }
    parts.push_back(body.substr(content_start, next - content_start));
    position = next + 1;
  }
  return parts;
}

}  // namespace

EmailExtractor::EmailExtractor(TextDecoder decoder) : decoder_(std::move(decoder)) {}

bool EmailExtractor::can_handle(const fs::path& file_path) const {
  return has_extension(file_path, {".eml"});
}

std::string EmailExtractor::decode_base64(const std::string& encoded) {
  std::string compact;
  compact.reserve(encoded.size());
  for (char c : encoded) {
    if (!std::isspace(static_cast<unsigned char>(c))) compact += c;
  }
  while (compact.size() % 4 != 0) compact += '=';
  if (compact.empty()) return "";

  std::string decoded(compact.size() / 4 * 3, '\0');
  const int length = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(decoded.data()),
                                     reinterpret_cast<const unsigned char*>(compact.data()),
                                     static_cast<int>(compact.size()));
  if (length < 0) {
    throw ContentExtractorError("Invalid base64 content");
  }

  // EVP_DecodeBlock counts padding as zero bytes.
  size_t padding = 0;
  for (auto it = compact.rbegin(); it != compact.rend() && *it == '='; ++it) ++padding;
  decoded.resize(static_cast<size_t>(length) - std::min<size_t>(padding, static_cast<size_t>(length)));
  return decoded;
}

std::string EmailExtractor::decode_quoted_printable(const std::string& encoded) {
  std::string decoded;
  decoded.reserve(encoded.size());
  for (size_t i = 0; i < encoded.size(); ++i) {
    if (encoded[i] != '=') {
      decoded += encoded[i];
      continue;
    }
    // Soft line break
    if (i + 1 < encoded.size() && encoded[i + 1] == '\n') {
      ++i;
      continue;
    }
    if (i + 2 < encoded.size() && encoded[i + 1] == '\r' && encoded[i + 2] == '\n') {
      i += 2;
      continue;
    }
    if (i + 2 < encoded.size()) {
      const int high = hex_value(encoded[i + 1]);
      const int low = hex_value(encoded[i + 2]);
      if (high >= 0 && low >= 0) {
        decoded += static_cast<char>(high * 16 + low);
        i += 2;
        continue;
      }
    }
    decoded += '=';
  }
  return decoded;
}

std::string EmailExtractor::decode_charset(const std::string& bytes, const std::string& charset) const {
  const std::string name = lower(charset);
  if (!name.empty() && name != "us-ascii") {
    try {
      if (auto text = TextDecoder::try_decode(bytes, text_encoding_from_string(name))) {
        return *text;
      }
    } catch (const std::invalid_argument&) {
      // Unknown charset label: fall through to the decoder ladder.
    }
  }
  return decoder_.decode(bytes).text;
}

std::string EmailExtractor::decode_header_value(const std::string& value) const {
  static const std::regex encoded_word("=\\?([^?]+)\\?([bBqQ])\\?([^?]*)\\?=");

  std::string result;
  auto begin = std::sregex_iterator(value.begin(), value.end(), encoded_word);
  size_t last = 0;
  bool previous_was_encoded = false;
  for (auto it = begin; it != std::sregex_iterator(); ++it) {
    const auto& match = *it;
    std::string between = value.substr(last, static_cast<size_t>(match.position()) - last);
    // Whitespace between adjacent encoded words is not part of the text.
    if (!(previous_was_encoded && trim(between).empty())) {
      result += between;
    }

    std::string payload = match[3].str();
    std::string bytes;
    if (std::toupper(static_cast<unsigned char>(match[2].str()[0])) == 'B') {
      bytes = decode_base64(payload);
    } else {
      std::replace(payload.begin(), payload.end(), '_', ' ');
      bytes = decode_quoted_printable(payload);
    }
    result += decode_charset(bytes, match[1].str());

    last = static_cast<size_t>(match.position() + match.length());
    previous_was_encoded = true;
  }
  result += value.substr(last);
  return result;
}

std::string EmailExtractor::strip_html(const std::string& html) {
  const std::string lowered = lower(html);
  std::string text;
  text.reserve(html.size());

  size_t position = 0;
  while (position < html.size()) {
    const size_t open = html.find('<', position);
    if (open == std::string::npos) {
      text.append(html, position, std::string::npos);
      break;
    }
    text.append(html, position, open - position);
    const size_t close = html.find('>', open);
    if (close == std::string::npos) {
      // A stray '<' with no closing bracket is kept as text.
      text.append(html, open, std::string::npos);
      break;
    }

    std::string name = lowered.substr(open + 1, close - open - 1);
    name = name.substr(0, name.find_first_of(" \t\n/", 1));
    position = close + 1;

    if (name == "script" || name == "style") {
      const size_t end_tag = lowered.find("</" + name, position);
      const size_t end_close = end_tag == std::string::npos ? std::string::npos : lowered.find('>', end_tag);
      position = end_close == std::string::npos ? html.size() : end_close + 1;
      text += ' ';
    } else if (name == "br") {
      text += '\n';
    } else if (name == "/p" || name == "/div" || name == "/li" || name == "/tr" ||
               (name.size() == 3 && name[0] == '/' && name[1] == 'h' && name[2] >= '1' && name[2] <= '6')) {
      text += "\n\n";
    }
  }

  static const std::vector<std::pair<std::string, std::string>> entities = {
      {"&nbsp;", " "}, {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""}, {"&#39;", "'"}, {"&amp;", "&"}};
  for (const auto& [entity, replacement] : entities) {
    size_t found = 0;
    while ((found = text.find(entity, found)) != std::string::npos) {
      text.replace(found, entity.size(), replacement);
      found += replacement.size();
    }
  }

  // Collapse blank runs: spaces and tabs to one space, no spaces around line
  // breaks, at most one empty line.
  std::string collapsed;
  collapsed.reserve(text.size());
  size_t newlines = 0;
  bool pending_space = false;
  for (char c : text) {
    if (c == ' ' || c == '\t') {
      pending_space = true;
    } else if (c == '\n') {
      pending_space = false;
      if (++newlines <= 2) collapsed += '\n';
    } else {
      if (pending_space && newlines == 0 && !collapsed.empty()) collapsed += ' ';
      pending_space = false;
      newlines = 0;
      collapsed += c;
    }
  }
  return trim(collapsed);
}

ExtractionResult EmailExtractor::extract_content(const fs::path& file_path) const {
  std::string raw = read_file_bytes(file_path);
  raw.erase(std::remove(raw.begin(), raw.end(), '\r'), raw.end());

  const MimePart message = parse_part(raw);
  MessageText collected;

  std::function<void(const MimePart&, int)> walk = [&](const MimePart& part, int depth) {
    const std::string type = media_type(part);
    const std::string content_type = header(part, "content-type");

    if (type.rfind("multipart/", 0) == 0) {
      const std::string boundary = header_parameter(content_type, "boundary");
      if (boundary.empty() || depth >= MAX_MULTIPART_DEPTH) return;
      for (const auto& child : split_multipart(part.body, boundary)) {
        walk(parse_part(child), depth + 1);
      }
      return;
    }

    const std::string disposition = header(part, "content-disposition");
    std::string file_name = header_parameter(disposition, "filename");
    if (file_name.empty()) file_name = header_parameter(content_type, "name");
    const bool is_attachment = lower(disposition).rfind("attachment", 0) == 0 || !file_name.empty();
    if (is_attachment) {
      collected.attachments.push_back(file_name.empty() ? "(unnamed)" : decode_header_value(file_name));
      return;
    }
    if (type != "text/plain" && type != "text/html") return;

    const std::string transfer = lower(header(part, "content-transfer-encoding"));
    std::string bytes = part.body;
    if (transfer == "base64") {
      bytes = decode_base64(bytes);
    } else if (transfer == "quoted-printable") {
      bytes = decode_quoted_printable(bytes);
    }
    std::string text = decode_charset(bytes, header_parameter(content_type, "charset"));
    if (type == "text/html") {
      collected.html.push_back(strip_html(text));
    } else {
      collected.plain.push_back(trim(text));
    }
  };
  walk(message, 0);

  std::string text;
  for (const char* name : {"Subject", "From", "To", "Cc", "Date"}) {
    const std::string value = header(message, lower(name));
    if (!value.empty()) {
      text += std::string(name) + ": " + decode_header_value(value) + "\n";
    }
  }

  const auto& bodies = collected.plain.empty() ? collected.html : collected.plain;
  for (const auto& body : bodies) {
    if (body.empty()) continue;
    text += "\n" + body + "\n";
  }

  if (!collected.attachments.empty()) {
    text += "\nAttachments: ";
    for (size_t i = 0; i < collected.attachments.size(); ++i) {
      if (i > 0) text += ", ";
      text += collected.attachments[i];
    }
    text += "\n";
  }
  return ExtractionResult::success(trim(text));
}

}  // namespace docqa_core
