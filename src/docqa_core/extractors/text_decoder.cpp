#include "docqa_core/extractors/text_decoder.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iterator>
#include <stdexcept>

namespace docqa_core {

namespace {

// Windows-1252 code points for 0x80..0x9F; zero marks an undefined byte.
constexpr uint32_t kCp1252High[32] = {
    0x20AC, 0,      0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0,      0x017D, 0,
    0,      0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0,      0x017E, 0x0178};

const std::string kUtf8Bom = "\xEF\xBB\xBF";

}  // namespace

std::string to_string(TextEncoding encoding) {
  switch (encoding) {
    case TextEncoding::Utf8:
      return "utf-8";
    case TextEncoding::Windows1252:
      return "cp1252";
    case TextEncoding::Latin1:
    default:
      return "latin-1";
  }
}

TextEncoding text_encoding_from_string(const std::string& name) {
  std::string lowered = name;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "utf-8" || lowered == "utf8") return TextEncoding::Utf8;
  if (lowered == "cp1252" || lowered == "windows-1252") return TextEncoding::Windows1252;
  if (lowered == "latin-1" || lowered == "latin1" || lowered == "iso-8859-1") {
    return TextEncoding::Latin1;
  }
  throw std::invalid_argument("Unsupported text encoding: " + name);
}

TextDecoder::TextDecoder()
    : ladder_{TextEncoding::Utf8, TextEncoding::Windows1252, TextEncoding::Latin1} {}

TextDecoder::TextDecoder(std::vector<TextEncoding> ladder) : ladder_(std::move(ladder)) {}

std::optional<std::string> TextDecoder::try_decode(const std::string& bytes,
                                                   TextEncoding encoding) {
  if (encoding == TextEncoding::Utf8) {
    std::string body = bytes.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0
                           ? bytes.substr(kUtf8Bom.size())
                           : bytes;
    if (!utf8::is_valid(body.begin(), body.end())) {
      return std::nullopt;
    }
    return body;
  }

  std::string out;
  out.reserve(bytes.size() + bytes.size() / 4);
  for (unsigned char byte : bytes) {
    uint32_t code_point = byte;
    if (encoding == TextEncoding::Windows1252 && byte >= 0x80 && byte <= 0x9F) {
      code_point = kCp1252High[byte - 0x80];
      if (code_point == 0) {
        return std::nullopt;
      }
    }
    utf8::append(code_point, std::back_inserter(out));
  }
  return out;
}

DecodedText TextDecoder::decode(const std::string& bytes) const {
  for (TextEncoding encoding : ladder_) {
    if (auto text = try_decode(bytes, encoding)) {
      return {std::move(*text), encoding};
    }
  }

  std::string repaired;
  utf8::replace_invalid(bytes.begin(), bytes.end(), std::back_inserter(repaired));
  return {std::move(repaired), std::nullopt};
}

}  // namespace docqa_core
