#pragma once

#include <optional>
#include <string>
#include <vector>

namespace docqa_core {

enum class TextEncoding { Utf8, Windows1252, Latin1 };

std::string to_string(TextEncoding encoding);

// Accepts common spellings: "utf-8", "utf8", "cp1252", "windows-1252",
// "latin-1", "latin1", "iso-8859-1". Throws std::invalid_argument otherwise.
TextEncoding text_encoding_from_string(const std::string& name);

struct DecodedText {
  std::string text;  // always valid UTF-8
  std::optional<TextEncoding> encoding;  // empty when the lossy fallback was used
};

// Tries each encoding of the ladder in order and returns the first strict
// decode. When every rung rejects the input, invalid UTF-8 sequences are
// replaced with U+FFFD.
class TextDecoder {
 public:
  TextDecoder();
  explicit TextDecoder(std::vector<TextEncoding> ladder);

  DecodedText decode(const std::string& bytes) const;

  const std::vector<TextEncoding>& ladder() const { return ladder_; }

  static std::optional<std::string> try_decode(const std::string& bytes, TextEncoding encoding);

 private:
  std::vector<TextEncoding> ladder_;
};

}  // namespace docqa_core
