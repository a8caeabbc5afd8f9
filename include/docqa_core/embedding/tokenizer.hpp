#pragma once

#include <string>
#include <vector>

namespace docqa_core {

class Tokenizer {
 public:
  virtual ~Tokenizer() = default;
  virtual std::vector<std::string> tokenize(const std::string& text) const = 0;
};

// Splits on ASCII whitespace.
class WhitespaceTokenizer : public Tokenizer {
 public:
  std::vector<std::string> tokenize(const std::string& text) const override;
};

// Characters per token measured on a fixed sample sentence; at least 1, and 4
// when the tokenizer returns nothing.
int estimate_chars_per_token(const Tokenizer& tokenizer);

}  // namespace docqa_core
