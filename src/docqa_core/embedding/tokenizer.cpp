#include "docqa_core/embedding/tokenizer.hpp"

#include <algorithm>
#include <sstream>

namespace docqa_core {

std::vector<std::string> WhitespaceTokenizer::tokenize(const std::string& text) const {
  std::vector<std::string> tokens;
  std::istringstream stream(text);
  std::string token;
  while (stream >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

int estimate_chars_per_token(const Tokenizer& tokenizer) {
  static const std::string sample = "This is a sample sentence to estimate token length.";
  const auto tokens = tokenizer.tokenize(sample);
  if (tokens.empty()) {
    return 4;
  }
  return std::max(1, static_cast<int>(sample.size() / tokens.size()));
}

}  // namespace docqa_core
