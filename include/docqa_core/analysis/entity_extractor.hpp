#pragma once

#include <regex>
#include <string>
#include <utility>
#include <vector>

#include "docqa_core/types/conversation.hpp"

namespace docqa_core {

// Keyword patterns per label, matched case-insensitively on word boundaries.
// Overlaps resolve to the earliest match, and the longer one on equal start.
class EntityExtractor {
 public:
  static constexpr size_t MAX_TEXT_LENGTH = 5000;
  static constexpr float PATTERN_CONFIDENCE = 0.6f;

  using PatternTable = std::vector<std::pair<std::string, std::vector<std::string>>>;

  explicit EntityExtractor(PatternTable patterns = default_patterns());

  // Never throws; input beyond MAX_TEXT_LENGTH bytes is ignored.
  std::vector<Entity> extract(const std::string& text) const;

  static PatternTable default_patterns();

  static std::vector<Entity> filter_overlapping(std::vector<Entity> entities);

 private:
  std::vector<std::pair<std::string, std::regex>> compiled_;
};

}  // namespace docqa_core
