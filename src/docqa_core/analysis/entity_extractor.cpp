#include "docqa_core/analysis/entity_extractor.hpp"

#include <algorithm>
#include <iostream>

namespace docqa_core {

namespace {

std::string escape_regex(const std::string& text) {
  static const std::string special = R"(\^$.|?*+()[]{})";
  std::string escaped;
  for (char c : text) {
    if (special.find(c) != std::string::npos) escaped += '\\';
    escaped += c;
  }
  return escaped;
}

}  // namespace

EntityExtractor::PatternTable EntityExtractor::default_patterns() {
  return {
      {"POLICY", {"policy", "guideline", "procedure", "rule"}},
      {"BENEFIT", {"benefit", "insurance", "coverage", "plan"}},
      {"LEAVE", {"leave", "vacation", "sick", "pto", "time off"}},
      {"DOCUMENT", {"form", "document", "paperwork", "application"}},
      {"DEPARTMENT", {"hr", "human resources", "it", "finance"}},
      {"ROLE", {"employee", "manager", "supervisor", "director"}},
      {"TIME", {"day", "week", "month", "year", "period"}},
  };
}

EntityExtractor::EntityExtractor(PatternTable patterns) {
  for (const auto& [label, keywords] : patterns) {
    if (keywords.empty()) continue;
    std::string alternation;
    for (const auto& keyword : keywords) {
      if (!alternation.empty()) alternation += '|';
      alternation += escape_regex(keyword);
    }
    compiled_.emplace_back(label, std::regex("\\b(?:" + alternation + ")\\b",
                                             std::regex::ECMAScript | std::regex::icase));
  }
}

std::vector<Entity> EntityExtractor::filter_overlapping(std::vector<Entity> entities) {
  std::sort(entities.begin(), entities.end(), [](const Entity& a, const Entity& b) {
    if (a.start != b.start) return a.start < b.start;
    return (a.end - a.start) > (b.end - b.start);
  });
  std::vector<Entity> filtered;
  for (auto& entity : entities) {
    if (filtered.empty() || entity.start >= filtered.back().end) {
      filtered.push_back(std::move(entity));
    } else if ((entity.end - entity.start) > (filtered.back().end - filtered.back().start)) {
      filtered.back() = std::move(entity);
    }
  }
  return filtered;
}

std::vector<Entity> EntityExtractor::extract(const std::string& text) const {
  try {
    const std::string input = text.size() > MAX_TEXT_LENGTH ? text.substr(0, MAX_TEXT_LENGTH) : text;
    std::vector<Entity> entities;
    for (const auto& [label, pattern] : compiled_) {
      for (auto it = std::sregex_iterator(input.begin(), input.end(), pattern); it != std::sregex_iterator();
           ++it) {
        const auto start = static_cast<size_t>(it->position());
        entities.push_back({it->str(), label, start, start + static_cast<size_t>(it->length()),
                            PATTERN_CONFIDENCE});
      }
    }
    return filter_overlapping(std::move(entities));
  } catch (const std::exception& e) {
    std::cerr << "[EntityExtractor] Error extracting entities: " << e.what() << std::endl;
    return {};
  }
}

}  // namespace docqa_core
