#include "docqa_core/analysis/language_detector.hpp"

#include <cctype>
#include <iostream>

namespace docqa_core {

namespace {

const std::unordered_map<std::string, std::unordered_set<std::string>>& builtin_profiles() {
  static const std::unordered_map<std::string, std::unordered_set<std::string>> profiles = {
      {"en",
       {"the", "and", "is", "are", "of", "to", "in", "for", "how", "what", "do", "does", "i",
        "my", "can", "with", "on", "many", "when", "where", "which", "have", "get", "about"}},
      {"es",
       {"el", "la", "los", "las", "de", "que", "y", "en", "un", "una", "es", "por", "para",
        "como", "cuantos", "mi", "puedo", "del", "con", "tengo", "se", "al", "sobre", "cual"}},
      {"fr",
       {"le", "la", "les", "de", "des", "et", "est", "un", "une", "pour", "que", "je", "mon",
        "ma", "comment", "combien", "du", "avec", "sur", "quel", "quelle", "dans", "ai", "puis"}},
      {"de",
       {"der", "die", "das", "und", "ist", "ich", "nicht", "ein", "eine", "zu", "mit", "wie",
        "viele", "mein", "meine", "kann", "habe", "den", "dem", "von", "auf", "was", "wann", "für"}},
  };
  return profiles;
}

// Lower-cased ASCII word tokens; bytes >= 0x80 stay inside words.
std::vector<std::string> words(const std::string& text) {
  std::vector<std::string> result;
  std::string current;
  for (unsigned char c : text) {
    if (std::isalnum(c) || c >= 0x80) {
      current += static_cast<char>(std::tolower(c));
    } else if (!current.empty()) {
      result.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) result.push_back(std::move(current));
  return result;
}

}  // namespace

LanguageDetector::LanguageDetector(std::vector<std::string> supported_languages, std::string default_language)
    : default_language_(std::move(default_language)) {
  const auto& builtin = builtin_profiles();
  for (const auto& language : supported_languages) {
    auto it = builtin.find(language);
    if (it == builtin.end()) {
      std::cerr << "[LanguageDetector] Warning: no stop-word profile for '" << language << "'" << std::endl;
      continue;
    }
    profiles_.emplace(language, it->second);
    languages_.push_back(language);
  }
}

std::string LanguageDetector::detect(const std::string& text) const {
  const auto tokens = words(text);
  if (tokens.empty()) {
    return default_language_;
  }

  std::string best = default_language_;
  int best_hits = 0;
  bool tied = false;
  for (const auto& language : languages_) {
    const auto& profile = profiles_.at(language);
    int hits = 0;
    for (const auto& token : tokens) {
      if (profile.count(token)) ++hits;
    }
    if (hits > best_hits) {
      best = language;
      best_hits = hits;
      tied = false;
    } else if (hits == best_hits && hits > 0) {
      tied = true;
    }
  }
  if (best_hits == 0 || tied) {
    return default_language_;
  }
  return best;
}

}  // namespace docqa_core
