#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace docqa_core {

// Stop-word profile scoring. A language wins when it has strictly more
// stop-word hits than every other profile; ties, empty input and input with
// no hits return the default language.
class LanguageDetector {
 public:
  explicit LanguageDetector(std::vector<std::string> supported_languages = {"en", "es", "fr", "de"},
                            std::string default_language = "en");

  std::string detect(const std::string& text) const;

  const std::string& default_language() const { return default_language_; }

 private:
  std::unordered_map<std::string, std::unordered_set<std::string>> profiles_;
  std::vector<std::string> languages_;
  std::string default_language_;
};

}  // namespace docqa_core
