#pragma once

#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace docqa_core {

struct IntentPrediction {
  std::string intent;
  float confidence = 0.0f;
};

struct IntentExample {
  std::string text;
  std::string intent;
};

// Multinomial naive Bayes (Laplace smoothing) trained on seed phrases. When
// the winning posterior is below the threshold, the first intent whose
// keyword occurs in the query is returned with KEYWORD_CONFIDENCE instead.
class IntentClassifier {
 public:
  static constexpr float KEYWORD_CONFIDENCE = 0.8f;

  // Insertion order of the keyword table decides fallback precedence.
  using KeywordTable = std::vector<std::pair<std::string, std::vector<std::string>>>;

  explicit IntentClassifier(float confidence_threshold = 0.6f,
                            std::vector<IntentExample> examples = default_examples(),
                            KeywordTable keywords = default_keywords());

  // Never throws; failures yield {"general", 0.0}.
  IntentPrediction classify(const std::string& query) const;

  // Adds one labelled example and refits.
  void update(const std::string& query, const std::string& intent);

  std::vector<std::string> keywords_for(const std::string& intent) const;

  static std::vector<IntentExample> default_examples();
  static KeywordTable default_keywords();

 private:
  void fit();
  IntentPrediction predict(const std::vector<std::string>& tokens) const;

  float threshold_;
  std::vector<IntentExample> examples_;
  KeywordTable keywords_;

  std::map<std::string, double> log_priors_;
  std::map<std::string, std::unordered_map<std::string, int>> word_counts_;
  std::map<std::string, int> total_words_;
  std::unordered_map<std::string, int> vocabulary_;
};

}  // namespace docqa_core
