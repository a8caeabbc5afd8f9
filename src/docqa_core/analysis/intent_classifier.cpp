#include "docqa_core/analysis/intent_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>

namespace docqa_core {

namespace {

std::string lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::vector<std::string> word_tokens(const std::string& text) {
  std::vector<std::string> tokens;
  std::string current;
  for (unsigned char c : text) {
    if (std::isalnum(c)) {
      current += static_cast<char>(std::tolower(c));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) tokens.push_back(std::move(current));
  return tokens;
}

}  // namespace

std::vector<IntentExample> IntentClassifier::default_examples() {
  return {
      {"How do I apply for vacation leave?", "leave"},
      {"What is the process for sick leave?", "leave"},
      {"Tell me about health insurance benefits", "benefits"},
      {"What dental coverage do we have?", "benefits"},
      {"When is the next salary review?", "compensation"},
      {"How do I request a raise?", "compensation"},
      {"What is the dress code policy?", "policy"},
      {"Can you explain the remote work policy?", "policy"},
      {"What is the onboarding process?", "onboarding"},
      {"How do I complete new hire paperwork?", "onboarding"},
      {"What is the exit interview process?", "offboarding"},
      {"How do I submit my resignation?", "offboarding"},
      {"What are the general office hours?", "general"},
      {"Where can I find the employee handbook?", "general"},
  };
}

IntentClassifier::KeywordTable IntentClassifier::default_keywords() {
  return {
      {"leave", {"leave", "vacation", "time off", "sick", "absence", "pto"}},
      {"benefits", {"benefits", "insurance", "health", "dental", "vision"}},
      {"compensation", {"salary", "pay", "compensation", "bonus", "raise"}},
      {"policy", {"policy", "guidelines", "rules", "procedures"}},
      {"onboarding", {"onboarding", "orientation", "new hire", "training"}},
      {"offboarding", {"offboarding", "exit", "termination", "resignation"}},
      {"general", {"general", "other", "miscellaneous"}},
  };
}

IntentClassifier::IntentClassifier(float confidence_threshold, std::vector<IntentExample> examples,
                                   KeywordTable keywords)
    : threshold_(confidence_threshold), examples_(std::move(examples)), keywords_(std::move(keywords)) {
  fit();
}

void IntentClassifier::fit() {
  log_priors_.clear();
  word_counts_.clear();
  total_words_.clear();
  vocabulary_.clear();

  std::map<std::string, int> documents;
  for (const auto& example : examples_) {
    ++documents[example.intent];
    auto& counts = word_counts_[example.intent];
    for (const auto& token : word_tokens(example.text)) {
      ++counts[token];
      ++total_words_[example.intent];
      ++vocabulary_[token];
    }
  }
  const double total = static_cast<double>(examples_.size());
  for (const auto& [intent, count] : documents) {
    log_priors_[intent] = std::log(count / total);
  }
}

IntentPrediction IntentClassifier::predict(const std::vector<std::string>& tokens) const {
  if (log_priors_.empty()) {
    return {"general", 0.0f};
  }
  const double vocabulary_size = static_cast<double>(vocabulary_.size());

  std::vector<std::pair<std::string, double>> scores;
  for (const auto& [intent, prior] : log_priors_) {
    const auto& counts = word_counts_.at(intent);
    const auto total_it = total_words_.find(intent);
    const double total = total_it == total_words_.end() ? 0.0 : total_it->second;
    double score = prior;
    for (const auto& token : tokens) {
      if (!vocabulary_.count(token)) continue;  // unseen words carry no evidence
      const auto it = counts.find(token);
      const double count = it == counts.end() ? 0.0 : it->second;
      score += std::log((count + 1.0) / (total + vocabulary_size));
    }
    scores.emplace_back(intent, score);
  }

  // Softmax over log scores.
  double max_score = scores.front().second;
  for (const auto& entry : scores) max_score = std::max(max_score, entry.second);
  double norm = 0.0;
  for (const auto& entry : scores) norm += std::exp(entry.second - max_score);

  IntentPrediction best{scores.front().first, 0.0f};
  for (const auto& [intent, score] : scores) {
    const float probability = static_cast<float>(std::exp(score - max_score) / norm);
    if (probability > best.confidence) {
      best = {intent, probability};
    }
  }
  return best;
}

IntentPrediction IntentClassifier::classify(const std::string& query) const {
  try {
    IntentPrediction prediction = predict(word_tokens(query));
    if (prediction.confidence < threshold_) {
      const std::string lowered = lower(query);
      for (const auto& [intent, words] : keywords_) {
        for (const auto& keyword : words) {
          if (lowered.find(keyword) != std::string::npos) {
            return {intent, KEYWORD_CONFIDENCE};
          }
        }
      }
    }
    return prediction;
  } catch (const std::exception& e) {
    std::cerr << "[IntentClassifier] Error classifying intent: " << e.what() << std::endl;
    return {"general", 0.0f};
  }
}

void IntentClassifier::update(const std::string& query, const std::string& intent) {
  examples_.push_back({query, intent});
  fit();
  std::cout << "[IntentClassifier] Updated model with new example for '" << intent << "'" << std::endl;
}

std::vector<std::string> IntentClassifier::keywords_for(const std::string& intent) const {
  for (const auto& [name, words] : keywords_) {
    if (name == intent) return words;
  }
  return {};
}

}  // namespace docqa_core
