#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "docqa_core/analysis/entity_extractor.hpp"
#include "docqa_core/analysis/intent_classifier.hpp"
#include "docqa_core/analysis/language_detector.hpp"

namespace docqa_core {

using ::testing::Contains;

// ---------------------------------------------------------------------------
// LanguageDetector
// ---------------------------------------------------------------------------

TEST(LanguageDetectorTest, DetectsSupportedLanguages) {
  LanguageDetector detector;
  EXPECT_EQ(detector.detect("How many vacation days do I get?"), "en");
  EXPECT_EQ(detector.detect("\xC2\xBF" "Cu\xC3\xA1ntos d\xC3\xAD" "as de vacaciones tengo por a\xC3\xB1o?"), "es");
  EXPECT_EQ(detector.detect("Combien de jours de cong\xC3\xA9 ai-je pour les vacances?"), "fr");
  EXPECT_EQ(detector.detect("Wie viele Urlaubstage habe ich pro Jahr?"), "de");
}

TEST(LanguageDetectorTest, TiesAndEmptyInputReturnDefault) {
  LanguageDetector detector;
  // "la" is a stop word in both Spanish and French.
  EXPECT_EQ(detector.detect("la"), "en");
  EXPECT_EQ(detector.detect(""), "en");
  EXPECT_EQ(detector.detect("   ?! "), "en");
  EXPECT_EQ(detector.detect("12345 xyz"), "en");
}

TEST(LanguageDetectorTest, UnsupportedLanguagesAreIgnored) {
  LanguageDetector detector({"en", "xx"}, "en");
  EXPECT_EQ(detector.detect("Wie viele Urlaubstage habe ich?"), "en");
  EXPECT_EQ(detector.default_language(), "en");
}

// ---------------------------------------------------------------------------
// IntentClassifier
// ---------------------------------------------------------------------------

TEST(IntentClassifierTest, StrongSeedVocabularyWins) {
  IntentClassifier classifier(0.0f);
  auto prediction = classifier.classify("dental coverage insurance benefits");
  EXPECT_EQ(prediction.intent, "benefits");
  EXPECT_GT(prediction.confidence, 0.5f);
}

TEST(IntentClassifierTest, LowConfidenceFallsBackToKeywords) {
  // A threshold above 1 forces the keyword path.
  IntentClassifier classifier(1.01f);

  auto leave = classifier.classify("Can I carry over unused PTO?");
  EXPECT_EQ(leave.intent, "leave");
  EXPECT_FLOAT_EQ(leave.confidence, IntentClassifier::KEYWORD_CONFIDENCE);

  EXPECT_EQ(classifier.classify("When is bonus season?").intent, "compensation");
  EXPECT_EQ(classifier.classify("What happens at my exit interview").intent, "offboarding");
}

TEST(IntentClassifierTest, KeywordTableOrderDecidesPrecedence) {
  IntentClassifier classifier(1.01f);
  // "sick" (leave) comes before "insurance" (benefits) in the table.
  EXPECT_EQ(classifier.classify("does insurance cover sick days").intent, "leave");
}

TEST(IntentClassifierTest, EmptyModelReturnsGeneral) {
  IntentClassifier classifier(0.6f, {}, {});
  auto prediction = classifier.classify("anything");
  EXPECT_EQ(prediction.intent, "general");
  EXPECT_FLOAT_EQ(prediction.confidence, 0.0f);
}

TEST(IntentClassifierTest, UpdateRefitsWithNewExample) {
  IntentClassifier classifier(0.6f, {}, {});
  classifier.update("How do I enroll in the pension scheme?", "retirement");

  auto prediction = classifier.classify("pension scheme");
  EXPECT_EQ(prediction.intent, "retirement");
  EXPECT_FLOAT_EQ(prediction.confidence, 1.0f);
}

TEST(IntentClassifierTest, KeywordsForIntent) {
  IntentClassifier classifier;
  EXPECT_THAT(classifier.keywords_for("leave"), Contains("pto"));
  EXPECT_TRUE(classifier.keywords_for("unknown").empty());
}

// ---------------------------------------------------------------------------
// EntityExtractor
// ---------------------------------------------------------------------------

TEST(EntityExtractorTest, LabelsKeywordsInTextOrder) {
  EntityExtractor extractor;
  auto entities = extractor.extract("I need a Vacation policy form for my manager");

  ASSERT_EQ(entities.size(), 4u);
  EXPECT_EQ(entities[0].label, "LEAVE");
  EXPECT_EQ(entities[0].text, "Vacation");
  EXPECT_EQ(entities[0].start, 9u);
  EXPECT_EQ(entities[0].end, 17u);
  EXPECT_EQ(entities[1].label, "POLICY");
  EXPECT_EQ(entities[2].label, "DOCUMENT");
  EXPECT_EQ(entities[3].label, "ROLE");
  EXPECT_FLOAT_EQ(entities[3].confidence, EntityExtractor::PATTERN_CONFIDENCE);
}

TEST(EntityExtractorTest, MatchesWholeWordsOnly) {
  EntityExtractor extractor;
  // "planning" and "daylight" do not contain whole keywords.
  EXPECT_TRUE(extractor.extract("planning for daylight").empty());
}

TEST(EntityExtractorTest, OverlapsKeepEarliestThenLongest) {
  std::vector<Entity> entities = {
      {"time", "TIME", 5, 9, 0.6f},
      {"time off", "LEAVE", 5, 13, 0.6f},
      {"off", "OTHER", 10, 13, 0.6f},
      {"policy", "POLICY", 20, 26, 0.6f},
  };

  auto filtered = EntityExtractor::filter_overlapping(entities);

  ASSERT_EQ(filtered.size(), 2u);
  EXPECT_EQ(filtered[0].label, "LEAVE");
  EXPECT_EQ(filtered[1].label, "POLICY");
}

TEST(EntityExtractorTest, TextBeyondLimitIsIgnored) {
  EntityExtractor extractor;
  std::string text(EntityExtractor::MAX_TEXT_LENGTH, ' ');
  text += "policy";
  EXPECT_TRUE(extractor.extract(text).empty());
}

TEST(EntityExtractorTest, CustomPatternTable) {
  EntityExtractor extractor({{"LOCATION", {"head office", "warehouse"}}});
  auto entities = extractor.extract("Report to the Head Office on Monday");
  ASSERT_EQ(entities.size(), 1u);
  EXPECT_EQ(entities[0].label, "LOCATION");
  EXPECT_EQ(entities[0].text, "Head Office");
}

}  // namespace docqa_core
