#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "docqa_core/analysis/entity_extractor.hpp"
#include "docqa_core/analysis/intent_classifier.hpp"
#include "docqa_core/analysis/language_detector.hpp"
#include "docqa_core/cache/kv_cache.hpp"
#include "docqa_core/conversation/history_manager.hpp"
#include "docqa_core/conversation/llm_health_monitor.hpp"
#include "docqa_core/conversation/prompt_builder.hpp"
#include "docqa_core/llm/chat_client.hpp"
#include "docqa_core/services/context_assembler.hpp"
#include "docqa_core/types/conversation.hpp"

namespace docqa_core {

enum class TurnStage {
  CacheCheck,
  HealthCheck,
  Analyze,
  FileRefresh,
  HistoryLoad,
  ContextBuild,
  PromptBuild,
  Generate,
  PostProcess,
  CacheWrite,
  Return
};

std::string to_string(TurnStage stage);

inline constexpr const char* SERVICE_UNAVAILABLE_MESSAGE =
    "I'm sorry, but our language model service is currently experiencing issues. Please try again in "
    "a few minutes.";

struct ConversationOptions {
  GenerationParams generation;
  int max_retries = 2;
  std::chrono::milliseconds retry_backoff{1000};  // doubled per retry
  int context_max_tokens = 1500;
  float intent_confidence_threshold = 0.6f;
  bool enable_escalation = true;
  std::vector<std::string> hr_emails;
  bool cache_enabled = true;
  std::string cache_prefix = "docqa";
  std::chrono::seconds response_ttl{1800};
};

// Re-ingests an attached file if it changed since the last run.
using FileRefresher = std::function<void(const std::filesystem::path&)>;

// One question in, one answer out. Every path returns a TurnResult: cache
// hits and health failures short-circuit, analysis/context/cache failures
// degrade to defaults, and generation failures become friendly messages.
class ConversationService {
 public:
  ConversationService(ChatClient& chat, LlmHealthMonitor& health, ContextAssembler& context,
                      HistoryManager& history, const LanguageDetector& language,
                      const IntentClassifier& intents, const EntityExtractor& entities,
                      const PromptBuilder& prompts, KeyValueCache* cache,
                      ConversationOptions options = ConversationOptions());

  ConversationService(const ConversationService&) = delete;
  ConversationService& operator=(const ConversationService&) = delete;

  TurnResult handle(const TurnRequest& request);

  void set_file_refresher(FileRefresher refresher) { file_refresher_ = std::move(refresher); }

  // Lower-cased, punctuation-free query matches a stock greeting.
  static bool is_greeting(const std::string& query);

  static std::string greeting_response();

 private:
  struct Analysis {
    std::string language = "en";
    IntentPrediction intent{"unknown", 0.0f};
    std::vector<Entity> entities;
  };

  Analysis analyze(const std::string& query) const;
  void refresh_files(const std::vector<AttachedFile>& files);
  std::optional<TurnResult> cached_turn(const std::string& key);
  void store_turn(const std::string& key, const TurnResult& result);
  void record(const TurnRequest& request, const TurnResult& result);

  ChatClient& chat_;
  LlmHealthMonitor& health_;
  ContextAssembler& context_;
  HistoryManager& history_;
  const LanguageDetector& language_;
  const IntentClassifier& intents_;
  const EntityExtractor& entities_;
  const PromptBuilder& prompts_;
  KeyValueCache* cache_;
  ConversationOptions options_;
  FileRefresher file_refresher_;
};

}  // namespace docqa_core
