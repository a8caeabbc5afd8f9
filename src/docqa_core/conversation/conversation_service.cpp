#include "docqa_core/conversation/conversation_service.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <thread>
#include <unordered_set>

#include "docqa_core/conversation/generation_error.hpp"
#include "docqa_core/conversation/response_formatter.hpp"
#include "docqa_core/types/serialization.hpp"

namespace docqa_core {

namespace {

double seconds_since(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

std::string preview(const std::string& query) {
  return query.size() > 50 ? query.substr(0, 50) + "..." : query;
}

}  // namespace

std::string to_string(TurnStage stage) {
  switch (stage) {
    case TurnStage::CacheCheck:
      return "CacheCheck";
    case TurnStage::HealthCheck:
      return "HealthCheck";
    case TurnStage::Analyze:
      return "Analyze";
    case TurnStage::FileRefresh:
      return "FileRefresh";
    case TurnStage::HistoryLoad:
      return "HistoryLoad";
    case TurnStage::ContextBuild:
      return "ContextBuild";
    case TurnStage::PromptBuild:
      return "PromptBuild";
    case TurnStage::Generate:
      return "Generate";
    case TurnStage::PostProcess:
      return "PostProcess";
    case TurnStage::CacheWrite:
      return "CacheWrite";
    case TurnStage::Return:
    default:
      return "Return";
  }
}

ConversationService::ConversationService(ChatClient& chat, LlmHealthMonitor& health, ContextAssembler& context,
                                         HistoryManager& history, const LanguageDetector& language,
                                         const IntentClassifier& intents, const EntityExtractor& entities,
                                         const PromptBuilder& prompts, KeyValueCache* cache,
                                         ConversationOptions options)
    : chat_(chat),
      health_(health),
      context_(context),
      history_(history),
      language_(language),
      intents_(intents),
      entities_(entities),
      prompts_(prompts),
      cache_(cache),
      options_(std::move(options)) {}

bool ConversationService::is_greeting(const std::string& query) {
  static const std::unordered_set<std::string> greetings = {
      "hi",          "hello",          "hey",           "hiya",         "greetings",
      "good morning", "good afternoon", "good evening", "hi there",     "hello there",
      "hey there",   "howdy",          "yo"};
  std::string normalized;
  bool pending_space = false;
  for (unsigned char c : query) {
    if (std::isalpha(c)) {
      if (pending_space && !normalized.empty()) normalized += ' ';
      pending_space = false;
      normalized += static_cast<char>(std::tolower(c));
    } else if (std::isspace(c)) {
      pending_space = true;
    }
  }
  return greetings.count(normalized) > 0;
}

std::string ConversationService::greeting_response() {
  return "Hello! I'm your HR assistant. Ask me anything about company policies, benefits, leave or "
         "compensation, and I'll answer from the company documents.";
}

ConversationService::Analysis ConversationService::analyze(const std::string& query) const {
  Analysis analysis;
  try {
    analysis.language = language_.detect(query);
  } catch (const std::exception& e) {
    std::cerr << "[ConversationService] Language detection failed: " << e.what() << std::endl;
    analysis.language = "en";
  }
  try {
    analysis.intent = intents_.classify(query);
  } catch (const std::exception& e) {
    std::cerr << "[ConversationService] Intent classification failed: " << e.what() << std::endl;
    analysis.intent = {"unknown", 0.0f};
  }
  try {
    analysis.entities = entities_.extract(query);
  } catch (const std::exception& e) {
    std::cerr << "[ConversationService] Entity extraction failed: " << e.what() << std::endl;
    analysis.entities.clear();
  }
  return analysis;
}

void ConversationService::refresh_files(const std::vector<AttachedFile>& files) {
  if (!file_refresher_) return;
  for (const auto& file : files) {
    if (file.path.empty()) continue;
    try {
      file_refresher_(file.path);
    } catch (const std::exception& e) {
      std::cerr << "[ConversationService] Warning: could not refresh attached file " << file.path << ": "
                << e.what() << std::endl;
    }
  }
}

std::optional<TurnResult> ConversationService::cached_turn(const std::string& key) {
  if (!cache_ || !options_.cache_enabled) return std::nullopt;
  try {
    auto value = cache_->get(key);
    if (!value) return std::nullopt;
    return nlohmann::json::parse(*value).get<TurnResult>();
  } catch (const std::exception& e) {
    std::cerr << "[ConversationService] Warning: cache read failed: " << e.what() << std::endl;
    return std::nullopt;
  }
}

void ConversationService::store_turn(const std::string& key, const TurnResult& result) {
  if (!cache_ || !options_.cache_enabled) return;
  try {
    cache_->set(key, nlohmann::json(result).dump(), options_.response_ttl);
  } catch (const std::exception& e) {
    std::cerr << "[ConversationService] Warning: cache write failed: " << e.what() << std::endl;
  }
}

void ConversationService::record(const TurnRequest& request, const TurnResult& result) {
  ConversationTurn turn;
  turn.device_id = request.device_id;
  turn.chat_id = request.chat_id;
  turn.user_query = request.query;
  turn.assistant_response = result.content;
  turn.language = result.language;
  turn.sources = result.sources;
  turn.entities = result.entities;
  turn.intent = result.intent;
  turn.timestamp = std::chrono::system_clock::now();
  turn.response_time = result.response_time;
  history_.add_turn(turn);
}

TurnResult ConversationService::handle(const TurnRequest& request) {
  const auto started = std::chrono::steady_clock::now();
  const std::string cache_key = make_cache_key(options_.cache_prefix, CacheKind::Response, request.query);
  // Answers built around attached files depend on their current contents.
  const bool cacheable = request.files.empty();
  auto enter = [](TurnStage stage) {
    std::cout << "[ConversationService] Stage: " << to_string(stage) << std::endl;
  };

  enter(TurnStage::CacheCheck);
  if (auto cached = cacheable ? cached_turn(cache_key) : std::nullopt) {
    cached->cached = true;
    cached->response_time = seconds_since(started);
    std::cout << "[ConversationService] Cache hit for query: " << preview(request.query) << std::endl;
    enter(TurnStage::Return);
    return *cached;
  }

  enter(TurnStage::HealthCheck);
  if (!health_.is_operational()) {
    std::cerr << "[ConversationService] Language model service appears to be down" << std::endl;
    TurnResult result;
    result.content = SERVICE_UNAVAILABLE_MESSAGE;
    result.error = "ServiceUnavailable: language model health check failed";
    result.response_time = seconds_since(started);
    enter(TurnStage::Return);
    return result;
  }

  TurnResult result;
  for (int retry_count = 0;; ++retry_count) {
    enter(TurnStage::Analyze);
    const Analysis analysis = analyze(request.query);
    result = TurnResult();
    result.language = analysis.language;
    result.intent = analysis.intent.intent;
    result.intent_confidence = analysis.intent.confidence;
    result.entities = analysis.entities;

    if (is_greeting(request.query) && analysis.intent.confidence < options_.intent_confidence_threshold) {
      result.content = greeting_response();
      result.response_time = seconds_since(started);
      record(request, result);
      enter(TurnStage::Return);
      return result;
    }

    enter(TurnStage::FileRefresh);
    refresh_files(request.files);

    enter(TurnStage::HistoryLoad);
    std::vector<ConversationTurn> history;
    if (!request.device_id.empty()) {
      history = history_.get_history(request.device_id);
    }

    enter(TurnStage::ContextBuild);
    ContextBundle bundle;
    try {
      bundle = context_.build(request.query, options_.context_max_tokens, request.files);
    } catch (const std::exception& e) {
      std::cerr << "[ConversationService] Context build failed: " << e.what() << std::endl;
    }
    result.sources = bundle.sources;
    std::cout << "[ConversationService] Context size: " << bundle.context.size() << " characters, "
              << bundle.sources.size() << " sources" << std::endl;

    enter(TurnStage::PromptBuild);
    const auto messages = prompts_.build(request.query, analysis.language, history, bundle.context);

    enter(TurnStage::Generate);
    std::string raw_answer;
    try {
      std::cout << "[ConversationService] Sending request to language model (attempt " << (retry_count + 1)
                << ")" << std::endl;
      const auto generation_started = std::chrono::steady_clock::now();
      raw_answer = chat_.complete(messages, options_.generation);
      std::cout << "[ConversationService] LLM response time: " << std::fixed << std::setprecision(2)
                << seconds_since(generation_started) << "s" << std::endl;
    } catch (const std::exception& e) {
      const GenerationErrorKind kind = classify_generation_error(e);
      std::cerr << "[ConversationService] Error running generation: " << to_string(kind) << ": " << e.what()
                << std::endl;

      if (is_transient(kind) && retry_count < options_.max_retries) {
        const auto wait = options_.retry_backoff * (1 << retry_count);
        std::cout << "[ConversationService] Will retry request (attempt " << (retry_count + 1) << " of "
                  << options_.max_retries << ") after " << wait.count() << "ms" << std::endl;
        std::this_thread::sleep_for(wait);
        health_.is_operational(true);
        continue;
      }

      result.content = user_message(kind);
      result.language = "en";
      result.sources.clear();
      result.error = to_string(kind) + ": " + e.what();
      result.response_time = seconds_since(started);
      record(request, result);
      enter(TurnStage::Return);
      return result;
    }

    enter(TurnStage::PostProcess);
    const bool offer = options_.enable_escalation && !options_.hr_emails.empty();
    EscalationOutcome escalation = apply_escalation(raw_answer, offer);
    if (escalation.escalated) {
      std::cout << "[ConversationService] Escalation needed for query: " << preview(request.query) << std::endl;
    }
    result.escalated = escalation.escalated;
    result.content = format_response(escalation.text);
    result.response_time = seconds_since(started);
    break;
  }

  enter(TurnStage::CacheWrite);
  if (cacheable) {
    store_turn(cache_key, result);
  }
  record(request, result);
  enter(TurnStage::Return);
  std::cout << "[ConversationService] Generated response for query: " << preview(request.query) << std::endl;
  return result;
}

}  // namespace docqa_core
