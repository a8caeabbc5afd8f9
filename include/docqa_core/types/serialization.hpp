#pragma once

#include <nlohmann/json.hpp>

#include "docqa_core/types/conversation.hpp"
#include "docqa_core/types/retrieval.hpp"

namespace docqa_core {

// nlohmann ADL hooks for the record types written to the turn log and the cache.

inline void to_json(nlohmann::json& j, const SourceRef& s) {
  j = nlohmann::json{{"title", s.title}, {"source_file", s.source_file}, {"score", s.score}};
}

inline void from_json(const nlohmann::json& j, SourceRef& s) {
  s.title = j.value("title", std::string());
  s.source_file = j.value("source_file", std::string());
  s.score = j.value("score", 0.0f);
}

inline void to_json(nlohmann::json& j, const Entity& e) {
  j = nlohmann::json{{"text", e.text},   {"label", e.label},
                     {"start", e.start}, {"end", e.end},
                     {"confidence", e.confidence}};
}

inline void from_json(const nlohmann::json& j, Entity& e) {
  e.text = j.value("text", std::string());
  e.label = j.value("label", std::string());
  e.start = j.value("start", static_cast<size_t>(0));
  e.end = j.value("end", static_cast<size_t>(0));
  e.confidence = j.value("confidence", 0.0f);
}

inline void to_json(nlohmann::json& j, const TurnResult& r) {
  j = nlohmann::json{{"content", r.content},
                     {"language", r.language},
                     {"sources", r.sources},
                     {"response_time", r.response_time},
                     {"escalated", r.escalated},
                     {"intent", r.intent},
                     {"intent_confidence", r.intent_confidence},
                     {"entities", r.entities}};
  if (r.error) {
    j["error"] = *r.error;
  }
}

inline void from_json(const nlohmann::json& j, TurnResult& r) {
  r.content = j.value("content", std::string());
  r.language = j.value("language", std::string("en"));
  r.sources = j.value("sources", std::vector<SourceRef>{});
  r.response_time = j.value("response_time", 0.0);
  r.escalated = j.value("escalated", false);
  r.intent = j.value("intent", std::string());
  r.intent_confidence = j.value("intent_confidence", 0.0f);
  r.entities = j.value("entities", std::vector<Entity>{});
  if (j.contains("error") && j["error"].is_string()) {
    r.error = j["error"].get<std::string>();
  }
}

}  // namespace docqa_core
