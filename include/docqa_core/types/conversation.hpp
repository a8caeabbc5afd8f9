#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "docqa_core/types/retrieval.hpp"

namespace docqa_core {

struct Entity {
  std::string text;
  std::string label;
  size_t start = 0;
  size_t end = 0;
  float confidence = 0.0f;
};

// One user/assistant exchange, append-only per device.
struct ConversationTurn {
  std::string device_id;
  std::string chat_id;
  std::string user_query;
  std::string assistant_response;
  std::string language = "en";
  std::vector<SourceRef> sources;
  std::vector<Entity> entities;
  std::string intent;
  std::chrono::system_clock::time_point timestamp;
  double response_time = 0.0;
};

// An attachment that arrived with a question; prioritized during retrieval.
struct AttachedFile {
  std::string file_name;
  std::string path;
};

struct TurnRequest {
  std::string query;
  std::string device_id;
  std::string chat_id;
  std::vector<AttachedFile> files;
};

struct TurnResult {
  std::string content;
  std::string language = "en";
  std::vector<SourceRef> sources;
  double response_time = 0.0;
  bool escalated = false;
  bool cached = false;
  std::string intent;
  float intent_confidence = 0.0f;
  std::vector<Entity> entities;
  std::optional<std::string> error;
};

}  // namespace docqa_core
