#pragma once

#include <string>
#include <vector>

#include "docqa_core/llm/chat_client.hpp"
#include "docqa_core/types/conversation.hpp"

namespace docqa_core {

inline constexpr const char* ESCALATION_SENTINEL = "[ESCALATE_TO_HR]";

struct PromptOptions {
  std::string system_prompt;  // empty selects default_system_prompt()
  size_t history_turns = 5;
  bool enable_escalation = true;
};

// Message order: system prompt, history pairs (oldest first), the context
// block as a system message, then the user query with answering rules.
class PromptBuilder {
 public:
  explicit PromptBuilder(PromptOptions options = PromptOptions());

  std::vector<ChatMessage> build(const std::string& query, const std::string& language,
                                 const std::vector<ConversationTurn>& history,
                                 const std::string& context) const;

  std::string system_message(const std::string& language) const;

  static std::string default_system_prompt();

  // "es" -> "Spanish"; unknown codes are returned unchanged.
  static std::string language_name(const std::string& code);

 private:
  PromptOptions options_;
};

}  // namespace docqa_core
