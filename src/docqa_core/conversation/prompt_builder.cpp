#include "docqa_core/conversation/prompt_builder.hpp"

#include <unordered_map>
#include <utility>

namespace docqa_core {

PromptBuilder::PromptBuilder(PromptOptions options) : options_(std::move(options)) {
  if (options_.system_prompt.empty()) {
    options_.system_prompt = default_system_prompt();
  }
}

std::string PromptBuilder::default_system_prompt() {
  return "You are an HR assistant that helps employees with questions about company policies, "
         "benefits, leave and compensation. Answer strictly from the company documents provided as "
         "context; never rely on general HR knowledge or guess policy details.\n\n"
         "- Use plain, empathetic language and give concrete steps where they apply.\n"
         "- Quote numbers from the documents exactly (leave days, notice periods, amounts).\n"
         "- Use markdown: bold section titles and bullet points for lists.\n"
         "- If the documents do not cover the question, say so and ask for clarification or the "
         "related document.\n"
         "- End with an invitation for follow-up questions.";
}

std::string PromptBuilder::language_name(const std::string& code) {
  static const std::unordered_map<std::string, std::string> names = {
      {"en", "English"}, {"es", "Spanish"}, {"fr", "French"}, {"de", "German"},
  };
  auto it = names.find(code);
  return it == names.end() ? code : it->second;
}

std::string PromptBuilder::system_message(const std::string& language) const {
  std::string message = options_.system_prompt;
  message += "\n\nRespond in " + language_name(language.empty() ? "en" : language) + ".";
  if (options_.enable_escalation) {
    message += std::string("\n\nIf the documents cannot answer the question, or it needs a decision only "
                           "the HR team can make, append the token ") +
               ESCALATION_SENTINEL + " at the end of your reply.";
  }
  return message;
}

std::vector<ChatMessage> PromptBuilder::build(const std::string& query, const std::string& language,
                                              const std::vector<ConversationTurn>& history,
                                              const std::string& context) const {
  std::vector<ChatMessage> messages;
  messages.push_back({"system", system_message(language)});

  const size_t first = history.size() > options_.history_turns ? history.size() - options_.history_turns : 0;
  for (size_t i = first; i < history.size(); ++i) {
    messages.push_back({"user", history[i].user_query});
    messages.push_back({"assistant", history[i].assistant_response});
  }

  messages.push_back({"system", "Relevant HR context:\n\n" + context});
  messages.push_back({"user", query +
                                  "\n\nInstructions:\n"
                                  "- Only answer based on the provided context.\n"
                                  "- Do not make assumptions if the answer is not in the documents.\n"
                                  "- Use document metrics if mentioned.\n"
                                  "- Be concise, clear, and professional.\n"
                                  "- Ask for clarification if the query is vague."});
  return messages;
}

}  // namespace docqa_core
