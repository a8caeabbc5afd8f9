#pragma once

#include <string>

namespace docqa_core {

struct EscalationOutcome {
  std::string text;
  bool escalated = false;
};

// Removes every escalation sentinel and trims. When one was present and
// offer_escalation is set, appends the invitation to contact HR.
EscalationOutcome apply_escalation(const std::string& raw_answer, bool offer_escalation);

// Paragraphs are split on blank lines. Topic openers ("What is", "Types of",
// ...) become "### " headings; bullet and numbered lists are re-emitted one
// item per line; everything else passes through. Rejoined with blank lines.
std::string format_response(const std::string& text);

}  // namespace docqa_core
