#include "docqa_core/conversation/response_formatter.hpp"

#include <array>
#include <cctype>
#include <sstream>
#include <vector>

#include "docqa_core/conversation/prompt_builder.hpp"

namespace docqa_core {

namespace {

const char* const ESCALATION_INVITATION =
    "\n\n**Would you like me to escalate this question to the HR team?** They can provide a more "
    "specific answer to your question.";

std::string trim(const std::string& value) {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

std::vector<std::string> split_paragraphs(const std::string& text) {
  std::vector<std::string> paragraphs;
  size_t start = 0;
  while (true) {
    const size_t pos = text.find("\n\n", start);
    if (pos == std::string::npos) {
      paragraphs.push_back(text.substr(start));
      break;
    }
    paragraphs.push_back(text.substr(start, pos - start));
    start = pos + 2;
  }
  return paragraphs;
}

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    lines.push_back(line);
  }
  return lines;
}

bool starts_with(const std::string& value, const std::string& prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

EscalationOutcome apply_escalation(const std::string& raw_answer, bool offer_escalation) {
  EscalationOutcome outcome;
  outcome.text = raw_answer;
  const std::string sentinel = ESCALATION_SENTINEL;
  for (size_t pos = outcome.text.find(sentinel); pos != std::string::npos;
       pos = outcome.text.find(sentinel, pos)) {
    outcome.text.erase(pos, sentinel.size());
    outcome.escalated = true;
  }
  if (outcome.escalated) {
    outcome.text = trim(outcome.text);
    if (offer_escalation) {
      outcome.text += ESCALATION_INVITATION;
    }
  }
  return outcome;
}

std::string format_response(const std::string& text) {
  static const std::array<const char*, 6> headings = {"What is",      "Causes of",       "Symptoms of",
                                                      "Types of",     "Transmission of", "Prevention of"};

  std::vector<std::string> output;
  for (const auto& paragraph : split_paragraphs(text)) {
    const auto lines = split_lines(paragraph);

    bool heading = false;
    for (const char* keyword : headings) {
      if (starts_with(paragraph, keyword)) {
        heading = true;
        break;
      }
    }
    if (heading) {
      output.push_back("### " + paragraph);
      continue;
    }

    bool has_content = false;
    bool bullets = true;
    bool numbered = true;
    for (const auto& line : lines) {
      const std::string stripped = trim(line);
      if (stripped.empty()) continue;
      has_content = true;
      if (stripped[0] != '-' && stripped[0] != '*') bullets = false;
      if (stripped.size() < 2 || !std::isdigit(static_cast<unsigned char>(stripped[0])) || stripped[1] != '.') {
        numbered = false;
      }
    }

    if (has_content && bullets) {
      for (const auto& line : lines) output.push_back(trim(line));
    } else if (has_content && numbered) {
      for (const auto& line : lines) output.push_back(line);
    } else {
      output.push_back(paragraph);
    }
  }

  std::string joined;
  for (size_t i = 0; i < output.size(); ++i) {
    if (i > 0) joined += "\n\n";
    joined += output[i];
  }
  return joined;
}

}  // namespace docqa_core
