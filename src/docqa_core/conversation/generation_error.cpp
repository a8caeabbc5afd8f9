#include "docqa_core/conversation/generation_error.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>

#include "docqa_core/llm/chat_client.hpp"

namespace docqa_core {

namespace {

bool contains_any(const std::string& haystack, std::initializer_list<const char*> needles) {
  return std::any_of(needles.begin(), needles.end(),
                     [&haystack](const char* needle) { return haystack.find(needle) != std::string::npos; });
}

}  // namespace

std::string to_string(GenerationErrorKind kind) {
  switch (kind) {
    case GenerationErrorKind::Timeout:
      return "Timeout";
    case GenerationErrorKind::Connection:
      return "Connection";
    case GenerationErrorKind::RateLimit:
      return "RateLimit";
    case GenerationErrorKind::Authentication:
      return "Authentication";
    case GenerationErrorKind::ContextTooLarge:
      return "ContextTooLarge";
    case GenerationErrorKind::InvalidRequest:
      return "InvalidRequest";
    case GenerationErrorKind::Unknown:
    default:
      return "Unknown";
  }
}

GenerationErrorKind classify_generation_error(const std::exception& e) {
  std::string message = e.what();
  std::transform(message.begin(), message.end(), message.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (const auto* llm = dynamic_cast<const LlmError*>(&e)) {
    switch (llm->http_status()) {
      case 401:
      case 403:
        return GenerationErrorKind::Authentication;
      case 408:
      case 504:
        return GenerationErrorKind::Timeout;
      case 413:
        return GenerationErrorKind::ContextTooLarge;
      case 429:
        return GenerationErrorKind::RateLimit;
      case 400:
      case 422:
        if (contains_any(message, {"context length", "context_length", "maximum context", "too many tokens"})) {
          return GenerationErrorKind::ContextTooLarge;
        }
        return GenerationErrorKind::InvalidRequest;
      default:
        break;
    }
  }

  if (contains_any(message, {"timeout", "timed out"})) {
    return GenerationErrorKind::Timeout;
  }
  if (contains_any(message, {"api key", "authentication", "unauthorized"})) {
    return GenerationErrorKind::Authentication;
  }
  if (contains_any(message, {"rate limit", "too many requests"})) {
    return GenerationErrorKind::RateLimit;
  }
  if (contains_any(message, {"connection", "network"})) {
    return GenerationErrorKind::Connection;
  }
  if (contains_any(message, {"context length", "context_length", "maximum context"})) {
    return GenerationErrorKind::ContextTooLarge;
  }
  if (contains_any(message, {"invalid request", "invalid_request"})) {
    return GenerationErrorKind::InvalidRequest;
  }
  return GenerationErrorKind::Unknown;
}

bool is_transient(GenerationErrorKind kind) {
  return kind == GenerationErrorKind::Timeout || kind == GenerationErrorKind::Connection ||
         kind == GenerationErrorKind::RateLimit;
}

std::string user_message(GenerationErrorKind kind) {
  std::string message;
  switch (kind) {
    case GenerationErrorKind::Timeout:
      message =
          "The request took too long to process. This might be due to a complex query or temporary "
          "service issues.";
      break;
    case GenerationErrorKind::Authentication:
      message = "There was an issue with the API authentication. Please check the API key configuration.";
      break;
    case GenerationErrorKind::RateLimit:
      message = "The service is currently experiencing high demand. Please try again in a few moments.";
      break;
    case GenerationErrorKind::Connection:
      message =
          "There was a network connection issue. Please check your internet connection and try again.";
      break;
    case GenerationErrorKind::ContextTooLarge:
      message = "Your question needed more document context than the language model can accept at once.";
      break;
    case GenerationErrorKind::InvalidRequest:
      message = "The language model rejected the request as invalid.";
      break;
    case GenerationErrorKind::Unknown:
    default:
      message = "I'm sorry, I encountered an error while processing your request. Please try again.";
      break;
  }
  return message + " If the problem persists, try simplifying your question or try again later.";
}

}  // namespace docqa_core
