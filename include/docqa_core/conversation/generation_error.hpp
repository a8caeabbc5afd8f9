#pragma once

#include <exception>
#include <string>

namespace docqa_core {

enum class GenerationErrorKind {
  Timeout,
  Connection,
  RateLimit,
  Authentication,
  ContextTooLarge,
  InvalidRequest,
  Unknown
};

std::string to_string(GenerationErrorKind kind);

// HTTP status first (LlmError), then message substrings.
GenerationErrorKind classify_generation_error(const std::exception& e);

// Timeout, Connection and RateLimit.
bool is_transient(GenerationErrorKind kind);

// Friendly text shown to the user; never contains the internal detail.
std::string user_message(GenerationErrorKind kind);

}  // namespace docqa_core
