#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace docqa_core {

class LlmError : public std::exception {
 public:
  explicit LlmError(const std::string& message, long http_status = 0)
      : message_(message), http_status_(http_status) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

  // 0 when the request never produced an HTTP response.
  long http_status() const noexcept { return http_status_; }

 private:
  std::string message_;
  long http_status_;
};

struct ChatMessage {
  std::string role;  // "system", "user" or "assistant"
  std::string content;
};

struct GenerationParams {
  int max_tokens = 700;
  double temperature = 0.1;
  double top_p = 0.9;
  double frequency_penalty = 0.2;
  double presence_penalty = 0.6;
  std::chrono::seconds timeout{60};
};

// Language model used for answer generation.
class ChatClient {
 public:
  virtual ~ChatClient() = default;

  // Returns the assistant text. Throws LlmError on transport or API errors.
  virtual std::string complete(const std::vector<ChatMessage>& messages,
                               const GenerationParams& params) = 0;

  // Lightweight liveness probe; never throws.
  virtual bool is_available() = 0;
};

// OpenAI-compatible /chat/completions endpoint over libcurl. The timeout in
// GenerationParams bounds the whole transfer.
class HttpChatClient : public ChatClient {
 public:
  static constexpr long PROBE_TIMEOUT_SECONDS = 5;

  HttpChatClient(std::string api_url, std::string api_key, std::string model);

  HttpChatClient(const HttpChatClient&) = delete;
  HttpChatClient& operator=(const HttpChatClient&) = delete;

  std::string complete(const std::vector<ChatMessage>& messages,
                       const GenerationParams& params) override;
  bool is_available() override;

  // Request body for a completion call.
  std::string build_request_body(const std::vector<ChatMessage>& messages,
                                 const GenerationParams& params) const;

  // Pulls choices[0].message.content out of a response body; throws LlmError.
  static std::string parse_completion(const std::string& body);

 private:
  static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp);

  std::string api_url_;
  std::string api_key_;
  std::string model_;
};

}  // namespace docqa_core
