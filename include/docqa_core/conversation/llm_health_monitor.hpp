#pragma once

#include <chrono>
#include <mutex>
#include <optional>

#include "docqa_core/llm/chat_client.hpp"

namespace docqa_core {

// Caches the chat service liveness probe for cache_duration.
class LlmHealthMonitor {
 public:
  explicit LlmHealthMonitor(ChatClient& client,
                            std::chrono::seconds cache_duration = std::chrono::seconds(300));

  LlmHealthMonitor(const LlmHealthMonitor&) = delete;
  LlmHealthMonitor& operator=(const LlmHealthMonitor&) = delete;

  bool is_operational(bool force_refresh = false);

 private:
  ChatClient& client_;
  std::chrono::seconds cache_duration_;
  std::mutex mutex_;
  std::optional<bool> last_status_;
  std::chrono::steady_clock::time_point expires_at_;
};

}  // namespace docqa_core
