#include "docqa_core/conversation/llm_health_monitor.hpp"

#include <iostream>

namespace docqa_core {

LlmHealthMonitor::LlmHealthMonitor(ChatClient& client, std::chrono::seconds cache_duration)
    : client_(client), cache_duration_(cache_duration) {}

bool LlmHealthMonitor::is_operational(bool force_refresh) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = std::chrono::steady_clock::now();
  if (!force_refresh && last_status_ && now < expires_at_) {
    return *last_status_;
  }

  const bool available = client_.is_available();
  if (!available) {
    std::cerr << "[LlmHealthMonitor] Warning: language model service is not operational" << std::endl;
  }
  last_status_ = available;
  expires_at_ = now + cache_duration_;
  return available;
}

}  // namespace docqa_core
