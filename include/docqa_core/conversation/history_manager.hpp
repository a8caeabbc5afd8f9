#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "docqa_core/db/conversation_store.hpp"
#include "docqa_core/types/conversation.hpp"

namespace docqa_core {

// Bounded per-device window over the durable turn log. Reads and writes for
// one device are serialized; different devices proceed independently.
class HistoryManager {
 public:
  HistoryManager(ConversationStore& store, size_t max_messages = 10);

  HistoryManager(const HistoryManager&) = delete;
  HistoryManager& operator=(const HistoryManager&) = delete;

  // Persists the turn, then appends it to the window. The window is loaded
  // from the store first if this device has not been seen yet. A store
  // failure is logged and the window still updates.
  void add_turn(const ConversationTurn& turn);

  // Oldest first. Loads from the store on first use of the device.
  std::vector<ConversationTurn> get_history(const std::string& device_id);

  // Drops the in-memory window only; the next read reloads from the store.
  void clear(const std::string& device_id);

  size_t max_messages() const { return max_messages_; }

 private:
  struct DeviceHistory {
    std::mutex mutex;
    std::deque<ConversationTurn> turns;
    bool loaded = false;
  };

  std::shared_ptr<DeviceHistory> device(const std::string& device_id);
  // Caller holds history.mutex.
  void load_locked(const std::string& device_id, DeviceHistory& history);

  ConversationStore& store_;
  size_t max_messages_;
  std::mutex devices_mutex_;
  std::unordered_map<std::string, std::shared_ptr<DeviceHistory>> devices_;
};

}  // namespace docqa_core
