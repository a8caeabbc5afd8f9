#include "docqa_core/conversation/history_manager.hpp"

#include <iostream>

namespace docqa_core {

HistoryManager::HistoryManager(ConversationStore& store, size_t max_messages)
    : store_(store), max_messages_(max_messages == 0 ? 1 : max_messages) {}

std::shared_ptr<HistoryManager::DeviceHistory> HistoryManager::device(const std::string& device_id) {
  std::lock_guard<std::mutex> lock(devices_mutex_);
  auto& entry = devices_[device_id];
  if (!entry) {
    entry = std::make_shared<DeviceHistory>();
  }
  return entry;
}

void HistoryManager::load_locked(const std::string& device_id, DeviceHistory& history) {
  if (history.loaded) {
    return;
  }
  // A failed load is not retried; the window then holds only this process's turns.
  history.loaded = true;
  try {
    auto stored = store_.last_turns(device_id, max_messages_);
    history.turns.insert(history.turns.begin(), stored.begin(), stored.end());
    std::cout << "[HistoryManager] Retrieved " << stored.size() << " turns from database for device "
              << device_id << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "[HistoryManager] Error loading history for device " << device_id << ": " << e.what()
              << std::endl;
  }
}

void HistoryManager::add_turn(const ConversationTurn& turn) {
  auto history = device(turn.device_id);
  std::lock_guard<std::mutex> lock(history->mutex);
  load_locked(turn.device_id, *history);

  try {
    store_.append_turn(turn);
  } catch (const std::exception& e) {
    std::cerr << "[HistoryManager] Error persisting turn for device " << turn.device_id << ": " << e.what()
              << std::endl;
  }

  history->turns.push_back(turn);
  while (history->turns.size() > max_messages_) {
    history->turns.pop_front();
  }
}

std::vector<ConversationTurn> HistoryManager::get_history(const std::string& device_id) {
  auto history = device(device_id);
  std::lock_guard<std::mutex> lock(history->mutex);

  load_locked(device_id, *history);
  return {history->turns.begin(), history->turns.end()};
}

void HistoryManager::clear(const std::string& device_id) {
  auto history = device(device_id);
  std::lock_guard<std::mutex> lock(history->mutex);
  history->turns.clear();
  history->loaded = false;
  std::cout << "[HistoryManager] Cleared history for device " << device_id << std::endl;
}

}  // namespace docqa_core
