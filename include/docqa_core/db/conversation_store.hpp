#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "docqa_core/db/database_manager.hpp"
#include "docqa_core/types/conversation.hpp"

namespace docqa_core {

class ConversationStoreError : public std::exception {
 public:
  explicit ConversationStoreError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Durable, append-only turn log.
class ConversationStore {
 public:
  virtual ~ConversationStore() = default;

  virtual void append_turn(const ConversationTurn& turn) = 0;

  // Oldest first.
  virtual std::vector<ConversationTurn> last_turns(const std::string& device_id, size_t limit) = 0;

  // Oldest first; page is zero-based.
  virtual std::vector<ConversationTurn> turns_for_chat(const std::string& chat_id, size_t page,
                                                       size_t page_size) = 0;
};

class SqliteConversationStore : public ConversationStore {
 public:
  explicit SqliteConversationStore(DatabaseManager& db_manager);

  SqliteConversationStore(const SqliteConversationStore&) = delete;
  SqliteConversationStore& operator=(const SqliteConversationStore&) = delete;

  void append_turn(const ConversationTurn& turn) override;
  std::vector<ConversationTurn> last_turns(const std::string& device_id, size_t limit) override;
  std::vector<ConversationTurn> turns_for_chat(const std::string& chat_id, size_t page,
                                               size_t page_size) override;

 private:
  DatabaseManager& db_manager_;
};

}  // namespace docqa_core
