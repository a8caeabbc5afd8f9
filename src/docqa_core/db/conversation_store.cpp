#include "docqa_core/db/conversation_store.hpp"

#include <algorithm>
#include <optional>

#include "docqa_core/db/pooled_connection.hpp"
#include "docqa_core/db/sqlite_error_utils.hpp"
#include "docqa_core/types/serialization.hpp"
#include "docqa_core/utils/time_utils.hpp"

namespace docqa_core {

namespace {

ConversationTurn turn_from_row(std::string device_id, std::optional<std::string> chat_id,
                               std::string user_query, std::string assistant_response,
                               std::string language, std::optional<std::string> intent,
                               std::optional<std::string> sources,
                               std::optional<std::string> entities, double response_time,
                               const std::string& created_at) {
  ConversationTurn turn;
  turn.device_id = std::move(device_id);
  if (chat_id) turn.chat_id = *chat_id;
  turn.user_query = std::move(user_query);
  turn.assistant_response = std::move(assistant_response);
  turn.language = std::move(language);
  if (intent) turn.intent = *intent;
  if (sources && !sources->empty()) {
    turn.sources = nlohmann::json::parse(*sources).get<std::vector<SourceRef>>();
  }
  if (entities && !entities->empty()) {
    turn.entities = nlohmann::json::parse(*entities).get<std::vector<Entity>>();
  }
  turn.response_time = response_time;
  turn.timestamp = string_to_time_point(created_at);
  return turn;
}

}  // namespace

SqliteConversationStore::SqliteConversationStore(DatabaseManager& db_manager)
    : db_manager_(db_manager) {}

void SqliteConversationStore::append_turn(const ConversationTurn& turn) {
  if (turn.device_id.empty()) {
    throw ConversationStoreError("append_turn requires a device_id");
  }
  try {
    auto timestamp = turn.timestamp.time_since_epoch().count() == 0
                         ? std::chrono::system_clock::now()
                         : turn.timestamp;
    PooledConnection conn(db_manager_);
    *conn << "INSERT INTO turns (device_id, chat_id, user_query, assistant_response, language, "
             "intent, sources, entities, response_time, created_at) "
             "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)"
          << turn.device_id << turn.chat_id << turn.user_query << turn.assistant_response
          << turn.language << turn.intent << nlohmann::json(turn.sources).dump()
          << nlohmann::json(turn.entities).dump() << turn.response_time
          << time_point_to_string(timestamp);
  } catch (const sqlite::sqlite_exception& e) {
    throw ConversationStoreError(format_db_error("append_turn", e));
  }
}

std::vector<ConversationTurn> SqliteConversationStore::last_turns(const std::string& device_id,
                                                                  size_t limit) {
  std::vector<ConversationTurn> turns;
  if (limit == 0) {
    return turns;
  }
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT device_id, chat_id, user_query, assistant_response, language, intent, "
             "sources, entities, response_time, created_at FROM turns WHERE device_id = ? "
             "ORDER BY id DESC LIMIT ?"
          << device_id << static_cast<long long>(limit) >>
        [&](std::string device, std::optional<std::string> chat_id, std::string user_query,
            std::string assistant_response, std::string language,
            std::optional<std::string> intent, std::optional<std::string> sources,
            std::optional<std::string> entities, double response_time, std::string created_at) {
          turns.push_back(turn_from_row(std::move(device), std::move(chat_id),
                                        std::move(user_query), std::move(assistant_response),
                                        std::move(language), std::move(intent),
                                        std::move(sources), std::move(entities), response_time,
                                        created_at));
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw ConversationStoreError(format_db_error("last_turns", e));
  } catch (const nlohmann::json::exception& e) {
    throw ConversationStoreError("last_turns failed: corrupt turn record: " + std::string(e.what()));
  }
  std::reverse(turns.begin(), turns.end());
  return turns;
}

std::vector<ConversationTurn> SqliteConversationStore::turns_for_chat(const std::string& chat_id,
                                                                      size_t page,
                                                                      size_t page_size) {
  std::vector<ConversationTurn> turns;
  if (page_size == 0) {
    return turns;
  }
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT device_id, chat_id, user_query, assistant_response, language, intent, "
             "sources, entities, response_time, created_at FROM turns WHERE chat_id = ? "
             "ORDER BY id ASC LIMIT ? OFFSET ?"
          << chat_id << static_cast<long long>(page_size)
          << static_cast<long long>(page * page_size) >>
        [&](std::string device, std::optional<std::string> chat, std::string user_query,
            std::string assistant_response, std::string language,
            std::optional<std::string> intent, std::optional<std::string> sources,
            std::optional<std::string> entities, double response_time, std::string created_at) {
          turns.push_back(turn_from_row(std::move(device), std::move(chat), std::move(user_query),
                                        std::move(assistant_response), std::move(language),
                                        std::move(intent), std::move(sources),
                                        std::move(entities), response_time, created_at));
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw ConversationStoreError(format_db_error("turns_for_chat", e));
  } catch (const nlohmann::json::exception& e) {
    throw ConversationStoreError("turns_for_chat failed: corrupt turn record: " +
                                 std::string(e.what()));
  }
  return turns;
}

}  // namespace docqa_core
