#include "docqa_core/db/database_manager.hpp"

#include <stdexcept>

namespace docqa_core {

DatabaseManager::DatabaseManager(const std::filesystem::path& db_path,
                                 const std::string& db_key,
                                 int pool_size)
    : db_path_(db_path), db_key_(db_key) {
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path());
  }

  setup_schema();
  pool_ = std::make_unique<ConnectionPool>(db_path_.string(), db_key_, pool_size);
  is_open_ = true;
}

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::shutdown() {
  if (!is_open_) {
    return;
  }
  pool_->shutdown();
  is_open_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_open_) {
    throw std::runtime_error("DatabaseManager has been shut down.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_open_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema() {
  // Single-use connection so table creation never races a pooled caller.
  auto db = ConnectionPool::open_keyed(db_path_.string(), db_key_);

  *db << R"(
      CREATE TABLE IF NOT EXISTS documents (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          title TEXT NOT NULL,
          content BLOB NOT NULL,
          source_file TEXT NOT NULL,
          chunk_index INTEGER NOT NULL,
          vector_blob BLOB,
          created_at TEXT NOT NULL
      )
    )";
  *db << "CREATE INDEX IF NOT EXISTS idx_documents_source ON documents(source_file)";

  *db << R"(
      CREATE TABLE IF NOT EXISTS turns (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          device_id TEXT NOT NULL,
          chat_id TEXT,
          user_query TEXT NOT NULL,
          assistant_response TEXT NOT NULL,
          language TEXT NOT NULL,
          intent TEXT,
          sources TEXT,
          entities TEXT,
          response_time REAL NOT NULL DEFAULT 0.0,
          created_at TEXT NOT NULL
      )
    )";
  *db << "CREATE INDEX IF NOT EXISTS idx_turns_device ON turns(device_id, id)";
  *db << "CREATE INDEX IF NOT EXISTS idx_turns_chat ON turns(chat_id, id)";

  *db << R"(
      CREATE TABLE IF NOT EXISTS cache_entries (
          cache_key TEXT PRIMARY KEY,
          value TEXT NOT NULL,
          expires_at INTEGER NOT NULL
      )
    )";
}

}  // namespace docqa_core
