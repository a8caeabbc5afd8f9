#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "docqa_core/db/connection_pool.hpp"

namespace docqa_core {

// Owns the keyed database file: creates the schema once, then serves pooled
// connections to the chunk store, conversation store and cache.
class DatabaseManager {
 public:
  DatabaseManager(const std::filesystem::path& db_path, const std::string& db_key, int pool_size);
  ~DatabaseManager();

  // These methods are used by the PooledConnection guard
  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);

  void shutdown();
  bool is_open() const { return is_open_; }
  const std::filesystem::path& path() const { return db_path_; }

  DatabaseManager(const DatabaseManager&) = delete;
  DatabaseManager& operator=(const DatabaseManager&) = delete;

 private:
  void setup_schema();

  std::filesystem::path db_path_;
  std::string db_key_;
  std::unique_ptr<ConnectionPool> pool_;
  bool is_open_ = false;
};

}  // namespace docqa_core
