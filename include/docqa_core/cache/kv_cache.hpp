#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

#include "docqa_core/db/database_manager.hpp"

namespace docqa_core {

class CacheError : public std::exception {
 public:
  explicit CacheError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

enum class CacheKind { Query, Embedding, Response };

std::string to_string(CacheKind kind);

// "<prefix>:<kind>:<sha256(lower(trim(text)))>"
std::string make_cache_key(const std::string& prefix, CacheKind kind, const std::string& text);

class KeyValueCache {
 public:
  virtual ~KeyValueCache() = default;

  virtual std::optional<std::string> get(const std::string& key) = 0;
  virtual void set(const std::string& key, const std::string& value,
                   std::chrono::seconds ttl) = 0;
  virtual void erase(const std::string& key) = 0;
};

// Cache entries in the shared database. Expired rows read as a miss and are
// swept by purge_expired(), which also runs after every `purge_interval`
// writes (0 disables the automatic sweep). Transient SQLite failures (busy/locked) are
// retried up to MAX_ATTEMPTS with a linear backoff before surfacing.
class SqliteKeyValueCache : public KeyValueCache {
 public:
  static constexpr int MAX_ATTEMPTS = 3;
  static constexpr size_t DEFAULT_PURGE_INTERVAL = 100;

  explicit SqliteKeyValueCache(DatabaseManager& db_manager,
                               std::chrono::milliseconds retry_delay = std::chrono::milliseconds(200),
                               size_t purge_interval = DEFAULT_PURGE_INTERVAL);

  SqliteKeyValueCache(const SqliteKeyValueCache&) = delete;
  SqliteKeyValueCache& operator=(const SqliteKeyValueCache&) = delete;

  std::optional<std::string> get(const std::string& key) override;
  void set(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
  void erase(const std::string& key) override;

  size_t purge_expired();

 private:
  template <typename Fn>
  auto with_retry(const std::string& operation, Fn&& fn) -> decltype(fn());

  DatabaseManager& db_manager_;
  std::chrono::milliseconds retry_delay_;
  size_t purge_interval_;
  std::atomic<size_t> writes_{0};
};

}  // namespace docqa_core
