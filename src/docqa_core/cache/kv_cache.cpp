#include "docqa_core/cache/kv_cache.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <thread>

#include "docqa_core/db/pooled_connection.hpp"
#include "docqa_core/db/sqlite_error_utils.hpp"
#include "docqa_core/utils/hashing.hpp"

namespace docqa_core {

namespace {

long long now_epoch_seconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string normalize_for_key(const std::string& text) {
  auto begin = std::find_if_not(text.begin(), text.end(),
                                [](unsigned char c) { return std::isspace(c); });
  auto end = std::find_if_not(text.rbegin(), text.rend(),
                              [](unsigned char c) { return std::isspace(c); })
                 .base();
  std::string normalized = begin < end ? std::string(begin, end) : std::string();
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return normalized;
}

}  // namespace

std::string to_string(CacheKind kind) {
  switch (kind) {
    case CacheKind::Query:
      return "query";
    case CacheKind::Embedding:
      return "embedding";
    case CacheKind::Response:
    default:
      return "response";
  }
}

std::string make_cache_key(const std::string& prefix, CacheKind kind, const std::string& text) {
  return prefix + ":" + to_string(kind) + ":" + sha256_hex(normalize_for_key(text));
}

SqliteKeyValueCache::SqliteKeyValueCache(DatabaseManager& db_manager,
                                         std::chrono::milliseconds retry_delay, size_t purge_interval)
    : db_manager_(db_manager), retry_delay_(retry_delay), purge_interval_(purge_interval) {}

template <typename Fn>
auto SqliteKeyValueCache::with_retry(const std::string& operation, Fn&& fn) -> decltype(fn()) {
  for (int attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const sqlite::sqlite_exception& e) {
      if (!is_retryable(e) || attempt >= MAX_ATTEMPTS) {
        throw CacheError(format_db_error(operation, e));
      }
      std::cerr << "[Cache] " << operation << " attempt " << attempt << " failed, retrying: "
                << e.what() << std::endl;
      std::this_thread::sleep_for(retry_delay_ * attempt);
    }
  }
}

std::optional<std::string> SqliteKeyValueCache::get(const std::string& key) {
  return with_retry("cache_get", [&]() -> std::optional<std::string> {
    std::optional<std::string> value;
    PooledConnection conn(db_manager_);
    *conn << "SELECT value FROM cache_entries WHERE cache_key = ? AND expires_at > ?" << key
          << now_epoch_seconds() >>
        [&](std::string stored) { value = std::move(stored); };
    return value;
  });
}

void SqliteKeyValueCache::set(const std::string& key, const std::string& value,
                              std::chrono::seconds ttl) {
  if (ttl.count() <= 0) {
    throw CacheError("cache_set failed: ttl must be positive for key " + key);
  }
  with_retry("cache_set", [&]() {
    PooledConnection conn(db_manager_);
    *conn << "REPLACE INTO cache_entries (cache_key, value, expires_at) VALUES (?, ?, ?)" << key
          << value << now_epoch_seconds() + static_cast<long long>(ttl.count());
  });

  if (purge_interval_ > 0 && ++writes_ % purge_interval_ == 0) {
    try {
      const size_t purged = purge_expired();
      if (purged > 0) {
        std::cout << "[Cache] Purged " << purged << " expired entries" << std::endl;
      }
    } catch (const CacheError& e) {
      std::cerr << "[Cache] Warning: purge failed: " << e.what() << std::endl;
    }
  }
}

void SqliteKeyValueCache::erase(const std::string& key) {
  with_retry("cache_erase", [&]() {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM cache_entries WHERE cache_key = ?" << key;
  });
}

size_t SqliteKeyValueCache::purge_expired() {
  return with_retry("cache_purge", [&]() -> size_t {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM cache_entries WHERE expires_at <= ?" << now_epoch_seconds();
    return static_cast<size_t>(sqlite3_changes(conn->connection().get()));
  });
}

}  // namespace docqa_core
