#pragma once
#include <sqlite_modern_cpp.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace docqa_core {

// Fixed set of keyed connections handed out to concurrent callers.
class ConnectionPool {
 public:
  ConnectionPool(const std::string& db_path, const std::string& db_key, int pool_size);

  // Blocks until a connection is free. Throws once the pool is shut down.
  std::unique_ptr<sqlite::database> get_connection();

  void return_connection(std::unique_ptr<sqlite::database> conn);
  void shutdown();

  // Opens a connection, applies the key and the per-connection pragmas.
  static std::unique_ptr<sqlite::database> open_keyed(const std::string& db_path,
                                                      const std::string& db_key);

 private:
  bool shutting_down_ = false;
  std::string db_path_;
  std::string db_key_;
  std::queue<std::unique_ptr<sqlite::database>> pool_;
  std::mutex mtx_;
  std::condition_variable cv_;
};

}  // namespace docqa_core
