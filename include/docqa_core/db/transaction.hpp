#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>
#include <string>
#include <utility>

namespace docqa_core {

// Scoped write transaction. Anything not committed is rolled back when the
// scope unwinds; the operation name only labels the rollback log line.
class Transaction {
 public:
  Transaction(sqlite::database& db, std::string operation, bool immediate = true)
      : db_(db), operation_(std::move(operation)) {
    db_ << (immediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
    open_ = true;
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  ~Transaction() noexcept {
    if (!open_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
      std::cerr << "[Transaction] " << operation_ << " rolled back" << std::endl;
    } catch (const sqlite::sqlite_exception& e) {
      std::cerr << "[Transaction] " << operation_ << " rollback failed: " << e.what() << std::endl;
    }
  }

  void commit() {
    if (open_) {
      db_ << "COMMIT;";
      open_ = false;
    }
  }

  bool is_open() const { return open_; }

 private:
  sqlite::database& db_;
  std::string operation_;
  bool open_ = false;
};

}  // namespace docqa_core
