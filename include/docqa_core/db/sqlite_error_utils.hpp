#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

namespace docqa_core {

enum class DbErrorKind { BusyOrLocked, Constraint, Readonly, Io, CantOpen, Full, Schema, Generic };

struct DbErrorInfo {
  DbErrorKind kind;
  const char* name;
  bool retryable;
};

// Extended codes are reduced to their primary code first.
inline DbErrorInfo describe_sqlite_code(int code) {
  switch (code & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED: return {DbErrorKind::BusyOrLocked, "busy_or_locked", true};
    case SQLITE_CONSTRAINT: return {DbErrorKind::Constraint, "constraint", false};
    case SQLITE_READONLY: return {DbErrorKind::Readonly, "readonly", false};
    case SQLITE_IOERR: return {DbErrorKind::Io, "io", false};
    case SQLITE_CANTOPEN: return {DbErrorKind::CantOpen, "cantopen", false};
    case SQLITE_FULL: return {DbErrorKind::Full, "full", false};
    case SQLITE_ERROR:
    case SQLITE_SCHEMA: return {DbErrorKind::Schema, "schema", false};
  }
  return {DbErrorKind::Generic, "generic", false};
}

inline bool is_retryable(const sqlite::sqlite_exception& e) {
  return describe_sqlite_code(e.get_code()).retryable;
}

// e.g. "save_chunk failed: (constraint) UNIQUE constraint failed [code=19, xcode=2067]"
inline std::string format_db_error(const std::string& operation, const sqlite::sqlite_exception& e) {
  return operation + " failed: (" + describe_sqlite_code(e.get_code()).name + ") " + e.errstr() +
         " [code=" + std::to_string(e.get_code()) + ", xcode=" + std::to_string(e.get_extended_code()) + "]";
}

}  // namespace docqa_core
