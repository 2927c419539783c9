#pragma once

#include <stdexcept>
#include <string>

namespace pdt {

// -----------------------------------------------------------------------------
// DbErrorKind
// -----------------------------------------------------------------------------
// Classification of store failures. Each kind has its own log severity and
// recovery action in ResilientStore:
//
//   Connectivity    ALERT     drop the write, reconnect
//   SchemaMismatch  CRITICAL  revalidate, report fix SQL (or retry the write
//                             without the missing optional column)
//   DataValidation  WARNING   drop the write
//   Unknown         ERROR     log only
// -----------------------------------------------------------------------------
enum class DbErrorKind { Connectivity, SchemaMismatch, DataValidation, Unknown };

const char* kindName(DbErrorKind kind);
const char* severityFor(DbErrorKind kind);

// -----------------------------------------------------------------------------
// DatabaseError
// -----------------------------------------------------------------------------
// Thrown by SqliteConnection / Statement. Carries the SQLite result code and,
// for undefined-column / undefined-table failures, the names parsed out of
// the engine's message (empty when not applicable).
// -----------------------------------------------------------------------------
class DatabaseError : public std::runtime_error {
 public:
  DatabaseError(DbErrorKind kind, int code, const std::string& message,
                std::string table = {}, std::string column = {});

  DbErrorKind kind() const noexcept { return kind_; }
  int code() const noexcept { return code_; }
  const std::string& table() const noexcept { return table_; }
  const std::string& column() const noexcept { return column_; }

 private:
  DbErrorKind kind_;
  int code_;
  std::string table_;
  std::string column_;
};

// -----------------------------------------------------------------------------
// classifySqliteError(code, message)
// -----------------------------------------------------------------------------
// @brief  Maps an SQLite result code plus sqlite3_errmsg() text to a
//         DatabaseError.
//
// @details
//   SQLITE_CANTOPEN / IOERR / BUSY / LOCKED / NOTADB / CORRUPT / FULL
//                                   -> Connectivity (BUSY is the timeout)
//   "no such column: c"             -> SchemaMismatch, column = c
//   "table t has no column named c" -> SchemaMismatch, table = t, column = c
//   "no such table: t"              -> SchemaMismatch, table = t
//   SQLITE_CONSTRAINT / MISMATCH / TOOBIG / RANGE
//                                   -> DataValidation
//   anything else                   -> Unknown
// -----------------------------------------------------------------------------
DatabaseError classifySqliteError(int code, const std::string& message);

}  // namespace pdt
