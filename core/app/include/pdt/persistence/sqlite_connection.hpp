#pragma once

#include "pdt/persistence/database_error.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace pdt {

// A value bound to a `?` placeholder. nullptr_t binds SQL NULL.
using BindValue = std::variant<std::nullptr_t, std::int64_t, double, std::string>;

// -----------------------------------------------------------------------------
// Statement: RAII prepared statement
// -----------------------------------------------------------------------------
// Finalized on destruction. Every failure throws DatabaseError classified by
// classifySqliteError(). Values are only ever bound, never spliced into SQL.
// -----------------------------------------------------------------------------
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql);
  ~Statement();

  Statement(Statement&& other) noexcept;
  Statement& operator=(Statement&&) = delete;
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  // Binds params[i] to placeholder i + 1.
  void bindAll(const std::vector<BindValue>& params);

  // Returns true while a row is available, false when done.
  bool step();

  std::string columnText(int index) const;
  std::int64_t columnInt64(int index) const;
  double columnDouble(int index) const;
  bool columnIsNull(int index) const;

 private:
  [[noreturn]] void fail(int rc) const;

  sqlite3* db_;
  sqlite3_stmt* stmt_{nullptr};
};

// -----------------------------------------------------------------------------
// SqliteConnection
// -----------------------------------------------------------------------------
//
// @brief  One open SQLite database handle.
//
// @details
// `target` is a filesystem path or a `file:` URI. A leading "sqlite://" is
// accepted and stripped so CORE_DATABASE_URL may carry a scheme. The
// database file is created if missing; a directory that does not exist is a
// Connectivity failure.
//
// busy_timeout bounds every round-trip: a statement that cannot get the
// database lock within it fails with SQLITE_BUSY, which classifies as
// Connectivity.
//
// Thread model:
//   A connection is used by one thread at a time. ResilientStore serialises
//   writers; the schema monitor opens its own connection.
// -----------------------------------------------------------------------------
class SqliteConnection {
 public:
  SqliteConnection(const std::string& target,
                   std::chrono::milliseconds busy_timeout);
  ~SqliteConnection();

  SqliteConnection(const SqliteConnection&) = delete;
  SqliteConnection& operator=(const SqliteConnection&) = delete;

  // Runs one or more statements without parameters (DDL, pragmas).
  void execute(const std::string& sql);

  Statement prepare(const std::string& sql);

  // Runs a parameterised INSERT and returns the new rowid.
  std::int64_t insert(const std::string& sql,
                      const std::vector<BindValue>& params);

  bool tableExists(const std::string& table);

  // Column names in declaration order (PRAGMA table_info). Empty when the
  // table does not exist.
  std::vector<std::string> tableColumns(const std::string& table);

  // Cheap liveness check. Never throws.
  bool ping() noexcept;

  static std::string normalizeTarget(const std::string& target);

 private:
  sqlite3* db_{nullptr};
};

}  // namespace pdt
