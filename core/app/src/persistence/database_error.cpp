#include "pdt/persistence/database_error.hpp"

#include <sqlite3.h>

#include <utility>

namespace pdt {

namespace {

// Returns the identifier following `marker` in `message`, or an empty
// string. Identifiers end at whitespace, quote or end of text.
std::string identifierAfter(const std::string& message,
                            const std::string& marker) {
  const auto pos = message.find(marker);
  if (pos == std::string::npos) {
    return {};
  }
  std::size_t begin = pos + marker.size();
  std::size_t end = begin;
  while (end < message.size() && message[end] != ' ' &&
         message[end] != '"' && message[end] != '\'' &&
         message[end] != ',') {
    ++end;
  }
  std::string id = message.substr(begin, end - begin);
  // "no such column: positions.order_id" / "no such table: main.signals"
  // carry a qualifier.
  const auto dot = id.rfind('.');
  if (dot != std::string::npos && marker.rfind("no such ", 0) == 0) {
    id = id.substr(dot + 1);
  }
  return id;
}

}  // namespace

const char* kindName(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::Connectivity:   return "connectivity";
    case DbErrorKind::SchemaMismatch: return "schema_mismatch";
    case DbErrorKind::DataValidation: return "data_validation";
    case DbErrorKind::Unknown:        return "unknown";
  }
  return "unknown";
}

const char* severityFor(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::Connectivity:   return "ALERT";
    case DbErrorKind::SchemaMismatch: return "CRITICAL";
    case DbErrorKind::DataValidation: return "WARNING";
    case DbErrorKind::Unknown:        return "ERROR";
  }
  return "ERROR";
}

DatabaseError::DatabaseError(DbErrorKind kind, int code,
                             const std::string& message, std::string table,
                             std::string column)
    : std::runtime_error(message),
      kind_(kind),
      code_(code),
      table_(std::move(table)),
      column_(std::move(column)) {}

// -----------------------------------------------------------------------------
// classifySqliteError
// -----------------------------------------------------------------------------
DatabaseError classifySqliteError(int code, const std::string& message) {
  switch (code & 0xff) {
    case SQLITE_CANTOPEN:
    case SQLITE_IOERR:
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
    case SQLITE_NOTADB:
    case SQLITE_CORRUPT:
    case SQLITE_FULL:
      return DatabaseError(DbErrorKind::Connectivity, code, message);
    case SQLITE_CONSTRAINT:
    case SQLITE_MISMATCH:
    case SQLITE_TOOBIG:
    case SQLITE_RANGE:
      return DatabaseError(DbErrorKind::DataValidation, code, message);
    default:
      break;
  }

  // Undefined column/table surface as SQLITE_ERROR at prepare time.
  if (message.find("has no column named ") != std::string::npos) {
    return DatabaseError(DbErrorKind::SchemaMismatch, code, message,
                         identifierAfter(message, "table "),
                         identifierAfter(message, "has no column named "));
  }
  if (message.find("no such column: ") != std::string::npos) {
    return DatabaseError(DbErrorKind::SchemaMismatch, code, message, {},
                         identifierAfter(message, "no such column: "));
  }
  if (message.find("no such table: ") != std::string::npos) {
    return DatabaseError(DbErrorKind::SchemaMismatch, code, message,
                         identifierAfter(message, "no such table: "));
  }
  return DatabaseError(DbErrorKind::Unknown, code, message);
}

}  // namespace pdt
