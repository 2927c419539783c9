#include "pdt/persistence/sqlite_connection.hpp"

#include <sqlite3.h>

#include <type_traits>
#include <utility>

namespace pdt {

// ---- Statement ----

Statement::Statement(sqlite3* db, const std::string& sql) : db_(db) {
  const int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    const std::string msg = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
    throw classifySqliteError(rc, msg);
  }
}

Statement::~Statement() {
  if (stmt_) {
    sqlite3_finalize(stmt_);
  }
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(std::exchange(other.stmt_, nullptr)) {}

void Statement::bindAll(const std::vector<BindValue>& params) {
  for (std::size_t i = 0; i < params.size(); ++i) {
    const int idx = static_cast<int>(i) + 1;
    const int rc = std::visit(
        [this, idx](const auto& v) -> int {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return sqlite3_bind_null(stmt_, idx);
          } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return sqlite3_bind_int64(stmt_, idx, v);
          } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(stmt_, idx, v);
          } else {
            return sqlite3_bind_text(stmt_, idx, v.c_str(),
                                     static_cast<int>(v.size()),
                                     SQLITE_TRANSIENT);
          }
        },
        params[i]);
    if (rc != SQLITE_OK) {
      fail(rc);
    }
  }
}

bool Statement::step() {
  const int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  fail(rc);
}

std::string Statement::columnText(int index) const {
  const unsigned char* text = sqlite3_column_text(stmt_, index);
  return text ? std::string(reinterpret_cast<const char*>(text)) : std::string{};
}

std::int64_t Statement::columnInt64(int index) const {
  return sqlite3_column_int64(stmt_, index);
}

double Statement::columnDouble(int index) const {
  return sqlite3_column_double(stmt_, index);
}

bool Statement::columnIsNull(int index) const {
  return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

void Statement::fail(int rc) const {
  // sqlite3_step reports the generic code; the handle holds the extended one.
  const int extended = sqlite3_extended_errcode(db_);
  throw classifySqliteError(extended != SQLITE_OK ? extended : rc,
                            sqlite3_errmsg(db_));
}

// ---- SqliteConnection ----

std::string SqliteConnection::normalizeTarget(const std::string& target) {
  static const std::string kScheme = "sqlite://";
  if (target.compare(0, kScheme.size(), kScheme) == 0) {
    return target.substr(kScheme.size());
  }
  return target;
}

SqliteConnection::SqliteConnection(const std::string& target,
                                   std::chrono::milliseconds busy_timeout) {
  const std::string path = normalizeTarget(target);
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                    SQLITE_OPEN_URI | SQLITE_OPEN_FULLMUTEX;
  const int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
  if (rc != SQLITE_OK) {
    const std::string msg =
        db_ ? sqlite3_errmsg(db_) : "unable to allocate sqlite handle";
    sqlite3_close(db_);
    db_ = nullptr;
    throw classifySqliteError(rc, "cannot open '" + path + "': " + msg);
  }
  sqlite3_extended_result_codes(db_, 1);
  sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count()));
}

SqliteConnection::~SqliteConnection() {
  if (db_) {
    sqlite3_close(db_);
  }
}

void SqliteConnection::execute(const std::string& sql) {
  char* err = nullptr;
  const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    throw classifySqliteError(rc, msg);
  }
}

Statement SqliteConnection::prepare(const std::string& sql) {
  return Statement(db_, sql);
}

std::int64_t SqliteConnection::insert(const std::string& sql,
                                      const std::vector<BindValue>& params) {
  Statement stmt(db_, sql);
  stmt.bindAll(params);
  while (stmt.step()) {
  }
  return sqlite3_last_insert_rowid(db_);
}

bool SqliteConnection::tableExists(const std::string& table) {
  Statement stmt(db_,
                 "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
  stmt.bindAll({table});
  return stmt.step();
}

std::vector<std::string> SqliteConnection::tableColumns(
    const std::string& table) {
  // PRAGMA arguments cannot be bound; the table_info table-valued function
  // accepts a parameter.
  Statement stmt(db_, "SELECT name FROM pragma_table_info(?)");
  stmt.bindAll({table});

  std::vector<std::string> columns;
  while (stmt.step()) {
    columns.push_back(stmt.columnText(0));
  }
  return columns;
}

bool SqliteConnection::ping() noexcept {
  if (!db_) {
    return false;
  }
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT count(*) FROM sqlite_master", -1, &stmt,
                         nullptr) != SQLITE_OK) {
    sqlite3_finalize(stmt);
    return false;
  }
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  return rc == SQLITE_ROW;
}

}  // namespace pdt
