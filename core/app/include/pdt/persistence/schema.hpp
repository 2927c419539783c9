#pragma once

#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace pdt {

class SqliteConnection;

// -----------------------------------------------------------------------------
// ColumnSpec / TableSchema: expected layout of one table
// -----------------------------------------------------------------------------
//
// @details
// `optional` columns may be missing from a live database without blocking
// writes: ResilientStore leaves them out of INSERT/UPDATE column lists.
//
// `not_null_promotion` marks a column that older schemas carried as
// nullable (or not at all) and that is now NOT NULL. Its fix is a
// three-step add / backfill / constrain sequence; `backfill` is the SQL
// expression used for existing rows.
//
// `validated == false` columns are created by getSchemaCreationSql() but
// never reported missing (bookkeeping columns with defaults).
// -----------------------------------------------------------------------------
struct ColumnSpec {
  std::string name;
  std::string type;  // SQLite type plus constraints, as in CREATE TABLE
  bool optional{false};
  bool not_null_promotion{false};
  std::string backfill;
  bool validated{true};
};

struct TableSchema {
  std::string name;
  std::vector<ColumnSpec> columns;
  std::vector<std::string> indexes;  // complete CREATE INDEX statements

  const ColumnSpec* column(const std::string& column_name) const;
  std::string createTableSql() const;
};

// The tables and columns the engine writes to: positions, signals.
const std::vector<TableSchema>& expectedSchema();

const TableSchema* findTable(const std::string& table);

// -----------------------------------------------------------------------------
// SchemaMismatch: what validation found missing
// -----------------------------------------------------------------------------
struct SchemaMismatch {
  std::vector<std::string> missing_tables;
  std::map<std::string, std::vector<std::string>> missing_columns;

  bool empty() const { return missing_tables.empty() && missing_columns.empty(); }

  // One-line summary, e.g.
  //   "missing tables: signals; positions missing columns: order_id"
  std::string describe() const;

  // Corrective statements in execution order, SQLite dialect.
  std::vector<std::string> fixStatements() const;
};

// -----------------------------------------------------------------------------
// SchemaMismatchError
// -----------------------------------------------------------------------------
// Thrown by ResilientStore::initialize() / validateSchema() when the live
// schema lacks expected tables or columns. The coordinator catches it and
// keeps running in degraded mode.
// -----------------------------------------------------------------------------
class SchemaMismatchError : public std::runtime_error {
 public:
  explicit SchemaMismatchError(SchemaMismatch mismatch);

  const SchemaMismatch& mismatch() const noexcept { return mismatch_; }
  const std::vector<std::string>& missingTables() const noexcept {
    return mismatch_.missing_tables;
  }
  const std::map<std::string, std::vector<std::string>>& missingColumns()
      const noexcept {
    return mismatch_.missing_columns;
  }

  // Newline-separated fix statements. Empty string when nothing is missing.
  std::string getFixSql() const;

 private:
  SchemaMismatch mismatch_;
};

// -----------------------------------------------------------------------------
// SchemaState
// -----------------------------------------------------------------------------
//
// @brief  What ResilientStore believes about the live schema.
//
// @details
// present_columns holds, per expected table that exists, the expected
// columns confirmed present. A table absent from the map is "unknown": writes
// then include every column and rely on the fallback retry.
// -----------------------------------------------------------------------------
struct SchemaState {
  bool validated{false};
  std::map<std::string, std::set<std::string>> present_columns;
  SchemaMismatch last_mismatch;

  // True when the column is confirmed present or the table is unknown.
  bool mayHaveColumn(const std::string& table, const std::string& column) const;

  void forgetColumn(const std::string& table, const std::string& column);
};

// -----------------------------------------------------------------------------
// inspectSchema(conn)
// -----------------------------------------------------------------------------
// Reads sqlite_master / table_info for every expected table. Throws
// DatabaseError on store failure; never throws for a mismatch (the result
// has validated == false and last_mismatch filled in).
// -----------------------------------------------------------------------------
SchemaState inspectSchema(SqliteConnection& conn);

// Full schema (tables plus indexes) for a fresh database.
std::string schemaCreationSql();

}  // namespace pdt
