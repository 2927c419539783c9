#include "pdt/persistence/schema.hpp"

#include "pdt/persistence/sqlite_connection.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace pdt {

namespace {

// Strips what ALTER TABLE ADD COLUMN rejects in SQLite: NOT NULL without a
// default, PRIMARY KEY, and non-constant defaults.
std::string addableType(const std::string& type) {
  std::string out = type;
  for (const std::string word : {" NOT NULL", " PRIMARY KEY AUTOINCREMENT",
                                 " DEFAULT CURRENT_TIMESTAMP"}) {
    for (auto pos = out.find(word); pos != std::string::npos;
         pos = out.find(word)) {
      out.erase(pos, word.size());
    }
  }
  return out;
}

std::vector<TableSchema> buildExpectedSchema() {
  TableSchema positions;
  positions.name = "positions";
  positions.columns = {
      {"id", "INTEGER PRIMARY KEY AUTOINCREMENT"},
      {"symbol", "TEXT NOT NULL"},
      {"quantity", "REAL NOT NULL"},
      {"entry_price", "REAL NOT NULL"},
      {"current_price", "REAL NOT NULL"},
      {"unrealized_pl", "REAL DEFAULT 0"},
      {"realized_pl", "REAL DEFAULT 0"},
      {"strategy", "TEXT NOT NULL"},
      {"status", "TEXT NOT NULL DEFAULT 'open'"},
      {"order_id", "TEXT NOT NULL", true, true, "'LEGACY_' || id"},
      {"closed_at", "TEXT", true},
      {"created_at", "TEXT DEFAULT CURRENT_TIMESTAMP", true, false, "", false},
  };
  positions.indexes = {
      "CREATE INDEX IF NOT EXISTS idx_positions_symbol ON positions(symbol);",
      "CREATE INDEX IF NOT EXISTS idx_positions_status ON positions(status);",
      "CREATE INDEX IF NOT EXISTS idx_positions_strategy ON positions(strategy);",
  };

  TableSchema signals;
  signals.name = "signals";
  signals.columns = {
      {"id", "INTEGER PRIMARY KEY AUTOINCREMENT"},
      {"strategy", "TEXT NOT NULL"},
      {"symbol", "TEXT NOT NULL"},
      {"action", "TEXT NOT NULL"},
      {"confidence", "REAL NOT NULL"},
      {"expected_profit", "REAL", true},
      {"metadata", "TEXT", true},
      {"created_at", "TEXT DEFAULT CURRENT_TIMESTAMP"},
  };
  signals.indexes = {
      "CREATE INDEX IF NOT EXISTS idx_signals_symbol ON signals(symbol);",
      "CREATE INDEX IF NOT EXISTS idx_signals_strategy ON signals(strategy);",
      "CREATE INDEX IF NOT EXISTS idx_signals_created_at ON signals(created_at);",
  };

  return {std::move(positions), std::move(signals)};
}

// add / backfill / constrain. SQLite cannot change a column's constraints
// in place, so the constraint is enforced by triggers.
void appendPromotion(std::vector<std::string>& out, const TableSchema& table,
                     const ColumnSpec& col) {
  const std::string& t = table.name;
  const std::string& c = col.name;
  const std::string raise = "SELECT RAISE(ABORT, 'NOT NULL constraint failed: " +
                            t + "." + c + "'); END;";

  out.push_back("ALTER TABLE " + t + " ADD COLUMN " + c + " " +
                addableType(col.type) + ";");
  out.push_back("UPDATE " + t + " SET " + c + " = " + col.backfill + " WHERE " +
                c + " IS NULL;");
  out.push_back("CREATE TRIGGER IF NOT EXISTS " + t + "_" + c +
                "_not_null_insert BEFORE INSERT ON " + t + " WHEN NEW." + c +
                " IS NULL BEGIN " + raise);
  out.push_back("CREATE TRIGGER IF NOT EXISTS " + t + "_" + c +
                "_not_null_update BEFORE UPDATE OF " + c + " ON " + t +
                " WHEN NEW." + c + " IS NULL BEGIN " + raise);
}

}  // namespace

// ---- TableSchema ----

const ColumnSpec* TableSchema::column(const std::string& column_name) const {
  auto it = std::find_if(columns.begin(), columns.end(),
                         [&column_name](const ColumnSpec& c) {
                           return c.name == column_name;
                         });
  return it == columns.end() ? nullptr : &*it;
}

std::string TableSchema::createTableSql() const {
  std::ostringstream os;
  os << "CREATE TABLE IF NOT EXISTS " << name << " (\n";
  for (std::size_t i = 0; i < columns.size(); ++i) {
    os << "    " << columns[i].name << " " << columns[i].type
       << (i + 1 < columns.size() ? ",\n" : "\n");
  }
  os << ");";
  return os.str();
}

const std::vector<TableSchema>& expectedSchema() {
  static const std::vector<TableSchema> schema = buildExpectedSchema();
  return schema;
}

const TableSchema* findTable(const std::string& table) {
  for (const auto& t : expectedSchema()) {
    if (t.name == table) {
      return &t;
    }
  }
  return nullptr;
}

// ---- SchemaMismatch ----

std::string SchemaMismatch::describe() const {
  std::ostringstream os;
  bool first = true;
  if (!missing_tables.empty()) {
    os << "missing tables: ";
    for (std::size_t i = 0; i < missing_tables.size(); ++i) {
      os << (i ? ", " : "") << missing_tables[i];
    }
    first = false;
  }
  for (const auto& [table, cols] : missing_columns) {
    os << (first ? "" : "; ") << table << " missing columns: ";
    for (std::size_t i = 0; i < cols.size(); ++i) {
      os << (i ? ", " : "") << cols[i];
    }
    first = false;
  }
  return os.str();
}

std::vector<std::string> SchemaMismatch::fixStatements() const {
  std::vector<std::string> out;

  for (const auto& name : missing_tables) {
    if (const TableSchema* table = findTable(name)) {
      out.push_back(table->createTableSql());
      out.insert(out.end(), table->indexes.begin(), table->indexes.end());
    }
  }

  for (const auto& [name, cols] : missing_columns) {
    const TableSchema* table = findTable(name);
    if (!table) {
      continue;
    }
    for (const auto& col_name : cols) {
      const ColumnSpec* col = table->column(col_name);
      if (!col) {
        continue;
      }
      if (col->not_null_promotion) {
        appendPromotion(out, *table, *col);
      } else {
        out.push_back("ALTER TABLE " + name + " ADD COLUMN " + col_name + " " +
                      addableType(col->type) + ";");
      }
    }
  }
  return out;
}

// ---- SchemaMismatchError ----

SchemaMismatchError::SchemaMismatchError(SchemaMismatch mismatch)
    : std::runtime_error("schema mismatch: " + mismatch.describe()),
      mismatch_(std::move(mismatch)) {}

std::string SchemaMismatchError::getFixSql() const {
  std::string sql;
  for (const auto& stmt : mismatch_.fixStatements()) {
    sql += stmt;
    sql += "\n";
  }
  return sql;
}

// ---- SchemaState ----

bool SchemaState::mayHaveColumn(const std::string& table,
                                const std::string& column) const {
  auto it = present_columns.find(table);
  if (it == present_columns.end()) {
    return true;
  }
  return it->second.count(column) > 0;
}

void SchemaState::forgetColumn(const std::string& table,
                               const std::string& column) {
  auto it = present_columns.find(table);
  if (it != present_columns.end()) {
    it->second.erase(column);
  } else {
    // Table was unknown: everything but the failing column is assumed present.
    if (const TableSchema* schema = findTable(table)) {
      std::set<std::string>& cols = present_columns[table];
      for (const auto& c : schema->columns) {
        if (c.name != column) {
          cols.insert(c.name);
        }
      }
    }
  }
}

// ---- inspectSchema ----

SchemaState inspectSchema(SqliteConnection& conn) {
  SchemaState state;

  for (const auto& table : expectedSchema()) {
    if (!conn.tableExists(table.name)) {
      state.last_mismatch.missing_tables.push_back(table.name);
      continue;
    }

    const std::vector<std::string> live = conn.tableColumns(table.name);
    std::set<std::string>& present = state.present_columns[table.name];
    for (const auto& col : table.columns) {
      const bool found = std::find(live.begin(), live.end(), col.name) != live.end();
      if (found) {
        present.insert(col.name);
      } else if (col.validated) {
        state.last_mismatch.missing_columns[table.name].push_back(col.name);
      }
    }
  }

  state.validated = state.last_mismatch.empty();
  return state;
}

std::string schemaCreationSql() {
  std::ostringstream os;
  os << "-- Day-trade scheduler schema (SQLite)\n";
  for (const auto& table : expectedSchema()) {
    os << "\n" << table.createTableSql() << "\n\n";
    for (const auto& idx : table.indexes) {
      os << idx << "\n";
    }
  }
  return os.str();
}

}  // namespace pdt
