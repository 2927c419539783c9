#include "pdt/persistence/resilient_store.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <iostream>
#include <map>
#include <thread>
#include <utility>

namespace pdt {

namespace {

// What operators lose while an optional column is missing.
const std::map<std::string, std::string>& columnImpact() {
  static const std::map<std::string, std::string> impact = {
      {"order_id", "Trade tracking may be incomplete"},
      {"closed_at", "Position closure timestamps unavailable"},
      {"metadata", "Cannot store additional signal context"},
      {"expected_profit", "Signal profit estimates not recorded"},
  };
  return impact;
}

Timestamp nowTimestamp() { return std::chrono::system_clock::now(); }

}  // namespace

ResilientStore::ResilientStore(StoreSettings settings, INotificationSink& sink)
    : settings_(std::move(settings)), sink_(sink) {}

ResilientStore::~ResilientStore() {
  std::lock_guard lock(conn_mutex_);
  conn_.reset();
}

// -----------------------------------------------------------------------------
// initialize: connect with retries, then validate
// -----------------------------------------------------------------------------
void ResilientStore::initialize() {
  {
    std::lock_guard lock(conn_mutex_);
    connectWithRetryLocked(settings_.connect_attempts);
  }
  validateSchema();
}

// -----------------------------------------------------------------------------
// validateSchema: inspect on the write connection
// -----------------------------------------------------------------------------
void ResilientStore::validateSchema() {
  SchemaState state;
  {
    std::lock_guard lock(conn_mutex_);
    if (!conn_) {
      throw DatabaseError(DbErrorKind::Connectivity, SQLITE_CANTOPEN,
                          "not connected to " + settings_.database_url);
    }
    state = inspectSchema(*conn_);
  }

  const bool ok = state.validated;
  SchemaMismatch mismatch = state.last_mismatch;
  applyState(std::move(state));

  if (!ok) {
    printDegradedBanner(mismatch);
    throw SchemaMismatchError(std::move(mismatch));
  }
  std::cout << "[ResilientStore] schema validated.\n";
}

// -----------------------------------------------------------------------------
// revalidate: inspect on a private connection, swap state in
// -----------------------------------------------------------------------------
bool ResilientStore::revalidate() {
  SqliteConnection inspector(settings_.database_url, settings_.busy_timeout);
  SchemaState state = inspectSchema(inspector);
  const bool ok = state.validated;
  SchemaMismatch mismatch = state.last_mismatch;
  if (applyState(std::move(state))) {
    printDegradedBanner(mismatch);
  }
  return ok;
}

bool ResilientStore::reconnect() {
  std::lock_guard lock(conn_mutex_);
  conn_.reset();
  connected_.store(false);
  try {
    connectWithRetryLocked(1);
    return true;
  } catch (const DatabaseError& e) {
    std::cerr << "[ResilientStore] ALERT: reconnect failed: " << e.what()
              << "\n";
    return false;
  }
}

bool ResilientStore::ping() {
  std::lock_guard lock(conn_mutex_);
  if (!conn_) {
    return false;
  }
  if (conn_->ping()) {
    return true;
  }
  std::cerr << "[ResilientStore] ALERT: lost connection to "
            << settings_.database_url << "\n";
  conn_.reset();
  connected_.store(false);
  return false;
}

// -----------------------------------------------------------------------------
// recordPositionOpened
// -----------------------------------------------------------------------------
std::optional<std::int64_t> ResilientStore::recordPositionOpened(
    const PositionOpenedEvent& event) {
  std::int64_t id = 0;
  const bool ok = writeWithFallback(
      "positions", "position.opened " + event.symbol,
      {
          {"symbol", event.symbol},
          {"quantity", event.quantity},
          {"entry_price", event.entry_price},
          {"current_price", event.entry_price},
          {"unrealized_pl", 0.0},
          {"strategy", event.strategy_id},
          {"status", std::string("open")},
          {"order_id", event.order_id, true},
      },
      [&id](SqliteConnection& conn, const std::vector<WriteColumn>& cols) {
        id = conn.insert(insertSql("positions", cols), bindValues(cols));
      });
  if (!ok) {
    return std::nullopt;
  }

  // The notification always carries order_id, stored or not.
  sendNotification("position.opened", {{"id", id},
                                       {"symbol", event.symbol},
                                       {"quantity", event.quantity},
                                       {"entry_price", event.entry_price},
                                       {"strategy", event.strategy_id},
                                       {"order_id", event.order_id}});
  std::cout << "[ResilientStore] recorded position opened: " << event.symbol
            << " x" << event.quantity << " @ " << event.entry_price
            << " (id=" << id << ")\n";
  return id;
}

// -----------------------------------------------------------------------------
// recordPositionClosed
// -----------------------------------------------------------------------------
bool ResilientStore::recordPositionClosed(const PositionClosedEvent& event) {
  if (event.position_id <= 0) {
    std::cerr << "[ResilientStore] WARNING: position.closed for "
              << event.symbol << " carries no position id, not recorded\n";
    writes_dropped_.fetch_add(1);
    return false;
  }

  const Timestamp closed_at =
      event.timestamp == Timestamp{} ? nowTimestamp() : event.timestamp;

  bool found = false;
  std::string symbol;
  double quantity = 0.0;
  std::string strategy;

  const bool ok = writeWithFallback(
      "positions", "position.closed " + event.symbol,
      {
          {"status", std::string("closed")},
          {"current_price", event.exit_price},
          {"realized_pl", event.realized_pl},
          {"closed_at", to_iso8601(closed_at), true},
      },
      [&](SqliteConnection& conn, const std::vector<WriteColumn>& cols) {
        std::string sql = "UPDATE positions SET ";
        for (std::size_t i = 0; i < cols.size(); ++i) {
          sql += (i ? ", " : "") + cols[i].name + " = ?";
        }
        sql += " WHERE id = ? RETURNING symbol, quantity, strategy";

        std::vector<BindValue> values = bindValues(cols);
        values.emplace_back(event.position_id);

        Statement stmt = conn.prepare(sql);
        stmt.bindAll(values);
        while (stmt.step()) {
          found = true;
          symbol = stmt.columnText(0);
          quantity = stmt.columnDouble(1);
          strategy = stmt.columnText(2);
        }
      });
  if (!ok) {
    return false;
  }
  if (!found) {
    std::cerr << "[ResilientStore] WARNING: no position with id "
              << event.position_id << " to close\n";
    return false;
  }

  sendNotification("position.closed", {{"id", event.position_id},
                                       {"symbol", symbol},
                                       {"quantity", quantity},
                                       {"exit_price", event.exit_price},
                                       {"realized_pl", event.realized_pl},
                                       {"strategy", strategy}});
  std::cout << "[ResilientStore] recorded position closed: " << symbol
            << " @ " << event.exit_price << ", PL " << event.realized_pl
            << "\n";
  return true;
}

// -----------------------------------------------------------------------------
// recordSignal
// -----------------------------------------------------------------------------
std::optional<std::int64_t> ResilientStore::recordSignal(
    const SignalEvent& signal) {
  const Timestamp created =
      signal.timestamp == Timestamp{} ? nowTimestamp() : signal.timestamp;

  std::int64_t id = 0;
  const bool ok = writeWithFallback(
      "signals", "signal " + signal.symbol,
      {
          {"strategy", signal.strategy_id},
          {"symbol", signal.symbol},
          {"action", std::string(actionToString(signal.action))},
          {"confidence", signal.confidence},
          {"expected_profit", signal.estimated_profit, true},
          {"metadata",
           signal.metadata.dump(-1, ' ', false,
                                nlohmann::json::error_handler_t::replace),
           true},
          {"created_at", to_iso8601(created)},
      },
      [&id](SqliteConnection& conn, const std::vector<WriteColumn>& cols) {
        id = conn.insert(insertSql("signals", cols), bindValues(cols));
      });
  if (!ok) {
    return std::nullopt;
  }

  sendNotification("signal.generated",
                   {{"id", id},
                    {"strategy", signal.strategy_id},
                    {"symbol", signal.symbol},
                    {"action", actionToString(signal.action)},
                    {"confidence", signal.confidence},
                    {"expected_profit", signal.estimated_profit}});
  std::cout << "[ResilientStore] recorded signal: "
            << actionToString(signal.action) << " " << signal.symbol << " @ "
            << signal.confidence << "\n";
  return id;
}

// ---- status ----

bool ResilientStore::isDegraded() const {
  std::lock_guard lock(schema_mutex_);
  return has_validated_ && !schema_.validated;
}

bool ResilientStore::isValidated() const {
  std::lock_guard lock(schema_mutex_);
  return has_validated_;
}

SchemaMismatch ResilientStore::lastMismatch() const {
  std::lock_guard lock(schema_mutex_);
  return schema_.last_mismatch;
}

std::string ResilientStore::fixSql() const {
  return SchemaMismatchError(lastMismatch()).getFixSql();
}

SchemaState ResilientStore::schemaState() const {
  std::lock_guard lock(schema_mutex_);
  return schema_;
}

StoreStats ResilientStore::stats() const {
  StoreStats s;
  s.writes_ok = writes_ok_.load();
  s.writes_dropped = writes_dropped_.load();
  s.fallback_retries = fallback_retries_.load();
  s.notifications = notifications_.load();
  return s;
}

std::string ResilientStore::getSchemaCreationSql() {
  return schemaCreationSql();
}

// -----------------------------------------------------------------------------
// writeWithFallback: schema-aware write with one optional-column retry
// -----------------------------------------------------------------------------
bool ResilientStore::writeWithFallback(const std::string& table,
                                       const std::string& what,
                                       std::vector<WriteColumn> columns,
                                       const WriteFn& fn) {
  std::lock_guard lock(conn_mutex_);
  if (!conn_) {
    std::cerr << "[ResilientStore] WARNING: store unavailable, dropping "
              << what << "\n";
    writes_dropped_.fetch_add(1);
    return false;
  }

  std::vector<WriteColumn> cols = presentColumns(table, std::move(columns));
  try {
    fn(*conn_, cols);
    writes_ok_.fetch_add(1);
    return true;
  } catch (const DatabaseError& e) {
    auto failing = std::find_if(cols.begin(), cols.end(),
                                [&e](const WriteColumn& c) {
                                  return c.optional && c.name == e.column();
                                });
    const bool retryable = e.kind() == DbErrorKind::SchemaMismatch &&
                           (e.table().empty() || e.table() == table) &&
                           failing != cols.end();
    if (!retryable) {
      handleFailureLocked(e, what);
      return false;
    }

    std::cerr << "[ResilientStore] WARNING: column " << table << "."
              << e.column() << " does not exist, retrying " << what
              << " without it\n";
    {
      std::lock_guard schema_lock(schema_mutex_);
      schema_.forgetColumn(table, e.column());
      std::vector<std::string>& missing =
          schema_.last_mismatch.missing_columns[table];
      if (std::find(missing.begin(), missing.end(), e.column()) ==
          missing.end()) {
        missing.push_back(e.column());
      }
      schema_.validated = false;
      has_validated_ = true;
    }
    fallback_retries_.fetch_add(1);
    cols.erase(failing);

    try {
      fn(*conn_, cols);
      writes_ok_.fetch_add(1);
      return true;
    } catch (const DatabaseError& retry_error) {
      handleFailureLocked(retry_error, what);
      return false;
    }
  }
}

std::vector<ResilientStore::WriteColumn> ResilientStore::presentColumns(
    const std::string& table, std::vector<WriteColumn> columns) const {
  std::lock_guard lock(schema_mutex_);
  columns.erase(std::remove_if(columns.begin(), columns.end(),
                               [this, &table](const WriteColumn& c) {
                                 return c.optional &&
                                        !schema_.mayHaveColumn(table, c.name);
                               }),
                columns.end());
  return columns;
}

std::string ResilientStore::insertSql(const std::string& table,
                                      const std::vector<WriteColumn>& columns) {
  std::string names;
  std::string placeholders;
  for (std::size_t i = 0; i < columns.size(); ++i) {
    names += (i ? ", " : "") + columns[i].name;
    placeholders += i ? ", ?" : "?";
  }
  return "INSERT INTO " + table + " (" + names + ") VALUES (" + placeholders +
         ")";
}

std::vector<BindValue> ResilientStore::bindValues(
    const std::vector<WriteColumn>& columns) {
  std::vector<BindValue> values;
  values.reserve(columns.size());
  for (const auto& c : columns) {
    values.push_back(c.value);
  }
  return values;
}

// -----------------------------------------------------------------------------
// connectWithRetryLocked: bounded attempts, exponential backoff
// -----------------------------------------------------------------------------
void ResilientStore::connectWithRetryLocked(int attempts) {
  attempts = std::max(1, attempts);
  std::chrono::milliseconds delay = settings_.connect_backoff;

  for (int attempt = 1;; ++attempt) {
    try {
      auto conn = std::make_unique<SqliteConnection>(settings_.database_url,
                                                     settings_.busy_timeout);
      // Opening is lazy in SQLite; touch the catalogue so a file that is not
      // a database fails here.
      Statement check = conn->prepare("SELECT count(*) FROM sqlite_master");
      check.step();

      conn_ = std::move(conn);
      connected_.store(true);
      std::cout << "[ResilientStore] connected to " << settings_.database_url
                << "\n";
      return;
    } catch (const DatabaseError& e) {
      std::cerr << "[ResilientStore] " << severityFor(e.kind())
                << ": connection attempt " << attempt << "/" << attempts
                << " failed: " << e.what() << "\n";
      if (attempt >= attempts) {
        connected_.store(false);
        throw;
      }
    }
    std::this_thread::sleep_for(delay);
    delay *= 2;
  }
}

// -----------------------------------------------------------------------------
// handleFailureLocked: one recovery action per error class
// -----------------------------------------------------------------------------
void ResilientStore::handleFailureLocked(const DatabaseError& error,
                                         const std::string& what) {
  writes_dropped_.fetch_add(1);
  std::cerr << "[ResilientStore] " << severityFor(error.kind()) << ": "
            << kindName(error.kind()) << " error, dropping " << what << ": "
            << error.what() << "\n";

  switch (error.kind()) {
    case DbErrorKind::Connectivity:
      conn_.reset();
      connected_.store(false);
      try {
        connectWithRetryLocked(1);
      } catch (const DatabaseError&) {
        std::cerr << "[ResilientStore] ALERT: store still unreachable, "
                     "monitor will keep retrying\n";
      }
      break;

    case DbErrorKind::SchemaMismatch: {
      SchemaState state;
      try {
        state = inspectSchema(*conn_);
      } catch (const DatabaseError& e) {
        std::cerr << "[ResilientStore] ERROR: revalidation failed: "
                  << e.what() << "\n";
        break;
      }
      const bool ok = state.validated;
      SchemaMismatch mismatch = state.last_mismatch;
      applyState(std::move(state));
      if (!ok) {
        std::cerr << "[ResilientStore] CRITICAL: to fix this issue, run:\n"
                  << SchemaMismatchError(mismatch).getFixSql();
      }
      break;
    }

    case DbErrorKind::DataValidation:
    case DbErrorKind::Unknown:
      break;
  }
}

bool ResilientStore::applyState(SchemaState state) {
  std::lock_guard lock(schema_mutex_);
  const bool was_degraded = has_validated_ && !schema_.validated;
  schema_ = std::move(state);
  has_validated_ = true;
  if (was_degraded && schema_.validated) {
    std::cout << "[ResilientStore] schema validated, leaving degraded mode.\n";
  }
  return !was_degraded && !schema_.validated;
}

void ResilientStore::sendNotification(std::string type, nlohmann::json data) {
  Notification n;
  n.type = std::move(type);
  n.data = std::move(data);
  n.timestamp = nowTimestamp();
  sink_.notify(std::move(n));
  notifications_.fetch_add(1);
}

// -----------------------------------------------------------------------------
// printDegradedBanner
// -----------------------------------------------------------------------------
void ResilientStore::printDegradedBanner(const SchemaMismatch& mismatch) {
  const std::string rule(72, '=');
  std::cerr << "[ResilientStore] " << rule << "\n"
            << "[ResilientStore] CRITICAL: DEGRADED MODE - database schema "
               "mismatch\n";

  for (const auto& table : mismatch.missing_tables) {
    std::cerr << "[ResilientStore]   missing table: " << table << "\n";
  }
  for (const auto& [table, cols] : mismatch.missing_columns) {
    for (const auto& col : cols) {
      std::cerr << "[ResilientStore]   missing column: " << table << "."
                << col;
      auto it = columnImpact().find(col);
      if (it != columnImpact().end()) {
        std::cerr << " (" << it->second << ")";
      }
      std::cerr << "\n";
    }
  }

  std::cerr << "[ResilientStore] writes continue with the columns present.\n"
            << "[ResilientStore] to fix this issue, run the following SQL:\n"
            << SchemaMismatchError(mismatch).getFixSql()
            << "[ResilientStore] " << rule << "\n";
}

}  // namespace pdt
