#pragma once

#include "pdt/events/event_types.hpp"
#include "pdt/events/position_events.hpp"
#include "pdt/notify/notification.hpp"
#include "pdt/persistence/database_error.hpp"
#include "pdt/persistence/schema.hpp"
#include "pdt/persistence/sqlite_connection.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pdt {

// -----------------------------------------------------------------------------
// StoreSettings
// -----------------------------------------------------------------------------
// database_url: SQLite path or `file:` URI (CORE_DATABASE_URL).
// Connection attempts back off exponentially from connect_backoff.
// busy_timeout bounds each round-trip; exceeding it is a Connectivity error.
// -----------------------------------------------------------------------------
struct StoreSettings {
  std::string database_url{"pdt_engine.db"};
  int connect_attempts{3};
  std::chrono::milliseconds connect_backoff{1000};
  std::chrono::milliseconds busy_timeout{5000};
};

// Write-path counters, readable from any thread.
struct StoreStats {
  std::uint64_t writes_ok{0};
  std::uint64_t writes_dropped{0};
  std::uint64_t fallback_retries{0};
  std::uint64_t notifications{0};
};

// -----------------------------------------------------------------------------
// ResilientStore
// -----------------------------------------------------------------------------
//
// @brief  Durable record of signals and positions that keeps accepting
//         writes when the live schema has drifted from the expected one.
//
// @details
// Lifecycle:
//   initialize() connects (bounded retries with exponential backoff) and
//   validates the schema. A mismatch throws SchemaMismatchError after the
//   per-table present-column sets have been recorded and the degraded-mode
//   banner (missing columns, their impact, fix SQL) has been printed. The
//   store stays usable: the caller catches and continues degraded.
//
// Schema-aware writes:
//   recordPositionOpened / recordPositionClosed / recordSignal build their
//   column lists from the present-column sets, leaving out optional columns
//   known to be absent (positions.order_id, positions.closed_at,
//   signals.expected_profit, signals.metadata). When the store still
//   rejects a write because an included optional column is undefined, the
//   write is retried once without it and the column is removed from the
//   cached set, so later writes skip it without a round-trip.
//
//   Every successful write sends a Notification to the sink. Failures never
//   throw: the write is dropped, counted and handled per DbErrorKind
//   (see database_error.hpp).
//
// Revalidation:
//   revalidate() inspects the schema on a short-lived connection of its own
//   and only takes the schema mutex to swap in the new state, so writers are
//   never blocked behind validation queries. SchemaMonitor drives it.
//
// Thread model:
//   All public methods are safe from any thread. Writers are serialised on
//   the write connection's mutex. Lock order: connection -> schema.
//
// Ownership:
//   Owned by SchedulerEngine. Holds a reference to the notification sink,
//   which must outlive the store.
// -----------------------------------------------------------------------------
class ResilientStore {
 public:
  ResilientStore(StoreSettings settings, INotificationSink& sink);
  ~ResilientStore();

  ResilientStore(const ResilientStore&) = delete;
  ResilientStore& operator=(const ResilientStore&) = delete;

  // -------------------------------------------------------------------------
  // initialize()
  // -------------------------------------------------------------------------
  // @throws DatabaseError (Connectivity) when every connection attempt
  //         failed.
  // @throws SchemaMismatchError when tables or columns are missing. The
  //         connection stays open and writes run degraded.
  // -------------------------------------------------------------------------
  void initialize();

  // Re-inspects the schema on the write connection. Same throw contract as
  // initialize() for mismatches.
  void validateSchema();

  // -------------------------------------------------------------------------
  // revalidate()
  // -------------------------------------------------------------------------
  // @brief  Inspects the schema on a separate connection and swaps the
  //         result in. Leaves degraded mode when nothing is missing.
  //
  // @return true when the schema matches.
  // @throws DatabaseError when the store cannot be reached.
  // -------------------------------------------------------------------------
  bool revalidate();

  // Single reconnection attempt for the write connection. Never throws.
  bool reconnect();

  // Liveness check on the write connection. A failed check marks the store
  // disconnected. Never throws.
  bool ping();

  std::optional<std::int64_t> recordPositionOpened(
      const PositionOpenedEvent& event);
  bool recordPositionClosed(const PositionClosedEvent& event);
  std::optional<std::int64_t> recordSignal(const SignalEvent& signal);

  bool isConnected() const { return connected_.load(); }
  bool isDegraded() const;
  // False until one schema inspection has completed.
  bool isValidated() const;

  // Empty when the schema matched on the last validation.
  SchemaMismatch lastMismatch() const;
  std::string fixSql() const;
  SchemaState schemaState() const;

  StoreStats stats() const;

  // Full schema for a fresh database: tables plus indexes.
  static std::string getSchemaCreationSql();

 private:
  struct WriteColumn {
    std::string name;
    BindValue value;
    bool optional{false};
  };

  using WriteFn = std::function<void(SqliteConnection&,
                                     const std::vector<WriteColumn>&)>;

  bool writeWithFallback(const std::string& table, const std::string& what,
                         std::vector<WriteColumn> columns, const WriteFn& fn);

  std::vector<WriteColumn> presentColumns(const std::string& table,
                                          std::vector<WriteColumn> columns) const;

  static std::string insertSql(const std::string& table,
                               const std::vector<WriteColumn>& columns);
  static std::vector<BindValue> bindValues(
      const std::vector<WriteColumn>& columns);

  void connectWithRetryLocked(int attempts);
  void handleFailureLocked(const DatabaseError& error, const std::string& what);
  // Returns true when this state moved the store into degraded mode.
  bool applyState(SchemaState state);
  void sendNotification(std::string type, nlohmann::json data);

  static void printDegradedBanner(const SchemaMismatch& mismatch);

  const StoreSettings settings_;
  INotificationSink& sink_;

  mutable std::mutex conn_mutex_;
  std::unique_ptr<SqliteConnection> conn_;
  std::atomic<bool> connected_{false};

  mutable std::mutex schema_mutex_;
  SchemaState schema_;
  bool has_validated_{false};

  std::atomic<std::uint64_t> writes_ok_{0};
  std::atomic<std::uint64_t> writes_dropped_{0};
  std::atomic<std::uint64_t> fallback_retries_{0};
  std::atomic<std::uint64_t> notifications_{0};
};

}  // namespace pdt
