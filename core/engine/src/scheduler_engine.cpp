#include "pdt/engine/scheduler_engine.hpp"

#include "pdt/execution/stub_execution_venue.hpp"
#include "pdt/persistence/database_error.hpp"
#include "pdt/persistence/schema.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace pdt {

namespace {

EngineConfig validated(EngineConfig config) {
  validateEngineConfig(config);
  return config;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
SchedulerEngine::SchedulerEngine(const ITimeProvider& clock,
                                 EngineConfig config,
                                 INotificationSink* sink,
                                 IExecutionVenue* venue)
    : clock_(clock),
      config_(validated(std::move(config))),
      allocator_(config_.allocator),
      analysis_loop_(bus_),
      injected_sink_(sink),
      venue_(venue) {
  tracker_ = std::make_unique<ComplianceTracker>(
      bus_, allocator_, clock_, config_.compliance, config_.risk);

  if (venue_ == nullptr) {
    owned_venue_ = std::make_unique<StubExecutionVenue>(clock_);
    venue_ = owned_venue_.get();
  }
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
SchedulerEngine::~SchedulerEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void SchedulerEngine::start() {
  std::unique_lock lock(lifecycle_mutex_);
  if (running_.load()) {
    return;
  }

  // ---  1) Notification sink ------------------------------------------------
  INotificationSink* sink = injected_sink_;
  if (sink == nullptr) {
    if (!config_.notify_endpoint.empty()) {
      publisher_ = std::make_unique<NotificationPublisher>(config_.notify_endpoint);
      publisher_->start();
      sink = publisher_.get();
    } else {
      sink = &discard_sink_;
    }
  }

  // ---  2) Persistence (best effort) ----------------------------------------
  store_ = std::make_unique<ResilientStore>(config_.store, *sink);
  try {
    store_->initialize();
  } catch (const SchemaMismatchError& e) {
    std::cerr << "[SchedulerEngine] WARNING: starting in degraded persistence "
                 "mode: "
              << e.what() << "\n";
  } catch (const DatabaseError& e) {
    std::cerr << "[SchedulerEngine] ALERT: database unavailable at startup ("
              << e.what() << "); the schema monitor will keep reconnecting.\n";
  }

  // ---  3) Wiring: persistence first, so a signal is stored before the
  //          admission chain it triggers ----------------------------------
  subscribePersistence();
  router_ = std::make_unique<ExecutionRouter>(bus_, *venue_, clock_,
                                              config_.execution);

  // ---  4) Background schema monitor ----------------------------------------
  monitor_ = std::make_unique<SchemaMonitor>(*store_, config_.monitor);
  monitor_->start();

  // ---  5) Analysis loop LAST (market data begins flowing) -------------------
  subscriptions_.push_back(bus_.subscribe<MarketDataEvent>(
      [this](const MarketDataEvent& e) { onMarketData(e); }));
  analysis_loop_.start();

  running_.store(true);

  std::cout << "[SchedulerEngine] started. weekly_limit="
            << config_.compliance.weekly_limit
            << " emergency_reserve=" << config_.compliance.emergency_reserve
            << " store=" << (store_->isConnected() ? "connected" : "offline")
            << (store_->isDegraded() ? " (degraded)" : "") << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void SchedulerEngine::stop() {
  if (!running_.load()) {
    return;
  }

  // ---  1) Drain and stop market data analysis -------------------------------
  // Outside the lifecycle lock: the loop thread publishes signals, which
  // takes the lock shared.
  analysis_loop_.stop();

  // ---  2) Wait out in-flight emissions, refuse new ones --------------------
  std::unique_lock lock(lifecycle_mutex_);
  if (!running_.load()) {
    return;
  }
  running_.store(false);

  // ---  3) Detach handlers that reach into runtime components ---------------
  unsubscribeAll();
  router_.reset();

  // ---  4) Monitor before the store it watches ------------------------------
  monitor_.reset();
  store_.reset();

  // ---  5) Publisher last (sends what the store queued) ---------------------
  publisher_.reset();

  std::cout << "[SchedulerEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// addStrategy(strategy)
// -----------------------------------------------------------------------------
void SchedulerEngine::addStrategy(std::unique_ptr<ISignalStrategy> strategy) {
  if (!strategy) {
    return;
  }
  std::lock_guard lock(strategies_mutex_);
  strategies_.push_back(std::shared_ptr<ISignalStrategy>(std::move(strategy)));
}

void SchedulerEngine::pushMarketData(MarketDataEvent event) {
  analysis_loop_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// publishSignal(signal)
// -----------------------------------------------------------------------------
bool SchedulerEngine::publishSignal(SignalEvent signal) {
  if (signal.action == Action::Hold || signal.confidence <= 0.0) {
    return false;
  }
  std::shared_lock lock(lifecycle_mutex_);
  if (!running_.load()) {
    return false;
  }
  if (signal.timestamp == Timestamp{}) {
    signal.timestamp = ms_to_timestamp(clock_.now_ms());
  }
  bus_.emit(signal);
  return true;
}

bool SchedulerEngine::reportPositionClosed(PositionClosedEvent event) {
  std::shared_lock lock(lifecycle_mutex_);
  if (!running_.load()) {
    return false;
  }
  if (event.timestamp == Timestamp{}) {
    event.timestamp = ms_to_timestamp(clock_.now_ms());
  }
  bus_.emit(event);
  return true;
}

std::vector<TradeApprovalEvent> SchedulerEngine::runWeeklyBatch() {
  std::shared_lock lock(lifecycle_mutex_);
  return tracker_->runWeeklyBatch();
}

ComplianceStatus SchedulerEngine::complianceStatus() {
  std::shared_lock lock(lifecycle_mutex_);
  return tracker_->status();
}

// -----------------------------------------------------------------------------
// status()
// -----------------------------------------------------------------------------
nlohmann::json SchedulerEngine::status() {
  std::shared_lock lock(lifecycle_mutex_);
  nlohmann::json j;
  j["running"] = running_.load();
  j["compliance"] = tracker_->status().toJson();
  j["allocator"] = {{"pending", allocator_.pendingCount()}};

  nlohmann::json persistence;
  if (store_) {
    const StoreStats stats = store_->stats();
    const SchemaMismatch mismatch = store_->lastMismatch();
    persistence["connected"] = store_->isConnected();
    persistence["degraded"] = store_->isDegraded();
    persistence["missing"] = mismatch.empty() ? "" : mismatch.describe();
    persistence["fix_sql"] = store_->fixSql();
    persistence["stats"] = {{"writes_ok", stats.writes_ok},
                            {"writes_dropped", stats.writes_dropped},
                            {"fallback_retries", stats.fallback_retries},
                            {"notifications", stats.notifications}};
  } else {
    persistence["connected"] = false;
    persistence["degraded"] = false;
  }
  persistence["monitor"] = monitor_
                               ? SchemaMonitor::stateName(monitor_->state())
                               : SchemaMonitor::stateName(
                                     SchemaMonitor::State::Stopped);
  j["persistence"] = std::move(persistence);

  if (publisher_) {
    j["notifications"] = {{"endpoint", publisher_->endpoint()},
                          {"sent", publisher_->sentCount()}};
  }
  return j;
}

// -----------------------------------------------------------------------------
// onMarketData(event): analysis thread
// -----------------------------------------------------------------------------
void SchedulerEngine::onMarketData(const MarketDataEvent& event) {
  std::vector<std::shared_ptr<ISignalStrategy>> strategies;
  {
    std::lock_guard lock(strategies_mutex_);
    strategies = strategies_;
  }

  for (const auto& strategy : strategies) {
    std::optional<SignalEvent> signal;
    try {
      signal = strategy->analyze(event);
    } catch (const std::exception& e) {
      std::cerr << "[SchedulerEngine] ERROR: strategy '" << strategy->name()
                << "' failed on " << event.symbol << ": " << e.what() << "\n";
      continue;
    }
    if (!signal) {
      continue;
    }
    if (signal->strategy_id.empty()) {
      signal->strategy_id = strategy->name();
    }
    publishSignal(std::move(*signal));
  }
}

// -----------------------------------------------------------------------------
// subscribePersistence()
// -----------------------------------------------------------------------------
void SchedulerEngine::subscribePersistence() {
  subscriptions_.push_back(bus_.subscribe<SignalEvent>(
      [this](const SignalEvent& e) { store_->recordSignal(e); }));
  subscriptions_.push_back(bus_.subscribe<PositionOpenedEvent>(
      [this](const PositionOpenedEvent& e) { store_->recordPositionOpened(e); }));
  subscriptions_.push_back(bus_.subscribe<PositionClosedEvent>(
      [this](const PositionClosedEvent& e) {
        if (e.position_id > 0) {
          store_->recordPositionClosed(e);
        }
      }));
}

void SchedulerEngine::unsubscribeAll() {
  for (const auto& id : subscriptions_) {
    bus_.unsubscribe(id);
  }
  subscriptions_.clear();
}

}  // namespace pdt
