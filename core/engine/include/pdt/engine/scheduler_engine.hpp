#pragma once

#include "pdt/allocation/priority_allocator.hpp"
#include "pdt/compliance/compliance_tracker.hpp"
#include "pdt/concurrent/event_loop_thread.hpp"
#include "pdt/config/engine_config.hpp"
#include "pdt/eventbus/event_bus.hpp"
#include "pdt/execution/execution_router.hpp"
#include "pdt/execution/i_execution_venue.hpp"
#include "pdt/network/notification_publisher.hpp"
#include "pdt/notify/notification.hpp"
#include "pdt/persistence/resilient_store.hpp"
#include "pdt/persistence/schema_monitor.hpp"
#include "pdt/strategy/i_signal_strategy.hpp"
#include "pdt/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace pdt {

// -----------------------------------------------------------------------------
// SchedulerEngine
// -----------------------------------------------------------------------------
//
// @brief  Coordinator that owns and wires the day-trade scheduler: event
//         bus, allocator, compliance tracker, execution router, resilient
//         store with its schema monitor, the notification publisher and the
//         analysis loop.
//
// @details
// Event flow (all on one EventBus):
//
//   pushMarketData ─► analysis loop ─► strategies ─► "signal.generated"
//        "signal.generated"   ─► ResilientStore::recordSignal
//                             ─► ExecutionRouter ─► "day_trade.requested"
//        "day_trade.requested" ─► ComplianceTracker ─► "day_trade.approved"
//        "day_trade.approved"  ─► ExecutionRouter ─► "position.opened"
//        "position.opened"     ─► ResilientStore::recordPositionOpened
//        "position.closed"     ─► ComplianceTracker (ledger, outcome history)
//                             ─► ResilientStore::recordPositionClosed
//
// Persistence is best-effort: start() catches SchemaMismatchError (degraded
// mode, monitor revalidates) and DatabaseError (store unreachable, monitor
// reconnects) and carries on. Admission decisions never wait on the store.
//
// Thread layout:
//   caller thread     start()/stop(), status queries
//   analysis thread   EventLoopThread: market data -> strategies -> signals
//   monitor thread    SchemaMonitor reconnect / revalidate cycles
//   publisher thread  NotificationPublisher PUB socket
//   Signals published through publishSignal() run the chain on the caller's
//   thread; the tracker serialises admission decisions itself.
//
//   The entry points that emit onto the bus (publishSignal,
//   reportPositionClosed, runWeeklyBatch, complianceStatus, status) hold
//   lifecycle_mutex_ shared for the whole emission. start() and the
//   teardown half of stop() hold it exclusively, so no handler can run
//   against a store or router that is being destroyed. Bus handlers must not
//   call start() or stop().
//
// Ownership:
//   SchedulerEngine
//    ├── bus_                 (EventBus, value member, destroyed last)
//    ├── allocator_           (PriorityAllocator, value member)
//    ├── tracker_             (unique_ptr<ComplianceTracker>, from ctor)
//    ├── publisher_ / sink    (owned NotificationPublisher or injected sink)
//    ├── venue                (owned StubExecutionVenue or injected venue)
//    ├── router_              (unique_ptr<ExecutionRouter>, start..stop)
//    ├── store_               (unique_ptr<ResilientStore>, start..stop)
//    ├── monitor_             (unique_ptr<SchemaMonitor>, start..stop)
//    └── analysis_loop_       (EventLoopThread, value member)
//   The clock, an injected sink and an injected venue must outlive the
//   engine.
// -----------------------------------------------------------------------------
class SchedulerEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  clock   Time source for week boundaries and event timestamps.
  // @param  config  Validated here; throws ConfigError.
  // @param  sink    Optional notification sink. When null, a ZeroMQ
  //                 NotificationPublisher is bound to config.notify_endpoint
  //                 at start() (or notifications are discarded when the
  //                 endpoint is empty).
  // @param  venue   Optional broker venue. When null, StubExecutionVenue.
  //
  // The allocator and compliance tracker exist from construction, so their
  // state survives stop()/start() cycles. No threads, sockets or database
  // connections are opened until start().
  // -------------------------------------------------------------------------
  explicit SchedulerEngine(const ITimeProvider& clock,
                           EngineConfig config = EngineConfig{},
                           INotificationSink* sink = nullptr,
                           IExecutionVenue* venue = nullptr);

  ~SchedulerEngine();

  SchedulerEngine(const SchedulerEngine&) = delete;
  SchedulerEngine& operator=(const SchedulerEngine&) = delete;
  SchedulerEngine(SchedulerEngine&&) = delete;
  SchedulerEngine& operator=(SchedulerEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Startup sequence:
  //   1. Notification publisher (if owned).
  //   2. ResilientStore::initialize(); mismatch / outage are logged, not
  //      fatal.
  //   3. Persistence subscriptions, then ExecutionRouter.
  //   4. SchemaMonitor.
  //   5. Analysis loop (market data flows last).
  // Idempotent.
  // -------------------------------------------------------------------------
  void start();

  // Reverse of start(). Market data already queued is analysed first, then
  // in-flight emissions finish before any component is torn down.
  // Idempotent.
  void stop();

  bool running() const { return running_.load(); }

  // Registers a strategy for every subsequent market data event.
  void addStrategy(std::unique_ptr<ISignalStrategy> strategy);

  // Queues market data for the analysis loop. Safe from any thread.
  void pushMarketData(MarketDataEvent event);

  // -------------------------------------------------------------------------
  // publishSignal(signal)
  // -------------------------------------------------------------------------
  // Emits on "signal.generated" unless the engine is stopped, or the signal
  // is a hold or has confidence <= 0. Returns whether it was emitted. The
  // whole downstream chain runs before this returns.
  // -------------------------------------------------------------------------
  bool publishSignal(SignalEvent signal);

  // Emits "position.closed" for a position the broker reports as closed.
  // Ignored while the engine is stopped.
  bool reportPositionClosed(PositionClosedEvent event);

  // Decides pending allocator requests against this week's free slots.
  std::vector<TradeApprovalEvent> runWeeklyBatch();

  ComplianceStatus complianceStatus();

  // -------------------------------------------------------------------------
  // status()
  // -------------------------------------------------------------------------
  // Operator view: running flag, compliance status, pending allocator
  // requests, persistence health (connected, degraded, missing schema
  // parts, fix SQL, write counters) and the monitor state.
  // -------------------------------------------------------------------------
  nlohmann::json status();

  EventBus& eventBus() { return bus_; }
  PriorityAllocator& allocator() { return allocator_; }
  ComplianceTracker& tracker() { return *tracker_; }

  // Null before start() and after stop().
  ResilientStore* store() { return store_.get(); }
  SchemaMonitor* monitor() { return monitor_.get(); }

  const EngineConfig& config() const { return config_; }

 private:
  void onMarketData(const MarketDataEvent& event);
  void subscribePersistence();
  void unsubscribeAll();

  const ITimeProvider& clock_;
  const EngineConfig config_;

  // --- Bus and pure-logic components (live for the engine's lifetime) ------
  EventBus bus_;
  PriorityAllocator allocator_;
  std::unique_ptr<ComplianceTracker> tracker_;
  EventLoopThread analysis_loop_;

  // --- Collaborator seams ----------------------------------------------------
  INotificationSink* injected_sink_;
  std::unique_ptr<NotificationPublisher> publisher_;
  DiscardingNotificationSink discard_sink_;
  IExecutionVenue* venue_;
  std::unique_ptr<IExecutionVenue> owned_venue_;

  // --- Runtime components (start..stop) -------------------------------------
  std::unique_ptr<ResilientStore> store_;
  std::unique_ptr<SchemaMonitor> monitor_;
  std::unique_ptr<ExecutionRouter> router_;

  std::vector<EventBus::SubscriptionId> subscriptions_;

  std::mutex strategies_mutex_;
  std::vector<std::shared_ptr<ISignalStrategy>> strategies_;

  std::shared_mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};
};

}  // namespace pdt
