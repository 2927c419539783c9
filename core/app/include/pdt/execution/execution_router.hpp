#pragma once

#include "pdt/eventbus/event_bus.hpp"
#include "pdt/execution/i_execution_venue.hpp"
#include "pdt/execution/stub_execution_venue.hpp"
#include "pdt/events/position_events.hpp"
#include "pdt/events/trade_events.hpp"
#include "pdt/time/i_time_provider.hpp"

#include <optional>
#include <vector>

namespace pdt {

// -----------------------------------------------------------------------------
// ExecutionPolicy
// -----------------------------------------------------------------------------
// A signal whose estimated profit is below day_trade_profit_threshold is a
// quick in-and-out trade and is requested as a day trade.
// -----------------------------------------------------------------------------
struct ExecutionPolicy {
  double day_trade_profit_threshold{0.03};
  double requested_position_fraction{0.05};
};

// -----------------------------------------------------------------------------
// ExecutionRouter: the execution collaborator
// -----------------------------------------------------------------------------
//
// @brief  Bridges signals to the compliance tracker and approved trades to
//         the venue.
//
// @details
//   "signal.generated"    -> build TradeRequestEvent -> "day_trade.requested"
//   "day_trade.approved"  -> approved == true: place the order on the venue
//                            (stub fallback on failure) -> "position.opened"
//
// Rejections are logged and otherwise ignored.
//
// Thread model:
//   Stateless apart from its references; callbacks run on the emitter's
//   thread.
//
// Ownership:
//   Holds references to the bus, venue and clock; owns the fallback stub.
//   Unsubscribes in the destructor.
// -----------------------------------------------------------------------------
class ExecutionRouter {
 public:
  ExecutionRouter(EventBus& bus, IExecutionVenue& venue,
                  const ITimeProvider& clock,
                  ExecutionPolicy policy = ExecutionPolicy{});
  ~ExecutionRouter();

  ExecutionRouter(const ExecutionRouter&) = delete;
  ExecutionRouter& operator=(const ExecutionRouter&) = delete;

  TradeRequestEvent makeRequest(const SignalEvent& signal) const;

  void onSignal(const SignalEvent& signal);
  void onApproval(const TradeApprovalEvent& approval);

  // Places the order and publishes "position.opened". Returns the published
  // event, or std::nullopt when neither venue could place the order.
  std::optional<PositionOpenedEvent> execute(const SignalEvent& signal);

 private:
  std::optional<OrderFill> placeWithFallback(const SignalEvent& signal);

  EventBus& bus_;
  IExecutionVenue& venue_;
  const ITimeProvider& clock_;
  const ExecutionPolicy policy_;
  StubExecutionVenue fallback_;

  std::vector<EventBus::SubscriptionId> subscriptions_;
};

}  // namespace pdt
