#include "pdt/execution/execution_router.hpp"

#include <exception>
#include <iostream>

namespace pdt {

// -----------------------------------------------------------------------------
// Constructor: subscribe to signals and approvals
// -----------------------------------------------------------------------------
ExecutionRouter::ExecutionRouter(EventBus& bus, IExecutionVenue& venue,
                                 const ITimeProvider& clock,
                                 ExecutionPolicy policy)
    : bus_(bus),
      venue_(venue),
      clock_(clock),
      policy_(policy),
      fallback_(clock) {
  subscriptions_.push_back(bus_.subscribe<SignalEvent>(
      [this](const SignalEvent& s) { onSignal(s); }));
  subscriptions_.push_back(bus_.subscribe<TradeApprovalEvent>(
      [this](const TradeApprovalEvent& a) { onApproval(a); }));
}

ExecutionRouter::~ExecutionRouter() {
  for (const auto& id : subscriptions_) {
    bus_.unsubscribe(id);
  }
}

TradeRequestEvent ExecutionRouter::makeRequest(const SignalEvent& signal) const {
  TradeRequestEvent request;
  request.signal = signal;
  request.is_day_trade =
      signal.estimated_profit < policy_.day_trade_profit_threshold;
  request.requested_position_fraction = policy_.requested_position_fraction;
  return request;
}

// ---- onSignal: signal.generated -> day_trade.requested ----
void ExecutionRouter::onSignal(const SignalEvent& signal) {
  std::cout << "[ExecutionRouter] signal " << actionToString(signal.action)
            << " " << signal.symbol << " @ " << signal.confidence
            << " confidence\n";
  bus_.emit(makeRequest(signal));
}

// ---- onApproval: day_trade.approved -> venue -> position.opened ----
void ExecutionRouter::onApproval(const TradeApprovalEvent& approval) {
  if (!approval.approved) {
    std::cout << "[ExecutionRouter] not executing "
              << approval.request.signal.symbol << ": " << approval.reason
              << "\n";
    return;
  }
  execute(approval.request.signal);
}

std::optional<PositionOpenedEvent> ExecutionRouter::execute(
    const SignalEvent& signal) {
  auto fill = placeWithFallback(signal);
  if (!fill) {
    std::cerr << "[ExecutionRouter] ERROR: could not execute " << signal.symbol
              << "\n";
    return std::nullopt;
  }

  PositionOpenedEvent opened;
  opened.symbol = signal.symbol;
  opened.strategy_id = signal.strategy_id;
  opened.order_id = fill->order_id;
  opened.quantity = fill->quantity;
  opened.entry_price = fill->price;
  opened.timestamp = ms_to_timestamp(clock_.now_ms());

  std::cout << "[ExecutionRouter] executed " << opened.order_id << " - "
            << opened.quantity << " @ " << opened.entry_price << "\n";
  bus_.emit(opened);
  return opened;
}

std::optional<OrderFill> ExecutionRouter::placeWithFallback(
    const SignalEvent& signal) {
  try {
    if (auto fill = venue_.placeOrder(signal)) {
      return fill;
    }
    std::cerr << "[ExecutionRouter] ERROR: venue '" << venue_.name()
              << "' did not place " << signal.symbol << "\n";
  } catch (const std::exception& e) {
    std::cerr << "[ExecutionRouter] ERROR: venue '" << venue_.name()
              << "' failed: " << e.what() << "\n";
  }

  return fallback_.placeOrder(signal);
}

}  // namespace pdt
