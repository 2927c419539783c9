#pragma once

#include "pdt/events/event_types.hpp"

#include <string>

namespace pdt {

// -----------------------------------------------------------------------------
// TradeRequestEvent: "day_trade.requested"
// -----------------------------------------------------------------------------
//
// @brief  A request to act on a signal, created by the execution
//         collaborator when it receives a SignalEvent.
//
// @details
// is_day_trade tells the compliance tracker whether the trade would consume
// a weekly day-trade slot. requested_position_fraction is the share of the
// portfolio the collaborator intends to commit (0.05 == 5%).
//
// Value type; immutable after publication.
// -----------------------------------------------------------------------------
struct TradeRequestEvent {
  SignalEvent signal;
  bool is_day_trade{false};
  double requested_position_fraction{0.0};
};

// -----------------------------------------------------------------------------
// TradeApprovalEvent: "day_trade.approved"
// -----------------------------------------------------------------------------
//
// @brief  The compliance decision for one TradeRequestEvent. Carries both
//         approvals and rejections (approved == false).
//
// @details
// Exactly one approval event is produced per request per decision cycle.
// A request rejected because the limit was reached may receive a second
// decision later, from the weekly batch.
// -----------------------------------------------------------------------------
struct TradeApprovalEvent {
  TradeRequestEvent request;
  bool approved{false};
  std::string reason;
  Timestamp timestamp{};
};

}  // namespace pdt
