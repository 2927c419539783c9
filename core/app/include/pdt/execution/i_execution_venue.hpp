#pragma once

#include "pdt/events/event_types.hpp"

#include <optional>
#include <string>

namespace pdt {

// Result of a placed order as reported by the venue.
struct OrderFill {
  std::string order_id;
  double quantity{0.0};
  double price{0.0};
};

// -----------------------------------------------------------------------------
// IExecutionVenue: broker seam
// -----------------------------------------------------------------------------
//
// @brief  Places the order for an approved signal.
//
// @details
// The scheduler never sizes or routes orders itself; a broker integration
// implements this interface and ExecutionRouter calls it for every approved
// TradeApprovalEvent. std::nullopt (or an exception) means the venue could
// not place the order; the router then falls back to its stub venue.
//
// Thread model:
//   Called on whichever thread publishes the approval (bus callbacks run on
//   the emitter's thread). Implementations synchronise themselves.
// -----------------------------------------------------------------------------
class IExecutionVenue {
 public:
  virtual ~IExecutionVenue() = default;

  virtual std::string name() const = 0;

  virtual std::optional<OrderFill> placeOrder(const SignalEvent& signal) = 0;
};

}  // namespace pdt
