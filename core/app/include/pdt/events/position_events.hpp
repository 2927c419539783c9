#pragma once

#include "pdt/events/event_types.hpp"

#include <cstdint>
#include <string>

namespace pdt {

// -----------------------------------------------------------------------------
// PositionOpenedEvent: "position.opened"
// -----------------------------------------------------------------------------
// Published by the execution collaborator after a broker order for an
// approved trade has been placed. position_id is 0 until the store has
// assigned one.
// -----------------------------------------------------------------------------
struct PositionOpenedEvent {
  std::string symbol;
  std::string strategy_id;
  std::string order_id;
  double quantity{0.0};
  double entry_price{0.0};
  std::int64_t position_id{0};
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// PositionClosedEvent: "position.closed"
// -----------------------------------------------------------------------------
// Consumed by the compliance tracker (closes the oldest open ledger entry for
// the symbol) and by persistence (marks the row closed). position_id == 0
// means the collaborator does not know the stored row; persistence then
// skips the update.
// -----------------------------------------------------------------------------
struct PositionClosedEvent {
  std::string symbol;
  std::string strategy_id;
  std::int64_t position_id{0};
  double exit_price{0.0};
  double realized_pl{0.0};
  Timestamp timestamp{};
};

}  // namespace pdt
