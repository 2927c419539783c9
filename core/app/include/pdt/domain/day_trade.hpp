#pragma once

#include "pdt/time/time_utils.hpp"

#include <string>

namespace pdt {
namespace domain {

// -----------------------------------------------------------------------------
// DayTrade: one compliance ledger entry
// -----------------------------------------------------------------------------
//
// @brief  Records a day trade admitted by the ComplianceTracker.
//
// @details
// close_time == open_time means the position has not closed yet. The first
// matching position.closed event for the symbol stamps close_time; the entry
// is then terminal until it is purged at the next weekly rollover.
//
// `emergency` marks entries admitted through the emergency reserve. They are
// listed and counted in trades_used, but never count against the ordinary
// allocation budget (weekly_limit - emergency_reserve).
// -----------------------------------------------------------------------------
struct DayTrade {
  std::string symbol;
  std::string strategy;
  Timestamp open_time{};
  Timestamp close_time{};
  bool emergency{false};

  bool isOpen() const { return close_time == open_time; }
};

}  // namespace domain
}  // namespace pdt
