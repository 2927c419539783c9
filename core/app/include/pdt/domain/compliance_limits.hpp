#pragma once

namespace pdt {
namespace domain {

// -----------------------------------------------------------------------------
// ComplianceLimits: weekly day-trade budget
// -----------------------------------------------------------------------------
//
// @brief  Parameters of the "N day trades per week" rule.
//
// @details
// Ordinary admissions may use at most (weekly_limit - emergency_reserve)
// slots per week; the reserve is withheld for loss-cutting exits. Values are
// copied into the ComplianceTracker at construction and never change while
// it runs.
//
// Loaded from EngineConfig; the defaults reproduce the regulatory "3 per
// rolling week" rule with one emergency slot.
// -----------------------------------------------------------------------------
struct ComplianceLimits {
  int weekly_limit{3};
  int emergency_reserve{1};

  int ordinaryBudget() const {
    int budget = weekly_limit - emergency_reserve;
    return budget > 0 ? budget : 0;
  }
};

// -----------------------------------------------------------------------------
// RiskRules: portfolio-level rules reported with the compliance status
// -----------------------------------------------------------------------------
// Fractions of portfolio value. Not enforced by the scheduler itself; the
// execution collaborator sizes positions from them.
// -----------------------------------------------------------------------------
struct RiskRules {
  double max_position_size{0.02};
  double max_daily_loss{0.05};
  int max_open_positions{10};

  double positionSize(double portfolio_value) const {
    return portfolio_value * max_position_size;
  }
};

}  // namespace domain
}  // namespace pdt
