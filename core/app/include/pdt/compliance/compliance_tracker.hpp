#pragma once

#include "pdt/allocation/priority_allocator.hpp"
#include "pdt/domain/compliance_limits.hpp"
#include "pdt/domain/day_trade.hpp"
#include "pdt/eventbus/event_bus.hpp"
#include "pdt/events/position_events.hpp"
#include "pdt/events/trade_events.hpp"
#include "pdt/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace pdt {

// -----------------------------------------------------------------------------
// ComplianceStatus: snapshot returned by ComplianceTracker::status()
// -----------------------------------------------------------------------------
struct ComplianceStatus {
  int trades_used{0};
  int trades_remaining{0};
  bool can_day_trade{false};
  Timestamp week_start{};
  std::vector<domain::DayTrade> recent_trades;  // newest last, at most 5
  std::size_t pending_allocations{0};
  int emergency_reserved{0};
  int emergency_used{0};
  domain::RiskRules risk_rules;

  nlohmann::json toJson() const;
};

// -----------------------------------------------------------------------------
// ComplianceTracker
// -----------------------------------------------------------------------------
//
// @brief  Admission control for day trades under a weekly count limit with
//         an emergency reserve.
//
// @details
// Subscribes to "day_trade.requested" and "position.closed" on the bus it is
// given. For every request it publishes exactly one TradeApprovalEvent on
// "day_trade.approved":
//
//   not a day trade                 -> approved, "swing trade - unrestricted"
//   sell with metadata.stop_loss    -> approved, "emergency slot"
//   ordinary, ordinary_used < limit - reserve
//                                   -> approved, "slot available"
//   ordinary, budget exhausted      -> queued in the PriorityAllocator AND
//                                      rejected for this cycle,
//                                      "limit reached, queued for weekly batch"
//
// Requests with an empty symbol or strategy, or a confidence/profit that is
// not a finite number in range, are treated as ordinary day trades.
//
// Week window:
//   Anchored at Monday 00:00 UTC of the current calendar week (per the
//   injected ITimeProvider). Every operation first checks whether the anchor
//   has advanced. When it has, the ledger is cleared and the allocator's
//   pending queue is decided against the fresh week's ordinary budget
//   (weekly batch); batch approvals take ordinary ledger slots.
//
// Thread model:
//   Bus callbacks may arrive on any thread. One mutex covers the whole
//   decision: rollover, budget check, ledger append and allocator enqueue.
//   Events are published after the mutex is released. Lock order is
//   tracker -> allocator; the allocator never calls back.
//
// Ownership:
//   Holds references to the bus, allocator and clock; all three must
//   outlive the tracker. Unsubscribes in the destructor.
// -----------------------------------------------------------------------------
class ComplianceTracker {
 public:
  static constexpr std::size_t kRecentTradeCount = 5;

  ComplianceTracker(EventBus& bus, PriorityAllocator& allocator,
                    const ITimeProvider& clock,
                    domain::ComplianceLimits limits = domain::ComplianceLimits{},
                    domain::RiskRules risk_rules = domain::RiskRules{});
  ~ComplianceTracker();

  ComplianceTracker(const ComplianceTracker&) = delete;
  ComplianceTracker& operator=(const ComplianceTracker&) = delete;

  // -------------------------------------------------------------------------
  // evaluate(request)
  // -------------------------------------------------------------------------
  // @brief  Decides one request, publishes the decision on the bus and
  //         returns it. The bus subscription calls this; tests may call it
  //         directly.
  // -------------------------------------------------------------------------
  TradeApprovalEvent evaluate(const TradeRequestEvent& request);

  // Stamps close_time on the oldest open ledger entry for the symbol and
  // feeds the outcome to the allocator's history.
  void onPositionClosed(const PositionClosedEvent& event);

  // -------------------------------------------------------------------------
  // runWeeklyBatch()
  // -------------------------------------------------------------------------
  // @brief  Decides all pending allocator requests against the ordinary
  //         slots still free this week. Returns (and publishes) one
  //         TradeApprovalEvent per decided request.
  // -------------------------------------------------------------------------
  std::vector<TradeApprovalEvent> runWeeklyBatch();

  // Applies any pending rollover, then reports usage for the current week.
  ComplianceStatus status();

  std::vector<domain::DayTrade> ledger() const;

  const domain::ComplianceLimits& limits() const { return limits_; }

 private:
  std::vector<TradeApprovalEvent> rolloverIfNeededLocked(std::int64_t now_ms);
  std::vector<TradeApprovalEvent> runBatchLocked(std::int64_t now_ms);
  void appendLocked(const TradeRequestEvent& request, std::int64_t now_ms,
                    bool emergency);
  int ordinaryUsedLocked() const;
  int emergencyUsedLocked() const;
  void publishAll(const std::vector<TradeApprovalEvent>& decisions);

  static bool isAmbiguous(const TradeRequestEvent& request);

  EventBus& bus_;
  PriorityAllocator& allocator_;
  const ITimeProvider& clock_;
  const domain::ComplianceLimits limits_;
  const domain::RiskRules risk_rules_;

  mutable std::mutex mutex_;
  std::vector<domain::DayTrade> ledger_;
  std::int64_t week_start_ms_{0};

  std::vector<EventBus::SubscriptionId> subscriptions_;
};

}  // namespace pdt
