#pragma once

#include "pdt/events/trade_events.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pdt {

// -----------------------------------------------------------------------------
// AllocatorSettings
// -----------------------------------------------------------------------------
// Bounds of the historical-success multiplier. A strategy with no history
// (or an even win/loss record) lands at the midpoint, 0.8 with the defaults.
// -----------------------------------------------------------------------------
struct AllocatorSettings {
  double min_success_factor{0.1};
  double max_success_factor{1.5};
};

// -----------------------------------------------------------------------------
// AllocationRequest
// -----------------------------------------------------------------------------
//
// @brief  A queued TradeRequestEvent together with its priority score.
//
// @details
// score = confidence × estimated_profit × historical_success_factor, fixed at
// construction. There is no setter: re-scoring means building a new request.
// A product that is not finite (NaN or infinite inputs) scores -infinity and
// ranks behind every finite score.
// arrival is the allocator-assigned sequence number used to break score ties
// (first in wins).
// -----------------------------------------------------------------------------
class AllocationRequest {
 public:
  AllocationRequest(TradeRequestEvent request, double success_factor,
                    std::uint64_t arrival);

  const TradeRequestEvent& request() const { return request_; }
  double score() const { return score_; }
  std::uint64_t arrival() const { return arrival_; }

  static double computeScore(const SignalEvent& signal, double success_factor);

 private:
  TradeRequestEvent request_;
  double score_{0.0};
  std::uint64_t arrival_{0};
};

// -----------------------------------------------------------------------------
// StrategyStats: per-strategy outcome history
// -----------------------------------------------------------------------------
struct StrategyStats {
  std::uint64_t trades{0};
  std::uint64_t wins{0};
  double cumulative_profit{0.0};

  double winRate() const {
    return trades == 0 ? 0.0
                       : static_cast<double>(wins) / static_cast<double>(trades);
  }
};

// One outcome of scheduleWeeklyBatch().
struct AllocationDecision {
  TradeRequestEvent request;
  double score{0.0};
  bool approved{false};
  std::string reason;
};

// -----------------------------------------------------------------------------
// PriorityAllocator
// -----------------------------------------------------------------------------
//
// @brief  Ranks competing day-trade requests once the weekly budget is
//         exhausted and hands out freed slots in weekly batches.
//
// @details
// Requests enter through requestAllocation() (called by the
// ComplianceTracker when it has to turn a request away). They wait in the
// pending queue until scheduleWeeklyBatch(available_slots) runs, which:
//
//   1. stable-sorts pending requests by score, highest first (ties keep
//      arrival order);
//   2. approves the first `available_slots` of them;
//   3. rejects the rest ("not in top-N this week"), or all of them when
//      available_slots <= 0 ("no slots available");
//   4. clears the queue. Unselected requests are NOT carried over.
//
// The historical-success multiplier is a Laplace-smoothed win rate,
//
//     p      = (wins + 1) / (trades + 2)
//     factor = min + (max - min) × p
//
// which is monotonic in the win rate, stays inside [min, max], and puts
// a strategy without history exactly where a 50/50 strategy sits.
//
// Thread model:
//   All public methods lock one internal mutex and never call back into
//   other components, so callers may invoke them while holding their own
//   locks (the ComplianceTracker does).
//
// Ownership:
//   Owned by the SchedulerEngine; the tracker holds a reference.
// -----------------------------------------------------------------------------
class PriorityAllocator {
 public:
  explicit PriorityAllocator(AllocatorSettings settings = AllocatorSettings{});

  PriorityAllocator(const PriorityAllocator&) = delete;
  PriorityAllocator& operator=(const PriorityAllocator&) = delete;

  // -------------------------------------------------------------------------
  // requestAllocation(request)
  // -------------------------------------------------------------------------
  // @brief  Scores and enqueues the request.
  //
  // @return Always true: the request is pending, not decided. Callers must
  //         not read it as an approval.
  // -------------------------------------------------------------------------
  bool requestAllocation(const TradeRequestEvent& request);

  // -------------------------------------------------------------------------
  // scheduleWeeklyBatch(available_slots)
  // -------------------------------------------------------------------------
  // @brief  Decides every pending request and empties the queue.
  //
  // @return One decision per pending request, in ranked order (approved
  //         first). Empty when nothing was pending.
  // -------------------------------------------------------------------------
  std::vector<AllocationDecision> scheduleWeeklyBatch(int available_slots);

  // -------------------------------------------------------------------------
  // recordOutcome(symbol, strategy, was_profitable, profit_amount)
  // -------------------------------------------------------------------------
  // @brief  Folds one closed trade into the strategy's history. Affects the
  //         score of requests enqueued afterwards, never already-queued ones.
  // -------------------------------------------------------------------------
  void recordOutcome(const std::string& symbol, const std::string& strategy,
                     bool was_profitable, double profit_amount);

  double historicalSuccessFactor(const std::string& strategy) const;

  std::optional<StrategyStats> strategyStats(const std::string& strategy) const;

  std::size_t pendingCount() const;

  // Copy of the queue in arrival order (status reporting and tests).
  std::vector<AllocationRequest> pendingSnapshot() const;

  // -------------------------------------------------------------------------
  // qualifiesForEmergency(request)
  // -------------------------------------------------------------------------
  // @brief  Emergency-reserve policy: a sell whose signal metadata carries
  //         `"stop_loss": true`, i.e. a loss-cutting exit.
  // -------------------------------------------------------------------------
  static bool qualifiesForEmergency(const TradeRequestEvent& request);

 private:
  double successFactorLocked(const std::string& strategy) const;

  const AllocatorSettings settings_;

  mutable std::mutex mutex_;
  std::vector<AllocationRequest> pending_;
  std::unordered_map<std::string, StrategyStats> stats_;
  std::uint64_t next_arrival_{0};
};

}  // namespace pdt
