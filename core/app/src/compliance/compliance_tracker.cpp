#include "pdt/compliance/compliance_tracker.hpp"

#include "pdt/compliance/decision_reasons.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace pdt {

// -----------------------------------------------------------------------------
// ComplianceStatus::toJson
// -----------------------------------------------------------------------------
nlohmann::json ComplianceStatus::toJson() const {
  nlohmann::json recent = nlohmann::json::array();
  for (const auto& t : recent_trades) {
    recent.push_back({
        {"symbol", t.symbol},
        {"strategy", t.strategy},
        {"open_time", to_iso8601(t.open_time)},
        {"close_time", t.isOpen() ? nlohmann::json(nullptr)
                                  : nlohmann::json(to_iso8601(t.close_time))},
        {"emergency", t.emergency},
    });
  }

  return {
      {"trades_used", trades_used},
      {"trades_remaining", trades_remaining},
      {"can_day_trade", can_day_trade},
      {"week_start", to_iso8601(week_start)},
      {"recent_trades", std::move(recent)},
      {"pending_allocations", pending_allocations},
      {"emergency_reserved", emergency_reserved},
      {"emergency_used", emergency_used},
      {"risk_rules",
       {{"max_position_size", risk_rules.max_position_size},
        {"max_daily_loss", risk_rules.max_daily_loss},
        {"max_open_positions", risk_rules.max_open_positions}}},
  };
}

// -----------------------------------------------------------------------------
// Construction / destruction: bus wiring
// -----------------------------------------------------------------------------
ComplianceTracker::ComplianceTracker(EventBus& bus,
                                     PriorityAllocator& allocator,
                                     const ITimeProvider& clock,
                                     domain::ComplianceLimits limits,
                                     domain::RiskRules risk_rules)
    : bus_(bus),
      allocator_(allocator),
      clock_(clock),
      limits_(limits),
      risk_rules_(risk_rules),
      week_start_ms_(week_start_ms(clock.now_ms())) {
  subscriptions_.push_back(bus_.subscribe<TradeRequestEvent>(
      [this](const TradeRequestEvent& request) { evaluate(request); }));
  subscriptions_.push_back(bus_.subscribe<PositionClosedEvent>(
      [this](const PositionClosedEvent& event) { onPositionClosed(event); }));

  std::cout << "[ComplianceTracker] weekly limit=" << limits_.weekly_limit
            << " emergency reserve=" << limits_.emergency_reserve
            << " week start=" << to_iso8601(week_start_ms_) << "\n";
}

ComplianceTracker::~ComplianceTracker() {
  for (const auto& id : subscriptions_) {
    bus_.unsubscribe(id);
  }
}

// -----------------------------------------------------------------------------
// evaluate: the admission decision
// -----------------------------------------------------------------------------
TradeApprovalEvent ComplianceTracker::evaluate(
    const TradeRequestEvent& request) {
  const std::int64_t now = clock_.now_ms();

  TradeApprovalEvent decision;
  decision.request = request;
  decision.timestamp = ms_to_timestamp(now);

  std::vector<TradeApprovalEvent> batch;
  {
    std::lock_guard lock(mutex_);
    batch = rolloverIfNeededLocked(now);

    const bool ambiguous = isAmbiguous(request);
    if (ambiguous) {
      std::cerr << "[ComplianceTracker] WARNING: ambiguous request (symbol='"
                << request.signal.symbol << "', strategy='"
                << request.signal.strategy_id
                << "'), treating as an ordinary day trade\n";
    }

    if (!request.is_day_trade && !ambiguous) {
      decision.approved = true;
      decision.reason = reasons::kSwingTrade;
    } else if (!ambiguous && PriorityAllocator::qualifiesForEmergency(request)) {
      appendLocked(request, now, /*emergency=*/true);
      decision.approved = true;
      decision.reason = reasons::kEmergencySlot;

      const int used = emergencyUsedLocked();
      if (used > limits_.emergency_reserve) {
        std::cerr << "[ComplianceTracker] WARNING: emergency slots used ("
                  << used << ") exceed reserve ("
                  << limits_.emergency_reserve << ")\n";
      }
    } else if (ordinaryUsedLocked() < limits_.ordinaryBudget()) {
      appendLocked(request, now, /*emergency=*/false);
      decision.approved = true;
      decision.reason = reasons::kSlotAvailable;
    } else {
      allocator_.requestAllocation(request);
      decision.approved = false;
      decision.reason = reasons::kLimitReachedQueued;
    }
  }

  publishAll(batch);
  std::cout << "[ComplianceTracker] " << request.signal.symbol << " ("
            << request.signal.strategy_id << ") "
            << (decision.approved ? "APPROVED" : "REJECTED") << ": "
            << decision.reason << "\n";
  bus_.emit(decision);
  return decision;
}

// -----------------------------------------------------------------------------
// onPositionClosed: close the ledger entry, record the outcome
// -----------------------------------------------------------------------------
void ComplianceTracker::onPositionClosed(const PositionClosedEvent& event) {
  const std::int64_t now = clock_.now_ms();

  std::vector<TradeApprovalEvent> batch;
  {
    std::lock_guard lock(mutex_);
    batch = rolloverIfNeededLocked(now);

    auto it = std::find_if(ledger_.begin(), ledger_.end(),
                           [&event](const domain::DayTrade& t) {
                             return t.symbol == event.symbol && t.isOpen();
                           });
    if (it != ledger_.end()) {
      Timestamp closed = ms_to_timestamp(now);
      // close_time == open_time means "open"; keep a closed entry distinct
      // even when both land on the same millisecond.
      if (closed <= it->open_time) {
        closed = it->open_time + std::chrono::milliseconds{1};
      }
      it->close_time = closed;
    }
  }

  allocator_.recordOutcome(event.symbol, event.strategy_id,
                           event.realized_pl > 0.0, event.realized_pl);
  publishAll(batch);
}

// -----------------------------------------------------------------------------
// runWeeklyBatch: manual trigger
// -----------------------------------------------------------------------------
std::vector<TradeApprovalEvent> ComplianceTracker::runWeeklyBatch() {
  const std::int64_t now = clock_.now_ms();

  std::vector<TradeApprovalEvent> decisions;
  {
    std::lock_guard lock(mutex_);
    decisions = rolloverIfNeededLocked(now);
    std::vector<TradeApprovalEvent> more = runBatchLocked(now);
    decisions.insert(decisions.end(), std::make_move_iterator(more.begin()),
                     std::make_move_iterator(more.end()));
  }

  publishAll(decisions);
  return decisions;
}

// -----------------------------------------------------------------------------
// status
// -----------------------------------------------------------------------------
ComplianceStatus ComplianceTracker::status() {
  const std::int64_t now = clock_.now_ms();

  ComplianceStatus s;
  std::vector<TradeApprovalEvent> batch;
  {
    std::lock_guard lock(mutex_);
    batch = rolloverIfNeededLocked(now);

    const int ordinary = ordinaryUsedLocked();
    s.trades_used = static_cast<int>(ledger_.size());
    s.trades_remaining = std::max(0, limits_.weekly_limit - s.trades_used);
    s.can_day_trade = ordinary < limits_.ordinaryBudget();
    s.week_start = ms_to_timestamp(week_start_ms_);

    const std::size_t n = std::min(ledger_.size(), kRecentTradeCount);
    s.recent_trades.assign(ledger_.end() - static_cast<std::ptrdiff_t>(n),
                           ledger_.end());

    s.pending_allocations = allocator_.pendingCount();
    s.emergency_reserved = limits_.emergency_reserve;
    s.emergency_used = emergencyUsedLocked();
    s.risk_rules = risk_rules_;
  }

  publishAll(batch);
  return s;
}

std::vector<domain::DayTrade> ComplianceTracker::ledger() const {
  std::lock_guard lock(mutex_);
  return ledger_;
}

// -----------------------------------------------------------------------------
// rolloverIfNeededLocked: hard weekly reset + automatic batch
// -----------------------------------------------------------------------------
std::vector<TradeApprovalEvent> ComplianceTracker::rolloverIfNeededLocked(
    std::int64_t now_ms) {
  const std::int64_t boundary = week_start_ms(now_ms);
  if (boundary <= week_start_ms_) {
    return {};
  }

  std::cout << "[ComplianceTracker] week rollover " << to_iso8601(week_start_ms_)
            << " -> " << to_iso8601(boundary) << ", dropping " << ledger_.size()
            << " ledger entries\n";

  const Timestamp cutoff = ms_to_timestamp(boundary);
  ledger_.erase(std::remove_if(ledger_.begin(), ledger_.end(),
                               [&cutoff](const domain::DayTrade& t) {
                                 return t.open_time < cutoff;
                               }),
                ledger_.end());
  week_start_ms_ = boundary;

  return runBatchLocked(now_ms);
}

std::vector<TradeApprovalEvent> ComplianceTracker::runBatchLocked(
    std::int64_t now_ms) {
  const int free_slots =
      std::max(0, limits_.ordinaryBudget() - ordinaryUsedLocked());

  std::vector<TradeApprovalEvent> out;
  for (auto& d : allocator_.scheduleWeeklyBatch(free_slots)) {
    if (d.approved) {
      appendLocked(d.request, now_ms, /*emergency=*/false);
    }
    TradeApprovalEvent e;
    e.request = std::move(d.request);
    e.approved = d.approved;
    e.reason = std::move(d.reason);
    e.timestamp = ms_to_timestamp(now_ms);
    out.push_back(std::move(e));
  }
  return out;
}

void ComplianceTracker::appendLocked(const TradeRequestEvent& request,
                                     std::int64_t now_ms, bool emergency) {
  domain::DayTrade t;
  t.symbol = request.signal.symbol;
  t.strategy = request.signal.strategy_id;
  t.open_time = ms_to_timestamp(now_ms);
  t.close_time = t.open_time;
  t.emergency = emergency;
  ledger_.push_back(std::move(t));
}

int ComplianceTracker::ordinaryUsedLocked() const {
  return static_cast<int>(std::count_if(
      ledger_.begin(), ledger_.end(),
      [](const domain::DayTrade& t) { return !t.emergency; }));
}

int ComplianceTracker::emergencyUsedLocked() const {
  return static_cast<int>(ledger_.size()) - ordinaryUsedLocked();
}

void ComplianceTracker::publishAll(
    const std::vector<TradeApprovalEvent>& decisions) {
  for (const auto& d : decisions) {
    bus_.emit(d);
  }
}

bool ComplianceTracker::isAmbiguous(const TradeRequestEvent& request) {
  const SignalEvent& s = request.signal;
  if (s.symbol.empty() || s.strategy_id.empty()) {
    return true;
  }
  if (!std::isfinite(s.confidence) || s.confidence < 0.0 ||
      s.confidence > 1.0) {
    return true;
  }
  return !std::isfinite(s.estimated_profit);
}

}  // namespace pdt
