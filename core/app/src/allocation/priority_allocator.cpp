#include "pdt/allocation/priority_allocator.hpp"

#include "pdt/compliance/decision_reasons.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <utility>

namespace pdt {

AllocationRequest::AllocationRequest(TradeRequestEvent request,
                                     double success_factor,
                                     std::uint64_t arrival)
    : request_(std::move(request)),
      score_(computeScore(request_.signal, success_factor)),
      arrival_(arrival) {}

double AllocationRequest::computeScore(const SignalEvent& signal,
                                       double success_factor) {
  const double score =
      signal.confidence * signal.estimated_profit * success_factor;
  if (!std::isfinite(score)) {
    return -std::numeric_limits<double>::infinity();
  }
  return score;
}

PriorityAllocator::PriorityAllocator(AllocatorSettings settings)
    : settings_(settings) {}

// -----------------------------------------------------------------------------
// requestAllocation: score now, decide at the next weekly batch
// -----------------------------------------------------------------------------
bool PriorityAllocator::requestAllocation(const TradeRequestEvent& request) {
  std::lock_guard lock(mutex_);
  const double factor = successFactorLocked(request.signal.strategy_id);
  pending_.emplace_back(request, factor, next_arrival_++);

  std::cout << "[PriorityAllocator] queued " << request.signal.symbol << " ("
            << request.signal.strategy_id
            << ") score=" << pending_.back().score()
            << " pending=" << pending_.size() << "\n";
  return true;
}

// -----------------------------------------------------------------------------
// scheduleWeeklyBatch: rank, take top-N, reject the rest, clear
// -----------------------------------------------------------------------------
std::vector<AllocationDecision> PriorityAllocator::scheduleWeeklyBatch(
    int available_slots) {
  std::vector<AllocationRequest> batch;
  {
    std::lock_guard lock(mutex_);
    batch.swap(pending_);
  }

  // pending_ is kept in arrival order, so a stable sort preserves FIFO among
  // equal scores.
  std::stable_sort(batch.begin(), batch.end(),
                   [](const AllocationRequest& a, const AllocationRequest& b) {
                     return a.score() > b.score();
                   });

  const std::size_t slots =
      available_slots > 0 ? static_cast<std::size_t>(available_slots) : 0;

  std::vector<AllocationDecision> decisions;
  decisions.reserve(batch.size());
  for (std::size_t i = 0; i < batch.size(); ++i) {
    AllocationDecision d;
    d.request = batch[i].request();
    d.score = batch[i].score();
    if (i < slots) {
      d.approved = true;
      d.reason = reasons::kBatchApproved;
    } else {
      d.approved = false;
      d.reason = slots == 0 ? reasons::kNoSlotsAvailable : reasons::kNotInTopN;
    }
    decisions.push_back(std::move(d));
  }

  if (!decisions.empty()) {
    std::cout << "[PriorityAllocator] weekly batch: " << decisions.size()
              << " pending, " << std::min(slots, decisions.size())
              << " approved\n";
  }
  return decisions;
}

// -----------------------------------------------------------------------------
// recordOutcome
// -----------------------------------------------------------------------------
void PriorityAllocator::recordOutcome(const std::string& symbol,
                                      const std::string& strategy,
                                      bool was_profitable,
                                      double profit_amount) {
  std::lock_guard lock(mutex_);
  StrategyStats& s = stats_[strategy];
  ++s.trades;
  if (was_profitable) {
    ++s.wins;
  }
  s.cumulative_profit += profit_amount;

  std::cout << "[PriorityAllocator] outcome " << symbol << " (" << strategy
            << ") profitable=" << (was_profitable ? "yes" : "no")
            << " win_rate=" << s.winRate() << "\n";
}

double PriorityAllocator::historicalSuccessFactor(
    const std::string& strategy) const {
  std::lock_guard lock(mutex_);
  return successFactorLocked(strategy);
}

std::optional<StrategyStats> PriorityAllocator::strategyStats(
    const std::string& strategy) const {
  std::lock_guard lock(mutex_);
  auto it = stats_.find(strategy);
  if (it == stats_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t PriorityAllocator::pendingCount() const {
  std::lock_guard lock(mutex_);
  return pending_.size();
}

std::vector<AllocationRequest> PriorityAllocator::pendingSnapshot() const {
  std::lock_guard lock(mutex_);
  return pending_;
}

// -----------------------------------------------------------------------------
// qualifiesForEmergency
// -----------------------------------------------------------------------------
bool PriorityAllocator::qualifiesForEmergency(
    const TradeRequestEvent& request) {
  const SignalEvent& signal = request.signal;
  if (signal.action != Action::Sell || !signal.metadata.is_object()) {
    return false;
  }
  auto it = signal.metadata.find("stop_loss");
  return it != signal.metadata.end() && it->is_boolean() &&
         it->get<bool>();
}

double PriorityAllocator::successFactorLocked(
    const std::string& strategy) const {
  std::uint64_t trades = 0;
  std::uint64_t wins = 0;
  auto it = stats_.find(strategy);
  if (it != stats_.end()) {
    trades = it->second.trades;
    wins = it->second.wins;
  }

  const double p = (static_cast<double>(wins) + 1.0) /
                   (static_cast<double>(trades) + 2.0);
  const double lo = settings_.min_success_factor;
  const double hi = std::max(settings_.min_success_factor,
                             settings_.max_success_factor);
  return std::clamp(lo + (hi - lo) * p, lo, hi);
}

}  // namespace pdt
