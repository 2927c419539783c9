// =============================================================================
// priority_allocator_test.cpp
// =============================================================================
// Unit tests for pdt::PriorityAllocator.
//
// Validates:
//   - score = confidence × expected profit × historical success factor
//   - Weekly batch approves the top-N by score and rejects the rest
//   - Ties keep arrival order; the queue is empty after a batch
//   - Zero slots rejects everything with "no slots available"
//   - Outcome history moves the success factor within its bounds
//   - Emergency qualification (stop-loss sells only)
//   - Non-finite scores rank behind every finite one
// =============================================================================

#include "pdt/allocation/priority_allocator.hpp"
#include "pdt/compliance/decision_reasons.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

class PriorityAllocatorTest : public ::testing::Test {
 protected:
  pdt::PriorityAllocator allocator;

  static pdt::TradeRequestEvent makeRequest(const std::string& symbol,
                                            double confidence,
                                            double expected_profit,
                                            const std::string& strategy = "s1") {
    pdt::TradeRequestEvent r;
    r.signal.strategy_id = strategy;
    r.signal.symbol = symbol;
    r.signal.action = pdt::Action::Buy;
    r.signal.confidence = confidence;
    r.signal.estimated_profit = expected_profit;
    r.is_day_trade = true;
    r.requested_position_fraction = 0.05;
    return r;
  }
};

// -----------------------------------------------------------------------------
// 1. A strategy without history scores with the neutral factor 0.8.
// -----------------------------------------------------------------------------
TEST_F(PriorityAllocatorTest, ScoreUsesNeutralFactorWithoutHistory) {
  EXPECT_DOUBLE_EQ(allocator.historicalSuccessFactor("unknown"), 0.8);

  EXPECT_TRUE(allocator.requestAllocation(makeRequest("AAPL", 0.5, 0.04)));

  auto pending = allocator.pendingSnapshot();
  ASSERT_EQ(pending.size(), 1u);
  EXPECT_DOUBLE_EQ(pending[0].score(), 0.5 * 0.04 * 0.8);
}

// -----------------------------------------------------------------------------
// 2. Scores [10, 50, 5, 90, 30] with 2 slots: 90 and 50 approved, the other
//    three rejected as "not in top-N this week", queue emptied.
// Why: This is the ranking contract operators rely on when the budget is
//      exhausted mid-week.
// -----------------------------------------------------------------------------
TEST_F(PriorityAllocatorTest, WeeklyBatchApprovesTopN) {
  const std::vector<double> scores{10, 50, 5, 90, 30};
  for (std::size_t i = 0; i < scores.size(); ++i) {
    allocator.requestAllocation(
        makeRequest("SYM" + std::to_string(i), 1.0, scores[i]));
  }
  ASSERT_EQ(allocator.pendingCount(), 5u);

  auto decisions = allocator.scheduleWeeklyBatch(2);

  ASSERT_EQ(decisions.size(), 5u);
  EXPECT_TRUE(decisions[0].approved);
  EXPECT_EQ(decisions[0].request.signal.symbol, "SYM3");  // 90
  EXPECT_TRUE(decisions[1].approved);
  EXPECT_EQ(decisions[1].request.signal.symbol, "SYM1");  // 50
  EXPECT_EQ(decisions[0].reason, pdt::reasons::kBatchApproved);

  for (std::size_t i = 2; i < decisions.size(); ++i) {
    EXPECT_FALSE(decisions[i].approved);
    EXPECT_EQ(decisions[i].reason, pdt::reasons::kNotInTopN);
  }
  EXPECT_EQ(allocator.pendingCount(), 0u);
}

// -----------------------------------------------------------------------------
// 3. Equal scores keep arrival order.
// -----------------------------------------------------------------------------
TEST_F(PriorityAllocatorTest, TiesKeepArrivalOrder) {
  allocator.requestAllocation(makeRequest("FIRST", 0.5, 0.02));
  allocator.requestAllocation(makeRequest("SECOND", 0.5, 0.02));
  allocator.requestAllocation(makeRequest("THIRD", 0.5, 0.02));

  auto decisions = allocator.scheduleWeeklyBatch(1);

  ASSERT_EQ(decisions.size(), 3u);
  EXPECT_EQ(decisions[0].request.signal.symbol, "FIRST");
  EXPECT_TRUE(decisions[0].approved);
  EXPECT_EQ(decisions[1].request.signal.symbol, "SECOND");
  EXPECT_EQ(decisions[2].request.signal.symbol, "THIRD");
}

// -----------------------------------------------------------------------------
// 4. No slots: every pending request is rejected with "no slots available".
// -----------------------------------------------------------------------------
TEST_F(PriorityAllocatorTest, ZeroSlotsRejectsAll) {
  allocator.requestAllocation(makeRequest("AAPL", 0.9, 0.02));
  allocator.requestAllocation(makeRequest("MSFT", 0.8, 0.02));

  auto decisions = allocator.scheduleWeeklyBatch(0);

  ASSERT_EQ(decisions.size(), 2u);
  for (const auto& d : decisions) {
    EXPECT_FALSE(d.approved);
    EXPECT_EQ(d.reason, pdt::reasons::kNoSlotsAvailable);
  }
  EXPECT_EQ(allocator.pendingCount(), 0u);
}

// -----------------------------------------------------------------------------
// 5. More slots than requests approves everything; an empty queue yields no
//    decisions.
// -----------------------------------------------------------------------------
TEST_F(PriorityAllocatorTest, SurplusSlotsAndEmptyQueue) {
  EXPECT_TRUE(allocator.scheduleWeeklyBatch(3).empty());

  allocator.requestAllocation(makeRequest("AAPL", 0.9, 0.02));
  auto decisions = allocator.scheduleWeeklyBatch(3);

  ASSERT_EQ(decisions.size(), 1u);
  EXPECT_TRUE(decisions[0].approved);
}

// -----------------------------------------------------------------------------
// 6. Wins raise and losses lower the factor, always within [0.1, 1.5].
// -----------------------------------------------------------------------------
TEST_F(PriorityAllocatorTest, OutcomesMoveSuccessFactor) {
  allocator.recordOutcome("AAPL", "winner", true, 120.0);
  allocator.recordOutcome("AAPL", "loser", false, -80.0);

  const double win = allocator.historicalSuccessFactor("winner");
  const double loss = allocator.historicalSuccessFactor("loser");
  EXPECT_NEAR(win, 0.1 + 1.4 * (2.0 / 3.0), 1e-12);
  EXPECT_NEAR(loss, 0.1 + 1.4 * (1.0 / 3.0), 1e-12);
  EXPECT_GT(win, 0.8);
  EXPECT_LT(loss, 0.8);

  for (int i = 0; i < 200; ++i) {
    allocator.recordOutcome("AAPL", "winner", true, 1.0);
    allocator.recordOutcome("AAPL", "loser", false, -1.0);
  }
  EXPECT_LE(allocator.historicalSuccessFactor("winner"), 1.5);
  EXPECT_GE(allocator.historicalSuccessFactor("loser"), 0.1);
}

// -----------------------------------------------------------------------------
// 7. History changes the ranking of requests queued afterwards.
// -----------------------------------------------------------------------------
TEST_F(PriorityAllocatorTest, HistoryAffectsRanking) {
  for (int i = 0; i < 5; ++i) {
    allocator.recordOutcome("X", "good", true, 10.0);
    allocator.recordOutcome("X", "bad", false, -10.0);
  }

  allocator.requestAllocation(makeRequest("BAD", 0.8, 0.02, "bad"));
  allocator.requestAllocation(makeRequest("GOOD", 0.8, 0.02, "good"));

  auto decisions = allocator.scheduleWeeklyBatch(1);
  ASSERT_EQ(decisions.size(), 2u);
  EXPECT_EQ(decisions[0].request.signal.symbol, "GOOD");
  EXPECT_TRUE(decisions[0].approved);
  EXPECT_FALSE(decisions[1].approved);
}

// -----------------------------------------------------------------------------
// 8. Per-strategy statistics.
// -----------------------------------------------------------------------------
TEST_F(PriorityAllocatorTest, StrategyStats) {
  EXPECT_FALSE(allocator.strategyStats("momentum").has_value());

  allocator.recordOutcome("AAPL", "momentum", true, 100.0);
  allocator.recordOutcome("MSFT", "momentum", false, -40.0);

  auto stats = allocator.strategyStats("momentum");
  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->trades, 2u);
  EXPECT_EQ(stats->wins, 1u);
  EXPECT_DOUBLE_EQ(stats->cumulative_profit, 60.0);
  EXPECT_DOUBLE_EQ(stats->winRate(), 0.5);
}

// -----------------------------------------------------------------------------
// 9. Only sells flagged as stop-loss qualify for the emergency reserve.
// -----------------------------------------------------------------------------
TEST_F(PriorityAllocatorTest, EmergencyQualification) {
  pdt::TradeRequestEvent r = makeRequest("AAPL", 0.9, 0.01);
  EXPECT_FALSE(pdt::PriorityAllocator::qualifiesForEmergency(r));

  r.signal.action = pdt::Action::Sell;
  EXPECT_FALSE(pdt::PriorityAllocator::qualifiesForEmergency(r));

  r.signal.metadata["stop_loss"] = "yes";
  EXPECT_FALSE(pdt::PriorityAllocator::qualifiesForEmergency(r));

  r.signal.metadata["stop_loss"] = true;
  EXPECT_TRUE(pdt::PriorityAllocator::qualifiesForEmergency(r));

  r.signal.action = pdt::Action::Buy;
  EXPECT_FALSE(pdt::PriorityAllocator::qualifiesForEmergency(r));
}

// -----------------------------------------------------------------------------
// 10. A NaN or infinite input scores -infinity and cannot displace a finite
//     request from the top-N.
// Why: A NaN in the comparator breaks the sort order and the batch would
//      approve whatever happened to arrive first.
// -----------------------------------------------------------------------------
TEST_F(PriorityAllocatorTest, NonFiniteScoreRanksLast) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  allocator.requestAllocation(makeRequest("A", 1.0, 10));
  allocator.requestAllocation(makeRequest("B", 1.0, 50));
  allocator.requestAllocation(makeRequest("C", 1.0, nan));
  allocator.requestAllocation(makeRequest("D", 1.0, 5));
  allocator.requestAllocation(makeRequest("E", 1.0, 90));
  allocator.requestAllocation(
      makeRequest("F", std::numeric_limits<double>::infinity(), 1.0));

  auto decisions = allocator.scheduleWeeklyBatch(2);

  ASSERT_EQ(decisions.size(), 6u);
  EXPECT_EQ(decisions[0].request.signal.symbol, "E");
  EXPECT_EQ(decisions[1].request.signal.symbol, "B");
  EXPECT_TRUE(decisions[0].approved);
  EXPECT_TRUE(decisions[1].approved);
  EXPECT_EQ(decisions[2].request.signal.symbol, "A");
  EXPECT_EQ(decisions[3].request.signal.symbol, "D");
  for (std::size_t i = 2; i < decisions.size(); ++i) {
    EXPECT_FALSE(decisions[i].approved);
  }
  EXPECT_TRUE(std::isinf(decisions[4].score));
  EXPECT_LT(decisions[5].score, 0.0);
}
