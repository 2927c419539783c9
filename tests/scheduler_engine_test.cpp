// =============================================================================
// scheduler_engine_test.cpp
// =============================================================================
// End-to-end tests for pdt::SchedulerEngine: real bus, tracker, allocator,
// router (stub venue) and a SQLite file in the temp directory.
//
// Validates:
//   - Signal -> request -> approval -> position, with every step persisted
//     and notified
//   - Hold and zero-confidence signals never reach the bus
//   - Strategies run on the analysis thread; stop() drains queued data and
//     a throwing strategy does not take the others down
//   - A degraded or unreachable store does not stop the engine
//   - The weekly batch after a rollover opens the queued trade
//   - start()/stop() are idempotent
//   - stop() waits for in-flight publishes and refuses later ones
// =============================================================================

#include "pdt/compliance/decision_reasons.hpp"
#include "pdt/engine/scheduler_engine.hpp"
#include "pdt/persistence/resilient_store.hpp"
#include "pdt/persistence/schema.hpp"
#include "pdt/persistence/sqlite_connection.hpp"
#include "pdt/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

// 2024-01-01T00:00:00Z, a Monday.
constexpr std::int64_t kMonday = 1704067200000;
constexpr std::int64_t kHour = 60LL * 60 * 1000;

class RecordingSink : public pdt::INotificationSink {
 public:
  void notify(pdt::Notification n) override {
    std::lock_guard lock(mutex_);
    received_.push_back(std::move(n));
  }

  std::size_t count(const std::string& type) const {
    std::lock_guard lock(mutex_);
    std::size_t n = 0;
    for (const auto& r : received_) {
      if (r.type == type) {
        ++n;
      }
    }
    return n;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<pdt::Notification> received_;
};

// Emits one buy per observation, leaving strategy_id for the engine to fill.
class BuyEverything final : public pdt::ISignalStrategy {
 public:
  explicit BuyEverything(pdt::Action action = pdt::Action::Buy)
      : action_(action) {}

  std::string name() const override { return "buy_everything"; }

  std::optional<pdt::SignalEvent> analyze(
      const pdt::MarketDataEvent& event) override {
    pdt::SignalEvent s;
    s.symbol = event.symbol;
    s.action = action_;
    s.confidence = 0.6;
    s.estimated_profit = 0.05;
    return s;
  }

 private:
  pdt::Action action_;
};

class Exploding final : public pdt::ISignalStrategy {
 public:
  std::string name() const override { return "exploding"; }

  std::optional<pdt::SignalEvent> analyze(const pdt::MarketDataEvent&) override {
    throw std::runtime_error("indicator buffer underflow");
  }
};

pdt::SignalEvent signal(const std::string& symbol, double confidence,
                        double profit) {
  pdt::SignalEvent s;
  s.strategy_id = "momentum";
  s.symbol = symbol;
  s.action = pdt::Action::Buy;
  s.confidence = confidence;
  s.estimated_profit = profit;
  return s;
}

}  // namespace

class SchedulerEngineTest : public ::testing::Test {
 protected:
  fs::path db_path;
  // Wednesday noon.
  pdt::SimulationTimeProvider clock{kMonday + 2 * pdt::kMillisPerDay +
                                    12 * kHour};
  RecordingSink sink;
  std::unique_ptr<pdt::SqliteConnection> side;

  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    db_path = fs::temp_directory_path() /
              (std::string("pdt_engine_") + info->name() + ".db");
    fs::remove(db_path);
    side = std::make_unique<pdt::SqliteConnection>(db_path.string(), 1000ms);
  }

  void TearDown() override {
    side.reset();
    fs::remove(db_path);
  }

  void createSchema() {
    side->execute(pdt::ResilientStore::getSchemaCreationSql());
  }

  pdt::EngineConfig config() const {
    pdt::EngineConfig c;
    c.store.database_url = db_path.string();
    c.store.connect_attempts = 1;
    c.store.connect_backoff = 1ms;
    c.notify_endpoint = "";
    return c;
  }

  std::int64_t rowCount(const std::string& table) {
    pdt::Statement q = side->prepare("SELECT COUNT(*) FROM " + table);
    EXPECT_TRUE(q.step());
    return q.columnInt64(0);
  }
};

// -----------------------------------------------------------------------------
// 1. Limit 3 / reserve 1: two quick trades open positions, the third is
//    queued. All three signals and both positions are stored.
// -----------------------------------------------------------------------------
TEST_F(SchedulerEngineTest, SignalFlowsThroughToStore) {
  createSchema();
  pdt::SchedulerEngine engine(clock, config(), &sink);

  std::vector<pdt::TradeApprovalEvent> approvals;
  engine.eventBus().subscribe<pdt::TradeApprovalEvent>(
      [&approvals](const pdt::TradeApprovalEvent& a) { approvals.push_back(a); });

  engine.start();
  ASSERT_TRUE(engine.running());
  ASSERT_NE(engine.store(), nullptr);
  EXPECT_FALSE(engine.store()->isDegraded());

  EXPECT_TRUE(engine.publishSignal(signal("AAPL", 0.8, 0.01)));
  EXPECT_TRUE(engine.publishSignal(signal("MSFT", 0.7, 0.02)));
  EXPECT_TRUE(engine.publishSignal(signal("NVDA", 0.9, 0.01)));

  ASSERT_EQ(approvals.size(), 3u);
  EXPECT_TRUE(approvals[0].approved);
  EXPECT_TRUE(approvals[1].approved);
  EXPECT_FALSE(approvals[2].approved);
  EXPECT_EQ(approvals[2].reason, pdt::reasons::kLimitReachedQueued);

  EXPECT_EQ(rowCount("signals"), 3);
  EXPECT_EQ(rowCount("positions"), 2);
  EXPECT_EQ(sink.count("signal.generated"), 3u);
  EXPECT_EQ(sink.count("position.opened"), 2u);

  pdt::ComplianceStatus status = engine.complianceStatus();
  EXPECT_EQ(status.trades_used, 2);
  EXPECT_FALSE(status.can_day_trade);
  EXPECT_EQ(status.pending_allocations, 1u);

  engine.stop();
  EXPECT_FALSE(engine.running());
  EXPECT_EQ(engine.store(), nullptr);
}

// -----------------------------------------------------------------------------
// 2. Hold and non-positive confidence are dropped before the bus.
// -----------------------------------------------------------------------------
TEST_F(SchedulerEngineTest, HoldAndZeroConfidenceAreDropped) {
  createSchema();
  pdt::SchedulerEngine engine(clock, config(), &sink);
  engine.start();

  pdt::SignalEvent hold = signal("AAPL", 0.8, 0.01);
  hold.action = pdt::Action::Hold;

  EXPECT_FALSE(engine.publishSignal(hold));
  EXPECT_FALSE(engine.publishSignal(signal("AAPL", 0.0, 0.01)));
  EXPECT_EQ(rowCount("signals"), 0);
  EXPECT_EQ(engine.complianceStatus().trades_used, 0);
}

// -----------------------------------------------------------------------------
// 3. Swing trades and stop-loss exits pass even with the budget spent.
// -----------------------------------------------------------------------------
TEST_F(SchedulerEngineTest, SwingAndStopLossBypassBudget) {
  createSchema();
  pdt::SchedulerEngine engine(clock, config(), &sink);
  engine.start();

  engine.publishSignal(signal("AAPL", 0.8, 0.01));
  engine.publishSignal(signal("MSFT", 0.8, 0.01));
  engine.publishSignal(signal("SPY", 0.6, 0.08));

  pdt::SignalEvent cut = signal("AAPL", 0.95, 0.0);
  cut.action = pdt::Action::Sell;
  cut.metadata["stop_loss"] = true;
  engine.publishSignal(cut);

  pdt::ComplianceStatus status = engine.complianceStatus();
  EXPECT_EQ(status.trades_used, 3);
  EXPECT_EQ(status.emergency_used, 1);
  EXPECT_EQ(rowCount("positions"), 4);
}

// -----------------------------------------------------------------------------
// 4. Strategies run on the analysis thread. stop() drains what was queued.
// -----------------------------------------------------------------------------
TEST_F(SchedulerEngineTest, StrategiesRunOnAnalysisLoop) {
  createSchema();
  pdt::SchedulerEngine engine(clock, config(), &sink);

  std::mutex m;
  std::vector<pdt::SignalEvent> signals;
  engine.eventBus().subscribe<pdt::SignalEvent>(
      [&](const pdt::SignalEvent& s) {
        std::lock_guard lock(m);
        signals.push_back(s);
      });

  engine.addStrategy(std::make_unique<Exploding>());
  engine.addStrategy(std::make_unique<BuyEverything>());
  engine.addStrategy(std::make_unique<BuyEverything>(pdt::Action::Hold));
  engine.start();

  for (const char* symbol : {"AAPL", "MSFT", "QQQ"}) {
    pdt::MarketDataEvent md;
    md.symbol = symbol;
    md.price = 100.0;
    engine.pushMarketData(md);
  }
  engine.stop();

  std::lock_guard lock(m);
  ASSERT_EQ(signals.size(), 3u);
  EXPECT_EQ(signals[0].symbol, "AAPL");
  EXPECT_EQ(signals[2].symbol, "QQQ");
  EXPECT_EQ(signals[0].strategy_id, "buy_everything");
  EXPECT_EQ(pdt::timestamp_to_ms(signals[0].timestamp), clock.now_ms());
  EXPECT_EQ(rowCount("signals"), 3);
}

// -----------------------------------------------------------------------------
// 5. A database without the signals table: the engine runs degraded, keeps
//    storing positions and reports the fix in status().
// Why: Losing compliance decisions because of a schema drift is worse than
//      losing the signal history.
// -----------------------------------------------------------------------------
TEST_F(SchedulerEngineTest, DegradedStoreKeepsRunning) {
  side->execute(pdt::findTable("positions")->createTableSql());
  pdt::SchedulerEngine engine(clock, config(), &sink);

  ASSERT_NO_THROW(engine.start());
  ASSERT_TRUE(engine.running());
  EXPECT_TRUE(engine.store()->isDegraded());

  engine.publishSignal(signal("AAPL", 0.8, 0.01));

  EXPECT_EQ(rowCount("positions"), 1);
  EXPECT_EQ(engine.complianceStatus().trades_used, 1);

  nlohmann::json s = engine.status();
  EXPECT_TRUE(s["persistence"]["degraded"].get<bool>());
  EXPECT_NE(s["persistence"]["fix_sql"].get<std::string>().find(
                "CREATE TABLE IF NOT EXISTS signals"),
            std::string::npos);
  EXPECT_GE(s["persistence"]["stats"]["writes_dropped"].get<std::uint64_t>(), 1u);
  EXPECT_EQ(s["persistence"]["stats"]["writes_ok"].get<std::uint64_t>(), 1u);
}

TEST_F(SchedulerEngineTest, UnreachableStoreKeepsRunning) {
  pdt::EngineConfig c = config();
  c.store.database_url =
      (fs::temp_directory_path() / "pdt_no_such_dir" / "engine.db").string();
  pdt::SchedulerEngine engine(clock, c, &sink);

  ASSERT_NO_THROW(engine.start());
  EXPECT_FALSE(engine.store()->isConnected());

  pdt::TradeApprovalEvent last;
  engine.eventBus().subscribe<pdt::TradeApprovalEvent>(
      [&last](const pdt::TradeApprovalEvent& a) { last = a; });
  engine.publishSignal(signal("AAPL", 0.8, 0.01));

  EXPECT_TRUE(last.approved);
  EXPECT_FALSE(engine.status()["persistence"]["connected"].get<bool>());
}

// -----------------------------------------------------------------------------
// 6. A closed position is marked in the store and in the ledger.
// -----------------------------------------------------------------------------
TEST_F(SchedulerEngineTest, PositionCloseIsRecorded) {
  createSchema();
  pdt::SchedulerEngine engine(clock, config(), &sink);
  engine.start();

  engine.publishSignal(signal("AAPL", 0.8, 0.01));
  clock.advance_by(kHour);

  pdt::PositionClosedEvent closed;
  closed.symbol = "AAPL";
  closed.strategy_id = "momentum";
  closed.position_id = 1;
  closed.exit_price = 101.0;
  closed.realized_pl = 100.0;
  engine.reportPositionClosed(closed);

  pdt::Statement q =
      side->prepare("SELECT status, realized_pl FROM positions WHERE id = 1");
  ASSERT_TRUE(q.step());
  EXPECT_EQ(q.columnText(0), "closed");
  EXPECT_DOUBLE_EQ(q.columnDouble(1), 100.0);
  EXPECT_EQ(sink.count("position.closed"), 1u);

  auto ledger = engine.tracker().ledger();
  ASSERT_EQ(ledger.size(), 1u);
  EXPECT_FALSE(ledger[0].isOpen());

  auto stats = engine.allocator().strategyStats("momentum");
  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->wins, 1u);
}

// -----------------------------------------------------------------------------
// 7. The queued trade is opened by the batch that follows the rollover.
// -----------------------------------------------------------------------------
TEST_F(SchedulerEngineTest, WeeklyBatchOpensQueuedTrade) {
  createSchema();
  pdt::SchedulerEngine engine(clock, config(), &sink);
  engine.start();

  engine.publishSignal(signal("AAPL", 0.8, 0.01));
  engine.publishSignal(signal("MSFT", 0.8, 0.01));
  engine.publishSignal(signal("NVDA", 0.9, 0.01));
  ASSERT_EQ(rowCount("positions"), 2);

  clock.set_time(kMonday + pdt::kMillisPerWeek + kHour);
  std::vector<pdt::TradeApprovalEvent> decisions = engine.runWeeklyBatch();

  ASSERT_EQ(decisions.size(), 1u);
  EXPECT_TRUE(decisions[0].approved);
  EXPECT_EQ(decisions[0].reason, pdt::reasons::kBatchApproved);
  EXPECT_EQ(decisions[0].request.signal.symbol, "NVDA");
  EXPECT_EQ(rowCount("positions"), 3);

  pdt::ComplianceStatus status = engine.complianceStatus();
  EXPECT_EQ(status.trades_used, 1);
  EXPECT_EQ(status.pending_allocations, 0u);
}

// -----------------------------------------------------------------------------
// 8. start() and stop() are idempotent; the engine can be restarted.
// -----------------------------------------------------------------------------
TEST_F(SchedulerEngineTest, StartStopIdempotent) {
  createSchema();
  pdt::SchedulerEngine engine(clock, config(), &sink);

  engine.stop();
  engine.start();
  engine.start();
  EXPECT_EQ(engine.eventBus().subscriberCount(pdt::Topic::SignalGenerated), 2u);
  engine.stop();
  engine.stop();
  EXPECT_EQ(engine.eventBus().subscriberCount(pdt::Topic::SignalGenerated), 0u);

  engine.start();
  EXPECT_TRUE(engine.publishSignal(signal("AAPL", 0.8, 0.01)));
  EXPECT_EQ(rowCount("signals"), 1);

  nlohmann::json s = engine.status();
  EXPECT_TRUE(s["running"].get<bool>());
  EXPECT_EQ(s["compliance"]["trades_used"].get<int>(), 1);
  EXPECT_FALSE(s.contains("notifications"));
}

// -----------------------------------------------------------------------------
// 9. Publishers racing stop(): every accepted signal is stored in full, and
//    nothing is accepted once stop() has returned.
// -----------------------------------------------------------------------------
TEST_F(SchedulerEngineTest, StopWaitsForInFlightPublishes) {
  createSchema();
  pdt::SchedulerEngine engine(clock, config(), &sink);
  engine.start();

  constexpr int kThreads = 4;
  constexpr int kPerThread = 200;
  std::atomic<int> accepted{0};
  std::atomic<bool> go{false};

  std::vector<std::thread> publishers;
  for (int t = 0; t < kThreads; ++t) {
    publishers.emplace_back([&engine, &accepted, &go, t]() {
      while (!go.load()) {
        std::this_thread::yield();
      }
      for (int i = 0; i < kPerThread; ++i) {
        // Swing trades, so the weekly budget never interferes.
        if (engine.publishSignal(
                signal("SYM" + std::to_string(t), 0.7, 0.08))) {
          ++accepted;
        }
      }
    });
  }

  go = true;
  std::this_thread::sleep_for(5ms);
  engine.stop();

  for (auto& th : publishers) {
    th.join();
  }

  EXPECT_FALSE(engine.running());
  EXPECT_EQ(rowCount("signals"), accepted.load());
  EXPECT_FALSE(engine.publishSignal(signal("AAPL", 0.8, 0.01)));
  EXPECT_FALSE(engine.reportPositionClosed(pdt::PositionClosedEvent{}));
}

TEST(SchedulerEngineConfigTest, InvalidConfigThrows) {
  pdt::SimulationTimeProvider clock{kMonday};
  pdt::EngineConfig c;
  c.compliance.emergency_reserve = 5;

  EXPECT_THROW(pdt::SchedulerEngine{clock, c}, pdt::ConfigError);
}
