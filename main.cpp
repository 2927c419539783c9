// -----------------------------------------------------------------------------
// pdt_engine: single executable entry point.
//
//   1) Build the EngineConfig: defaults, then --config <file>, then
//      environment overrides (CORE_DATABASE_URL, PDT_NOTIFY_ENDPOINT,
//      PDT_WEEKLY_LIMIT, PDT_EMERGENCY_RESERVE).
//   2) Create the SchedulerEngine on the wall clock and start it. Persistence
//      problems at startup are reported and the engine runs degraded.
//   3) --demo: push a handful of synthetic signals through the full chain
//      (request -> compliance -> execution -> persistence -> notification),
//      print the status and exit.
//      Otherwise: run until Ctrl-C, then print the final status.
//   4) Shut down cleanly.
//
// --print-schema writes the full SQLite schema (tables and indexes) to stdout
// and exits without starting anything.
//
// Thread layout: see SchedulerEngine. The main thread only waits here.
// -----------------------------------------------------------------------------

#include "pdt/config/engine_config.hpp"
#include "pdt/engine/scheduler_engine.hpp"
#include "pdt/events/position_events.hpp"
#include "pdt/persistence/resilient_store.hpp"
#include "pdt/time/live_time_provider.hpp"

#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

namespace {

// Set by the SIGINT handler, polled by the main thread.
volatile std::sig_atomic_t g_stop_requested = 0;

void sigint_handler(int /*signum*/) { g_stop_requested = 1; }

void printUsage(const char* argv0) {
  std::cout << "usage: " << argv0
            << " [--config <file>] [--demo] [--print-schema]\n";
}

pdt::SignalEvent demoSignal(const std::string& symbol, pdt::Action action,
                            double confidence, double estimated_profit) {
  pdt::SignalEvent s;
  s.strategy_id = "demo";
  s.symbol = symbol;
  s.action = action;
  s.confidence = confidence;
  s.estimated_profit = estimated_profit;
  return s;
}

// -----------------------------------------------------------------------------
// runDemo
// -----------------------------------------------------------------------------
// Four short-horizon buys against the default 3/1 budget: two are admitted
// immediately, the rest wait for the weekly batch. A stop-loss exit then
// takes the emergency slot.
// -----------------------------------------------------------------------------
void runDemo(pdt::SchedulerEngine& engine) {
  engine.publishSignal(demoSignal("AAPL", pdt::Action::Buy, 0.80, 0.020));
  engine.publishSignal(demoSignal("MSFT", pdt::Action::Buy, 0.65, 0.015));
  engine.publishSignal(demoSignal("NVDA", pdt::Action::Buy, 0.90, 0.025));
  engine.publishSignal(demoSignal("TSLA", pdt::Action::Buy, 0.40, 0.010));
  // Long-horizon signal: swing trade, never counted.
  engine.publishSignal(demoSignal("SPY", pdt::Action::Buy, 0.70, 0.080));

  pdt::SignalEvent stop_loss =
      demoSignal("AAPL", pdt::Action::Sell, 0.95, 0.010);
  stop_loss.metadata["stop_loss"] = true;
  engine.publishSignal(stop_loss);

  pdt::PositionClosedEvent closed;
  closed.symbol = "AAPL";
  closed.strategy_id = "demo";
  closed.exit_price = 101.5;
  closed.realized_pl = 150.0;
  engine.reportPositionClosed(closed);
}

}  // namespace

int main(int argc, char** argv) {
  std::string config_path;
  bool demo = false;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (std::strcmp(argv[i], "--demo") == 0) {
      demo = true;
    } else if (std::strcmp(argv[i], "--print-schema") == 0) {
      std::cout << pdt::ResilientStore::getSchemaCreationSql();
      return 0;
    } else {
      printUsage(argv[0]);
      return 2;
    }
  }

  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  pdt::EngineConfig config;
  try {
    if (!config_path.empty()) {
      config = pdt::loadEngineConfig(config_path);
    }
    pdt::applyEnvironmentOverrides(config);
  } catch (const pdt::ConfigError& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Engine.
  // -------------------------------------------------------------------------
  pdt::LiveTimeProvider clock;
  pdt::SchedulerEngine engine(clock, config);

  try {
    engine.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] ERROR: engine failed to start: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 3) Demo or service mode.
  // -------------------------------------------------------------------------
  if (demo) {
    runDemo(engine);
  } else {
    std::signal(SIGINT, sigint_handler);
    std::cout << "[main] running. Press Ctrl-C to shut down.\n";
    while (g_stop_requested == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    std::cout << "\n[main] SIGINT received. Shutting down...\n";
  }

  std::cout << engine.status().dump(2, ' ', false,
                                    nlohmann::json::error_handler_t::replace)
            << "\n";

  // -------------------------------------------------------------------------
  // 4) Clean shutdown.
  // -------------------------------------------------------------------------
  engine.stop();
  return 0;
}
