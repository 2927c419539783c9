#pragma once

#include "pdt/persistence/resilient_store.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>
#include <vector>

namespace pdt {

// -----------------------------------------------------------------------------
// MonitorSettings
// -----------------------------------------------------------------------------
// backoff_ladder: waits between failed attempts; the last rung repeats.
// health_check_interval: wait between checks while healthy.
// -----------------------------------------------------------------------------
struct MonitorSettings {
  std::vector<std::chrono::milliseconds> backoff_ladder{
      std::chrono::seconds(30), std::chrono::seconds(60),
      std::chrono::minutes(5), std::chrono::minutes(10)};
  std::chrono::milliseconds health_check_interval{std::chrono::seconds(60)};
};

// -----------------------------------------------------------------------------
// SchemaMonitor
// -----------------------------------------------------------------------------
//
// @brief  Supervised background task that brings a ResilientStore back to
//         health: reconnects a lost connection and revalidates the schema
//         while the store runs degraded.
//
// @details
// States:
//
//   Stopped ──start()/runOnce()──► Validating ──ok──► Healthy
//                                      │                 │
//                                      └──fail──► Degraded
//
// Each cycle (runOnce) pings the store and reconnects it when it does not
// answer, then validates the schema when the store is degraded or has never
// been validated (initialize() failed before reaching the schema check).
// A failed cycle waits the next rung of the backoff ladder (30s, 60s, 5min,
// 10min, then 10min forever); success resets the ladder and switches to
// health checks.
//
// Thread model:
//   start() spawns one worker; stop() wakes it through a condition variable
//   (no need to wait out a 10 minute rung) and joins. runOnce() may be
//   called directly when the worker is not running (tests, manual checks).
//
// Ownership:
//   Holds a reference to the store, which must outlive the monitor.
// -----------------------------------------------------------------------------
class SchemaMonitor {
 public:
  enum class State { Stopped, Validating, Degraded, Healthy };

  explicit SchemaMonitor(ResilientStore& store,
                         MonitorSettings settings = MonitorSettings{});
  ~SchemaMonitor();

  SchemaMonitor(const SchemaMonitor&) = delete;
  SchemaMonitor& operator=(const SchemaMonitor&) = delete;

  void start();
  void stop();

  // One reconnect/revalidate cycle. Returns how long to wait before the
  // next one.
  std::chrono::milliseconds runOnce();

  State state() const { return state_.load(); }
  std::size_t consecutiveFailures() const { return failures_.load(); }

  static const char* stateName(State s);

 private:
  void run();
  std::chrono::milliseconds backoffFor(std::size_t failures) const;
  std::chrono::milliseconds fail();

  ResilientStore& store_;
  const MonitorSettings settings_;

  std::atomic<State> state_{State::Stopped};
  std::atomic<std::size_t> failures_{0};

  std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_requested_{false};
  std::thread thread_;
};

}  // namespace pdt
