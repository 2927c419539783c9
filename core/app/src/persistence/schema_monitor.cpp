#include "pdt/persistence/schema_monitor.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace pdt {

SchemaMonitor::SchemaMonitor(ResilientStore& store, MonitorSettings settings)
    : store_(store), settings_(std::move(settings)) {}

SchemaMonitor::~SchemaMonitor() { stop(); }

const char* SchemaMonitor::stateName(State s) {
  switch (s) {
    case State::Stopped:    return "stopped";
    case State::Validating: return "validating";
    case State::Degraded:   return "degraded";
    case State::Healthy:    return "healthy";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// start / stop
// -----------------------------------------------------------------------------
void SchemaMonitor::start() {
  if (thread_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = false;
  }
  thread_ = std::thread([this] { run(); });
  std::cout << "[SchemaMonitor] started.\n";
}

void SchemaMonitor::stop() {
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();

  if (thread_.joinable()) {
    thread_.join();
    std::cout << "[SchemaMonitor] stopped.\n";
  }
  state_.store(State::Stopped);
}

// -----------------------------------------------------------------------------
// runOnce: check liveness, reconnect, then validate
// -----------------------------------------------------------------------------
std::chrono::milliseconds SchemaMonitor::runOnce() {
  state_.store(State::Validating);

  if (store_.isConnected() && !store_.ping()) {
    std::cerr << "[SchemaMonitor] ALERT: store stopped answering\n";
  }
  if (!store_.isConnected()) {
    std::cerr << "[SchemaMonitor] ALERT: store disconnected, reconnecting\n";
    if (!store_.reconnect()) {
      return fail();
    }
  }

  // A store that connected only now has never had its schema checked.
  if (!store_.isValidated() || store_.isDegraded()) {
    try {
      if (!store_.revalidate()) {
        std::cerr << "[SchemaMonitor] WARNING: schema still mismatched: "
                  << store_.lastMismatch().describe() << "\n";
        return fail();
      }
      std::cout << "[SchemaMonitor] schema validated.\n";
    } catch (const DatabaseError& e) {
      std::cerr << "[SchemaMonitor] " << severityFor(e.kind())
                << ": revalidation failed: " << e.what() << "\n";
      return fail();
    }
  }

  failures_.store(0);
  state_.store(State::Healthy);
  return settings_.health_check_interval;
}

std::chrono::milliseconds SchemaMonitor::fail() {
  const std::size_t failures = failures_.fetch_add(1);
  state_.store(State::Degraded);
  const auto delay = backoffFor(failures);
  std::cerr << "[SchemaMonitor] next attempt in " << delay.count() << " ms\n";
  return delay;
}

std::chrono::milliseconds SchemaMonitor::backoffFor(std::size_t failures) const {
  if (settings_.backoff_ladder.empty()) {
    return settings_.health_check_interval;
  }
  const std::size_t rung =
      std::min(failures, settings_.backoff_ladder.size() - 1);
  return settings_.backoff_ladder[rung];
}

// -----------------------------------------------------------------------------
// run: worker loop with a cancellable wait
// -----------------------------------------------------------------------------
void SchemaMonitor::run() {
  const bool healthy = store_.isConnected() && store_.isValidated() &&
                       !store_.isDegraded();
  std::chrono::milliseconds delay = settings_.health_check_interval;
  if (healthy) {
    state_.store(State::Healthy);
  } else {
    // The failed initialize() counts as the first rung.
    delay = backoffFor(0);
    failures_.store(1);
    state_.store(State::Degraded);
  }

  while (true) {
    {
      std::unique_lock lock(mutex_);
      if (cv_.wait_for(lock, delay, [this] { return stop_requested_; })) {
        return;
      }
    }
    delay = runOnce();
  }
}

}  // namespace pdt
