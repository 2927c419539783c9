#pragma once

#include "pdt/allocation/priority_allocator.hpp"
#include "pdt/domain/compliance_limits.hpp"
#include "pdt/execution/execution_router.hpp"
#include "pdt/persistence/resilient_store.hpp"
#include "pdt/persistence/schema_monitor.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace pdt {

// Unreadable file, malformed JSON, wrong value types or out-of-range values.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// EngineConfig: everything SchedulerEngine needs to run
// -----------------------------------------------------------------------------
//
// @details
// Plain value struct; every field has a working default, so an empty JSON
// object (or no file at all) yields the stock configuration:
//   3 day trades per week, 1 reserved for emergencies, SQLite file
//   "pdt_engine.db", notifications on tcp://127.0.0.1:5557.
//
// JSON layout (all keys optional):
//
//   {
//     "compliance": {"weekly_limit": 3, "emergency_reserve": 1},
//     "allocator":  {"min_success_factor": 0.1, "max_success_factor": 1.5},
//     "store":      {"database_url": "pdt_engine.db", "connect_attempts": 3,
//                    "connect_backoff_ms": 1000, "busy_timeout_ms": 5000},
//     "monitor":    {"backoff_ladder_s": [30, 60, 300, 600],
//                    "health_check_interval_s": 60},
//     "risk":       {"max_position_size": 0.02, "max_daily_loss": 0.05,
//                    "max_open_positions": 10},
//     "execution":  {"day_trade_profit_threshold": 0.03,
//                    "requested_position_fraction": 0.05},
//     "notify_endpoint": "tcp://127.0.0.1:5557"
//   }
//
// An empty notify_endpoint disables the ZeroMQ publisher.
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::ComplianceLimits compliance;
  AllocatorSettings allocator;
  StoreSettings store;
  MonitorSettings monitor;
  domain::RiskRules risk;
  ExecutionPolicy execution;
  std::string notify_endpoint{"tcp://127.0.0.1:5557"};
};

// Returns the value of an environment variable, or std::nullopt.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Builds a config from parsed JSON. Throws ConfigError.
EngineConfig engineConfigFromJson(const nlohmann::json& j);

// Reads and parses `path`. Throws ConfigError.
EngineConfig loadEngineConfig(const std::string& path);

// -----------------------------------------------------------------------------
// applyEnvironmentOverrides(config, lookup)
// -----------------------------------------------------------------------------
//   CORE_DATABASE_URL      -> store.database_url
//   PDT_NOTIFY_ENDPOINT    -> notify_endpoint
//   PDT_WEEKLY_LIMIT       -> compliance.weekly_limit
//   PDT_EMERGENCY_RESERVE  -> compliance.emergency_reserve
// Non-integer limit values throw ConfigError. The default lookup reads the
// process environment.
// -----------------------------------------------------------------------------
void applyEnvironmentOverrides(EngineConfig& config);
void applyEnvironmentOverrides(EngineConfig& config, const EnvLookup& lookup);

// Rejects negative limits, a reserve above the limit, an empty database
// url, inverted success-factor bounds and non-positive monitor intervals.
void validateEngineConfig(const EngineConfig& config);

}  // namespace pdt
