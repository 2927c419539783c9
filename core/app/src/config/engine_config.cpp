#include "pdt/config/engine_config.hpp"

#include <cstdlib>
#include <fstream>

namespace pdt {

namespace {

int parseInt(const std::string& name, const std::string& text) {
  std::size_t used = 0;
  int value = 0;
  try {
    value = std::stoi(text, &used);
  } catch (const std::exception&) {
    throw ConfigError(name + " is not an integer: '" + text + "'");
  }
  if (used != text.size()) {
    throw ConfigError(name + " is not an integer: '" + text + "'");
  }
  return value;
}

std::optional<std::string> processEnv(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

}  // namespace

// -----------------------------------------------------------------------------
// engineConfigFromJson
// -----------------------------------------------------------------------------
EngineConfig engineConfigFromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ConfigError("configuration root must be a JSON object");
  }

  EngineConfig c;
  try {
    if (auto it = j.find("compliance"); it != j.end()) {
      c.compliance.weekly_limit =
          it->value("weekly_limit", c.compliance.weekly_limit);
      c.compliance.emergency_reserve =
          it->value("emergency_reserve", c.compliance.emergency_reserve);
    }
    if (auto it = j.find("allocator"); it != j.end()) {
      c.allocator.min_success_factor =
          it->value("min_success_factor", c.allocator.min_success_factor);
      c.allocator.max_success_factor =
          it->value("max_success_factor", c.allocator.max_success_factor);
    }
    if (auto it = j.find("store"); it != j.end()) {
      c.store.database_url = it->value("database_url", c.store.database_url);
      c.store.connect_attempts =
          it->value("connect_attempts", c.store.connect_attempts);
      c.store.connect_backoff = std::chrono::milliseconds(it->value(
          "connect_backoff_ms",
          static_cast<std::int64_t>(c.store.connect_backoff.count())));
      c.store.busy_timeout = std::chrono::milliseconds(it->value(
          "busy_timeout_ms",
          static_cast<std::int64_t>(c.store.busy_timeout.count())));
    }
    if (auto it = j.find("monitor"); it != j.end()) {
      if (auto ladder = it->find("backoff_ladder_s"); ladder != it->end()) {
        c.monitor.backoff_ladder.clear();
        for (const auto& s : *ladder) {
          c.monitor.backoff_ladder.push_back(
              std::chrono::seconds(s.get<std::int64_t>()));
        }
      }
      if (auto hc = it->find("health_check_interval_s"); hc != it->end()) {
        c.monitor.health_check_interval =
            std::chrono::seconds(hc->get<std::int64_t>());
      }
    }
    if (auto it = j.find("risk"); it != j.end()) {
      c.risk.max_position_size =
          it->value("max_position_size", c.risk.max_position_size);
      c.risk.max_daily_loss = it->value("max_daily_loss", c.risk.max_daily_loss);
      c.risk.max_open_positions =
          it->value("max_open_positions", c.risk.max_open_positions);
    }
    if (auto it = j.find("execution"); it != j.end()) {
      c.execution.day_trade_profit_threshold = it->value(
          "day_trade_profit_threshold", c.execution.day_trade_profit_threshold);
      c.execution.requested_position_fraction =
          it->value("requested_position_fraction",
                    c.execution.requested_position_fraction);
    }
    c.notify_endpoint = j.value("notify_endpoint", c.notify_endpoint);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid configuration: ") + e.what());
  }

  validateEngineConfig(c);
  return c;
}

// -----------------------------------------------------------------------------
// loadEngineConfig
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open configuration file '" + path + "'");
  }

  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("cannot parse '" + path + "': " + e.what());
  }
  return engineConfigFromJson(j);
}

// -----------------------------------------------------------------------------
// applyEnvironmentOverrides
// -----------------------------------------------------------------------------
void applyEnvironmentOverrides(EngineConfig& config) {
  applyEnvironmentOverrides(config, &processEnv);
}

void applyEnvironmentOverrides(EngineConfig& config, const EnvLookup& lookup) {
  if (auto v = lookup("CORE_DATABASE_URL"); v && !v->empty()) {
    config.store.database_url = *v;
  }
  if (auto v = lookup("PDT_NOTIFY_ENDPOINT")) {
    config.notify_endpoint = *v;
  }
  if (auto v = lookup("PDT_WEEKLY_LIMIT")) {
    config.compliance.weekly_limit = parseInt("PDT_WEEKLY_LIMIT", *v);
  }
  if (auto v = lookup("PDT_EMERGENCY_RESERVE")) {
    config.compliance.emergency_reserve =
        parseInt("PDT_EMERGENCY_RESERVE", *v);
  }
  validateEngineConfig(config);
}

// -----------------------------------------------------------------------------
// validateEngineConfig
// -----------------------------------------------------------------------------
void validateEngineConfig(const EngineConfig& c) {
  if (c.compliance.weekly_limit < 0) {
    throw ConfigError("compliance.weekly_limit must be >= 0");
  }
  if (c.compliance.emergency_reserve < 0 ||
      c.compliance.emergency_reserve > c.compliance.weekly_limit) {
    throw ConfigError(
        "compliance.emergency_reserve must be between 0 and weekly_limit");
  }
  if (c.allocator.min_success_factor <= 0.0 ||
      c.allocator.max_success_factor < c.allocator.min_success_factor) {
    throw ConfigError(
        "allocator success factor bounds must satisfy 0 < min <= max");
  }
  if (c.store.database_url.empty()) {
    throw ConfigError("store.database_url must not be empty");
  }
  if (c.store.connect_attempts < 1) {
    throw ConfigError("store.connect_attempts must be >= 1");
  }
  for (const auto& rung : c.monitor.backoff_ladder) {
    if (rung.count() <= 0) {
      throw ConfigError("monitor.backoff_ladder_s entries must be positive");
    }
  }
  if (c.monitor.health_check_interval.count() <= 0) {
    throw ConfigError("monitor.health_check_interval_s must be positive");
  }
}

}  // namespace pdt
