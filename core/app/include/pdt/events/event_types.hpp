#pragma once

#include "pdt/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace pdt {

// -----------------------------------------------------------------------------
// Action
// -----------------------------------------------------------------------------
// What a strategy wants to do with a symbol. Hold signals are produced by
// strategies but never emitted onto the bus by the coordinator.
// -----------------------------------------------------------------------------
enum class Action { Buy, Sell, Hold };

inline const char* actionToString(Action a) {
  switch (a) {
    case Action::Buy:  return "buy";
    case Action::Sell: return "sell";
    case Action::Hold: return "hold";
  }
  return "unknown";
}

inline std::optional<Action> parseAction(const std::string& text) {
  if (text == "buy") return Action::Buy;
  if (text == "sell") return Action::Sell;
  if (text == "hold") return Action::Hold;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// MarketDataEvent
// -----------------------------------------------------------------------------
// Responsibility: One market data observation handed to the coordinator by
// the (external) ingestion collaborator. Strategies analyze these on the
// analysis loop thread.
// -----------------------------------------------------------------------------
struct MarketDataEvent {
  std::string symbol;
  double price{0.0};
  double volume{0.0};
  double high{0.0};
  double low{0.0};
  double open{0.0};
  double close{0.0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// SignalEvent
// -----------------------------------------------------------------------------
// Responsibility: A trading signal produced by a strategy. Immutable once
// emitted on "signal.generated".
//
// confidence is expected in [0, 1]; estimated_profit is fractional
// (0.02 == 2%). metadata is a free-form JSON object; the compliance policy
// reads the boolean `stop_loss` key to recognise loss-cutting exits.
// -----------------------------------------------------------------------------
struct SignalEvent {
  std::string strategy_id;
  std::string symbol;
  Action action{Action::Hold};
  double confidence{0.0};
  double estimated_profit{0.0};
  nlohmann::json metadata = nlohmann::json::object();
  Timestamp timestamp{};
};

}  // namespace pdt
