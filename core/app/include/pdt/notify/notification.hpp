#pragma once

#include "pdt/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace pdt {

// -----------------------------------------------------------------------------
// Notification: outward state-change message
// -----------------------------------------------------------------------------
// Wire shape: {"type": "...", "data": {...}, "timestamp": "<ISO-8601>"}.
// Types emitted by ResilientStore: "position.opened", "position.closed",
// "signal.generated".
// -----------------------------------------------------------------------------
struct Notification {
  std::string type;
  nlohmann::json data = nlohmann::json::object();
  Timestamp timestamp{};

  nlohmann::json toJson() const {
    return {{"type", type}, {"data", data}, {"timestamp", to_iso8601(timestamp)}};
  }

  // Compact wire text. Invalid UTF-8 in any string is replaced with U+FFFD
  // instead of throwing.
  std::string serialize() const {
    return toJson().dump(-1, ' ', false,
                         nlohmann::json::error_handler_t::replace);
  }
};

// -----------------------------------------------------------------------------
// INotificationSink
// -----------------------------------------------------------------------------
// Where ResilientStore sends a notification after every successful write.
// Implementations must be callable from any thread and must not block the
// write path for long (queue and return).
// -----------------------------------------------------------------------------
class INotificationSink {
 public:
  virtual ~INotificationSink() = default;
  virtual void notify(Notification notification) = 0;
};

// Used when no notification endpoint is configured.
class DiscardingNotificationSink final : public INotificationSink {
 public:
  void notify(Notification) override {}
};

}  // namespace pdt
