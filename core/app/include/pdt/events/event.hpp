#pragma once

#include "pdt/events/event_types.hpp"
#include "pdt/events/position_events.hpp"
#include "pdt/events/trade_events.hpp"

#include <cstddef>
#include <type_traits>
#include <variant>

namespace pdt {

// -----------------------------------------------------------------------------
// Topic
// -----------------------------------------------------------------------------
// The closed set of dispatcher topics. Each topic has exactly one payload
// type (see TopicOf below); the pairing is checked at compile time, so a
// handler for "day_trade.approved" can never be handed a SignalEvent.
// -----------------------------------------------------------------------------
enum class Topic : std::size_t {
  MarketDataReceived = 0,
  SignalGenerated,
  DayTradeRequested,
  DayTradeApproved,
  PositionOpened,
  PositionClosed,
};

constexpr std::size_t kTopicCount = 6;

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Envelope used where events of any topic travel together (the analysis loop
// queue, generic publish). Alternative order MUST match Topic order: the
// variant index is the topic.
// -----------------------------------------------------------------------------
using Event = std::variant<
    MarketDataEvent,
    SignalEvent,
    TradeRequestEvent,
    TradeApprovalEvent,
    PositionOpenedEvent,
    PositionClosedEvent>;

static_assert(std::variant_size_v<Event> == kTopicCount,
              "every topic needs exactly one payload alternative");

// -----------------------------------------------------------------------------
// TopicOf<Payload>
// -----------------------------------------------------------------------------
// Compile-time payload → topic mapping. Only the six payload types above
// have a specialisation; anything else fails to compile at the call site.
// -----------------------------------------------------------------------------
template <typename Payload>
struct TopicOf;

template <>
struct TopicOf<MarketDataEvent> {
  static constexpr Topic value = Topic::MarketDataReceived;
};
template <>
struct TopicOf<SignalEvent> {
  static constexpr Topic value = Topic::SignalGenerated;
};
template <>
struct TopicOf<TradeRequestEvent> {
  static constexpr Topic value = Topic::DayTradeRequested;
};
template <>
struct TopicOf<TradeApprovalEvent> {
  static constexpr Topic value = Topic::DayTradeApproved;
};
template <>
struct TopicOf<PositionOpenedEvent> {
  static constexpr Topic value = Topic::PositionOpened;
};
template <>
struct TopicOf<PositionClosedEvent> {
  static constexpr Topic value = Topic::PositionClosed;
};

template <typename Payload>
constexpr Topic topic_of_v = TopicOf<std::decay_t<Payload>>::value;

template <typename Payload>
constexpr bool kTopicMatchesVariant = std::is_same_v<
    std::variant_alternative_t<static_cast<std::size_t>(topic_of_v<Payload>),
                               Event>,
    Payload>;

static_assert(kTopicMatchesVariant<MarketDataEvent> &&
                  kTopicMatchesVariant<SignalEvent> &&
                  kTopicMatchesVariant<TradeRequestEvent> &&
                  kTopicMatchesVariant<TradeApprovalEvent> &&
                  kTopicMatchesVariant<PositionOpenedEvent> &&
                  kTopicMatchesVariant<PositionClosedEvent>,
              "Event alternatives are out of Topic order");

inline Topic topicOf(const Event& event) {
  return static_cast<Topic>(event.index());
}

// Wire names, as seen by external consumers and in logs.
inline const char* topicName(Topic topic) {
  switch (topic) {
    case Topic::MarketDataReceived: return "market_data.received";
    case Topic::SignalGenerated:    return "signal.generated";
    case Topic::DayTradeRequested:  return "day_trade.requested";
    case Topic::DayTradeApproved:   return "day_trade.approved";
    case Topic::PositionOpened:     return "position.opened";
    case Topic::PositionClosed:     return "position.closed";
  }
  return "unknown";
}

}  // namespace pdt
