#pragma once

#include "pdt/events/event.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace pdt {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: In-process publish/subscribe dispatcher between signal
// producers, the compliance tracker, the execution collaborator and
// persistence. Synchronous, in-memory, at-most-once fan-out; no replay.
//
// Topics: one handler list per Topic. subscribe<Payload>() derives the topic
// from the payload type, so a handler is only ever invoked with the payload
// shape of its topic.
//
// Failure isolation: each handler runs inside its own try/catch. An
// exception is reported to the error sink (default: std::cerr) together
// with the topic, and the remaining handlers still run. Nothing propagates
// back to the emitter.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Each topic has its own mutex, held only while the handler list is copied,
// so emissions on different topics never contend and handlers may
// re-enter the bus (publish, subscribe, unsubscribe) without deadlock.
// A handler removed while an emission is in flight may still see that one
// emission.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using ErrorSink = std::function<void(Topic, const std::string&)>;

  // Opaque handle returned by subscribe(); pass to unsubscribe().
  struct SubscriptionId {
    Topic topic{Topic::MarketDataReceived};
    std::size_t value{0};
  };

  EventBus();
  explicit EventBus(ErrorSink error_sink);

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(topic, callback)
  // -------------------------------------------------------------------------
  // Registers `callback` for `topic`. Handlers for one topic run in
  // registration order.
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(Topic topic, GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<Payload>(callback)
  // -------------------------------------------------------------------------
  // Typed form: the topic is TopicOf<Payload>. The wrapper unpacks the
  // variant with std::get_if, which cannot fail for a correctly routed
  // event.
  // -------------------------------------------------------------------------
  template <typename Payload>
  SubscriptionId subscribe(std::function<void(const Payload&)> callback);

  // Removes the registration. Unknown or already-removed ids are a no-op.
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Invokes every handler registered for topicOf(event) on the calling
  // thread, before returning. Zero handlers is a no-op.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  // Typed emit: wraps the payload in the Event envelope.
  template <typename Payload>
  void emit(const Payload& payload) {
    publish(Event{std::in_place_type<Payload>, payload});
  }

  // Number of live registrations for a topic (diagnostics and tests).
  std::size_t subscriberCount(Topic topic) const;

 private:
  using SubscriberEntry = std::pair<std::size_t, GenericCallback>;

  struct TopicSlot {
    mutable std::mutex mutex;
    std::vector<SubscriberEntry> subscribers;
  };

  TopicSlot& slot(Topic topic) {
    return slots_[static_cast<std::size_t>(topic)];
  }
  const TopicSlot& slot(Topic topic) const {
    return slots_[static_cast<std::size_t>(topic)];
  }

  void reportHandlerFailure(Topic topic, const std::string& what);

  std::array<TopicSlot, kTopicCount> slots_;
  std::atomic<std::size_t> next_id_{1};
  ErrorSink error_sink_;
};

// -----------------------------------------------------------------------------
// Template implementation: typed subscribe
// -----------------------------------------------------------------------------
template <typename Payload>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const Payload&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<Payload>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(topic_of_v<Payload>, std::move(wrapped));
}

}  // namespace pdt
