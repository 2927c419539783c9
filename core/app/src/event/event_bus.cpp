#include "pdt/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace pdt {

namespace {

void logToStderr(Topic topic, const std::string& what) {
  std::cerr << "[EventBus] ERROR: handler for '" << topicName(topic)
            << "' threw: " << what << "\n";
}

}  // namespace

EventBus::EventBus() : error_sink_(&logToStderr) {}

EventBus::EventBus(ErrorSink error_sink) : error_sink_(std::move(error_sink)) {
  if (!error_sink_) {
    error_sink_ = &logToStderr;
  }
}

// -----------------------------------------------------------------------------
// subscribe(topic, callback)
// -----------------------------------------------------------------------------
EventBus::SubscriptionId EventBus::subscribe(Topic topic,
                                             GenericCallback callback) {
  SubscriptionId id{topic, next_id_.fetch_add(1)};

  TopicSlot& s = slot(topic);
  std::lock_guard lock(s.mutex);
  s.subscribers.emplace_back(id.value, std::move(callback));
  return id;
}

// -----------------------------------------------------------------------------
// unsubscribe(id)
// -----------------------------------------------------------------------------
void EventBus::unsubscribe(SubscriptionId id) {
  TopicSlot& s = slot(id.topic);
  std::lock_guard lock(s.mutex);
  s.subscribers.erase(
      std::remove_if(s.subscribers.begin(), s.subscribers.end(),
                     [&id](const SubscriberEntry& e) {
                       return e.first == id.value;
                     }),
      s.subscribers.end());
}

// -----------------------------------------------------------------------------
// publish(event)
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  const Topic topic = topicOf(event);
  std::vector<SubscriberEntry> copy;

  {
    // Only the copy is taken under the topic lock. Handlers run unlocked so
    // they may publish or (un)subscribe themselves.
    const TopicSlot& s = slot(topic);
    std::lock_guard lock(s.mutex);
    copy = s.subscribers;
  }

  for (const auto& [id, callback] : copy) {
    try {
      callback(event);
    } catch (const std::exception& e) {
      reportHandlerFailure(topic, e.what());
    } catch (...) {
      reportHandlerFailure(topic, "non-standard exception");
    }
  }
}

std::size_t EventBus::subscriberCount(Topic topic) const {
  const TopicSlot& s = slot(topic);
  std::lock_guard lock(s.mutex);
  return s.subscribers.size();
}

void EventBus::reportHandlerFailure(Topic topic, const std::string& what) {
  error_sink_(topic, what);
}

}  // namespace pdt
