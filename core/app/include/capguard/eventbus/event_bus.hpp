#pragma once

#include "capguard/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace capguard {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: In-process publish-subscribe channel for audit events.
// The AuditEmitter publishes; the control gateway's telemetry bridge, tests
// and any embedding application subscribe.
//
// Failure isolation: a subscriber that throws std::exception is logged and
// skipped; the remaining subscribers still receive the event and publish()
// reports how many failed. An audit consumer can therefore never roll back
// or block the state change the event describes.
//
// Thread model: Thread-safe for concurrent subscribe, unsubscribe and
// publish. Callbacks run synchronously on the publishing thread, outside the
// internal lock.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Registers a callback for every event kind.
  SubscriptionId subscribe(GenericCallback callback);

  // Registers a callback that only sees payloads of type EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // A callback already running in publish() may finish its current event.
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Delivers event to a copy of the subscriber list taken under the lock, so
  // callbacks may subscribe, unsubscribe or publish re-entrantly.
  // Returns the number of subscribers that threw.
  // -------------------------------------------------------------------------
  std::size_t publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace capguard
