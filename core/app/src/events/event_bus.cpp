#include "capguard/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace capguard {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& e) { return e.first == id; }),
      subscribers_.end());
}

std::size_t EventBus::publish(const Event& event) {
  std::vector<SubscriberEntry> copy;
  {
    std::lock_guard lock(mutex_);
    copy = subscribers_;
  }

  std::size_t failures = 0;
  for (const auto& [id, callback] : copy) {
    try {
      callback(event);
    } catch (const std::exception& e) {
      ++failures;
      std::cerr << "[EventBus] subscriber " << id << " failed on "
                << eventId(event) << ": " << e.what() << "\n";
    }
  }
  return failures;
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace capguard
