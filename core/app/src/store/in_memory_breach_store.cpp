#include "capguard/store/in_memory_breach_store.hpp"

namespace capguard {

InMemoryBreachStore::InMemoryBreachStore(
    const std::vector<domain::BreachEvent>& seed) {
  for (const auto& e : seed) {
    if (ids_.insert(e.id).second) {
      events_.push_back(e);
    }
  }
}

bool InMemoryBreachStore::append(const domain::BreachEvent& event) {
  std::lock_guard lock(mutex_);
  if (!ids_.insert(event.id).second) {
    return false;
  }
  events_.push_back(event);
  return true;
}

std::vector<domain::BreachEvent> InMemoryBreachStore::list() const {
  std::lock_guard lock(mutex_);
  return events_;
}

std::vector<domain::BreachEvent> InMemoryBreachStore::since(
    std::int64_t cutoff_ms) const {
  std::lock_guard lock(mutex_);
  std::vector<domain::BreachEvent> out;
  for (const auto& e : events_) {
    if (e.occurred_at_ms >= cutoff_ms) {
      out.push_back(e);
    }
  }
  return out;
}

}  // namespace capguard
