#include "capguard/audit/audit_emitter.hpp"

#include <algorithm>
#include <iostream>

namespace capguard {

AuditEmitter::AuditEmitter(EventBus& bus, std::int64_t retention_ms)
    : bus_(bus), retention_ms_(retention_ms) {}

bool AuditEmitter::emit(const Event& event) {
  const std::string& id = eventId(event);
  const std::int64_t occurred = eventOccurredAt(event);
  {
    std::lock_guard lock(mutex_);
    if (!emitted_.insert(id).second) {
      return false;
    }
    order_.emplace_back(occurred, id);
    newest_ms_ = any_ ? std::max(newest_ms_, occurred) : occurred;
    any_ = true;
    pruneExpired();
  }

  const std::size_t failures = bus_.publish(event);
  if (failures > 0) {
    std::cerr << "[AuditEmitter] " << failures
              << " subscriber(s) failed to record " << id << "\n";
  }
  return true;
}

// Entries arrive in near time order, so trimming from the front is enough to
// keep the window bounded.
void AuditEmitter::pruneExpired() {
  const std::int64_t cutoff = newest_ms_ - retention_ms_;
  while (!order_.empty() && order_.front().first < cutoff) {
    emitted_.erase(order_.front().second);
    order_.pop_front();
  }
}

bool AuditEmitter::hasEmitted(const std::string& id) const {
  std::lock_guard lock(mutex_);
  return emitted_.count(id) != 0;
}

std::vector<std::string> AuditEmitter::emittedIds() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(order_.size());
  for (const auto& [occurred, id] : order_) {
    ids.push_back(id);
  }
  return ids;
}

std::vector<std::string> AuditEmitter::emittedIdsSince(
    std::int64_t since_ms) const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> ids;
  for (const auto& [occurred, id] : order_) {
    if (occurred >= since_ms) {
      ids.push_back(id);
    }
  }
  return ids;
}

}  // namespace capguard
