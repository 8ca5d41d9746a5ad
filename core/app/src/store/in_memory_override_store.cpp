#include "capguard/store/in_memory_override_store.hpp"

#include <algorithm>

namespace capguard {

bool applyStatusTransition(domain::CapitalOverride& record,
                           domain::OverrideStatus expected,
                           domain::OverrideStatus next, std::int64_t at_ms) {
  if (record.status != expected) {
    return false;
  }
  record.status = next;
  if (next == domain::OverrideStatus::Revoked) {
    record.revoked_at_ms = at_ms;
  }
  return true;
}

InMemoryOverrideStore::InMemoryOverrideStore(
    const std::vector<domain::CapitalOverride>& seed) {
  for (const auto& r : seed) {
    insertIfAbsent(r);
  }
}

bool InMemoryOverrideStore::insertIfAbsent(
    const domain::CapitalOverride& record) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(records_.begin(), records_.end(),
                         [&](const auto& r) { return r.id == record.id; });
  if (it != records_.end()) {
    return false;
  }
  records_.push_back(record);
  return true;
}

std::optional<domain::CapitalOverride> InMemoryOverrideStore::find(
    const std::string& id) const {
  std::lock_guard lock(mutex_);
  for (const auto& r : records_) {
    if (r.id == id) {
      return r;
    }
  }
  return std::nullopt;
}

std::vector<domain::CapitalOverride> InMemoryOverrideStore::list() const {
  std::lock_guard lock(mutex_);
  return records_;
}

bool InMemoryOverrideStore::compareAndSetStatus(const std::string& id,
                                                domain::OverrideStatus expected,
                                                domain::OverrideStatus next,
                                                std::int64_t at_ms) {
  std::lock_guard lock(mutex_);
  for (auto& r : records_) {
    if (r.id == id) {
      return applyStatusTransition(r, expected, next, at_ms);
    }
  }
  return false;
}

}  // namespace capguard
