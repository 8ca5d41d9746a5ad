#pragma once

#include "capguard/store/i_override_store.hpp"

#include <mutex>
#include <vector>

namespace capguard {

// -----------------------------------------------------------------------------
// InMemoryOverrideStore: process-local IOverrideStore
// -----------------------------------------------------------------------------
// Records are kept in creation order. The CAS runs under the same mutex as
// every read, which is what makes a single-record update atomic.
// -----------------------------------------------------------------------------
class InMemoryOverrideStore final : public IOverrideStore {
 public:
  InMemoryOverrideStore() = default;
  explicit InMemoryOverrideStore(
      const std::vector<domain::CapitalOverride>& seed);

  InMemoryOverrideStore(const InMemoryOverrideStore&) = delete;
  InMemoryOverrideStore& operator=(const InMemoryOverrideStore&) = delete;

  bool insertIfAbsent(const domain::CapitalOverride& record) override;
  std::optional<domain::CapitalOverride> find(
      const std::string& id) const override;
  std::vector<domain::CapitalOverride> list() const override;
  bool compareAndSetStatus(const std::string& id,
                           domain::OverrideStatus expected,
                           domain::OverrideStatus next,
                           std::int64_t at_ms) override;

 private:
  mutable std::mutex mutex_;
  std::vector<domain::CapitalOverride> records_;
};

// Applies a status transition to one record in place (shared with the
// JSON-file store). Returns false when the current status != expected.
bool applyStatusTransition(domain::CapitalOverride& record,
                           domain::OverrideStatus expected,
                           domain::OverrideStatus next, std::int64_t at_ms);

}  // namespace capguard
