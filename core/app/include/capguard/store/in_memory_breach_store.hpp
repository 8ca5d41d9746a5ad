#pragma once

#include "capguard/store/i_breach_store.hpp"

#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace capguard {

// -----------------------------------------------------------------------------
// InMemoryBreachStore: process-local IBreachStore
// -----------------------------------------------------------------------------
// Used by tests and as the cold-start store when no file path is configured.
// A single mutex guards both the event vector and the id index.
// -----------------------------------------------------------------------------
class InMemoryBreachStore final : public IBreachStore {
 public:
  InMemoryBreachStore() = default;

  // Seeds the store (e.g. from a file). Duplicate ids are dropped.
  explicit InMemoryBreachStore(const std::vector<domain::BreachEvent>& seed);

  InMemoryBreachStore(const InMemoryBreachStore&) = delete;
  InMemoryBreachStore& operator=(const InMemoryBreachStore&) = delete;

  bool append(const domain::BreachEvent& event) override;
  std::vector<domain::BreachEvent> list() const override;
  std::vector<domain::BreachEvent> since(std::int64_t cutoff_ms) const override;

 private:
  mutable std::mutex mutex_;
  std::vector<domain::BreachEvent> events_;
  std::unordered_set<std::string> ids_;
};

}  // namespace capguard
