#pragma once

#include "capguard/domain/breach_event.hpp"

#include <cstdint>
#include <vector>

namespace capguard {

// -----------------------------------------------------------------------------
// IBreachStore: append-only breach-event log keyed by content-addressed id
// -----------------------------------------------------------------------------
//
// @brief  Storage seam injected into the breach classifier and the
//         control-mode evaluation path.
//
// @details
// append() is the only mutation. It is atomic per event: either the event is
// stored and true is returned, or the id already exists and the call is a
// no-op returning false. Because ids are derived from the conditions they
// describe, concurrent sweeps that observe the same state converge on the
// same record without any locking outside the store.
//
// Error contract:
//   Every method may throw StoreUnavailableError. Nothing else escapes.
//
// Thread-safety:
//   Implementations must be safe for concurrent use from any thread.
// -----------------------------------------------------------------------------
class IBreachStore {
 public:
  virtual ~IBreachStore() = default;

  // Returns false (and stores nothing) if event.id is already present.
  virtual bool append(const domain::BreachEvent& event) = 0;

  // All events, in append order.
  virtual std::vector<domain::BreachEvent> list() const = 0;

  // Events with occurred_at_ms >= cutoff_ms, in append order.
  virtual std::vector<domain::BreachEvent> since(std::int64_t cutoff_ms) const = 0;
};

}  // namespace capguard
