#pragma once

#include "capguard/domain/capital_override.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace capguard {

// -----------------------------------------------------------------------------
// IOverrideStore: keyed override records with atomic status transitions
// -----------------------------------------------------------------------------
//
// @brief  Storage seam used by the override governor.
//
// @details
// Override creation and revocation are not naturally idempotent, so the
// store offers exactly two mutations, both atomic on a single record:
//
//   insertIfAbsent()       create-once by id
//   compareAndSetStatus()  status CAS; on REVOKED it also stamps
//                          revoked_at_ms with at_ms
//
// A double revoke or a revoke racing an expiry sweep therefore resolves to
// exactly one winner; the loser observes false.
//
// Error contract:
//   Every method may throw StoreUnavailableError.
//
// Thread-safety:
//   Implementations must be safe for concurrent use from any thread.
// -----------------------------------------------------------------------------
class IOverrideStore {
 public:
  virtual ~IOverrideStore() = default;

  // Stores the record unless its id exists. Returns true when stored.
  virtual bool insertIfAbsent(const domain::CapitalOverride& record) = 0;

  virtual std::optional<domain::CapitalOverride> find(
      const std::string& id) const = 0;

  // All records, in creation order.
  virtual std::vector<domain::CapitalOverride> list() const = 0;

  // Sets status to next only if the stored status equals expected.
  // Returns false if the id is unknown or the status did not match.
  virtual bool compareAndSetStatus(const std::string& id,
                                   domain::OverrideStatus expected,
                                   domain::OverrideStatus next,
                                   std::int64_t at_ms) = 0;
};

}  // namespace capguard
