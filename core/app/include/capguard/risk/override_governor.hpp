#pragma once

#include "capguard/audit/audit_emitter.hpp"
#include "capguard/domain/capital_override.hpp"
#include "capguard/domain/control_decision.hpp"
#include "capguard/store/i_override_store.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace capguard {

// Roles permitted to create and revoke overrides.
inline constexpr std::array<const char*, 3> kOverrideRoles{"admin", "treasury",
                                                           "compliance"};

// Minimum override reason length, in characters after trimming.
inline constexpr std::size_t kMinOverrideReasonLength = 20;

bool isOverrideRole(std::string_view role);

// -----------------------------------------------------------------------------
// OverrideRequest: raw creation request as received from a console
// -----------------------------------------------------------------------------
// scope and action_key arrive untyped. validateOverrideRequest() turns them
// into an OverrideScope, so only a well-formed scope ever reaches a record.
// -----------------------------------------------------------------------------
struct OverrideRequest {
  std::string scope;  // "GLOBAL" or "ACTION"
  std::optional<domain::ActionKey> action_key;
  std::string reason;
  std::int64_t expires_at_ms{0};
  std::string actor_role;
  std::string actor_user_id;
  std::string actor_name;
};

struct OverrideValidation {
  std::vector<std::string> errors;
  std::optional<domain::OverrideScope> scope;  // set when scope is well-formed

  bool valid() const { return errors.empty(); }
};

// Collects every violated rule; never stops at the first one.
OverrideValidation validateOverrideRequest(const OverrideRequest& request,
                                           domain::ControlMode current_mode,
                                           std::int64_t now_ms);

struct CreateOverrideResult {
  std::vector<std::string> errors;
  std::optional<domain::CapitalOverride> record;
  bool is_new{false};

  bool ok() const { return errors.empty() && record.has_value(); }

  // "[OVERRIDE_VALIDATION] first; second"
  std::string errorMessage() const;
};

struct RevokeOverrideResult {
  std::vector<std::string> errors;
  std::optional<domain::CapitalOverride> record;

  bool ok() const { return errors.empty() && record.has_value(); }
};

// "OVR-<actor>-<YYYY-MM-DDTHH:MM>[-<ACTION_KEY>]"
std::string overrideId(const std::string& actor_user_id,
                       std::int64_t created_at_ms,
                       const domain::OverrideScope& scope);

// ACTIVE records whose expiry has passed read as EXPIRED.
domain::OverrideStatus effectiveStatus(const domain::CapitalOverride& record,
                                       std::int64_t now_ms);

// True while the record is effectively ACTIVE and the current mode is no
// more severe than the mode the override was granted under.
bool overrideApplies(const domain::CapitalOverride& record,
                     domain::ControlMode current_mode, std::int64_t now_ms);

// -----------------------------------------------------------------------------
// applyOverrides()
// -----------------------------------------------------------------------------
// Effective block matrix after every applicable override:
//   ACTION scope → clears that one key
//   GLOBAL scope → intersects with the matrix of the mode one severity level
//                  below the current mode
// A cleared block is never re-set; overrides only relax.
// -----------------------------------------------------------------------------
domain::BlockMatrix applyOverrides(
    const domain::ControlDecision& decision,
    const std::vector<domain::CapitalOverride>& overrides, std::int64_t now_ms);

// Id of the first applicable override that unblocks action, if any.
std::optional<std::string> coveringOverride(
    domain::ActionKey action, const domain::ControlDecision& decision,
    const std::vector<domain::CapitalOverride>& overrides, std::int64_t now_ms);

// -----------------------------------------------------------------------------
// OverrideGovernor
// -----------------------------------------------------------------------------
//
// @brief  Role-gated creation, revocation and expiry of CapitalOverrides.
//
// @details
// create()  validates, then insertIfAbsent() under a deterministic id. A
//           repeat request from the same actor in the same minute returns
//           the stored record with is_new == false and emits nothing.
// revoke()  role check, effective-status check, then CAS ACTIVE → REVOKED.
//           Losing a race (double revoke, revoke vs. expiry) reports the
//           status that won.
// sweepExpired()  persists lazy expiry: CAS ACTIVE → EXPIRED for every
//           record past expires_at, auditing each transition it wins.
//
// Storage errors in create()/revoke() become result errors. list() and
// sweepExpired() let StoreUnavailableError propagate to the caller.
//
// Ownership:
//   Non-owning references to store and emitter; both must outlive this.
// -----------------------------------------------------------------------------
class OverrideGovernor {
 public:
  OverrideGovernor(IOverrideStore& store, AuditEmitter& audit);

  CreateOverrideResult create(const OverrideRequest& request,
                              const domain::ControlDecision& current,
                              std::int64_t now_ms);

  RevokeOverrideResult revoke(const std::string& override_id,
                              const std::string& actor_role,
                              const std::string& actor_user_id,
                              std::int64_t now_ms);

  // Newly expired records (status already EXPIRED).
  std::vector<domain::CapitalOverride> sweepExpired(std::int64_t now_ms);

  // All records with effective status applied.
  std::vector<domain::CapitalOverride> list(std::int64_t now_ms) const;

 private:
  IOverrideStore& store_;
  AuditEmitter& audit_;
};

}  // namespace capguard
