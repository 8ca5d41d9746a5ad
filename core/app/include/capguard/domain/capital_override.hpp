#pragma once

#include "capguard/domain/control_decision.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace capguard {
namespace domain {

// -----------------------------------------------------------------------------
// OverrideScope: tagged variant instead of (scope tag + nullable actionKey)
// -----------------------------------------------------------------------------
//
// GlobalScope relaxes the whole block matrix by one severity level.
// ActionScope suppresses the block of exactly one action key. Because the
// action key lives inside the ActionScope alternative, an ACTION override
// without a key cannot be represented.
// -----------------------------------------------------------------------------
struct GlobalScope {
  bool operator==(const GlobalScope&) const { return true; }
};

struct ActionScope {
  ActionKey action{ActionKey::CreateReservation};
  bool operator==(const ActionScope& other) const {
    return action == other.action;
  }
};

using OverrideScope = std::variant<GlobalScope, ActionScope>;

inline bool isGlobal(const OverrideScope& scope) {
  return std::holds_alternative<GlobalScope>(scope);
}

// Returns the action key of an ACTION scope, nullopt for GLOBAL.
inline std::optional<ActionKey> scopedAction(const OverrideScope& scope) {
  if (const auto* s = std::get_if<ActionScope>(&scope)) {
    return s->action;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// OverrideStatus
// -----------------------------------------------------------------------------
// Active → Expired (expires_at_ms passed) or Active → Revoked (actor).
// Expired and Revoked are terminal.
// -----------------------------------------------------------------------------
enum class OverrideStatus {
  Active,
  Expired,
  Revoked,
};

// -----------------------------------------------------------------------------
// CapitalOverride: time-boxed, role-gated relaxation of the block matrix
// -----------------------------------------------------------------------------
struct CapitalOverride {
  std::string id;
  OverrideScope scope{GlobalScope{}};
  std::string reason;
  std::int64_t created_at_ms{0};
  std::int64_t expires_at_ms{0};
  std::optional<std::int64_t> revoked_at_ms;
  OverrideStatus status{OverrideStatus::Active};

  std::string actor_role;
  std::string actor_user_id;
  std::string actor_name;

  // Risk state the override was granted against.
  std::string snapshot_hash;
  ControlMode mode_at_creation{ControlMode::Normal};
};

}  // namespace domain
}  // namespace capguard
