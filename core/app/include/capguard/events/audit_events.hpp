#pragma once

#include "capguard/domain/breach_event.hpp"
#include "capguard/domain/capital_override.hpp"
#include "capguard/domain/control_decision.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace capguard {

// -----------------------------------------------------------------------------
// Audit event payloads
// -----------------------------------------------------------------------------
//
// @brief  Plain structs published on the EventBus and forwarded to the
//         external governance log.
//
// @details
// Every payload carries a deterministic id. The AuditEmitter publishes a
// given id at most once, so replaying an evaluation never duplicates an
// audit record.
//
// Actor fields are empty for system-originated events.
// -----------------------------------------------------------------------------

enum class AuditSeverity {
  Info,
  Warning,
  Critical,
};

// CAPITAL_BREACH_DETECTED: one per newly persisted BreachEvent.
struct BreachDetectedEvent {
  std::string id;  // == BreachEvent::id
  std::int64_t occurred_at_ms{0};
  domain::BreachEventType breach_type{domain::BreachEventType::EcrCaution};
  domain::AlertLevel level{domain::AlertLevel::Info};
  std::string message;
  double hardstop_utilization{0.0};
  double ecr{0.0};
  std::vector<std::string> top_driver_ids;
};

// CAPITAL_CONTROL_MODE_CHANGED: emitted by the controls sweep.
struct ControlModeChangedEvent {
  std::string id;  // "CC-MODE-" + fingerprint(previous, next, snapshot hash)
  std::int64_t occurred_at_ms{0};
  domain::ControlMode previous_mode{domain::ControlMode::Normal};
  domain::ControlMode new_mode{domain::ControlMode::Normal};
  std::vector<std::string> reasons;
  std::string snapshot_hash;
};

// CAPITAL_CONTROL_BLOCKED: an action gate denied a request.
struct ActionBlockedEvent {
  std::string id;  // "CC-BLOCK-" + fingerprint(action, mode, minute, actor)
  std::int64_t occurred_at_ms{0};
  domain::ActionKey action{domain::ActionKey::CreateReservation};
  domain::ControlMode mode{domain::ControlMode::Normal};
  std::vector<std::string> reasons;
  std::string snapshot_hash;
  std::string actor_role;
  std::string actor_user_id;
};

enum class OverrideTransition {
  Created,
  Revoked,
  Expired,
};

// CAPITAL_OVERRIDE_CREATED / _REVOKED / _EXPIRED.
struct OverrideLifecycleEvent {
  std::string id;  // "CC-OVR-C-" / "CC-OVR-R-" / "CC-OVR-E-" + fingerprint
  std::int64_t occurred_at_ms{0};
  OverrideTransition transition{OverrideTransition::Created};
  domain::CapitalOverride record;
  std::string actor_role;
  std::string actor_user_id;
};

const char* auditAction(const BreachDetectedEvent&);
const char* auditAction(const ControlModeChangedEvent&);
const char* auditAction(const ActionBlockedEvent&);
const char* auditAction(const OverrideLifecycleEvent& e);

AuditSeverity auditSeverity(const BreachDetectedEvent& e);
AuditSeverity auditSeverity(const ControlModeChangedEvent& e);
AuditSeverity auditSeverity(const ActionBlockedEvent& e);
AuditSeverity auditSeverity(const OverrideLifecycleEvent& e);

const char* toString(AuditSeverity s);
const char* toString(OverrideTransition t);

}  // namespace capguard
