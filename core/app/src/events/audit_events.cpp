#include "capguard/events/audit_events.hpp"

namespace capguard {

const char* auditAction(const BreachDetectedEvent&) {
  return "CAPITAL_BREACH_DETECTED";
}

const char* auditAction(const ControlModeChangedEvent&) {
  return "CAPITAL_CONTROL_MODE_CHANGED";
}

const char* auditAction(const ActionBlockedEvent&) {
  return "CAPITAL_CONTROL_BLOCKED";
}

const char* auditAction(const OverrideLifecycleEvent& e) {
  switch (e.transition) {
    case OverrideTransition::Created: return "CAPITAL_OVERRIDE_CREATED";
    case OverrideTransition::Revoked: return "CAPITAL_OVERRIDE_REVOKED";
    case OverrideTransition::Expired: return "CAPITAL_OVERRIDE_EXPIRED";
  }
  return "CAPITAL_OVERRIDE";
}

AuditSeverity auditSeverity(const BreachDetectedEvent& e) {
  switch (e.level) {
    case domain::AlertLevel::Critical: return AuditSeverity::Critical;
    case domain::AlertLevel::Warn:     return AuditSeverity::Warning;
    case domain::AlertLevel::Info:     return AuditSeverity::Info;
  }
  return AuditSeverity::Info;
}

AuditSeverity auditSeverity(const ControlModeChangedEvent& e) {
  if (e.new_mode == domain::ControlMode::EmergencyHalt) {
    return AuditSeverity::Critical;
  }
  if (e.new_mode == domain::ControlMode::Normal) {
    return AuditSeverity::Info;
  }
  return AuditSeverity::Warning;
}

AuditSeverity auditSeverity(const ActionBlockedEvent& e) {
  return e.mode == domain::ControlMode::EmergencyHalt ? AuditSeverity::Critical
                                                      : AuditSeverity::Warning;
}

AuditSeverity auditSeverity(const OverrideLifecycleEvent& e) {
  // Granting a relaxation is the noteworthy transition.
  return e.transition == OverrideTransition::Created ? AuditSeverity::Warning
                                                     : AuditSeverity::Info;
}

const char* toString(AuditSeverity s) {
  switch (s) {
    case AuditSeverity::Info:     return "info";
    case AuditSeverity::Warning:  return "warning";
    case AuditSeverity::Critical: return "critical";
  }
  return "info";
}

const char* toString(OverrideTransition t) {
  switch (t) {
    case OverrideTransition::Created: return "CREATED";
    case OverrideTransition::Revoked: return "REVOKED";
    case OverrideTransition::Expired: return "EXPIRED";
  }
  return "UNKNOWN";
}

}  // namespace capguard
