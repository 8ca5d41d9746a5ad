#pragma once

#include "capguard/events/event.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace capguard {

// -----------------------------------------------------------------------------
// Audit record format
// -----------------------------------------------------------------------------
//
// One flat JSON object per audit event, the shape forwarded to the external
// governance log and broadcast on the telemetry socket:
//
//   {
//     "id":          "CC-MODE-1a2b3c4d",
//     "action":      "CAPITAL_CONTROL_MODE_CHANGED",
//     "severity":    "warning",
//     "occurred_at": "2026-03-02T14:05:00.000Z",
//     "entity_type": "capital_control",
//     "entity_id":   "FREEZE_CONVERSIONS",
//     "actor_role":  "system",
//     "actor_user_id": null,
//     "message":     "Control mode changed: NORMAL → FREEZE_CONVERSIONS",
//     "details":     { ... payload-specific fields ... }
//   }
// -----------------------------------------------------------------------------

// Human-readable one-line summary of the event.
std::string auditMessage(const Event& event);

nlohmann::json toAuditRecord(const Event& event);

}  // namespace capguard
