#include "capguard/serialization/audit_record.hpp"

#include "capguard/domain/names.hpp"
#include "capguard/serialization/json_codec.hpp"

namespace capguard {

using nlohmann::json;
using namespace domain;

namespace {

json nullableString(const std::string& s) {
  return s.empty() ? json(nullptr) : json(s);
}

std::string scopeLabel(const CapitalOverride& record) {
  std::string label = scopeName(record.scope);
  if (auto key = scopedAction(record.scope)) {
    label += " ";
    label += toString(*key);
  }
  return label;
}

std::string messageFor(const BreachDetectedEvent& e) { return e.message; }

std::string messageFor(const ControlModeChangedEvent& e) {
  return std::string("Control mode changed: ") + toString(e.previous_mode) +
         " → " + toString(e.new_mode);
}

std::string messageFor(const ActionBlockedEvent& e) {
  return std::string("Action ") + toString(e.action) +
         " blocked by capital control mode " + toString(e.mode);
}

std::string messageFor(const OverrideLifecycleEvent& e) {
  const char* verb = "created";
  if (e.transition == OverrideTransition::Revoked) verb = "revoked";
  if (e.transition == OverrideTransition::Expired) verb = "expired";
  return "Capital override " + e.record.id + " (" + scopeLabel(e.record) +
         ") " + verb;
}

json recordFor(const BreachDetectedEvent& e) {
  json j;
  j["entity_type"] = "capital_breach";
  j["entity_id"] = e.id;
  j["actor_role"] = "system";
  j["actor_user_id"] = nullptr;
  j["details"] = {
      {"breach_type", toString(e.breach_type)},
      {"level", toString(e.level)},
      {"hardstop_utilization", e.hardstop_utilization},
      {"ecr", e.ecr},
      {"top_driver_ids", e.top_driver_ids},
  };
  return j;
}

json recordFor(const ControlModeChangedEvent& e) {
  json j;
  j["entity_type"] = "capital_control";
  j["entity_id"] = toString(e.new_mode);
  j["actor_role"] = "system";
  j["actor_user_id"] = nullptr;
  j["details"] = {
      {"previous_mode", toString(e.previous_mode)},
      {"new_mode", toString(e.new_mode)},
      {"reasons", e.reasons},
      {"snapshot_hash", e.snapshot_hash},
  };
  return j;
}

json recordFor(const ActionBlockedEvent& e) {
  json j;
  j["entity_type"] = "capital_control";
  j["entity_id"] = toString(e.action);
  j["actor_role"] = e.actor_role.empty() ? json("anonymous") : json(e.actor_role);
  j["actor_user_id"] = nullableString(e.actor_user_id);
  j["details"] = {
      {"action", toString(e.action)},
      {"mode", toString(e.mode)},
      {"reasons", e.reasons},
      {"snapshot_hash", e.snapshot_hash},
  };
  return j;
}

json recordFor(const OverrideLifecycleEvent& e) {
  json j;
  j["entity_type"] = "capital_override";
  j["entity_id"] = e.record.id;
  j["actor_role"] = e.actor_role.empty() ? json("system") : json(e.actor_role);
  j["actor_user_id"] = nullableString(e.actor_user_id);
  j["details"] = {
      {"transition", toString(e.transition)},
      {"override", e.record},
  };
  return j;
}

}  // namespace

std::string auditMessage(const Event& event) {
  return std::visit([](const auto& e) { return messageFor(e); }, event);
}

json toAuditRecord(const Event& event) {
  return std::visit(
      [](const auto& e) {
        json j = recordFor(e);
        j["id"] = e.id;
        j["action"] = auditAction(e);
        j["severity"] = toString(auditSeverity(e));
        j["occurred_at"] = timestampToJson(e.occurred_at_ms);
        j["message"] = messageFor(e);
        return j;
      },
      event);
}

}  // namespace capguard
