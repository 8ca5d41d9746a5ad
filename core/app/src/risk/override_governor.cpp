#include "capguard/risk/override_governor.hpp"

#include "capguard/domain/names.hpp"
#include "capguard/risk/control_mode_evaluator.hpp"
#include "capguard/risk/fingerprint.hpp"
#include "capguard/store/store_error.hpp"
#include "capguard/time/time_utils.hpp"

#include <algorithm>
#include <iostream>

namespace capguard {

using namespace domain;

namespace {

std::string joinRoles() {
  std::string out;
  for (const char* r : kOverrideRoles) {
    if (!out.empty()) out += ", ";
    out += r;
  }
  return out;
}

std::string trim(const std::string& s) {
  const char* ws = " \t\r\n\f\v";
  auto first = s.find_first_not_of(ws);
  if (first == std::string::npos) {
    return {};
  }
  auto last = s.find_last_not_of(ws);
  return s.substr(first, last - first + 1);
}

// Code points, not bytes: reasons are free text and may contain non-ASCII.
std::size_t characterCount(const std::string& s) {
  std::size_t n = 0;
  for (unsigned char c : s) {
    if ((c & 0xC0) != 0x80) ++n;
  }
  return n;
}

ControlMode oneLevelBelow(ControlMode mode) {
  const int level = severity(mode);
  return level == 0 ? ControlMode::Normal : static_cast<ControlMode>(level - 1);
}

OverrideLifecycleEvent lifecycleEvent(const CapitalOverride& record,
                                      OverrideTransition transition,
                                      std::string id, std::int64_t at_ms,
                                      std::string actor_role,
                                      std::string actor_user_id) {
  OverrideLifecycleEvent e;
  e.id = std::move(id);
  e.occurred_at_ms = at_ms;
  e.transition = transition;
  e.record = record;
  e.actor_role = std::move(actor_role);
  e.actor_user_id = std::move(actor_user_id);
  return e;
}

}  // namespace

bool isOverrideRole(std::string_view role) {
  return std::any_of(kOverrideRoles.begin(), kOverrideRoles.end(),
                     [&](const char* r) { return role == r; });
}

OverrideValidation validateOverrideRequest(const OverrideRequest& req,
                                           ControlMode current_mode,
                                           std::int64_t now_ms) {
  OverrideValidation v;

  if (!isOverrideRole(req.actor_role)) {
    v.errors.push_back("Role \"" + req.actor_role +
                       "\" is not authorized to create overrides. Allowed: " +
                       joinRoles());
  }

  if (req.actor_user_id.empty()) {
    v.errors.push_back("Actor user id is required");
  }

  const std::size_t reason_len = characterCount(trim(req.reason));
  if (reason_len < kMinOverrideReasonLength) {
    v.errors.push_back("Reason must be at least " +
                       std::to_string(kMinOverrideReasonLength) +
                       " characters (got " + std::to_string(reason_len) + ")");
  }

  if (req.expires_at_ms <= now_ms) {
    v.errors.push_back("Expiry " + formatIso8601(req.expires_at_ms) +
                       " must be in the future");
  }

  if (req.scope == "GLOBAL") {
    if (!isGloballyOverridable(current_mode)) {
      v.errors.push_back(std::string("GLOBAL override not permitted for mode \"") +
                         toString(current_mode) +
                         "\". Only allowed for: THROTTLE_RESERVATIONS, "
                         "FREEZE_CONVERSIONS");
    } else {
      v.scope = GlobalScope{};
    }
  } else if (req.scope == "ACTION") {
    if (!req.action_key) {
      v.errors.push_back("ACTION-scoped override must specify an actionKey");
    } else {
      v.scope = ActionScope{*req.action_key};
    }
  } else {
    v.errors.push_back("Scope \"" + req.scope +
                       "\" is invalid. Expected GLOBAL or ACTION");
  }

  return v;
}

std::string CreateOverrideResult::errorMessage() const {
  std::string out = "[OVERRIDE_VALIDATION] ";
  for (std::size_t i = 0; i < errors.size(); ++i) {
    if (i != 0) out += "; ";
    out += errors[i];
  }
  return out;
}

std::string overrideId(const std::string& actor_user_id,
                       std::int64_t created_at_ms, const OverrideScope& scope) {
  std::string id = "OVR-" + actor_user_id + "-" + minuteBucket(created_at_ms);
  if (auto action = scopedAction(scope)) {
    id += "-";
    id += toString(*action);
  }
  return id;
}

OverrideStatus effectiveStatus(const CapitalOverride& r, std::int64_t now_ms) {
  if (r.status == OverrideStatus::Active && r.expires_at_ms <= now_ms) {
    return OverrideStatus::Expired;
  }
  return r.status;
}

bool overrideApplies(const CapitalOverride& r, ControlMode current_mode,
                     std::int64_t now_ms) {
  return effectiveStatus(r, now_ms) == OverrideStatus::Active &&
         severity(current_mode) <= severity(r.mode_at_creation);
}

BlockMatrix applyOverrides(const ControlDecision& decision,
                           const std::vector<CapitalOverride>& overrides,
                           std::int64_t now_ms) {
  BlockMatrix effective = decision.blocks;

  for (const auto& r : overrides) {
    if (!overrideApplies(r, decision.mode, now_ms)) continue;

    if (auto action = scopedAction(r.scope)) {
      effective.set(*action, false);
    } else {
      const BlockMatrix relaxed = blockMatrixFor(oneLevelBelow(decision.mode));
      for (ActionKey k : kAllActionKeys) {
        if (!relaxed.blocked(k)) {
          effective.set(k, false);
        }
      }
    }
  }
  return effective;
}

std::optional<std::string> coveringOverride(
    ActionKey action, const ControlDecision& decision,
    const std::vector<CapitalOverride>& overrides, std::int64_t now_ms) {
  for (const auto& r : overrides) {
    if (!overrideApplies(r, decision.mode, now_ms)) continue;

    if (auto scoped = scopedAction(r.scope)) {
      if (*scoped == action) return r.id;
    } else if (!blockMatrixFor(oneLevelBelow(decision.mode)).blocked(action)) {
      return r.id;
    }
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// OverrideGovernor
// -----------------------------------------------------------------------------
OverrideGovernor::OverrideGovernor(IOverrideStore& store, AuditEmitter& audit)
    : store_(store), audit_(audit) {}

CreateOverrideResult OverrideGovernor::create(const OverrideRequest& req,
                                              const ControlDecision& current,
                                              std::int64_t now_ms) {
  CreateOverrideResult result;

  OverrideValidation v = validateOverrideRequest(req, current.mode, now_ms);
  if (!v.valid()) {
    result.errors = std::move(v.errors);
    return result;
  }

  CapitalOverride record;
  record.scope = *v.scope;
  record.id = overrideId(req.actor_user_id, now_ms, record.scope);
  record.reason = trim(req.reason);
  record.created_at_ms = now_ms;
  record.expires_at_ms = req.expires_at_ms;
  record.status = OverrideStatus::Active;
  record.actor_role = req.actor_role;
  record.actor_user_id = req.actor_user_id;
  record.actor_name = req.actor_name;
  record.snapshot_hash = current.snapshot_hash;
  record.mode_at_creation = current.mode;

  try {
    if (store_.insertIfAbsent(record)) {
      result.record = record;
      result.is_new = true;
    } else {
      result.record = store_.find(record.id);
      if (!result.record) {
        result.errors.push_back("Override " + record.id +
                                " exists but could not be read back");
        return result;
      }
    }
  } catch (const StoreUnavailableError& e) {
    std::cerr << "[OverrideGovernor] create " << record.id
              << " failed: " << e.what() << "\n";
    result.errors.push_back(std::string("Override store unavailable: ") +
                            e.what());
    return result;
  }

  if (result.is_new) {
    audit_.emit(lifecycleEvent(record, OverrideTransition::Created,
                               "CC-OVR-C-" + fnv1aHex(record.id), now_ms,
                               req.actor_role, req.actor_user_id));
    std::cout << "[OverrideGovernor] created " << record.id << " scope="
              << scopeName(record.scope)
              << " mode=" << toString(record.mode_at_creation) << "\n";
  }
  return result;
}

RevokeOverrideResult OverrideGovernor::revoke(const std::string& id,
                                              const std::string& actor_role,
                                              const std::string& actor_user_id,
                                              std::int64_t now_ms) {
  RevokeOverrideResult result;

  if (!isOverrideRole(actor_role)) {
    result.errors.push_back("Role \"" + actor_role +
                            "\" is not authorized to revoke overrides. "
                            "Allowed: " +
                            joinRoles());
    return result;
  }

  try {
    auto existing = store_.find(id);
    if (!existing) {
      result.errors.push_back("Override " + id + " not found");
      return result;
    }

    const OverrideStatus status = effectiveStatus(*existing, now_ms);
    if (status != OverrideStatus::Active) {
      result.errors.push_back("Override " + id + " is " + toString(status) +
                              "; only ACTIVE overrides can be revoked");
      return result;
    }

    if (!store_.compareAndSetStatus(id, OverrideStatus::Active,
                                    OverrideStatus::Revoked, now_ms)) {
      auto after = store_.find(id);
      result.errors.push_back(
          "Override " + id + " is " +
          (after ? toString(after->status) : "missing") +
          "; only ACTIVE overrides can be revoked");
      return result;
    }
    result.record = store_.find(id);
  } catch (const StoreUnavailableError& e) {
    std::cerr << "[OverrideGovernor] revoke " << id << " failed: " << e.what()
              << "\n";
    result.errors.push_back(std::string("Override store unavailable: ") +
                            e.what());
    return result;
  }

  if (!result.record) {
    result.errors.push_back("Override " + id + " vanished after revocation");
    return result;
  }

  audit_.emit(lifecycleEvent(
      *result.record, OverrideTransition::Revoked,
      "CC-OVR-R-" + fnv1aHex(id + minuteBucket(now_ms)), now_ms, actor_role,
      actor_user_id));
  std::cout << "[OverrideGovernor] revoked " << id << " by " << actor_role
            << "\n";
  return result;
}

std::vector<CapitalOverride> OverrideGovernor::sweepExpired(
    std::int64_t now_ms) {
  std::vector<CapitalOverride> expired;

  for (auto& r : store_.list()) {
    if (r.status != OverrideStatus::Active || r.expires_at_ms > now_ms) {
      continue;
    }
    if (!store_.compareAndSetStatus(r.id, OverrideStatus::Active,
                                    OverrideStatus::Expired, now_ms)) {
      continue;
    }
    r.status = OverrideStatus::Expired;
    audit_.emit(lifecycleEvent(r, OverrideTransition::Expired,
                               "CC-OVR-E-" + fnv1aHex(r.id), now_ms, "system",
                               ""));
    expired.push_back(std::move(r));
  }

  if (!expired.empty()) {
    std::cout << "[OverrideGovernor] expired " << expired.size()
              << " override(s).\n";
  }
  return expired;
}

std::vector<CapitalOverride> OverrideGovernor::list(std::int64_t now_ms) const {
  auto records = store_.list();
  for (auto& r : records) {
    r.status = effectiveStatus(r, now_ms);
  }
  return records;
}

}  // namespace capguard
