// =============================================================================
// override_governor_test.cpp
// =============================================================================
// Unit tests for capguard::OverrideGovernor and the override rule functions.
//
// Validates:
//   - Request validation: role, actor, reason length, expiry, scope rules
//   - Creation: deterministic id, idempotence within a minute, audit event
//   - applyOverrides(): ACTION clears one key, GLOBAL relaxes one level
//   - An override stops applying once the mode escalates past its creation
//     mode, and once it expires
//   - Revocation and expiry sweeps, including their audit events
// =============================================================================

#include "capguard/audit/audit_emitter.hpp"
#include "capguard/eventbus/event_bus.hpp"
#include "capguard/risk/control_mode_evaluator.hpp"
#include "capguard/risk/fingerprint.hpp"
#include "capguard/risk/override_governor.hpp"
#include "capguard/store/in_memory_override_store.hpp"

#include "capital_fixtures.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace capguard;
using namespace capguard::domain;

// =============================================================================
// Test fixture: in-memory store, a governor, and the lifecycle events it
// publishes.
// =============================================================================
class OverrideGovernorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    bus.subscribe<OverrideLifecycleEvent>(
        [this](const OverrideLifecycleEvent& e) { lifecycle.push_back(e); });
  }

  static OverrideRequest actionRequest(ActionKey key) {
    OverrideRequest r;
    r.scope = "ACTION";
    r.action_key = key;
    r.reason = "Treasury injected capital; desk confirmed headroom.";
    r.expires_at_ms = fixtures::kNow + 4 * kMillisPerHour;
    r.actor_role = "treasury";
    r.actor_user_id = "u1";
    r.actor_name = "Tess Treasury";
    return r;
  }

  static OverrideRequest globalRequest() {
    OverrideRequest r = actionRequest(ActionKey::CreateReservation);
    r.scope = "GLOBAL";
    r.action_key.reset();
    return r;
  }

  EventBus bus;
  AuditEmitter audit{bus};
  InMemoryOverrideStore store;
  OverrideGovernor governor{store, audit};
  std::vector<OverrideLifecycleEvent> lifecycle;
};

// -----------------------------------------------------------------------------
// 1. A role outside admin/treasury/compliance is rejected with the allowed
//    list in the message.
// -----------------------------------------------------------------------------
TEST_F(OverrideGovernorTest, RejectsUnauthorizedRole) {
  OverrideRequest r = actionRequest(ActionKey::CreateReservation);
  r.actor_role = "trader";

  const OverrideValidation v = validateOverrideRequest(
      r, ControlMode::ThrottleReservations, fixtures::kNow);

  ASSERT_EQ(v.errors.size(), 1u);
  EXPECT_EQ(v.errors[0],
            "Role \"trader\" is not authorized to create overrides. Allowed: "
            "admin, treasury, compliance");
}

// -----------------------------------------------------------------------------
// 2. The reason is trimmed before its length is checked.
// Why: Whitespace padding must not let a content-free reason through review.
// -----------------------------------------------------------------------------
TEST_F(OverrideGovernorTest, RejectsShortReasonAfterTrim) {
  OverrideRequest r = actionRequest(ActionKey::CreateReservation);
  r.reason = "   too short          ";

  const OverrideValidation v = validateOverrideRequest(
      r, ControlMode::ThrottleReservations, fixtures::kNow);

  ASSERT_EQ(v.errors.size(), 1u);
  EXPECT_EQ(v.errors[0], "Reason must be at least 20 characters (got 9)");
}

// -----------------------------------------------------------------------------
// 3. An expiry that is not in the future is rejected.
// -----------------------------------------------------------------------------
TEST_F(OverrideGovernorTest, RejectsPastExpiry) {
  OverrideRequest r = actionRequest(ActionKey::CreateReservation);
  r.expires_at_ms = fixtures::kNow - kMillisPerHour;

  const OverrideValidation v = validateOverrideRequest(
      r, ControlMode::ThrottleReservations, fixtures::kNow);

  ASSERT_EQ(v.errors.size(), 1u);
  EXPECT_EQ(v.errors[0], "Expiry 2026-01-15T11:00:00.000Z must be in the future");

  r.expires_at_ms = fixtures::kNow;
  EXPECT_FALSE(validateOverrideRequest(r, ControlMode::ThrottleReservations,
                                       fixtures::kNow)
                   .valid());
}

// -----------------------------------------------------------------------------
// 4. GLOBAL overrides are only allowed under THROTTLE_RESERVATIONS and
//    FREEZE_CONVERSIONS.
// Why: A one-level downgrade from FREEZE_MARKETPLACE or EMERGENCY_HALT would
//      reopen listings or settlement while the platform is in breach.
// -----------------------------------------------------------------------------
TEST_F(OverrideGovernorTest, GlobalScopeLimitedToMildModes) {
  const OverrideRequest r = globalRequest();

  EXPECT_TRUE(validateOverrideRequest(r, ControlMode::ThrottleReservations,
                                      fixtures::kNow)
                  .valid());
  EXPECT_TRUE(validateOverrideRequest(r, ControlMode::FreezeConversions,
                                      fixtures::kNow)
                  .valid());

  const OverrideValidation marketplace = validateOverrideRequest(
      r, ControlMode::FreezeMarketplace, fixtures::kNow);
  ASSERT_EQ(marketplace.errors.size(), 1u);
  EXPECT_EQ(marketplace.errors[0],
            "GLOBAL override not permitted for mode \"FREEZE_MARKETPLACE\". "
            "Only allowed for: THROTTLE_RESERVATIONS, FREEZE_CONVERSIONS");

  EXPECT_FALSE(
      validateOverrideRequest(r, ControlMode::EmergencyHalt, fixtures::kNow)
          .valid());
  EXPECT_FALSE(
      validateOverrideRequest(r, ControlMode::Normal, fixtures::kNow).valid());
}

// -----------------------------------------------------------------------------
// 5. Malformed scopes are rejected; all problems are reported together.
// -----------------------------------------------------------------------------
TEST_F(OverrideGovernorTest, ScopeErrorsAndAccumulation) {
  OverrideRequest missing_key = actionRequest(ActionKey::CreateReservation);
  missing_key.action_key.reset();
  const OverrideValidation a = validateOverrideRequest(
      missing_key, ControlMode::ThrottleReservations, fixtures::kNow);
  ASSERT_EQ(a.errors.size(), 1u);
  EXPECT_EQ(a.errors[0], "ACTION-scoped override must specify an actionKey");

  OverrideRequest bad_scope = actionRequest(ActionKey::CreateReservation);
  bad_scope.scope = "PARTIAL";
  bad_scope.actor_role = "ops";
  bad_scope.actor_user_id.clear();
  bad_scope.reason = "short";
  const OverrideValidation b = validateOverrideRequest(
      bad_scope, ControlMode::ThrottleReservations, fixtures::kNow);
  ASSERT_EQ(b.errors.size(), 4u);
  EXPECT_EQ(b.errors[1], "Actor user id is required");
  EXPECT_EQ(b.errors[3], "Scope \"PARTIAL\" is invalid. Expected GLOBAL or ACTION");
  EXPECT_FALSE(b.scope.has_value());
}

// -----------------------------------------------------------------------------
// 6. create() records the override against the current decision and audits
//    it once. A repeat in the same minute returns the stored record.
// -----------------------------------------------------------------------------
TEST_F(OverrideGovernorTest, CreateIsIdempotentWithinMinute) {
  const ControlDecision current =
      fixtures::decisionFor(ControlMode::ThrottleReservations, "hash-throttle");

  const CreateOverrideResult first = governor.create(
      actionRequest(ActionKey::CreateReservation), current, fixtures::kNow);
  ASSERT_TRUE(first.ok()) << first.errorMessage();
  EXPECT_TRUE(first.is_new);

  const CapitalOverride& o = *first.record;
  EXPECT_EQ(o.id, "OVR-u1-2026-01-15T12:00-CREATE_RESERVATION");
  EXPECT_EQ(o.status, OverrideStatus::Active);
  EXPECT_EQ(o.mode_at_creation, ControlMode::ThrottleReservations);
  EXPECT_EQ(o.snapshot_hash, "hash-throttle");
  EXPECT_EQ(o.reason, "Treasury injected capital; desk confirmed headroom.");
  EXPECT_EQ(scopedAction(o.scope), ActionKey::CreateReservation);

  const CreateOverrideResult again =
      governor.create(actionRequest(ActionKey::CreateReservation), current,
                      fixtures::kNow + 20'000);
  ASSERT_TRUE(again.ok());
  EXPECT_FALSE(again.is_new);
  EXPECT_EQ(again.record->id, o.id);

  EXPECT_EQ(store.list().size(), 1u);
  ASSERT_EQ(lifecycle.size(), 1u);
  EXPECT_EQ(lifecycle[0].transition, OverrideTransition::Created);
  EXPECT_EQ(lifecycle[0].id, "CC-OVR-C-" + fnv1aHex(o.id));
}

// -----------------------------------------------------------------------------
// 7. Validation failures store nothing and join errors with a prefix.
// -----------------------------------------------------------------------------
TEST_F(OverrideGovernorTest, InvalidCreateStoresNothing) {
  const CreateOverrideResult r =
      governor.create(globalRequest(),
                      fixtures::decisionFor(ControlMode::EmergencyHalt),
                      fixtures::kNow);

  EXPECT_FALSE(r.ok());
  EXPECT_EQ(r.errorMessage().rfind("[OVERRIDE_VALIDATION] GLOBAL override", 0),
            0u);
  EXPECT_TRUE(store.list().empty());
  EXPECT_TRUE(lifecycle.empty());
}

// -----------------------------------------------------------------------------
// 8. An ACTION override clears exactly its own key.
// -----------------------------------------------------------------------------
TEST_F(OverrideGovernorTest, ActionOverrideClearsOneKey) {
  const ControlDecision freeze =
      fixtures::decisionFor(ControlMode::FreezeConversions);
  const auto created = governor.create(
      actionRequest(ActionKey::CreateReservation), freeze, fixtures::kNow);
  ASSERT_TRUE(created.ok());

  const BlockMatrix effective =
      applyOverrides(freeze, governor.list(fixtures::kNow), fixtures::kNow);

  EXPECT_FALSE(effective.blocked(ActionKey::CreateReservation));
  EXPECT_TRUE(effective.blocked(ActionKey::ConvertReservation));
  EXPECT_EQ(coveringOverride(ActionKey::CreateReservation, freeze,
                             governor.list(fixtures::kNow), fixtures::kNow),
            created.record->id);
  EXPECT_FALSE(coveringOverride(ActionKey::ConvertReservation, freeze,
                                governor.list(fixtures::kNow), fixtures::kNow)
                   .has_value());
}

// -----------------------------------------------------------------------------
// 9. A GLOBAL override yields the block matrix of the next milder mode.
// -----------------------------------------------------------------------------
TEST_F(OverrideGovernorTest, GlobalOverrideRelaxesOneLevel) {
  const ControlDecision freeze =
      fixtures::decisionFor(ControlMode::FreezeConversions);
  ASSERT_TRUE(governor.create(globalRequest(), freeze, fixtures::kNow).ok());

  const BlockMatrix effective =
      applyOverrides(freeze, governor.list(fixtures::kNow), fixtures::kNow);

  EXPECT_EQ(effective, blockMatrixFor(ControlMode::ThrottleReservations));
}

// -----------------------------------------------------------------------------
// 10. Overrides stop applying when the mode escalates past the mode they
//     were granted under, and when they expire.
// Why: An override granted for a throttle must not quietly carry over into a
//      marketplace freeze that nobody reviewed it against.
// -----------------------------------------------------------------------------
TEST_F(OverrideGovernorTest, EscalationAndExpiryDisableOverride) {
  const auto created = governor.create(
      actionRequest(ActionKey::CreateReservation),
      fixtures::decisionFor(ControlMode::ThrottleReservations), fixtures::kNow);
  ASSERT_TRUE(created.ok());
  const CapitalOverride& o = *created.record;

  EXPECT_TRUE(overrideApplies(o, ControlMode::ThrottleReservations,
                              fixtures::kNow));
  EXPECT_TRUE(overrideApplies(o, ControlMode::Normal, fixtures::kNow));
  EXPECT_FALSE(overrideApplies(o, ControlMode::FreezeMarketplace,
                               fixtures::kNow));

  const ControlDecision escalated =
      fixtures::decisionFor(ControlMode::FreezeMarketplace);
  EXPECT_TRUE(applyOverrides(escalated, {o}, fixtures::kNow)
                  .blocked(ActionKey::CreateReservation));

  EXPECT_EQ(effectiveStatus(o, o.expires_at_ms - 1), OverrideStatus::Active);
  EXPECT_EQ(effectiveStatus(o, o.expires_at_ms), OverrideStatus::Expired);
  EXPECT_FALSE(overrideApplies(o, ControlMode::ThrottleReservations,
                               o.expires_at_ms));
}

// -----------------------------------------------------------------------------
// 11. Revocation: role-gated, once only, stamped and audited.
// -----------------------------------------------------------------------------
TEST_F(OverrideGovernorTest, RevokeLifecycle) {
  const auto created = governor.create(
      actionRequest(ActionKey::PublishListing),
      fixtures::decisionFor(ControlMode::FreezeMarketplace), fixtures::kNow);
  ASSERT_TRUE(created.ok());
  const std::string id = created.record->id;

  const RevokeOverrideResult denied =
      governor.revoke(id, "trader", "u9", fixtures::kNow + 1000);
  EXPECT_FALSE(denied.ok());

  const RevokeOverrideResult missing =
      governor.revoke("OVR-nope", "admin", "u2", fixtures::kNow + 1000);
  ASSERT_EQ(missing.errors.size(), 1u);
  EXPECT_EQ(missing.errors[0], "Override OVR-nope not found");

  const std::int64_t at = fixtures::kNow + 5 * kMillisPerMinute;
  const RevokeOverrideResult revoked = governor.revoke(id, "admin", "u2", at);
  ASSERT_TRUE(revoked.ok());
  EXPECT_EQ(revoked.record->status, OverrideStatus::Revoked);
  EXPECT_EQ(revoked.record->revoked_at_ms, at);

  const RevokeOverrideResult twice = governor.revoke(id, "admin", "u2", at);
  ASSERT_EQ(twice.errors.size(), 1u);
  EXPECT_EQ(twice.errors[0],
            "Override " + id + " is REVOKED; only ACTIVE overrides can be revoked");

  ASSERT_EQ(lifecycle.size(), 2u);
  EXPECT_EQ(lifecycle[1].transition, OverrideTransition::Revoked);
  EXPECT_EQ(lifecycle[1].actor_user_id, "u2");
  EXPECT_EQ(lifecycle[1].id.rfind("CC-OVR-R-", 0), 0u);
}

// -----------------------------------------------------------------------------
// 12. The expiry sweep flips lapsed overrides once and audits each once.
// -----------------------------------------------------------------------------
TEST_F(OverrideGovernorTest, SweepExpiredOnce) {
  const auto created = governor.create(
      actionRequest(ActionKey::CreateReservation),
      fixtures::decisionFor(ControlMode::ThrottleReservations), fixtures::kNow);
  ASSERT_TRUE(created.ok());
  const std::int64_t after = created.record->expires_at_ms + 1;

  EXPECT_TRUE(governor.sweepExpired(fixtures::kNow).empty());

  const auto expired = governor.sweepExpired(after);
  ASSERT_EQ(expired.size(), 1u);
  EXPECT_EQ(expired[0].status, OverrideStatus::Expired);
  EXPECT_EQ(store.find(created.record->id)->status, OverrideStatus::Expired);

  EXPECT_TRUE(governor.sweepExpired(after + kMillisPerMinute).empty());

  ASSERT_EQ(lifecycle.size(), 2u);
  EXPECT_EQ(lifecycle[1].transition, OverrideTransition::Expired);
  EXPECT_EQ(lifecycle[1].id, "CC-OVR-E-" + fnv1aHex(created.record->id));
  EXPECT_EQ(lifecycle[1].actor_role, "system");

  // Expired overrides can no longer be revoked.
  EXPECT_FALSE(governor.revoke(created.record->id, "admin", "u2", after).ok());
}

// -----------------------------------------------------------------------------
// 13. list() reports the effective status even before a sweep runs.
// -----------------------------------------------------------------------------
TEST_F(OverrideGovernorTest, ListAppliesEffectiveStatus) {
  const auto created = governor.create(
      actionRequest(ActionKey::CreateReservation),
      fixtures::decisionFor(ControlMode::ThrottleReservations), fixtures::kNow);
  ASSERT_TRUE(created.ok());

  const auto later = governor.list(created.record->expires_at_ms);
  ASSERT_EQ(later.size(), 1u);
  EXPECT_EQ(later[0].status, OverrideStatus::Expired);
  EXPECT_EQ(store.find(created.record->id)->status, OverrideStatus::Active);
}
