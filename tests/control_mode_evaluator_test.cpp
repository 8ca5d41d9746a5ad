// =============================================================================
// control_mode_evaluator_test.cpp
// =============================================================================
// Unit tests for capguard::evaluateControlMode() and blockMatrixFor().
//
// Validates:
//   - Rule order: hardstop exceeded, recent BUFFER_NEGATIVE, BREACH level,
//     then the CAUTION sub-rules (conversion freeze before throttle)
//   - Reason text for each rule
//   - Block matrix per mode and its monotonicity in severity
//   - Throttle advisory limit
//   - Determinism and the fail-closed decision
//
// Snapshots are built directly so each rule can be isolated from the others.
// =============================================================================

#include "capguard/domain/control_decision.hpp"
#include "capguard/domain/names.hpp"
#include "capguard/domain/risk_config.hpp"
#include "capguard/risk/control_mode_evaluator.hpp"

#include "capital_fixtures.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace capguard;
using namespace capguard::domain;

// =============================================================================
// Test fixture: default config and an empty breach history.
// =============================================================================
class ControlModeEvaluatorTest : public ::testing::Test {
 protected:
  ControlDecision evaluate(const CapitalSnapshot& s) {
    return evaluateControlMode(s, history, config);
  }

  RiskConfig config;
  std::vector<BreachEvent> history;
};

// -----------------------------------------------------------------------------
// 1. Utilization at or above 100% halts everything.
// -----------------------------------------------------------------------------
TEST_F(ControlModeEvaluatorTest, HardstopExceededIsEmergencyHalt) {
  const ControlDecision d =
      evaluate(fixtures::snapshotWith(1.02, 3.0, BreachLevel::Breach));

  EXPECT_EQ(d.mode, ControlMode::EmergencyHalt);
  ASSERT_EQ(d.reasons.size(), 1u);
  EXPECT_EQ(d.reasons[0], "Hardstop utilization 102.00% ≥ 100% — EMERGENCY_HALT");
  for (ActionKey k : kAllActionKeys) {
    EXPECT_TRUE(d.blocks.blocked(k)) << toString(k);
  }
}

// -----------------------------------------------------------------------------
// 2. A BUFFER_NEGATIVE event inside the lookback halts even a CLEAR snapshot.
// Why: A negative tail-risk buffer is a solvency signal. It must keep the
//      platform halted for the whole lookback, not just the minute it fired.
// -----------------------------------------------------------------------------
TEST_F(ControlModeEvaluatorTest, RecentBufferNegativeIsEmergencyHalt) {
  history.push_back(fixtures::breachEvent(
      BreachEventType::BufferNegative, fixtures::kNow - 30 * kMillisPerMinute,
      "brch-recent"));

  const ControlDecision d =
      evaluate(fixtures::snapshotWith(0.2, 1.0, BreachLevel::Clear));

  EXPECT_EQ(d.mode, ControlMode::EmergencyHalt);
  ASSERT_EQ(d.reasons.size(), 1u);
  EXPECT_EQ(d.reasons[0],
            "BUFFER_NEGATIVE breach event detected within last 60 minutes — "
            "EMERGENCY_HALT");
}

// -----------------------------------------------------------------------------
// 3. Old BUFFER_NEGATIVE events and other event types do not halt.
// -----------------------------------------------------------------------------
TEST_F(ControlModeEvaluatorTest, StaleOrOtherEventsDoNotHalt) {
  history.push_back(fixtures::breachEvent(
      BreachEventType::BufferNegative,
      fixtures::kNow - config.buffer_negative_lookback_ms - 1, "brch-stale"));
  history.push_back(fixtures::breachEvent(BreachEventType::HardstopBreach,
                                          fixtures::kNow, "brch-hs"));

  const ControlDecision d =
      evaluate(fixtures::snapshotWith(0.2, 1.0, BreachLevel::Clear));

  EXPECT_EQ(d.mode, ControlMode::Normal);
  EXPECT_TRUE(d.reasons.empty());
}

// -----------------------------------------------------------------------------
// 4. BREACH level below 100% utilization freezes the marketplace only.
// -----------------------------------------------------------------------------
TEST_F(ControlModeEvaluatorTest, BreachLevelIsFreezeMarketplace) {
  const ControlDecision d =
      evaluate(fixtures::snapshotWith(0.98, 3.0, BreachLevel::Breach));

  EXPECT_EQ(d.mode, ControlMode::FreezeMarketplace);
  ASSERT_EQ(d.reasons.size(), 1u);
  EXPECT_EQ(d.reasons[0], "Breach level BREACH with HU 98.00% — FREEZE_MARKETPLACE");

  EXPECT_TRUE(d.blocks.blocked(ActionKey::CreateReservation));
  EXPECT_TRUE(d.blocks.blocked(ActionKey::ConvertReservation));
  EXPECT_TRUE(d.blocks.blocked(ActionKey::PublishListing));
  EXPECT_FALSE(d.blocks.blocked(ActionKey::OpenSettlement));
  EXPECT_FALSE(d.blocks.blocked(ActionKey::ExecuteDvp));
}

// -----------------------------------------------------------------------------
// 5. CAUTION with ECR at or above target × 1.05 freezes conversions.
// -----------------------------------------------------------------------------
TEST_F(ControlModeEvaluatorTest, EcrOverFreezeTriggerIsFreezeConversions) {
  const ControlDecision d =
      evaluate(fixtures::snapshotWith(0.7, 8.5, BreachLevel::Caution));

  EXPECT_EQ(d.mode, ControlMode::FreezeConversions);
  ASSERT_EQ(d.reasons.size(), 1u);
  EXPECT_EQ(d.reasons[0], "ECR 8.50x ≥ 8.4x (target × 1.05) — FREEZE_CONVERSIONS");
  EXPECT_TRUE(d.blocks.blocked(ActionKey::ConvertReservation));
  EXPECT_FALSE(d.blocks.blocked(ActionKey::PublishListing));
}

// -----------------------------------------------------------------------------
// 6. CAUTION with utilization at or above 93% freezes conversions; both
//    triggers together report both reasons.
// -----------------------------------------------------------------------------
TEST_F(ControlModeEvaluatorTest, HardstopOverFreezeTrigger) {
  const ControlDecision hu_only =
      evaluate(fixtures::snapshotWith(0.94, 5.0, BreachLevel::Caution));
  EXPECT_EQ(hu_only.mode, ControlMode::FreezeConversions);
  ASSERT_EQ(hu_only.reasons.size(), 1u);
  EXPECT_EQ(hu_only.reasons[0],
            "Hardstop utilization 94.00% ≥ 93% — FREEZE_CONVERSIONS");

  const ControlDecision both =
      evaluate(fixtures::snapshotWith(0.94, 8.5, BreachLevel::Caution));
  EXPECT_EQ(both.mode, ControlMode::FreezeConversions);
  EXPECT_EQ(both.reasons.size(), 2u);
}

// -----------------------------------------------------------------------------
// 7. CAUTION with a reservation as the top driver throttles reservations and
//    caps new reservation notional at half the remaining hardstop capacity.
// -----------------------------------------------------------------------------
TEST_F(ControlModeEvaluatorTest, ReservationTopDriverIsThrottle) {
  CapitalSnapshot s = fixtures::snapshotWith(0.85, 5.0, BreachLevel::Caution);
  s.top_drivers.push_back(
      fixtures::driver(DriverKind::Reservation, "R1", 400'000.0));
  s.top_drivers.push_back(fixtures::driver(DriverKind::Order, "O1", 100'000.0));

  const ControlDecision d = evaluate(s);

  EXPECT_EQ(d.mode, ControlMode::ThrottleReservations);
  ASSERT_EQ(d.reasons.size(), 1u);
  EXPECT_EQ(d.reasons[0],
            "Reserved notional is top exposure driver — THROTTLE_RESERVATIONS");
  ASSERT_TRUE(d.limits.max_reservation_notional.has_value());
  // (1,000,000 - 850,000) × 0.5
  EXPECT_NEAR(*d.limits.max_reservation_notional, 75'000.0, 1e-6);
  EXPECT_TRUE(d.blocks.blocked(ActionKey::CreateReservation));
  EXPECT_FALSE(d.blocks.blocked(ActionKey::ConvertReservation));
}

// -----------------------------------------------------------------------------
// 8. CAUTION with utilization at or above 90% throttles reservations.
// -----------------------------------------------------------------------------
TEST_F(ControlModeEvaluatorTest, HardstopOverThrottleTrigger) {
  CapitalSnapshot s = fixtures::snapshotWith(0.91, 5.0, BreachLevel::Caution);
  s.top_drivers.push_back(fixtures::driver(DriverKind::Settlement, "S1", 1.0));

  const ControlDecision d = evaluate(s);

  EXPECT_EQ(d.mode, ControlMode::ThrottleReservations);
  ASSERT_EQ(d.reasons.size(), 1u);
  EXPECT_EQ(d.reasons[0],
            "Hardstop utilization 91.00% ≥ 90% — THROTTLE_RESERVATIONS");
}

// -----------------------------------------------------------------------------
// 9. CAUTION with no specific trigger stays NORMAL but says why.
// -----------------------------------------------------------------------------
TEST_F(ControlModeEvaluatorTest, CautionWithoutTriggerStaysNormal) {
  CapitalSnapshot s = fixtures::snapshotWith(0.85, 5.0, BreachLevel::Caution);
  s.top_drivers.push_back(fixtures::driver(DriverKind::Order, "O1", 1.0));

  const ControlDecision d = evaluate(s);

  EXPECT_EQ(d.mode, ControlMode::Normal);
  ASSERT_EQ(d.reasons.size(), 1u);
  EXPECT_EQ(d.reasons[0],
            "Breach level CAUTION — no specific throttle triggers met. Mode "
            "remains NORMAL.");
  EXPECT_FALSE(d.blocks.any());
  EXPECT_FALSE(d.limits.max_reservation_notional.has_value());
}

// -----------------------------------------------------------------------------
// 10. A CLEAR snapshot is NORMAL with no reasons and nothing blocked.
// -----------------------------------------------------------------------------
TEST_F(ControlModeEvaluatorTest, ClearIsNormal) {
  const ControlDecision d =
      evaluate(fixtures::snapshotWith(0.4, 2.0, BreachLevel::Clear));

  EXPECT_EQ(d.mode, ControlMode::Normal);
  EXPECT_TRUE(d.reasons.empty());
  EXPECT_FALSE(d.blocks.any());
  EXPECT_EQ(d.as_of_ms, fixtures::kNow);
  EXPECT_FALSE(d.snapshot_hash.empty());
}

// -----------------------------------------------------------------------------
// 11. Blocked sets only grow with severity.
// Why: Escalating the mode must never unblock an action that a milder mode
//      already blocks; operators rely on "higher is stricter".
// -----------------------------------------------------------------------------
TEST_F(ControlModeEvaluatorTest, BlockMatrixIsMonotonic) {
  const std::vector<ControlMode> modes{
      ControlMode::Normal, ControlMode::ThrottleReservations,
      ControlMode::FreezeConversions, ControlMode::FreezeMarketplace,
      ControlMode::EmergencyHalt};

  for (std::size_t lo = 0; lo < modes.size(); ++lo) {
    for (std::size_t hi = lo; hi < modes.size(); ++hi) {
      const BlockMatrix a = blockMatrixFor(modes[lo]);
      const BlockMatrix b = blockMatrixFor(modes[hi]);
      for (ActionKey k : kAllActionKeys) {
        if (a.blocked(k)) {
          EXPECT_TRUE(b.blocked(k))
              << toString(k) << " unblocked going from " << toString(modes[lo])
              << " to " << toString(modes[hi]);
        }
      }
    }
  }

  EXPECT_FALSE(blockMatrixFor(ControlMode::Normal).any());
  EXPECT_TRUE(blockMatrixFor(ControlMode::EmergencyHalt)
                  .blocked(ActionKey::ExecuteDvp));
}

// -----------------------------------------------------------------------------
// 12. The same snapshot and history always yield the same decision.
// -----------------------------------------------------------------------------
TEST_F(ControlModeEvaluatorTest, DecisionIsDeterministic) {
  const CapitalSnapshot s =
      fixtures::snapshotWith(0.94, 8.5, BreachLevel::Caution);

  const ControlDecision a = evaluate(s);
  const ControlDecision b = evaluate(s);

  EXPECT_EQ(a.mode, b.mode);
  EXPECT_EQ(a.reasons, b.reasons);
  EXPECT_EQ(a.blocks, b.blocks);
  EXPECT_EQ(a.snapshot_hash, b.snapshot_hash);
}

// -----------------------------------------------------------------------------
// 13. The unavailable decision is a full EMERGENCY_HALT.
// -----------------------------------------------------------------------------
TEST_F(ControlModeEvaluatorTest, UnavailableDecisionFailsClosed) {
  const ControlDecision d = unavailableDecision(fixtures::kNow);

  EXPECT_EQ(d.mode, ControlMode::EmergencyHalt);
  ASSERT_EQ(d.reasons.size(), 1u);
  EXPECT_EQ(d.reasons[0], "Capital control decision unavailable");
  EXPECT_EQ(d.blocks, blockMatrixFor(ControlMode::EmergencyHalt));
}
