// =============================================================================
// transaction_risk_scorer_test.cpp
// =============================================================================
// Unit tests for the transaction policy functions: TRI scoring, capital
// validation, blockers, the approval ladder and the compliance checklist.
//
// Validates:
//   - TRI components, rounding, clamping, band and formula text
//   - Pre/post capital figures
//   - Blocker ids, severities and messages
//   - Approval rungs are checked in order, first match wins
//   - Compliance checklist PASS / WARN / FAIL details
//   - evaluateTransaction() is blocked exactly when a BLOCK blocker exists
// =============================================================================

#include "capguard/domain/risk_config.hpp"
#include "capguard/domain/transaction_policy.hpp"
#include "capguard/risk/transaction_risk_scorer.hpp"

#include "capital_fixtures.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

using namespace capguard;
using namespace capguard::domain;

// =============================================================================
// Test fixture: a clean counterparty, corridor and hub, and a capital position
// with 400M of hardstop headroom and post-transaction ECR well under limit.
// =============================================================================
class TransactionRiskScorerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    cp = Counterparty{"CP-1", "Acme Bullion", RiskLevel::Low,
                      EntityStatus::Active};
    corridor = Corridor{"COR-1", "UAE-CH", RiskLevel::Low,
                        CorridorStatus::Active};
    hub = Hub{"HUB-1", "Zurich Vault", HubStatus::Operational, 99.9};
    capital = CapitalPosition{100'000'000.0, 600'000'000.0, 1'000'000'000.0};
  }

  static const PolicyBlocker* findBlocker(
      const std::vector<PolicyBlocker>& blockers, const std::string& id) {
    auto it = std::find_if(blockers.begin(), blockers.end(),
                           [&](const PolicyBlocker& b) { return b.id == id; });
    return it == blockers.end() ? nullptr : &*it;
  }

  static const ComplianceCheck& findCheck(
      const std::vector<ComplianceCheck>& checks, const std::string& id) {
    auto it = std::find_if(checks.begin(), checks.end(),
                           [&](const ComplianceCheck& c) { return c.id == id; });
    if (it == checks.end()) {
      throw std::runtime_error("no check " + id);
    }
    return *it;
  }

  RiskConfig config;
  Counterparty cp;
  Corridor corridor;
  Hub hub;
  CapitalPosition capital;
};

// -----------------------------------------------------------------------------
// 1. Lowest-risk inputs score 1 (green) and the formula replays the maths.
// -----------------------------------------------------------------------------
TEST_F(TransactionRiskScorerTest, LowRiskScoresGreen) {
  const TriResult tri = computeTri(cp, corridor, 1'000'000.0, capital);

  EXPECT_EQ(tri.score, 1);
  EXPECT_EQ(tri.band, TriBand::Green);
  EXPECT_DOUBLE_EQ(tri.counterparty_risk.weight, 0.40);
  EXPECT_DOUBLE_EQ(tri.amount_concentration.raw, 1.0);
  EXPECT_EQ(tri.formula,
            "TRI = (CP_Risk:1 × 0.4) + (Corridor_Risk:1 × 0.25) + "
            "(Amt_Conc:1 × 0.2) + (CP_Status:0 × 0.15) = 0.85 → 1");
}

// -----------------------------------------------------------------------------
// 2. A high-risk, pending counterparty on a medium corridor lands in amber.
//    2.4 + 0.75 + 0.2 + 0.3 = 3.65 → 4.
// -----------------------------------------------------------------------------
TEST_F(TransactionRiskScorerTest, MixedRiskScoresAmber) {
  cp.risk_level = RiskLevel::High;
  cp.status = EntityStatus::Pending;
  corridor.risk_level = RiskLevel::Medium;

  const TriResult tri = computeTri(cp, corridor, 1'000'000.0, capital);

  EXPECT_EQ(tri.score, 4);
  EXPECT_EQ(tri.band, TriBand::Amber);
  EXPECT_DOUBLE_EQ(tri.counterparty_risk.raw, 6.0);
  EXPECT_DOUBLE_EQ(tri.corridor_risk.raw, 3.0);
  EXPECT_DOUBLE_EQ(tri.counterparty_status.raw, 2.0);
  EXPECT_NE(tri.formula.find("= 3.65 → 4"), std::string::npos) << tri.formula;
}

// -----------------------------------------------------------------------------
// 3. Critical everything with a concentrated amount lands in red.
//    3.6 + 2.25 + 2.0 + 1.2 = 9.05 → 9.
// -----------------------------------------------------------------------------
TEST_F(TransactionRiskScorerTest, CriticalRiskScoresRed) {
  cp.risk_level = RiskLevel::Critical;
  cp.status = EntityStatus::Suspended;
  corridor.risk_level = RiskLevel::Critical;

  const TriResult tri = computeTri(cp, corridor, 500'000'000.0, capital);

  EXPECT_DOUBLE_EQ(tri.amount_concentration.raw, 10.0);
  EXPECT_EQ(tri.score, 9);
  EXPECT_EQ(tri.band, TriBand::Red);
}

// -----------------------------------------------------------------------------
// 4. The amount score is clamped to [1, 10], including a zero hardstop.
// -----------------------------------------------------------------------------
TEST_F(TransactionRiskScorerTest, AmountScoreClamped) {
  EXPECT_DOUBLE_EQ(
      computeTri(cp, corridor, 5e9, capital).amount_concentration.raw, 10.0);
  EXPECT_DOUBLE_EQ(
      computeTri(cp, corridor, 0.0, capital).amount_concentration.raw, 1.0);

  capital.hardstop_limit = 0.0;
  EXPECT_DOUBLE_EQ(
      computeTri(cp, corridor, 1e6, capital).amount_concentration.raw, 1.0);

  // 60M of 1B is 6% → ceil(1.2) = 2.
  capital.hardstop_limit = 1e9;
  EXPECT_DOUBLE_EQ(
      computeTri(cp, corridor, 60e6, capital).amount_concentration.raw, 2.0);
}

// -----------------------------------------------------------------------------
// 5. Band boundaries.
// -----------------------------------------------------------------------------
TEST_F(TransactionRiskScorerTest, BandBoundaries) {
  EXPECT_EQ(triBand(1), TriBand::Green);
  EXPECT_EQ(triBand(3), TriBand::Green);
  EXPECT_EQ(triBand(4), TriBand::Amber);
  EXPECT_EQ(triBand(6), TriBand::Amber);
  EXPECT_EQ(triBand(7), TriBand::Red);
  EXPECT_EQ(triBand(10), TriBand::Red);
}

// -----------------------------------------------------------------------------
// 6. Pre/post transaction capital figures.
// -----------------------------------------------------------------------------
TEST_F(TransactionRiskScorerTest, CapitalValidationFigures) {
  const CapitalValidation v = validateCapital(50'000'000.0, capital);

  EXPECT_DOUBLE_EQ(v.current_exposure, 600'000'000.0);
  EXPECT_DOUBLE_EQ(v.post_txn_exposure, 650'000'000.0);
  EXPECT_DOUBLE_EQ(v.current_ecr, 6.0);
  EXPECT_DOUBLE_EQ(v.post_txn_ecr, 6.5);
  EXPECT_DOUBLE_EQ(v.current_hardstop_util, 0.6);
  EXPECT_DOUBLE_EQ(v.post_txn_hardstop_util, 0.65);
  EXPECT_DOUBLE_EQ(v.hardstop_remaining, 400'000'000.0);
}

// -----------------------------------------------------------------------------
// 7. Suspended counterparty, suspended corridor and an offline hub all BLOCK.
// -----------------------------------------------------------------------------
TEST_F(TransactionRiskScorerTest, SuspendedEntitiesBlock) {
  cp.status = EntityStatus::Suspended;
  corridor.status = CorridorStatus::Suspended;
  hub.status = HubStatus::Offline;

  const auto blockers = checkBlockers(&cp, &corridor, &hub, nullptr, 1e6,
                                      capital, config);

  const PolicyBlocker* b = findBlocker(blockers, "cp-susp");
  ASSERT_NE(b, nullptr);
  EXPECT_EQ(b->severity, BlockerSeverity::Block);
  EXPECT_EQ(b->detail, "Acme Bullion is suspended — transactions blocked.");

  ASSERT_NE(findBlocker(blockers, "cor-susp"), nullptr);
  ASSERT_NE(findBlocker(blockers, "hub-off"), nullptr);
  EXPECT_EQ(findBlocker(blockers, "hub-off")->detail, "Zurich Vault is offline.");
  EXPECT_TRUE(hasBlockLevel(blockers));
}

// -----------------------------------------------------------------------------
// 8. Softer entity states only warn or inform.
// -----------------------------------------------------------------------------
TEST_F(TransactionRiskScorerTest, SoftStatesWarnOrInform) {
  cp.status = EntityStatus::Pending;
  corridor.status = CorridorStatus::Restricted;
  hub.status = HubStatus::Maintenance;

  const auto blockers = checkBlockers(&cp, &corridor, &hub, nullptr, 1e6,
                                      capital, config);

  ASSERT_EQ(blockers.size(), 3u);
  EXPECT_EQ(findBlocker(blockers, "cp-pend")->severity, BlockerSeverity::Info);
  EXPECT_EQ(findBlocker(blockers, "cor-rest")->severity, BlockerSeverity::Warn);
  EXPECT_EQ(findBlocker(blockers, "hub-maint")->severity, BlockerSeverity::Warn);
  EXPECT_FALSE(hasBlockLevel(blockers));
}

// -----------------------------------------------------------------------------
// 9. Amounts beyond the remaining hardstop capacity or the ECR limit BLOCK.
// -----------------------------------------------------------------------------
TEST_F(TransactionRiskScorerTest, CapacityAndEcrBlock) {
  capital.active_exposure = 960'000'000.0;  // 40M headroom, ECR 9.6 already

  const auto blockers = checkBlockers(nullptr, nullptr, nullptr, nullptr,
                                      50'000'000.0, capital, config);

  const PolicyBlocker* hs = findBlocker(blockers, "hs-breach");
  ASSERT_NE(hs, nullptr);
  EXPECT_EQ(hs->detail, "Amount exceeds remaining capacity ($40.0M).");

  const PolicyBlocker* ecr = findBlocker(blockers, "ecr-breach");
  ASSERT_NE(ecr, nullptr);
  EXPECT_EQ(ecr->detail, "Post-transaction ECR 10.10x exceeds 8x limit.");
}

// -----------------------------------------------------------------------------
// 10. A critical TRI with a concentrated amount BLOCKs; an elevated TRI warns.
// -----------------------------------------------------------------------------
TEST_F(TransactionRiskScorerTest, TriConcentrationAndElevated) {
  TriResult tri;
  tri.score = 8;

  // Remaining 400M; 250M > 50% of it.
  const auto concentrated = checkBlockers(nullptr, nullptr, nullptr, &tri,
                                          250'000'000.0, capital, config);
  const PolicyBlocker* conc = findBlocker(concentrated, "tri-conc");
  ASSERT_NE(conc, nullptr);
  EXPECT_EQ(conc->severity, BlockerSeverity::Block);
  EXPECT_EQ(conc->detail, "TRI ≥ 8 and amount > 50% of remaining hardstop.");
  EXPECT_NE(findBlocker(concentrated, "tri-high"), nullptr);

  const auto small = checkBlockers(nullptr, nullptr, nullptr, &tri,
                                   10'000'000.0, capital, config);
  EXPECT_EQ(findBlocker(small, "tri-conc"), nullptr);

  tri.score = 7;
  const auto elevated = checkBlockers(nullptr, nullptr, nullptr, &tri,
                                      10'000'000.0, capital, config);
  const PolicyBlocker* high = findBlocker(elevated, "tri-high");
  ASSERT_NE(high, nullptr);
  EXPECT_EQ(high->severity, BlockerSeverity::Warn);
  EXPECT_EQ(high->detail, "TRI 7 (Red band) — enhanced monitoring.");
  EXPECT_FALSE(hasBlockLevel(elevated));
}

// -----------------------------------------------------------------------------
// 11. The approval ladder: first matching rung wins.
// Why: Routing a large or risky deal to a rung below its authority is a
//      governance failure, so each rung's bounds are checked exactly.
// -----------------------------------------------------------------------------
TEST_F(TransactionRiskScorerTest, ApprovalLadder) {
  const ApprovalResult a = determineApproval(3, 25'000'000.0, config);
  EXPECT_EQ(a.tier, ApprovalTier::Auto);
  EXPECT_EQ(a.label, "Auto-Approved");
  EXPECT_EQ(a.reason, "TRI ≤ 3 AND amount ≤ $25M");

  const ApprovalResult d = determineApproval(3, 30'000'000.0, config);
  EXPECT_EQ(d.tier, ApprovalTier::DeskHead);
  EXPECT_EQ(d.reason, "TRI ≤ 5 AND amount ≤ $50M");

  const ApprovalResult c = determineApproval(6, 10'000'000.0, config);
  EXPECT_EQ(c.tier, ApprovalTier::CreditCommittee);
  EXPECT_EQ(c.reason, "TRI ≤ 7 AND amount ≤ $100M");

  const ApprovalResult risky = determineApproval(8, 1'000'000.0, config);
  EXPECT_EQ(risky.tier, ApprovalTier::Board);
  EXPECT_EQ(risky.label, "Board Approval");
  EXPECT_EQ(risky.reason, "TRI > 7 OR amount > $100M");

  EXPECT_EQ(determineApproval(1, 150'000'000.0, config).tier,
            ApprovalTier::Board);
}

// -----------------------------------------------------------------------------
// 12. A clean transaction passes every checklist item.
// -----------------------------------------------------------------------------
TEST_F(TransactionRiskScorerTest, CleanChecklistPasses) {
  const TriResult tri = computeTri(cp, corridor, 50'000'000.0, capital);
  const CapitalValidation v = validateCapital(50'000'000.0, capital);
  const auto checks = runComplianceChecks(cp, corridor, hub, tri, v, config);

  ASSERT_EQ(checks.size(), 6u);
  for (const auto& c : checks) {
    EXPECT_EQ(c.result, CheckResult::Pass) << c.id << ": " << c.detail;
  }
  EXPECT_EQ(findCheck(checks, "cp").detail, "Acme Bullion is active.");
  EXPECT_EQ(findCheck(checks, "cor").detail, "UAE-CH active.");
  EXPECT_EQ(findCheck(checks, "hub").detail,
            "Zurich Vault operational (99.9%).");
  EXPECT_EQ(findCheck(checks, "ecr").detail, "Post-txn ECR 6.50x within limit.");
  EXPECT_EQ(findCheck(checks, "hs").detail, "Post-txn utilization 65.0%.");
  EXPECT_EQ(findCheck(checks, "tri").detail,
            "TRI " + std::to_string(tri.score) + " (Green).");
}

// -----------------------------------------------------------------------------
// 13. Near-limit figures warn, over-limit figures fail.
// -----------------------------------------------------------------------------
TEST_F(TransactionRiskScorerTest, ChecklistWarnAndFail) {
  TriResult amber;
  amber.score = 5;
  amber.band = TriBand::Amber;

  CapitalValidation warn;
  warn.post_txn_ecr = 7.5;
  warn.post_txn_hardstop_util = 0.95;
  const auto warned =
      runComplianceChecks(cp, corridor, hub, amber, warn, config);
  EXPECT_EQ(findCheck(warned, "ecr").result, CheckResult::Warn);
  EXPECT_EQ(findCheck(warned, "ecr").detail,
            "Post-txn ECR 7.50x approaching limit.");
  EXPECT_EQ(findCheck(warned, "hs").result, CheckResult::Warn);
  EXPECT_EQ(findCheck(warned, "tri").result, CheckResult::Warn);
  EXPECT_EQ(findCheck(warned, "tri").detail, "TRI 5 (amber).");

  TriResult red;
  red.score = 8;
  red.band = TriBand::Red;

  CapitalValidation fail;
  fail.post_txn_ecr = 8.5;
  fail.post_txn_hardstop_util = 1.05;
  cp.status = EntityStatus::Suspended;
  hub.status = HubStatus::Offline;
  const auto failed = runComplianceChecks(cp, corridor, hub, red, fail, config);
  EXPECT_EQ(findCheck(failed, "cp").result, CheckResult::Fail);
  EXPECT_EQ(findCheck(failed, "hub").result, CheckResult::Fail);
  EXPECT_EQ(findCheck(failed, "ecr").detail,
            "Post-txn ECR 8.50x > 8x limit.");
  EXPECT_EQ(findCheck(failed, "hs").detail,
            "Post-txn utilization 105.0% exceeds limit.");
  EXPECT_EQ(findCheck(failed, "tri").detail,
            "TRI 8 (Red) — board review required.");
}

// -----------------------------------------------------------------------------
// 14. evaluateTransaction() bundles everything and is blocked only on BLOCK.
// -----------------------------------------------------------------------------
TEST_F(TransactionRiskScorerTest, EvaluateTransactionBundles) {
  const TransactionPolicyEvaluation ok = evaluateTransaction(
      cp, corridor, hub, 10'000'000.0, capital, config, fixtures::kNow);
  EXPECT_FALSE(ok.blocked);
  EXPECT_EQ(ok.approval.tier, ApprovalTier::Auto);
  EXPECT_EQ(ok.evaluated_at_ms, fixtures::kNow);
  EXPECT_EQ(ok.checks.size(), 6u);

  hub.status = HubStatus::Degraded;
  const TransactionPolicyEvaluation degraded = evaluateTransaction(
      cp, corridor, hub, 10'000'000.0, capital, config, fixtures::kNow);
  EXPECT_FALSE(degraded.blocked);
  EXPECT_FALSE(degraded.blockers.empty());

  cp.status = EntityStatus::Suspended;
  const TransactionPolicyEvaluation blocked = evaluateTransaction(
      cp, corridor, hub, 10'000'000.0, capital, config, fixtures::kNow);
  EXPECT_TRUE(blocked.blocked);
}
