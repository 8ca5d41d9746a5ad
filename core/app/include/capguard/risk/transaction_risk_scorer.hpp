#pragma once

#include "capguard/domain/risk_config.hpp"
#include "capguard/domain/transaction_policy.hpp"

#include <cstdint>
#include <vector>

namespace capguard {

// -----------------------------------------------------------------------------
// Transaction Risk Index (TRI) and transaction policy
// -----------------------------------------------------------------------------
//
// @brief  Per-transaction scoring, blockers, approval tier and compliance
//         checklist, evaluated when a transaction is created.
//
// @details
// TRI = 0.40 × counterparty risk + 0.25 × corridor risk
//     + 0.20 × amount concentration + 0.15 × counterparty status
//
//   risk level   low 1, medium 3, high 6, critical 9
//   status       active 0, pending 2, under-review 4, closed 6, suspended 8
//   amount       clamp(ceil(amount / hardstop × 20), 1, 10)
//
// The weighted sum is rounded half-up and clamped to [1, 10].
// Bands: green ≤ 3, amber 4..6, red ≥ 7.
//
// Everything else reads its thresholds from RiskConfig. All functions are
// pure.
// -----------------------------------------------------------------------------

int riskLevelScore(domain::RiskLevel level);
int entityStatusScore(domain::EntityStatus status);
domain::TriBand triBand(int score);

domain::TriResult computeTri(const domain::Counterparty& counterparty,
                             const domain::Corridor& corridor, double amount,
                             const domain::CapitalPosition& capital);

domain::CapitalValidation validateCapital(
    double amount, const domain::CapitalPosition& capital);

// Any of counterparty, corridor, hub and tri may be null when the caller has
// not resolved it yet; the corresponding findings are skipped.
std::vector<domain::PolicyBlocker> checkBlockers(
    const domain::Counterparty* counterparty, const domain::Corridor* corridor,
    const domain::Hub* hub, const domain::TriResult* tri, double amount,
    const domain::CapitalPosition& capital, const domain::RiskConfig& config);

bool hasBlockLevel(const std::vector<domain::PolicyBlocker>& blockers);

// First matching rung wins: auto, desk head, credit committee, board.
domain::ApprovalResult determineApproval(int tri_score, double amount,
                                         const domain::RiskConfig& config);

std::vector<domain::ComplianceCheck> runComplianceChecks(
    const domain::Counterparty& counterparty, const domain::Corridor& corridor,
    const domain::Hub& hub, const domain::TriResult& tri,
    const domain::CapitalValidation& capital, const domain::RiskConfig& config);

// TRI, capital validation, approval, blockers and checklist in one record.
domain::TransactionPolicyEvaluation evaluateTransaction(
    const domain::Counterparty& counterparty, const domain::Corridor& corridor,
    const domain::Hub& hub, double amount,
    const domain::CapitalPosition& capital, const domain::RiskConfig& config,
    std::int64_t now_ms);

}  // namespace capguard
