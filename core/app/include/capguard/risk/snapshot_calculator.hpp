#pragma once

#include "capguard/domain/capital_inputs.hpp"
#include "capguard/domain/capital_snapshot.hpp"
#include "capguard/domain/risk_config.hpp"

namespace capguard {

// -----------------------------------------------------------------------------
// Snapshot calculator
// -----------------------------------------------------------------------------
//
// @brief  Pure transformation: aggregate exposure state → CapitalSnapshot.
//
// @details
// Algorithm (all thresholds come from the RiskConfig argument):
//   1. reserved   = Σ weight × locked price over ACTIVE reservations
//   2. allocated  = Σ weight × locked price over CONVERTED reservations
//                   + uncovered allocated inventory weight per listing,
//                     priced at the mean order price on that listing
//   3. open stl   = Σ notional over settlements in an open status;
//      settled   = Σ notional over SETTLED cases updated on today's UTC date
//   4. gross      = allocated + open stl + reserved × reserve_haircut
//   5. ratios     = gross / capital_base, gross / hardstop_limit (0 on a
//                   non-positive denominator, never NaN or infinite)
//   6. buffer     = capital_base − tvar99 − gross × tvar_addon_factor
//   7. breach classification, most severe first
//   8. top drivers (haircut reservations, live orders, open settlements)
//
// Notional sums are floored at zero.
//
// Thread-safety: Stateless. Safe to call concurrently.
// -----------------------------------------------------------------------------

// Settlement statuses that still carry open exposure.
bool isOpenSettlement(domain::SettlementStatus status);

// Orders that are neither completed nor cancelled.
bool isLiveOrder(domain::OrderStatus status);

// Returns a copy of inputs in which every ACTIVE reservation whose
// expires_at_ms <= now_ms is marked EXPIRED.
domain::CapitalInputs expireLapsedReservations(domain::CapitalInputs inputs);

domain::CapitalSnapshot computeCapitalSnapshot(
    const domain::CapitalInputs& inputs, const domain::RiskConfig& config);

}  // namespace capguard
