#pragma once

#include "capguard/domain/breach_event.hpp"
#include "capguard/domain/capital_snapshot.hpp"
#include "capguard/domain/control_decision.hpp"
#include "capguard/domain/risk_config.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace capguard {

inline constexpr const char* kDecisionUnavailableReason =
    "Capital control decision unavailable";

// Fixed, monotonically expanding block matrix for a mode.
//   NORMAL                 (nothing)
//   THROTTLE_RESERVATIONS  CREATE_RESERVATION
//   FREEZE_CONVERSIONS     + CONVERT_RESERVATION
//   FREEZE_MARKETPLACE     + PUBLISH_LISTING
//   EMERGENCY_HALT         + OPEN_SETTLEMENT, EXECUTE_DVP
domain::BlockMatrix blockMatrixFor(domain::ControlMode mode);

// -----------------------------------------------------------------------------
// evaluateControlMode()
// -----------------------------------------------------------------------------
//
// @brief  snapshot + recent breach history → ControlDecision.
//
// @details
// Computed from scratch on every call; no state carries over between
// evaluations. First matching rule wins:
//
//   1. hardstop_utilization ≥ hardstop_exceeded             → EMERGENCY_HALT
//   2. BUFFER_NEGATIVE event within buffer_negative_lookback → EMERGENCY_HALT
//   3. breach_level == BREACH                               → FREEZE_MARKETPLACE
//   4. breach_level == CAUTION and
//        ecr ≥ target × ecr_freeze_multiplier or
//        hu  ≥ hardstop_freeze                              → FREEZE_CONVERSIONS
//   5. breach_level == CAUTION and
//        top driver is a reservation or
//        hu  ≥ hardstop_throttle                            → THROTTLE_RESERVATIONS
//                                                             (+ advisory cap)
//   6. otherwise                                            → NORMAL
//
// recent_events may be the full log; only BUFFER_NEGATIVE events inside the
// lookback window are considered. An empty list (history unavailable)
// simply means no recent breach is known.
//
// Thread-safety: Pure function.
// -----------------------------------------------------------------------------
domain::ControlDecision evaluateControlMode(
    const domain::CapitalSnapshot& snapshot,
    const std::vector<domain::BreachEvent>& recent_events,
    const domain::RiskConfig& config);

// Most restrictive decision, used when evaluation itself fails.
domain::ControlDecision unavailableDecision(std::int64_t as_of_ms);

}  // namespace capguard
