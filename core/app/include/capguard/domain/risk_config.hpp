#pragma once

#include <cstdint>

namespace capguard {
namespace domain {

// -----------------------------------------------------------------------------
// RiskConfig: every numeric threshold used by the capital-control pipeline
// -----------------------------------------------------------------------------
//
// @brief  Immutable, versioned collection of the thresholds applied by the
//         snapshot calculator, breach classifier, control-mode evaluator and
//         transaction risk scorer.
//
// @details
// Every pure function in the pipeline takes a RiskConfig by value (or const
// reference) as an explicit argument. Nothing reads thresholds from globals,
// so a decision can be reproduced exactly from (inputs, config).
//
// The default member initializers are the compiled-in default set. They are
// used whenever the configuration file is missing or unreadable (see
// RiskConfigProvider).
//
// Units:
//   - ratios are plain multiples (8.0 == 8x, 0.95 == 95%)
//   - approval limits are in integer cents
//   - durations are milliseconds
//
// Thread model:
//   Plain value type. Copied into components; never shared mutably.
// -----------------------------------------------------------------------------
struct RiskConfig {
  /// Incremented whenever an operator publishes a new parameter set.
  std::int32_t version{1};

  // --- Snapshot calculation -------------------------------------------------

  /// Fraction of ACTIVE (unconverted) reservation notional counted toward
  /// gross exposure.
  double reserve_haircut{0.35};

  /// Tail-risk surcharge applied to gross exposure in bufferVsTvar99.
  double tvar_addon_factor{0.12};

  /// Exposure-to-capital target. ECR at or above this is CAUTION.
  double target_ecr{8.0};

  /// Number of exposure drivers kept in the snapshot.
  std::int32_t top_driver_count{5};

  // --- Hardstop bands -------------------------------------------------------

  double hardstop_caution{0.80};   // [0.80, 0.95) → CAUTION
  double hardstop_breach{0.95};    // ≥ 0.95 → BREACH
  double hardstop_exceeded{1.0};   // ≥ 1.0 → BREACH (EXCEEDED), EMERGENCY_HALT
  double hardstop_throttle{0.90};  // CAUTION + ≥ 0.90 → THROTTLE_RESERVATIONS
  double hardstop_freeze{0.93};    // CAUTION + ≥ 0.93 → FREEZE_CONVERSIONS

  // --- ECR multipliers over target_ecr --------------------------------------

  double ecr_freeze_multiplier{1.05};    // FREEZE_CONVERSIONS trigger
  double ecr_critical_multiplier{1.2};   // ECR_BREACH (CRITICAL) event

  // --- Control-mode evaluation ----------------------------------------------

  /// A BUFFER_NEGATIVE event newer than this forces EMERGENCY_HALT.
  std::int64_t buffer_negative_lookback_ms{60 * 60 * 1000};

  /// THROTTLE_RESERVATIONS advisory cap as a fraction of remaining hardstop
  /// capacity.
  double throttle_capacity_fraction{0.5};

  // --- Transaction policy ---------------------------------------------------

  double max_ecr_ratio{8.0};       // post-transaction ECR above → BLOCK / FAIL
  double ecr_warn_ratio{7.0};      // post-transaction ECR above → WARN
  double hardstop_util_fail{1.0};  // post-transaction utilization above → FAIL
  double hardstop_util_warn{0.9};  // post-transaction utilization above → WARN

  std::int32_t tri_critical_threshold{8};  // FAIL / concentration BLOCK
  std::int32_t tri_elevated_threshold{7};  // elevated-monitoring WARN
  std::int32_t tri_warn_threshold{5};      // checklist WARN
  double tri_concentration_factor{0.5};    // share of remaining capacity

  // --- Approval ladder (first matching rung wins) ---------------------------

  std::int32_t auto_approval_max_tri{3};
  std::int32_t desk_head_max_tri{5};
  std::int32_t credit_committee_max_tri{7};

  std::int64_t auto_approval_limit_cents{2'500'000'000};
  std::int64_t desk_head_limit_cents{5'000'000'000};
  std::int64_t credit_committee_limit_cents{10'000'000'000};
};

}  // namespace domain
}  // namespace capguard
