#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace capguard {
namespace domain {

// -----------------------------------------------------------------------------
// BreachLevel
// -----------------------------------------------------------------------------
// Snapshot-level classification. Ordered: Clear < Caution < Breach.
// -----------------------------------------------------------------------------
enum class BreachLevel {
  Clear,
  Caution,
  Breach,
};

// Where a top driver's notional comes from.
enum class DriverKind {
  Reservation,
  Order,
  Settlement,
};

// -----------------------------------------------------------------------------
// ExposureDriver: one ranked contributor to gross exposure
// -----------------------------------------------------------------------------
struct ExposureDriver {
  std::string label;
  double value{0.0};
  std::string id;  // empty when the source record has no id
  DriverKind kind{DriverKind::Order};
};

// -----------------------------------------------------------------------------
// CapitalSnapshot: real-time solvency view of the platform
// -----------------------------------------------------------------------------
//
// @brief  Output of computeCapitalSnapshot(). Immutable once computed.
//
// @details
// A snapshot is never mutated in place. Each evaluation recomputes it from
// the current aggregate state. Copies are embedded in BreachEvent records so
// that every persisted alert carries the exact state that triggered it.
//
// Invariants:
//   gross_exposure_notional = allocated + settlement_open
//                             + reserved * reserve_haircut
//   ecr                     = gross / capital_base    (0 if capital_base <= 0)
//   hardstop_utilization    = gross / hardstop_limit  (0 if limit <= 0)
//   buffer_vs_tvar99        = capital_base - tvar99 - gross * tvar_addon
//   top_drivers             sorted descending by value, size <= 5
// -----------------------------------------------------------------------------
struct CapitalSnapshot {
  std::int64_t as_of_ms{0};

  double capital_base{0.0};
  double hardstop_limit{0.0};

  double gross_exposure_notional{0.0};
  double reserved_notional{0.0};
  double allocated_notional{0.0};
  double settlement_notional_open{0.0};
  double settled_notional_today{0.0};

  double ecr{0.0};
  double hardstop_utilization{0.0};
  double buffer_vs_tvar99{0.0};

  BreachLevel breach_level{BreachLevel::Clear};
  std::vector<std::string> breach_reasons;

  std::vector<ExposureDriver> top_drivers;
};

}  // namespace domain
}  // namespace capguard
