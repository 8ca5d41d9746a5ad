#include "capguard/risk/control_mode_evaluator.hpp"

#include "capguard/domain/names.hpp"
#include "capguard/risk/fingerprint.hpp"
#include "capguard/util/number_format.hpp"

#include <algorithm>

namespace capguard {

using namespace domain;

namespace {

std::string percent(double ratio) { return formatFixed(ratio * 100.0, 2); }

ControlDecision buildDecision(const CapitalSnapshot& s, ControlMode mode,
                              std::vector<std::string> reasons) {
  ControlDecision d;
  d.as_of_ms = s.as_of_ms;
  d.mode = mode;
  d.reasons = std::move(reasons);
  d.blocks = blockMatrixFor(mode);
  d.snapshot_hash = snapshotHash(s);
  return d;
}

bool hasRecentBufferNegative(const std::vector<BreachEvent>& events,
                             std::int64_t cutoff_ms) {
  return std::any_of(events.begin(), events.end(), [&](const BreachEvent& e) {
    return e.type == BreachEventType::BufferNegative &&
           e.occurred_at_ms >= cutoff_ms;
  });
}

}  // namespace

BlockMatrix blockMatrixFor(ControlMode mode) {
  const int level = severity(mode);
  BlockMatrix m;
  m.set(ActionKey::CreateReservation, level >= 1);
  m.set(ActionKey::ConvertReservation, level >= 2);
  m.set(ActionKey::PublishListing, level >= 3);
  m.set(ActionKey::OpenSettlement, level >= 4);
  m.set(ActionKey::ExecuteDvp, level >= 4);
  return m;
}

ControlDecision evaluateControlMode(const CapitalSnapshot& s,
                                    const std::vector<BreachEvent>& recent,
                                    const RiskConfig& config) {
  const double hu = s.hardstop_utilization;

  // ---  1) Emergency halt ---------------------------------------------------
  if (hu >= config.hardstop_exceeded) {
    return buildDecision(
        s, ControlMode::EmergencyHalt,
        {"Hardstop utilization " + percent(hu) + "% ≥ " +
         formatNumber(config.hardstop_exceeded * 100.0) +
         "% — EMERGENCY_HALT"});
  }

  const std::int64_t cutoff = s.as_of_ms - config.buffer_negative_lookback_ms;
  if (hasRecentBufferNegative(recent, cutoff)) {
    return buildDecision(
        s, ControlMode::EmergencyHalt,
        {"BUFFER_NEGATIVE breach event detected within last " +
         std::to_string(config.buffer_negative_lookback_ms / 60000) +
         " minutes — EMERGENCY_HALT"});
  }

  // ---  2) Marketplace freeze -----------------------------------------------
  if (s.breach_level == BreachLevel::Breach) {
    return buildDecision(s, ControlMode::FreezeMarketplace,
                         {"Breach level BREACH with HU " + percent(hu) +
                          "% — FREEZE_MARKETPLACE"});
  }

  if (s.breach_level != BreachLevel::Caution) {
    return buildDecision(s, ControlMode::Normal, {});
  }

  // ---  3) CAUTION: conversion freeze, then throttle ------------------------
  std::vector<std::string> reasons;

  const double ecr_freeze = config.target_ecr * config.ecr_freeze_multiplier;
  const bool ecr_freeze_hit = s.ecr >= ecr_freeze;
  const bool hu_freeze_hit = hu >= config.hardstop_freeze;
  if (ecr_freeze_hit || hu_freeze_hit) {
    if (ecr_freeze_hit) {
      reasons.push_back("ECR " + formatFixed(s.ecr, 2) + "x ≥ " +
                        formatFixed(ecr_freeze, 1) + "x (target × " +
                        formatNumber(config.ecr_freeze_multiplier) +
                        ") — FREEZE_CONVERSIONS");
    }
    if (hu_freeze_hit) {
      reasons.push_back("Hardstop utilization " + percent(hu) + "% ≥ " +
                        formatFixed(config.hardstop_freeze * 100.0, 0) +
                        "% — FREEZE_CONVERSIONS");
    }
    return buildDecision(s, ControlMode::FreezeConversions, std::move(reasons));
  }

  const bool reserved_top = !s.top_drivers.empty() &&
                            s.top_drivers.front().kind == DriverKind::Reservation;
  const bool hu_throttle_hit = hu >= config.hardstop_throttle;
  if (reserved_top || hu_throttle_hit) {
    if (reserved_top) {
      reasons.push_back(
          "Reserved notional is top exposure driver — THROTTLE_RESERVATIONS");
    }
    if (hu_throttle_hit) {
      reasons.push_back("Hardstop utilization " + percent(hu) + "% ≥ " +
                        formatFixed(config.hardstop_throttle * 100.0, 0) +
                        "% — THROTTLE_RESERVATIONS");
    }
    ControlDecision d =
        buildDecision(s, ControlMode::ThrottleReservations, std::move(reasons));
    d.limits.max_reservation_notional =
        std::max(0.0, (s.hardstop_limit - s.gross_exposure_notional) *
                          config.throttle_capacity_fraction);
    return d;
  }

  return buildDecision(s, ControlMode::Normal,
                       {"Breach level CAUTION — no specific throttle triggers "
                        "met. Mode remains NORMAL."});
}

ControlDecision unavailableDecision(std::int64_t as_of_ms) {
  ControlDecision d;
  d.as_of_ms = as_of_ms;
  d.mode = ControlMode::EmergencyHalt;
  d.reasons.push_back(kDecisionUnavailableReason);
  d.blocks = blockMatrixFor(ControlMode::EmergencyHalt);
  return d;
}

}  // namespace capguard
