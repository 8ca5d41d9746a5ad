#pragma once

#include "capguard/audit/audit_emitter.hpp"
#include "capguard/domain/breach_event.hpp"
#include "capguard/domain/capital_snapshot.hpp"
#include "capguard/domain/risk_config.hpp"
#include "capguard/store/i_breach_store.hpp"

#include <vector>

namespace capguard {

// -----------------------------------------------------------------------------
// Breach candidates (pure)
// -----------------------------------------------------------------------------
//
// Evaluates the five independent conditions against one snapshot:
//
//   ECR        ≥ target × ecr_critical_multiplier  → ECR_BREACH       CRITICAL
//              ≥ target                            → ECR_CAUTION      WARN
//   hardstop   ≥ hardstop_breach                   → HARDSTOP_BREACH  CRITICAL
//              ≥ hardstop_caution                  → HARDSTOP_CAUTION WARN
//   buffer     < 0                                 → BUFFER_NEGATIVE  WARN
//
// Each candidate is stamped with occurred_at = snapshot.as_of and its
// content-addressed id; the snapshot is embedded by value.
// -----------------------------------------------------------------------------
std::vector<domain::BreachEvent> breachCandidates(
    const domain::CapitalSnapshot& snapshot, const domain::RiskConfig& config);

// Audit payload for a persisted breach event.
BreachDetectedEvent toAuditEvent(const domain::BreachEvent& event);

// -----------------------------------------------------------------------------
// BreachClassifier
// -----------------------------------------------------------------------------
//
// @brief  Persists new breach candidates and audits each one exactly once.
//
// @details
// evaluate() appends every candidate to the injected store. The store's
// append() is the dedup point: a false return means the id already exists,
// and the candidate is skipped silently with no audit. Only events the store
// actually accepted are returned and emitted.
//
// Storage unavailable: the failure is logged and evaluate() returns the
// events persisted before the failure (usually none). The caller's decision
// path continues on the snapshot alone.
//
// Ownership:
//   Non-owning references to the store and emitter; both must outlive the
//   classifier. RiskConfig is copied.
//
// Thread-safety:
//   Safe to call concurrently provided the store is (IBreachStore requires
//   it). Two racing sweeps on the same state both attempt append; exactly
//   one wins per id.
// -----------------------------------------------------------------------------
class BreachClassifier {
 public:
  BreachClassifier(IBreachStore& store, AuditEmitter& audit,
                   domain::RiskConfig config);

  std::vector<domain::BreachEvent> evaluate(
      const domain::CapitalSnapshot& snapshot);

  void setConfig(const domain::RiskConfig& config) { config_ = config; }

 private:
  IBreachStore& store_;
  AuditEmitter& audit_;
  domain::RiskConfig config_;
};

}  // namespace capguard
