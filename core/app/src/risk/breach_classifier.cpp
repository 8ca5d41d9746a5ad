#include "capguard/risk/breach_classifier.hpp"

#include "capguard/domain/names.hpp"
#include "capguard/risk/fingerprint.hpp"
#include "capguard/store/store_error.hpp"
#include "capguard/util/number_format.hpp"

#include <cmath>
#include <iostream>

namespace capguard {

using namespace domain;

namespace {

BreachEvent makeCandidate(const CapitalSnapshot& s, BreachEventType type,
                          AlertLevel level, std::string message) {
  BreachEvent e;
  e.id = fingerprint(BreachConditions{type, s.as_of_ms, s.breach_level,
                                      s.hardstop_utilization, s.ecr});
  e.occurred_at_ms = s.as_of_ms;
  e.type = type;
  e.level = level;
  e.message = std::move(message);
  e.snapshot = s;
  return e;
}

std::string percent(double ratio) { return formatFixed(ratio * 100.0, 2); }

}  // namespace

std::vector<BreachEvent> breachCandidates(const CapitalSnapshot& s,
                                          const RiskConfig& config) {
  std::vector<BreachEvent> out;

  // ---  ECR -----------------------------------------------------------------
  const double ecr_critical = config.target_ecr * config.ecr_critical_multiplier;
  if (s.ecr >= ecr_critical) {
    out.push_back(makeCandidate(
        s, BreachEventType::EcrBreach, AlertLevel::Critical,
        "ECR " + formatFixed(s.ecr, 2) + "x exceeds " +
            formatFixed(ecr_critical, 1) + "x critical threshold (target: " +
            formatNumber(config.target_ecr) + "x)"));
  } else if (s.ecr >= config.target_ecr) {
    out.push_back(makeCandidate(s, BreachEventType::EcrCaution,
                                AlertLevel::Warn,
                                "ECR " + formatFixed(s.ecr, 2) +
                                    "x exceeds target " +
                                    formatFixed(config.target_ecr, 1) + "x"));
  }

  // ---  Hardstop ------------------------------------------------------------
  const double hu = s.hardstop_utilization;
  if (hu >= config.hardstop_breach) {
    out.push_back(makeCandidate(
        s, BreachEventType::HardstopBreach, AlertLevel::Critical,
        "Hardstop utilization " + percent(hu) + "% ≥ " +
            formatNumber(config.hardstop_breach * 100.0) + "% — BREACH"));
  } else if (hu >= config.hardstop_caution) {
    out.push_back(makeCandidate(
        s, BreachEventType::HardstopCaution, AlertLevel::Warn,
        "Hardstop utilization " + percent(hu) + "% in " +
            formatNumber(config.hardstop_caution * 100.0) + "–" +
            formatNumber(config.hardstop_breach * 100.0) +
            "% caution band"));
  }

  // ---  Buffer --------------------------------------------------------------
  if (s.buffer_vs_tvar99 < 0.0) {
    out.push_back(makeCandidate(
        s, BreachEventType::BufferNegative, AlertLevel::Warn,
        "Buffer vs TVaR₉₉ is negative: -$" +
            formatGrouped(std::fabs(s.buffer_vs_tvar99))));
  }

  return out;
}

BreachDetectedEvent toAuditEvent(const BreachEvent& event) {
  BreachDetectedEvent a;
  a.id = event.id;
  a.occurred_at_ms = event.occurred_at_ms;
  a.breach_type = event.type;
  a.level = event.level;
  a.message = event.message;
  a.hardstop_utilization = event.snapshot.hardstop_utilization;
  a.ecr = event.snapshot.ecr;
  for (const auto& d : event.snapshot.top_drivers) {
    if (!d.id.empty()) {
      a.top_driver_ids.push_back(d.id);
    }
  }
  return a;
}

BreachClassifier::BreachClassifier(IBreachStore& store, AuditEmitter& audit,
                                   RiskConfig config)
    : store_(store), audit_(audit), config_(config) {}

std::vector<BreachEvent> BreachClassifier::evaluate(
    const CapitalSnapshot& snapshot) {
  std::vector<BreachEvent> appended;

  for (auto& candidate : breachCandidates(snapshot, config_)) {
    bool is_new = false;
    try {
      is_new = store_.append(candidate);
    } catch (const StoreUnavailableError& e) {
      std::cerr << "[BreachClassifier] breach store unavailable, "
                << candidate.id << " not persisted: " << e.what() << "\n";
      break;
    }
    if (!is_new) {
      continue;
    }

    audit_.emit(toAuditEvent(candidate));
    std::cout << "[BreachClassifier] " << toString(candidate.type) << " "
              << candidate.id << ": " << candidate.message << "\n";
    appended.push_back(std::move(candidate));
  }

  return appended;
}

}  // namespace capguard
