#include "capguard/risk/transaction_risk_scorer.hpp"

#include "capguard/domain/names.hpp"
#include "capguard/util/number_format.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace capguard {

using namespace domain;

namespace {

constexpr double kCounterpartyRiskWeight = 0.40;
constexpr double kCorridorRiskWeight = 0.25;
constexpr double kAmountWeight = 0.20;
constexpr double kCounterpartyStatusWeight = 0.15;

// Concentration of 5% of the hardstop limit per score point.
constexpr double kAmountScoreScale = 20.0;

TriComponent component(double weight, double raw) {
  return TriComponent{weight, raw, raw * weight};
}

double ratio(double num, double den) { return den > 0.0 ? num / den : 0.0; }

std::string millions(double usd, int decimals) {
  return "$" + formatFixed(usd / 1e6, decimals) + "M";
}

}  // namespace

int riskLevelScore(RiskLevel level) {
  switch (level) {
    case RiskLevel::Low:      return 1;
    case RiskLevel::Medium:   return 3;
    case RiskLevel::High:     return 6;
    case RiskLevel::Critical: return 9;
  }
  return 9;
}

int entityStatusScore(EntityStatus status) {
  switch (status) {
    case EntityStatus::Active:      return 0;
    case EntityStatus::Pending:     return 2;
    case EntityStatus::UnderReview: return 4;
    case EntityStatus::Closed:      return 6;
    case EntityStatus::Suspended:   return 8;
  }
  return 8;
}

TriBand triBand(int score) {
  if (score <= 3) return TriBand::Green;
  if (score <= 6) return TriBand::Amber;
  return TriBand::Red;
}

TriResult computeTri(const Counterparty& cp, const Corridor& corridor,
                     double amount, const CapitalPosition& capital) {
  const int cp_risk = riskLevelScore(cp.risk_level);
  const int cor_risk = riskLevelScore(corridor.risk_level);
  const double amount_ratio = ratio(amount, capital.hardstop_limit);
  const int amt_score = static_cast<int>(
      std::min(10.0, std::max(1.0, std::ceil(amount_ratio * kAmountScoreScale))));
  const int cp_status = entityStatusScore(cp.status);

  TriResult r;
  r.counterparty_risk = component(kCounterpartyRiskWeight, cp_risk);
  r.corridor_risk = component(kCorridorRiskWeight, cor_risk);
  r.amount_concentration = component(kAmountWeight, amt_score);
  r.counterparty_status = component(kCounterpartyStatusWeight, cp_status);

  const double raw = r.counterparty_risk.weighted + r.corridor_risk.weighted +
                     r.amount_concentration.weighted +
                     r.counterparty_status.weighted;
  r.score = std::clamp(static_cast<int>(std::floor(raw + 0.5)), 1, 10);
  r.band = triBand(r.score);

  r.formula = "TRI = (CP_Risk:" + std::to_string(cp_risk) + " × " +
              formatNumber(kCounterpartyRiskWeight) + ") + (Corridor_Risk:" +
              std::to_string(cor_risk) + " × " +
              formatNumber(kCorridorRiskWeight) + ") + (Amt_Conc:" +
              std::to_string(amt_score) + " × " + formatNumber(kAmountWeight) +
              ") + (CP_Status:" + std::to_string(cp_status) + " × " +
              formatNumber(kCounterpartyStatusWeight) +
              ") = " + formatFixed(raw, 2) + " → " + std::to_string(r.score);
  return r;
}

CapitalValidation validateCapital(double amount, const CapitalPosition& cap) {
  CapitalValidation v;
  v.current_exposure = cap.active_exposure;
  v.post_txn_exposure = cap.active_exposure + amount;
  v.capital_base = cap.capital_base;
  v.current_ecr = ratio(cap.active_exposure, cap.capital_base);
  v.post_txn_ecr = ratio(v.post_txn_exposure, cap.capital_base);
  v.hardstop_limit = cap.hardstop_limit;
  v.current_hardstop_util = ratio(cap.active_exposure, cap.hardstop_limit);
  v.post_txn_hardstop_util = ratio(v.post_txn_exposure, cap.hardstop_limit);
  v.hardstop_remaining = cap.hardstop_limit - cap.active_exposure;
  return v;
}

std::vector<PolicyBlocker> checkBlockers(const Counterparty* cp,
                                         const Corridor* corridor,
                                         const Hub* hub, const TriResult* tri,
                                         double amount,
                                         const CapitalPosition& capital,
                                         const RiskConfig& config) {
  std::vector<PolicyBlocker> b;

  if (cp) {
    switch (cp->status) {
      case EntityStatus::Suspended:
        b.push_back({"cp-susp", BlockerSeverity::Block, "Counterparty Suspended",
                     cp->entity + " is suspended — transactions blocked."});
        break;
      case EntityStatus::UnderReview:
        b.push_back({"cp-rev", BlockerSeverity::Warn, "Counterparty Under Review",
                     cp->entity + " is under active review."});
        break;
      case EntityStatus::Pending:
        b.push_back({"cp-pend", BlockerSeverity::Info, "Counterparty Pending",
                     cp->entity + " KYC/onboarding pending."});
        break;
      case EntityStatus::Active:
      case EntityStatus::Closed:
        break;
    }
  }

  if (corridor) {
    if (corridor->status == CorridorStatus::Suspended) {
      b.push_back({"cor-susp", BlockerSeverity::Block, "Corridor Suspended",
                   corridor->name + " corridor suspended."});
    } else if (corridor->status == CorridorStatus::Restricted) {
      b.push_back({"cor-rest", BlockerSeverity::Warn, "Corridor Restricted",
                   corridor->name + " restricted — enhanced due diligence."});
    }
  }

  if (hub) {
    switch (hub->status) {
      case HubStatus::Offline:
        b.push_back({"hub-off", BlockerSeverity::Block, "Hub Offline",
                     hub->name + " is offline."});
        break;
      case HubStatus::Maintenance:
        b.push_back({"hub-maint", BlockerSeverity::Warn, "Hub Maintenance",
                     hub->name + " under maintenance — delays possible."});
        break;
      case HubStatus::Degraded:
        b.push_back({"hub-deg", BlockerSeverity::Warn, "Hub Degraded",
                     hub->name + " degraded mode."});
        break;
      case HubStatus::Operational:
        break;
    }
  }

  const double remaining = capital.hardstop_limit - capital.active_exposure;
  if (amount > remaining) {
    b.push_back({"hs-breach", BlockerSeverity::Block, "Hardstop Breach",
                 "Amount exceeds remaining capacity (" +
                     millions(remaining, 1) + ")."});
  }

  const double post_ecr =
      ratio(capital.active_exposure + amount, capital.capital_base);
  if (post_ecr > config.max_ecr_ratio) {
    b.push_back({"ecr-breach", BlockerSeverity::Block, "ECR Breach",
                 "Post-transaction ECR " + formatFixed(post_ecr, 2) +
                     "x exceeds " + formatNumber(config.max_ecr_ratio) +
                     "x limit."});
  }

  if (tri) {
    if (tri->score >= config.tri_critical_threshold &&
        amount > remaining * config.tri_concentration_factor) {
      b.push_back({"tri-conc", BlockerSeverity::Block, "High-Risk Concentration",
                   "TRI ≥ " + std::to_string(config.tri_critical_threshold) +
                       " and amount > " +
                       formatFixed(config.tri_concentration_factor * 100.0, 0) +
                       "% of remaining hardstop."});
    }
    if (tri->score >= config.tri_elevated_threshold) {
      b.push_back({"tri-high", BlockerSeverity::Warn, "Elevated TRI",
                   "TRI " + std::to_string(tri->score) +
                       " (Red band) — enhanced monitoring."});
    }
  }

  return b;
}

bool hasBlockLevel(const std::vector<PolicyBlocker>& blockers) {
  return std::any_of(blockers.begin(), blockers.end(),
                     [](const PolicyBlocker& b) {
                       return b.severity == BlockerSeverity::Block;
                     });
}

ApprovalResult determineApproval(int tri, double amount,
                                 const RiskConfig& config) {
  const double auto_limit =
      static_cast<double>(config.auto_approval_limit_cents) / 100.0;
  const double desk_limit =
      static_cast<double>(config.desk_head_limit_cents) / 100.0;
  const double cc_limit =
      static_cast<double>(config.credit_committee_limit_cents) / 100.0;

  if (tri <= config.auto_approval_max_tri && amount <= auto_limit) {
    return {ApprovalTier::Auto, "Auto-Approved",
            "TRI ≤ " + std::to_string(config.auto_approval_max_tri) +
                " AND amount ≤ " + millions(auto_limit, 0)};
  }
  if (tri <= config.desk_head_max_tri && amount <= desk_limit) {
    return {ApprovalTier::DeskHead, "Desk Head",
            "TRI ≤ " + std::to_string(config.desk_head_max_tri) +
                " AND amount ≤ " + millions(desk_limit, 0)};
  }
  if (tri <= config.credit_committee_max_tri && amount <= cc_limit) {
    return {ApprovalTier::CreditCommittee, "Credit Committee",
            "TRI ≤ " + std::to_string(config.credit_committee_max_tri) +
                " AND amount ≤ " + millions(cc_limit, 0)};
  }
  return {ApprovalTier::Board, "Board Approval",
          "TRI > " + std::to_string(config.credit_committee_max_tri) +
              " OR amount > " + millions(cc_limit, 0)};
}

std::vector<ComplianceCheck> runComplianceChecks(const Counterparty& cp,
                                                 const Corridor& corridor,
                                                 const Hub& hub,
                                                 const TriResult& tri,
                                                 const CapitalValidation& cap,
                                                 const RiskConfig& config) {
  std::vector<ComplianceCheck> c;

  // ---  Counterparty -------------------------------------------------------
  {
    const std::string name = "Counterparty Status";
    if (cp.status == EntityStatus::Suspended) {
      c.push_back({"cp", name, CheckResult::Fail, cp.entity + " is suspended."});
    } else if (cp.status == EntityStatus::UnderReview ||
               cp.status == EntityStatus::Pending) {
      c.push_back({"cp", name, CheckResult::Warn,
                   cp.entity + " is " + toString(cp.status) + "."});
    } else {
      c.push_back({"cp", name, CheckResult::Pass,
                   cp.entity + " is " + toString(cp.status) + "."});
    }
  }

  // ---  Corridor -----------------------------------------------------------
  {
    const std::string name = "Corridor Status";
    if (corridor.status == CorridorStatus::Suspended) {
      c.push_back({"cor", name, CheckResult::Fail, corridor.name + " suspended."});
    } else if (corridor.status == CorridorStatus::Restricted) {
      c.push_back({"cor", name, CheckResult::Warn, corridor.name + " restricted."});
    } else {
      c.push_back({"cor", name, CheckResult::Pass, corridor.name + " active."});
    }
  }

  // ---  Hub ----------------------------------------------------------------
  {
    const std::string name = "Hub Operational";
    if (hub.status == HubStatus::Offline) {
      c.push_back({"hub", name, CheckResult::Fail, hub.name + " offline."});
    } else if (hub.status == HubStatus::Maintenance ||
               hub.status == HubStatus::Degraded) {
      c.push_back({"hub", name, CheckResult::Warn,
                   hub.name + " " + toString(hub.status) + "."});
    } else {
      c.push_back({"hub", name, CheckResult::Pass,
                   hub.name + " operational (" + formatNumber(hub.uptime_pct) +
                       "%)."});
    }
  }

  // ---  ECR ----------------------------------------------------------------
  {
    const std::string name = "Capital Adequacy (ECR)";
    const std::string ecr = formatFixed(cap.post_txn_ecr, 2);
    if (cap.post_txn_ecr > config.max_ecr_ratio) {
      c.push_back({"ecr", name, CheckResult::Fail,
                   "Post-txn ECR " + ecr + "x > " +
                       formatNumber(config.max_ecr_ratio) + "x limit."});
    } else if (cap.post_txn_ecr > config.ecr_warn_ratio) {
      c.push_back({"ecr", name, CheckResult::Warn,
                   "Post-txn ECR " + ecr + "x approaching limit."});
    } else {
      c.push_back({"ecr", name, CheckResult::Pass,
                   "Post-txn ECR " + ecr + "x within limit."});
    }
  }

  // ---  Hardstop -----------------------------------------------------------
  {
    const std::string name = "Hardstop Compliance";
    const std::string util = formatFixed(cap.post_txn_hardstop_util * 100.0, 1);
    if (cap.post_txn_hardstop_util > config.hardstop_util_fail) {
      c.push_back({"hs", name, CheckResult::Fail,
                   "Post-txn utilization " + util + "% exceeds limit."});
    } else if (cap.post_txn_hardstop_util > config.hardstop_util_warn) {
      c.push_back({"hs", name, CheckResult::Warn,
                   "Post-txn utilization " + util + "% near limit."});
    } else {
      c.push_back({"hs", name, CheckResult::Pass,
                   "Post-txn utilization " + util + "%."});
    }
  }

  // ---  TRI ----------------------------------------------------------------
  {
    const std::string name = "Transaction Risk Index";
    const std::string score = std::to_string(tri.score);
    if (tri.score >= config.tri_critical_threshold) {
      c.push_back({"tri", name, CheckResult::Fail,
                   "TRI " + score + " (Red) — board review required."});
    } else if (tri.score >= config.tri_warn_threshold) {
      c.push_back({"tri", name, CheckResult::Warn,
                   "TRI " + score + " (" + toString(tri.band) + ")."});
    } else {
      c.push_back({"tri", name, CheckResult::Pass, "TRI " + score + " (Green)."});
    }
  }

  return c;
}

TransactionPolicyEvaluation evaluateTransaction(
    const Counterparty& cp, const Corridor& corridor, const Hub& hub,
    double amount, const CapitalPosition& capital, const RiskConfig& config,
    std::int64_t now_ms) {
  TransactionPolicyEvaluation e;
  e.tri = computeTri(cp, corridor, amount, capital);
  e.capital = validateCapital(amount, capital);
  e.approval = determineApproval(e.tri.score, amount, config);
  e.blockers =
      checkBlockers(&cp, &corridor, &hub, &e.tri, amount, capital, config);
  e.checks = runComplianceChecks(cp, corridor, hub, e.tri, e.capital, config);
  e.blocked = hasBlockLevel(e.blockers);
  e.evaluated_at_ms = now_ms;
  return e;
}

}  // namespace capguard
