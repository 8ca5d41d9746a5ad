#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace capguard {
namespace domain {

// -----------------------------------------------------------------------------
// Counterparty / corridor / hub records (external collaborators)
// -----------------------------------------------------------------------------

enum class RiskLevel {
  Low,
  Medium,
  High,
  Critical,
};

enum class EntityStatus {
  Active,
  Pending,
  UnderReview,
  Closed,
  Suspended,
};

enum class CorridorStatus {
  Active,
  Restricted,
  Suspended,
};

enum class HubStatus {
  Operational,
  Degraded,
  Maintenance,
  Offline,
};

struct Counterparty {
  std::string id;
  std::string entity;
  RiskLevel risk_level{RiskLevel::Low};
  EntityStatus status{EntityStatus::Active};
};

struct Corridor {
  std::string id;
  std::string name;
  RiskLevel risk_level{RiskLevel::Low};
  CorridorStatus status{CorridorStatus::Active};
};

struct Hub {
  std::string id;
  std::string name;
  HubStatus status{HubStatus::Operational};
  double uptime_pct{100.0};
};

// Dashboard-level capital figures used at transaction-creation time.
struct CapitalPosition {
  double capital_base{0.0};
  double active_exposure{0.0};
  double hardstop_limit{0.0};
};

// -----------------------------------------------------------------------------
// TRIResult: Transaction Risk Index
// -----------------------------------------------------------------------------
//
// score is an integer in [1, 10]. Bands: green <= 3, amber 4..6, red >= 7.
// formula is a human-readable replay of the computation for the audit log.
// -----------------------------------------------------------------------------
enum class TriBand {
  Green,
  Amber,
  Red,
};

struct TriComponent {
  double weight{0.0};
  double raw{0.0};
  double weighted{0.0};
};

struct TriResult {
  int score{1};
  TriBand band{TriBand::Green};
  TriComponent counterparty_risk;
  TriComponent corridor_risk;
  TriComponent amount_concentration;
  TriComponent counterparty_status;
  std::string formula;
};

// Pre/post transaction capital figures.
struct CapitalValidation {
  double current_exposure{0.0};
  double post_txn_exposure{0.0};
  double capital_base{0.0};
  double current_ecr{0.0};
  double post_txn_ecr{0.0};
  double hardstop_limit{0.0};
  double current_hardstop_util{0.0};
  double post_txn_hardstop_util{0.0};
  double hardstop_remaining{0.0};
};

enum class BlockerSeverity {
  Block,
  Warn,
  Info,
};

struct PolicyBlocker {
  std::string id;
  BlockerSeverity severity{BlockerSeverity::Info};
  std::string title;
  std::string detail;
};

// Strictly ordered ladder: Auto < DeskHead < CreditCommittee < Board.
enum class ApprovalTier {
  Auto,
  DeskHead,
  CreditCommittee,
  Board,
};

struct ApprovalResult {
  ApprovalTier tier{ApprovalTier::Board};
  std::string label;
  std::string reason;
};

enum class CheckResult {
  Pass,
  Warn,
  Fail,
};

struct ComplianceCheck {
  std::string id;
  std::string name;
  CheckResult result{CheckResult::Pass};
  std::string detail;
};

// Everything derived for one proposed transaction, frozen at creation time.
struct TransactionPolicyEvaluation {
  TriResult tri;
  CapitalValidation capital;
  ApprovalResult approval;
  std::vector<PolicyBlocker> blockers;
  std::vector<ComplianceCheck> checks;
  bool blocked{false};
  std::int64_t evaluated_at_ms{0};
};

}  // namespace domain
}  // namespace capguard
