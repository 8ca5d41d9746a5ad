#pragma once

#include "capguard/domain/breach_event.hpp"
#include "capguard/domain/capital_inputs.hpp"
#include "capguard/domain/capital_override.hpp"
#include "capguard/domain/capital_snapshot.hpp"
#include "capguard/domain/control_decision.hpp"
#include "capguard/domain/transaction_policy.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace capguard {

// -----------------------------------------------------------------------------
// JSON codec for domain types
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json adapters (ADL to_json / from_json) used by the file
//         stores, the state source, the control gateway and export packets.
//
// @details
// Keys are snake_case. Timestamps are written as ISO-8601 UTC strings and
// read back from either an ISO string or an integer of epoch milliseconds.
// Enums travel by their canonical names (see names.hpp).
//
// Decoding errors surface as nlohmann::json::exception (missing key, wrong
// type) or CodecError (unknown enum name, bad timestamp, ACTION scope
// without an action key). Callers at an I/O boundary catch both.
// -----------------------------------------------------------------------------
class CodecError : public std::runtime_error {
 public:
  explicit CodecError(const std::string& what) : std::runtime_error(what) {}
};

nlohmann::json timestampToJson(std::int64_t epoch_ms);
std::int64_t timestampFromJson(const nlohmann::json& j);

namespace domain {

// --- Outputs and persisted records ------------------------------------------
void to_json(nlohmann::json& j, const ExposureDriver& d);
void from_json(const nlohmann::json& j, ExposureDriver& d);

void to_json(nlohmann::json& j, const CapitalSnapshot& s);
void from_json(const nlohmann::json& j, CapitalSnapshot& s);

void to_json(nlohmann::json& j, const BreachEvent& e);
void from_json(const nlohmann::json& j, BreachEvent& e);

void to_json(nlohmann::json& j, const BlockMatrix& b);
void to_json(nlohmann::json& j, const ControlDecision& d);

void to_json(nlohmann::json& j, const CapitalOverride& o);
void from_json(const nlohmann::json& j, CapitalOverride& o);

void to_json(nlohmann::json& j, const TriResult& r);
void to_json(nlohmann::json& j, const CapitalValidation& v);
void to_json(nlohmann::json& j, const PolicyBlocker& b);
void to_json(nlohmann::json& j, const ApprovalResult& a);
void to_json(nlohmann::json& j, const ComplianceCheck& c);
void to_json(nlohmann::json& j, const TransactionPolicyEvaluation& e);

// --- Inputs from collaborators ------------------------------------------------
void from_json(const nlohmann::json& j, CapitalBase& c);
void from_json(const nlohmann::json& j, Reservation& r);
void from_json(const nlohmann::json& j, MarketOrder& o);
void from_json(const nlohmann::json& j, InventoryPosition& p);
void from_json(const nlohmann::json& j, SettlementCase& c);
void from_json(const nlohmann::json& j, CapitalInputs& in);

void from_json(const nlohmann::json& j, Counterparty& c);
void from_json(const nlohmann::json& j, Corridor& c);
void from_json(const nlohmann::json& j, Hub& h);
void from_json(const nlohmann::json& j, CapitalPosition& p);

}  // namespace domain
}  // namespace capguard
