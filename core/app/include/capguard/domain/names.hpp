#pragma once

#include "capguard/domain/breach_event.hpp"
#include "capguard/domain/capital_inputs.hpp"
#include "capguard/domain/capital_override.hpp"
#include "capguard/domain/capital_snapshot.hpp"
#include "capguard/domain/control_decision.hpp"
#include "capguard/domain/transaction_policy.hpp"

#include <optional>
#include <string_view>

namespace capguard {
namespace domain {

// -----------------------------------------------------------------------------
// Canonical wire names for every domain enum
// -----------------------------------------------------------------------------
//
// toString() returns the name used in reasons, audit records, JSON files and
// gateway messages (e.g. "FREEZE_MARKETPLACE", "CREATE_RESERVATION").
// The parse*() functions are the exact inverse and return nullopt for any
// unknown spelling; they never guess.
// -----------------------------------------------------------------------------

const char* toString(BreachLevel v);
const char* toString(DriverKind v);
const char* toString(BreachEventType v);
const char* toString(AlertLevel v);
const char* toString(ControlMode v);
const char* toString(ActionKey v);
const char* toString(OverrideStatus v);
const char* toString(ReservationState v);
const char* toString(OrderStatus v);
const char* toString(SettlementStatus v);
const char* toString(RiskLevel v);
const char* toString(EntityStatus v);
const char* toString(CorridorStatus v);
const char* toString(HubStatus v);
const char* toString(TriBand v);
const char* toString(BlockerSeverity v);
const char* toString(ApprovalTier v);
const char* toString(CheckResult v);

// "GLOBAL" or "ACTION".
const char* scopeName(const OverrideScope& scope);

std::optional<BreachLevel> parseBreachLevel(std::string_view s);
std::optional<DriverKind> parseDriverKind(std::string_view s);
std::optional<BreachEventType> parseBreachEventType(std::string_view s);
std::optional<AlertLevel> parseAlertLevel(std::string_view s);
std::optional<ControlMode> parseControlMode(std::string_view s);
std::optional<ActionKey> parseActionKey(std::string_view s);
std::optional<OverrideStatus> parseOverrideStatus(std::string_view s);
std::optional<ReservationState> parseReservationState(std::string_view s);
std::optional<OrderStatus> parseOrderStatus(std::string_view s);
std::optional<SettlementStatus> parseSettlementStatus(std::string_view s);
std::optional<RiskLevel> parseRiskLevel(std::string_view s);
std::optional<EntityStatus> parseEntityStatus(std::string_view s);
std::optional<CorridorStatus> parseCorridorStatus(std::string_view s);
std::optional<HubStatus> parseHubStatus(std::string_view s);

}  // namespace domain
}  // namespace capguard
