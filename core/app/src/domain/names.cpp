#include "capguard/domain/names.hpp"

#include <initializer_list>

namespace capguard {
namespace domain {

namespace {

// Linear scan over the candidate values; every enum here has < 12 members.
template <typename E>
std::optional<E> parseByName(std::string_view s, std::initializer_list<E> all) {
  for (E v : all) {
    if (s == toString(v)) {
      return v;
    }
  }
  return std::nullopt;
}

}  // namespace

const char* toString(BreachLevel v) {
  switch (v) {
    case BreachLevel::Clear:   return "CLEAR";
    case BreachLevel::Caution: return "CAUTION";
    case BreachLevel::Breach:  return "BREACH";
  }
  return "UNKNOWN";
}

const char* toString(DriverKind v) {
  switch (v) {
    case DriverKind::Reservation: return "RESERVATION";
    case DriverKind::Order:       return "ORDER";
    case DriverKind::Settlement:  return "SETTLEMENT";
  }
  return "UNKNOWN";
}

const char* toString(BreachEventType v) {
  switch (v) {
    case BreachEventType::EcrCaution:      return "ECR_CAUTION";
    case BreachEventType::EcrBreach:       return "ECR_BREACH";
    case BreachEventType::HardstopCaution: return "HARDSTOP_CAUTION";
    case BreachEventType::HardstopBreach:  return "HARDSTOP_BREACH";
    case BreachEventType::BufferNegative:  return "BUFFER_NEGATIVE";
  }
  return "UNKNOWN";
}

const char* toString(AlertLevel v) {
  switch (v) {
    case AlertLevel::Info:     return "INFO";
    case AlertLevel::Warn:     return "WARN";
    case AlertLevel::Critical: return "CRITICAL";
  }
  return "UNKNOWN";
}

const char* toString(ControlMode v) {
  switch (v) {
    case ControlMode::Normal:               return "NORMAL";
    case ControlMode::ThrottleReservations: return "THROTTLE_RESERVATIONS";
    case ControlMode::FreezeConversions:    return "FREEZE_CONVERSIONS";
    case ControlMode::FreezeMarketplace:    return "FREEZE_MARKETPLACE";
    case ControlMode::EmergencyHalt:        return "EMERGENCY_HALT";
  }
  return "UNKNOWN";
}

const char* toString(ActionKey v) {
  switch (v) {
    case ActionKey::CreateReservation:  return "CREATE_RESERVATION";
    case ActionKey::ConvertReservation: return "CONVERT_RESERVATION";
    case ActionKey::PublishListing:     return "PUBLISH_LISTING";
    case ActionKey::OpenSettlement:     return "OPEN_SETTLEMENT";
    case ActionKey::ExecuteDvp:         return "EXECUTE_DVP";
  }
  return "UNKNOWN";
}

const char* toString(OverrideStatus v) {
  switch (v) {
    case OverrideStatus::Active:  return "ACTIVE";
    case OverrideStatus::Expired: return "EXPIRED";
    case OverrideStatus::Revoked: return "REVOKED";
  }
  return "UNKNOWN";
}

const char* toString(ReservationState v) {
  switch (v) {
    case ReservationState::Active:    return "ACTIVE";
    case ReservationState::Expired:   return "EXPIRED";
    case ReservationState::Converted: return "CONVERTED";
  }
  return "UNKNOWN";
}

const char* toString(OrderStatus v) {
  switch (v) {
    case OrderStatus::Draft:               return "draft";
    case OrderStatus::PendingVerification: return "pending_verification";
    case OrderStatus::Reserved:            return "reserved";
    case OrderStatus::SettlementPending:   return "settlement_pending";
    case OrderStatus::Completed:           return "completed";
    case OrderStatus::Cancelled:           return "cancelled";
  }
  return "unknown";
}

const char* toString(SettlementStatus v) {
  switch (v) {
    case SettlementStatus::Draft:                return "DRAFT";
    case SettlementStatus::EscrowOpen:           return "ESCROW_OPEN";
    case SettlementStatus::AwaitingFunds:        return "AWAITING_FUNDS";
    case SettlementStatus::AwaitingGold:         return "AWAITING_GOLD";
    case SettlementStatus::AwaitingVerification: return "AWAITING_VERIFICATION";
    case SettlementStatus::ReadyToSettle:        return "READY_TO_SETTLE";
    case SettlementStatus::Authorized:           return "AUTHORIZED";
    case SettlementStatus::Settled:              return "SETTLED";
    case SettlementStatus::Failed:               return "FAILED";
    case SettlementStatus::Cancelled:            return "CANCELLED";
  }
  return "UNKNOWN";
}

const char* toString(RiskLevel v) {
  switch (v) {
    case RiskLevel::Low:      return "low";
    case RiskLevel::Medium:   return "medium";
    case RiskLevel::High:     return "high";
    case RiskLevel::Critical: return "critical";
  }
  return "unknown";
}

const char* toString(EntityStatus v) {
  switch (v) {
    case EntityStatus::Active:      return "active";
    case EntityStatus::Pending:     return "pending";
    case EntityStatus::UnderReview: return "under-review";
    case EntityStatus::Closed:      return "closed";
    case EntityStatus::Suspended:   return "suspended";
  }
  return "unknown";
}

const char* toString(CorridorStatus v) {
  switch (v) {
    case CorridorStatus::Active:     return "active";
    case CorridorStatus::Restricted: return "restricted";
    case CorridorStatus::Suspended:  return "suspended";
  }
  return "unknown";
}

const char* toString(HubStatus v) {
  switch (v) {
    case HubStatus::Operational: return "operational";
    case HubStatus::Degraded:    return "degraded";
    case HubStatus::Maintenance: return "maintenance";
    case HubStatus::Offline:     return "offline";
  }
  return "unknown";
}

const char* toString(TriBand v) {
  switch (v) {
    case TriBand::Green: return "green";
    case TriBand::Amber: return "amber";
    case TriBand::Red:   return "red";
  }
  return "unknown";
}

const char* toString(BlockerSeverity v) {
  switch (v) {
    case BlockerSeverity::Block: return "BLOCK";
    case BlockerSeverity::Warn:  return "WARN";
    case BlockerSeverity::Info:  return "INFO";
  }
  return "UNKNOWN";
}

const char* toString(ApprovalTier v) {
  switch (v) {
    case ApprovalTier::Auto:            return "auto";
    case ApprovalTier::DeskHead:        return "desk-head";
    case ApprovalTier::CreditCommittee: return "credit-committee";
    case ApprovalTier::Board:           return "board";
  }
  return "unknown";
}

const char* toString(CheckResult v) {
  switch (v) {
    case CheckResult::Pass: return "PASS";
    case CheckResult::Warn: return "WARN";
    case CheckResult::Fail: return "FAIL";
  }
  return "UNKNOWN";
}

const char* scopeName(const OverrideScope& scope) {
  return isGlobal(scope) ? "GLOBAL" : "ACTION";
}

std::optional<BreachLevel> parseBreachLevel(std::string_view s) {
  return parseByName(s, {BreachLevel::Clear, BreachLevel::Caution,
                         BreachLevel::Breach});
}

std::optional<DriverKind> parseDriverKind(std::string_view s) {
  return parseByName(s, {DriverKind::Reservation, DriverKind::Order,
                         DriverKind::Settlement});
}

std::optional<BreachEventType> parseBreachEventType(std::string_view s) {
  return parseByName(
      s, {BreachEventType::EcrCaution, BreachEventType::EcrBreach,
          BreachEventType::HardstopCaution, BreachEventType::HardstopBreach,
          BreachEventType::BufferNegative});
}

std::optional<AlertLevel> parseAlertLevel(std::string_view s) {
  return parseByName(s,
                     {AlertLevel::Info, AlertLevel::Warn, AlertLevel::Critical});
}

std::optional<ControlMode> parseControlMode(std::string_view s) {
  return parseByName(
      s, {ControlMode::Normal, ControlMode::ThrottleReservations,
          ControlMode::FreezeConversions, ControlMode::FreezeMarketplace,
          ControlMode::EmergencyHalt});
}

std::optional<ActionKey> parseActionKey(std::string_view s) {
  for (ActionKey k : kAllActionKeys) {
    if (s == toString(k)) {
      return k;
    }
  }
  return std::nullopt;
}

std::optional<OverrideStatus> parseOverrideStatus(std::string_view s) {
  return parseByName(s, {OverrideStatus::Active, OverrideStatus::Expired,
                         OverrideStatus::Revoked});
}

std::optional<ReservationState> parseReservationState(std::string_view s) {
  return parseByName(s, {ReservationState::Active, ReservationState::Expired,
                         ReservationState::Converted});
}

std::optional<OrderStatus> parseOrderStatus(std::string_view s) {
  return parseByName(
      s, {OrderStatus::Draft, OrderStatus::PendingVerification,
          OrderStatus::Reserved, OrderStatus::SettlementPending,
          OrderStatus::Completed, OrderStatus::Cancelled});
}

std::optional<SettlementStatus> parseSettlementStatus(std::string_view s) {
  return parseByName(
      s, {SettlementStatus::Draft, SettlementStatus::EscrowOpen,
          SettlementStatus::AwaitingFunds, SettlementStatus::AwaitingGold,
          SettlementStatus::AwaitingVerification,
          SettlementStatus::ReadyToSettle, SettlementStatus::Authorized,
          SettlementStatus::Settled, SettlementStatus::Failed,
          SettlementStatus::Cancelled});
}

std::optional<RiskLevel> parseRiskLevel(std::string_view s) {
  return parseByName(s, {RiskLevel::Low, RiskLevel::Medium, RiskLevel::High,
                         RiskLevel::Critical});
}

std::optional<EntityStatus> parseEntityStatus(std::string_view s) {
  return parseByName(s, {EntityStatus::Active, EntityStatus::Pending,
                         EntityStatus::UnderReview, EntityStatus::Closed,
                         EntityStatus::Suspended});
}

std::optional<CorridorStatus> parseCorridorStatus(std::string_view s) {
  return parseByName(s, {CorridorStatus::Active, CorridorStatus::Restricted,
                         CorridorStatus::Suspended});
}

std::optional<HubStatus> parseHubStatus(std::string_view s) {
  return parseByName(s, {HubStatus::Operational, HubStatus::Degraded,
                         HubStatus::Maintenance, HubStatus::Offline});
}

}  // namespace domain
}  // namespace capguard
