#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace capguard {
namespace domain {

// -----------------------------------------------------------------------------
// Aggregate exposure state supplied by external collaborators
// -----------------------------------------------------------------------------
//
// @brief  Plain data mirrors of the marketplace, inventory and settlement
//         records the snapshot calculator consumes.
//
// @details
// These structs carry only the fields the capital pipeline reads. The
// owning systems (marketplace, settlement desk, treasury) keep the full
// records; an ICapitalStateSource implementation projects them into this
// shape once per evaluation.
//
// Monetary fields are USD as double; weights are troy ounces. Timestamps are
// epoch milliseconds (UTC).
// -----------------------------------------------------------------------------

// Capital base figures published by treasury.
struct CapitalBase {
  double capital_base{0.0};
  double hardstop_limit{0.0};
  double tvar99{0.0};
};

enum class ReservationState {
  Active,
  Expired,
  Converted,
};

struct Reservation {
  std::string id;
  std::string listing_id;
  double weight_oz{0.0};
  double price_per_oz_locked{0.0};
  std::int64_t expires_at_ms{0};
  ReservationState state{ReservationState::Active};
};

enum class OrderStatus {
  Draft,
  PendingVerification,
  Reserved,
  SettlementPending,
  Completed,
  Cancelled,
};

// Marketplace order (not to be confused with an exchange order: these are
// bilateral bullion orders created by converting a reservation).
struct MarketOrder {
  std::string id;
  std::string listing_id;
  double weight_oz{0.0};
  double price_per_oz{0.0};
  double notional{0.0};
  OrderStatus status{OrderStatus::Draft};
};

struct InventoryPosition {
  std::string id;
  std::string listing_id;
  double allocated_weight_oz{0.0};
};

enum class SettlementStatus {
  Draft,
  EscrowOpen,
  AwaitingFunds,
  AwaitingGold,
  AwaitingVerification,
  ReadyToSettle,
  Authorized,
  Settled,
  Failed,
  Cancelled,
};

struct SettlementCase {
  std::string id;
  double weight_oz{0.0};
  double notional_usd{0.0};
  SettlementStatus status{SettlementStatus::Draft};
  std::int64_t updated_at_ms{0};
};

// Everything the snapshot calculator needs for one evaluation.
struct CapitalInputs {
  CapitalBase capital;
  std::vector<Reservation> reservations;
  std::vector<MarketOrder> orders;
  std::vector<InventoryPosition> inventory;
  std::vector<SettlementCase> settlements;
  std::int64_t now_ms{0};
};

}  // namespace domain
}  // namespace capguard
