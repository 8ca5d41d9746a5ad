#include "capguard/risk/snapshot_calculator.hpp"

#include "capguard/domain/names.hpp"
#include "capguard/time/time_utils.hpp"
#include "capguard/util/number_format.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace capguard {

using namespace domain;

namespace {

double safeRatio(double numerator, double denominator) {
  if (!(denominator > 0.0)) {
    return 0.0;
  }
  double r = numerator / denominator;
  if (!std::isfinite(r) || r < 0.0) {
    return 0.0;
  }
  return r;
}

double floorZero(double v) { return std::isfinite(v) && v > 0.0 ? v : 0.0; }

std::string percent(double ratio) { return formatFixed(ratio * 100.0, 2); }

std::string wholePercent(double ratio) { return formatNumber(ratio * 100.0); }

// ---  Breach classification (step 7) ----------------------------------------
void classify(CapitalSnapshot& s, const RiskConfig& config) {
  const double hu = s.hardstop_utilization;

  if (hu >= config.hardstop_exceeded) {
    s.breach_level = BreachLevel::Breach;
    s.breach_reasons.push_back("Hardstop utilization " + percent(hu) + "% ≥ " +
                               wholePercent(config.hardstop_exceeded) +
                               "% — EXCEEDED");
  } else if (hu >= config.hardstop_breach) {
    s.breach_level = BreachLevel::Breach;
    s.breach_reasons.push_back("Hardstop utilization " + percent(hu) + "% ≥ " +
                               wholePercent(config.hardstop_breach) +
                               "% threshold");
  }

  if (s.breach_level == BreachLevel::Clear) {
    if (hu >= config.hardstop_caution) {
      s.breach_level = BreachLevel::Caution;
      s.breach_reasons.push_back(
          "Hardstop utilization " + percent(hu) + "% in " +
          wholePercent(config.hardstop_caution) + "–" +
          wholePercent(config.hardstop_breach) + "% caution band");
    }
    if (s.ecr >= config.target_ecr) {
      s.breach_level = BreachLevel::Caution;
      s.breach_reasons.push_back("ECR " + formatFixed(s.ecr, 4) +
                                 "x exceeds target " +
                                 formatFixed(config.target_ecr, 1) + "x");
    }
  }

  if (s.buffer_vs_tvar99 < 0.0 && s.breach_level == BreachLevel::Clear) {
    s.breach_level = BreachLevel::Caution;
    s.breach_reasons.push_back("Buffer vs TVaR₉₉ is negative: $" +
                               formatGrouped(std::fabs(s.buffer_vs_tvar99)));
  }
}

// ---  Top drivers (step 8) ---------------------------------------------------
std::vector<ExposureDriver> rankDrivers(const CapitalInputs& in,
                                        const RiskConfig& config) {
  std::vector<ExposureDriver> drivers;

  for (const auto& r : in.reservations) {
    if (r.state != ReservationState::Active) continue;
    drivers.push_back(ExposureDriver{
        "Reservation " + r.id + " (" + formatNumber(r.weight_oz) +
            " oz ACTIVE)",
        r.weight_oz * r.price_per_oz_locked * config.reserve_haircut, r.id,
        DriverKind::Reservation});
  }

  for (const auto& o : in.orders) {
    if (!isLiveOrder(o.status)) continue;
    drivers.push_back(ExposureDriver{
        "Order " + o.id + " (" + formatNumber(o.weight_oz) + " oz " +
            toString(o.status) + ")",
        o.notional, o.id, DriverKind::Order});
  }

  for (const auto& c : in.settlements) {
    if (!isOpenSettlement(c.status)) continue;
    drivers.push_back(ExposureDriver{
        "Settlement " + c.id + " (" + formatNumber(c.weight_oz) + " oz " +
            toString(c.status) + ")",
        c.notional_usd, c.id, DriverKind::Settlement});
  }

  // Stable: equal values keep input order (reservations, orders, settlements).
  std::stable_sort(drivers.begin(), drivers.end(),
                   [](const ExposureDriver& a, const ExposureDriver& b) {
                     return a.value > b.value;
                   });

  const auto keep = static_cast<std::size_t>(
      std::max<std::int32_t>(0, config.top_driver_count));
  if (drivers.size() > keep) {
    drivers.resize(keep);
  }
  return drivers;
}

}  // namespace

bool isOpenSettlement(SettlementStatus status) {
  switch (status) {
    case SettlementStatus::EscrowOpen:
    case SettlementStatus::AwaitingFunds:
    case SettlementStatus::AwaitingGold:
    case SettlementStatus::AwaitingVerification:
    case SettlementStatus::ReadyToSettle:
    case SettlementStatus::Authorized:
      return true;
    case SettlementStatus::Draft:
    case SettlementStatus::Settled:
    case SettlementStatus::Failed:
    case SettlementStatus::Cancelled:
      return false;
  }
  return false;
}

bool isLiveOrder(OrderStatus status) {
  return status != OrderStatus::Completed && status != OrderStatus::Cancelled;
}

CapitalInputs expireLapsedReservations(CapitalInputs inputs) {
  for (auto& r : inputs.reservations) {
    if (r.state == ReservationState::Active && r.expires_at_ms <= inputs.now_ms) {
      r.state = ReservationState::Expired;
    }
  }
  return inputs;
}

CapitalSnapshot computeCapitalSnapshot(const CapitalInputs& in,
                                       const RiskConfig& config) {
  CapitalSnapshot s;
  s.as_of_ms = in.now_ms;
  s.capital_base = in.capital.capital_base;
  s.hardstop_limit = in.capital.hardstop_limit;

  // ---  1) Reserved notional ------------------------------------------------
  double reserved = 0.0;
  double converted = 0.0;
  std::unordered_map<std::string, double> converted_oz_by_listing;
  for (const auto& r : in.reservations) {
    const double notional = r.weight_oz * r.price_per_oz_locked;
    if (r.state == ReservationState::Active) {
      reserved += notional;
    } else if (r.state == ReservationState::Converted) {
      converted += notional;
      converted_oz_by_listing[r.listing_id] += r.weight_oz;
    }
  }

  // ---  2) Allocated notional -----------------------------------------------
  std::unordered_map<std::string, std::pair<double, int>> price_by_listing;
  for (const auto& o : in.orders) {
    auto& acc = price_by_listing[o.listing_id];
    acc.first += o.price_per_oz;
    acc.second += 1;
  }

  double allocated = converted;
  for (const auto& inv : in.inventory) {
    if (!(inv.allocated_weight_oz > 0.0)) continue;
    auto it = price_by_listing.find(inv.listing_id);
    if (it == price_by_listing.end() || it->second.second == 0) continue;

    const double avg_price = it->second.first / it->second.second;
    double covered = 0.0;
    auto c = converted_oz_by_listing.find(inv.listing_id);
    if (c != converted_oz_by_listing.end()) {
      covered = c->second;
    }
    allocated += std::max(0.0, inv.allocated_weight_oz - covered) * avg_price;
  }

  // ---  3) Settlement notional ----------------------------------------------
  const std::int64_t today = utcDayIndex(in.now_ms);
  double open = 0.0;
  double settled_today = 0.0;
  for (const auto& c : in.settlements) {
    if (isOpenSettlement(c.status)) {
      open += c.notional_usd;
    }
    if (c.status == SettlementStatus::Settled &&
        utcDayIndex(c.updated_at_ms) == today) {
      settled_today += c.notional_usd;
    }
  }

  s.reserved_notional = floorZero(reserved);
  s.allocated_notional = floorZero(allocated);
  s.settlement_notional_open = floorZero(open);
  s.settled_notional_today = floorZero(settled_today);

  // ---  4-6) Gross exposure, ratios, buffer ---------------------------------
  s.gross_exposure_notional =
      s.allocated_notional + s.settlement_notional_open +
      s.reserved_notional * config.reserve_haircut;

  s.ecr = safeRatio(s.gross_exposure_notional, s.capital_base);
  s.hardstop_utilization =
      safeRatio(s.gross_exposure_notional, s.hardstop_limit);

  s.buffer_vs_tvar99 = s.capital_base - in.capital.tvar99 -
                       s.gross_exposure_notional * config.tvar_addon_factor;

  // ---  7) Breach level -----------------------------------------------------
  classify(s, config);

  // ---  8) Top drivers ------------------------------------------------------
  s.top_drivers = rankDrivers(in, config);

  return s;
}

}  // namespace capguard
