#include "capguard/serialization/json_codec.hpp"

#include "capguard/domain/names.hpp"
#include "capguard/time/time_utils.hpp"

#include <optional>
#include <string_view>

namespace capguard {

using nlohmann::json;

namespace {

template <typename E>
E enumFromJson(const json& j, std::optional<E> (*parse)(std::string_view),
               const char* what) {
  const auto& name = j.get_ref<const std::string&>();
  auto value = parse(name);
  if (!value) {
    throw CodecError(std::string("unknown ") + what + ": \"" + name + "\"");
  }
  return *value;
}

json optionalNumber(const std::optional<double>& v) {
  return v ? json(*v) : json(nullptr);
}

// Optional string member; absent and null both read as "".
std::string stringOr(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return {};
  }
  return it->get<std::string>();
}

}  // namespace

json timestampToJson(std::int64_t epoch_ms) { return formatIso8601(epoch_ms); }

std::int64_t timestampFromJson(const json& j) {
  if (j.is_number_integer()) {
    return j.get<std::int64_t>();
  }
  const auto& text = j.get_ref<const std::string&>();
  auto ms = parseIso8601(text);
  if (!ms) {
    throw CodecError("invalid timestamp: \"" + text + "\"");
  }
  return *ms;
}

namespace domain {

// -----------------------------------------------------------------------------
// Snapshot and drivers
// -----------------------------------------------------------------------------
void to_json(json& j, const ExposureDriver& d) {
  j = json{{"label", d.label},
           {"value", d.value},
           {"kind", toString(d.kind)}};
  j["id"] = d.id.empty() ? json(nullptr) : json(d.id);
}

void from_json(const json& j, ExposureDriver& d) {
  d.label = j.at("label").get<std::string>();
  d.value = j.at("value").get<double>();
  d.id = stringOr(j, "id");
  d.kind = enumFromJson(j.at("kind"), &parseDriverKind, "driver kind");
}

void to_json(json& j, const CapitalSnapshot& s) {
  j = json{{"as_of", timestampToJson(s.as_of_ms)},
           {"capital_base", s.capital_base},
           {"hardstop_limit", s.hardstop_limit},
           {"gross_exposure_notional", s.gross_exposure_notional},
           {"reserved_notional", s.reserved_notional},
           {"allocated_notional", s.allocated_notional},
           {"settlement_notional_open", s.settlement_notional_open},
           {"settled_notional_today", s.settled_notional_today},
           {"ecr", s.ecr},
           {"hardstop_utilization", s.hardstop_utilization},
           {"buffer_vs_tvar99", s.buffer_vs_tvar99},
           {"breach_level", toString(s.breach_level)},
           {"breach_reasons", s.breach_reasons},
           {"top_drivers", s.top_drivers}};
}

void from_json(const json& j, CapitalSnapshot& s) {
  s.as_of_ms = timestampFromJson(j.at("as_of"));
  s.capital_base = j.at("capital_base").get<double>();
  s.hardstop_limit = j.at("hardstop_limit").get<double>();
  s.gross_exposure_notional = j.at("gross_exposure_notional").get<double>();
  s.reserved_notional = j.at("reserved_notional").get<double>();
  s.allocated_notional = j.at("allocated_notional").get<double>();
  s.settlement_notional_open = j.at("settlement_notional_open").get<double>();
  s.settled_notional_today = j.at("settled_notional_today").get<double>();
  s.ecr = j.at("ecr").get<double>();
  s.hardstop_utilization = j.at("hardstop_utilization").get<double>();
  s.buffer_vs_tvar99 = j.at("buffer_vs_tvar99").get<double>();
  s.breach_level =
      enumFromJson(j.at("breach_level"), &parseBreachLevel, "breach level");
  s.breach_reasons = j.at("breach_reasons").get<std::vector<std::string>>();
  s.top_drivers = j.at("top_drivers").get<std::vector<ExposureDriver>>();
}

// -----------------------------------------------------------------------------
// Breach events
// -----------------------------------------------------------------------------
void to_json(json& j, const BreachEvent& e) {
  j = json{{"id", e.id},
           {"occurred_at", timestampToJson(e.occurred_at_ms)},
           {"type", toString(e.type)},
           {"level", toString(e.level)},
           {"message", e.message},
           {"snapshot", e.snapshot}};
}

void from_json(const json& j, BreachEvent& e) {
  e.id = j.at("id").get<std::string>();
  e.occurred_at_ms = timestampFromJson(j.at("occurred_at"));
  e.type = enumFromJson(j.at("type"), &parseBreachEventType, "breach type");
  e.level = enumFromJson(j.at("level"), &parseAlertLevel, "alert level");
  e.message = j.at("message").get<std::string>();
  e.snapshot = j.at("snapshot").get<CapitalSnapshot>();
}

// -----------------------------------------------------------------------------
// Control decision
// -----------------------------------------------------------------------------
void to_json(json& j, const BlockMatrix& b) {
  j = json::object();
  for (ActionKey k : kAllActionKeys) {
    j[toString(k)] = b.blocked(k);
  }
}

void to_json(json& j, const ControlDecision& d) {
  j = json{{"as_of", timestampToJson(d.as_of_ms)},
           {"mode", toString(d.mode)},
           {"reasons", d.reasons},
           {"blocks", d.blocks},
           {"limits",
            {{"max_reservation_notional",
              optionalNumber(d.limits.max_reservation_notional)},
             {"max_reservation_weight_oz",
              optionalNumber(d.limits.max_reservation_weight_oz)}}},
           {"snapshot_hash", d.snapshot_hash}};
}

// -----------------------------------------------------------------------------
// Overrides
// -----------------------------------------------------------------------------
void to_json(json& j, const CapitalOverride& o) {
  auto action = scopedAction(o.scope);
  j = json{{"id", o.id},
           {"scope", scopeName(o.scope)},
           {"action_key", action ? json(toString(*action)) : json(nullptr)},
           {"reason", o.reason},
           {"created_at", timestampToJson(o.created_at_ms)},
           {"expires_at", timestampToJson(o.expires_at_ms)},
           {"revoked_at", o.revoked_at_ms ? timestampToJson(*o.revoked_at_ms)
                                          : json(nullptr)},
           {"status", toString(o.status)},
           {"actor_role", o.actor_role},
           {"actor_user_id", o.actor_user_id},
           {"actor_name", o.actor_name},
           {"snapshot_hash", o.snapshot_hash},
           {"mode_at_creation", toString(o.mode_at_creation)}};
}

void from_json(const json& j, CapitalOverride& o) {
  o.id = j.at("id").get<std::string>();

  const auto& scope = j.at("scope").get_ref<const std::string&>();
  if (scope == "GLOBAL") {
    o.scope = GlobalScope{};
  } else if (scope == "ACTION") {
    auto it = j.find("action_key");
    if (it == j.end() || it->is_null()) {
      throw CodecError("override " + o.id + ": ACTION scope without action_key");
    }
    o.scope = ActionScope{enumFromJson(*it, &parseActionKey, "action key")};
  } else {
    throw CodecError("unknown override scope: \"" + scope + "\"");
  }

  o.reason = j.at("reason").get<std::string>();
  o.created_at_ms = timestampFromJson(j.at("created_at"));
  o.expires_at_ms = timestampFromJson(j.at("expires_at"));
  auto revoked = j.find("revoked_at");
  if (revoked != j.end() && !revoked->is_null()) {
    o.revoked_at_ms = timestampFromJson(*revoked);
  } else {
    o.revoked_at_ms.reset();
  }
  o.status = enumFromJson(j.at("status"), &parseOverrideStatus,
                          "override status");
  o.actor_role = j.at("actor_role").get<std::string>();
  o.actor_user_id = j.at("actor_user_id").get<std::string>();
  o.actor_name = stringOr(j, "actor_name");
  o.snapshot_hash = stringOr(j, "snapshot_hash");
  o.mode_at_creation = enumFromJson(j.at("mode_at_creation"),
                                    &parseControlMode, "control mode");
}

// -----------------------------------------------------------------------------
// Transaction policy outputs
// -----------------------------------------------------------------------------
namespace {

json componentJson(const TriComponent& c) {
  return json{{"weight", c.weight}, {"raw", c.raw}, {"weighted", c.weighted}};
}

}  // namespace

void to_json(json& j, const TriResult& r) {
  j = json{{"score", r.score},
           {"band", toString(r.band)},
           {"components",
            {{"counterparty_risk", componentJson(r.counterparty_risk)},
             {"corridor_risk", componentJson(r.corridor_risk)},
             {"amount_concentration", componentJson(r.amount_concentration)},
             {"counterparty_status", componentJson(r.counterparty_status)}}},
           {"formula", r.formula}};
}

void to_json(json& j, const CapitalValidation& v) {
  j = json{{"current_exposure", v.current_exposure},
           {"post_txn_exposure", v.post_txn_exposure},
           {"capital_base", v.capital_base},
           {"current_ecr", v.current_ecr},
           {"post_txn_ecr", v.post_txn_ecr},
           {"hardstop_limit", v.hardstop_limit},
           {"current_hardstop_util", v.current_hardstop_util},
           {"post_txn_hardstop_util", v.post_txn_hardstop_util},
           {"hardstop_remaining", v.hardstop_remaining}};
}

void to_json(json& j, const PolicyBlocker& b) {
  j = json{{"id", b.id},
           {"severity", toString(b.severity)},
           {"title", b.title},
           {"detail", b.detail}};
}

void to_json(json& j, const ApprovalResult& a) {
  j = json{{"tier", toString(a.tier)}, {"label", a.label}, {"reason", a.reason}};
}

void to_json(json& j, const ComplianceCheck& c) {
  j = json{{"id", c.id},
           {"name", c.name},
           {"result", toString(c.result)},
           {"detail", c.detail}};
}

void to_json(json& j, const TransactionPolicyEvaluation& e) {
  j = json{{"tri", e.tri},
           {"capital", e.capital},
           {"approval", e.approval},
           {"blockers", e.blockers},
           {"checks", e.checks},
           {"blocked", e.blocked},
           {"evaluated_at", timestampToJson(e.evaluated_at_ms)}};
}

// -----------------------------------------------------------------------------
// Inputs
// -----------------------------------------------------------------------------
void from_json(const json& j, CapitalBase& c) {
  c.capital_base = j.at("capital_base").get<double>();
  c.hardstop_limit = j.at("hardstop_limit").get<double>();
  c.tvar99 = j.at("tvar99").get<double>();
}

void from_json(const json& j, Reservation& r) {
  r.id = j.at("id").get<std::string>();
  r.listing_id = j.at("listing_id").get<std::string>();
  r.weight_oz = j.at("weight_oz").get<double>();
  r.price_per_oz_locked = j.at("price_per_oz_locked").get<double>();
  r.expires_at_ms = timestampFromJson(j.at("expires_at"));
  r.state = enumFromJson(j.at("state"), &parseReservationState,
                         "reservation state");
}

void from_json(const json& j, MarketOrder& o) {
  o.id = j.at("id").get<std::string>();
  o.listing_id = j.at("listing_id").get<std::string>();
  o.weight_oz = j.at("weight_oz").get<double>();
  o.price_per_oz = j.at("price_per_oz").get<double>();
  o.notional = j.at("notional").get<double>();
  o.status = enumFromJson(j.at("status"), &parseOrderStatus, "order status");
}

void from_json(const json& j, InventoryPosition& p) {
  p.id = j.at("id").get<std::string>();
  p.listing_id = j.at("listing_id").get<std::string>();
  p.allocated_weight_oz = j.at("allocated_weight_oz").get<double>();
}

void from_json(const json& j, SettlementCase& c) {
  c.id = j.at("id").get<std::string>();
  c.weight_oz = j.at("weight_oz").get<double>();
  c.notional_usd = j.at("notional_usd").get<double>();
  c.status = enumFromJson(j.at("status"), &parseSettlementStatus,
                          "settlement status");
  c.updated_at_ms = timestampFromJson(j.at("updated_at"));
}

void from_json(const json& j, CapitalInputs& in) {
  in.capital = j.at("capital").get<CapitalBase>();
  in.reservations = j.value("reservations", json::array())
                        .get<std::vector<Reservation>>();
  in.orders = j.value("orders", json::array()).get<std::vector<MarketOrder>>();
  in.inventory = j.value("inventory", json::array())
                     .get<std::vector<InventoryPosition>>();
  in.settlements = j.value("settlements", json::array())
                       .get<std::vector<SettlementCase>>();
}

void from_json(const json& j, Counterparty& c) {
  c.id = j.at("id").get<std::string>();
  c.entity = stringOr(j, "entity");
  c.risk_level = enumFromJson(j.at("risk_level"), &parseRiskLevel,
                              "risk level");
  c.status = enumFromJson(j.at("status"), &parseEntityStatus,
                          "counterparty status");
}

void from_json(const json& j, Corridor& c) {
  c.id = j.at("id").get<std::string>();
  c.name = stringOr(j, "name");
  c.risk_level = enumFromJson(j.at("risk_level"), &parseRiskLevel,
                              "risk level");
  c.status = enumFromJson(j.at("status"), &parseCorridorStatus,
                          "corridor status");
}

void from_json(const json& j, Hub& h) {
  h.id = j.at("id").get<std::string>();
  h.name = stringOr(j, "name");
  h.status = enumFromJson(j.at("status"), &parseHubStatus, "hub status");
  h.uptime_pct = j.value("uptime_pct", 100.0);
}

void from_json(const json& j, CapitalPosition& p) {
  p.capital_base = j.at("capital_base").get<double>();
  p.active_exposure = j.at("active_exposure").get<double>();
  p.hardstop_limit = j.at("hardstop_limit").get<double>();
}

}  // namespace domain
}  // namespace capguard
