#include "capguard/engine/capital_control_engine.hpp"

#include "capguard/domain/names.hpp"
#include "capguard/risk/breach_classifier.hpp"
#include "capguard/risk/control_mode_evaluator.hpp"
#include "capguard/risk/fingerprint.hpp"
#include "capguard/risk/snapshot_calculator.hpp"
#include "capguard/risk/transaction_risk_scorer.hpp"
#include "capguard/serialization/json_codec.hpp"
#include "capguard/store/store_error.hpp"
#include "capguard/time/time_utils.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

namespace capguard {

using namespace domain;
using nlohmann::json;

namespace {

constexpr int kExportPacketVersion = 2;
constexpr std::size_t kExportInactiveOverrides = 10;

std::string joinReasons(const std::vector<std::string>& reasons) {
  std::string out;
  for (const auto& r : reasons) {
    if (!out.empty()) out += "; ";
    out += r;
  }
  return out;
}

ActorContext actorFrom(const json& request) {
  ActorContext actor;
  auto it = request.find("actor");
  if (it == request.end() || it->is_null()) {
    return actor;
  }
  actor.role = it->value("role", "");
  actor.user_id = it->value("user_id", "");
  actor.name = it->value("name", "");
  return actor;
}

ActionKey actionFrom(const json& value) {
  const auto& name = value.get_ref<const std::string&>();
  auto key = parseActionKey(name);
  if (!key) {
    throw CodecError("unknown action key: \"" + name + "\"");
  }
  return *key;
}

json errorResponse(const std::string& message) {
  return json{{"status", "error"}, {"error", message}};
}

json errorResponse(const std::vector<std::string>& errors,
                   const std::string& message) {
  json j = errorResponse(message);
  j["errors"] = errors;
  return j;
}

std::int64_t inactiveSortKey(const CapitalOverride& o) {
  return o.revoked_at_ms ? *o.revoked_at_ms : o.expires_at_ms;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
CapitalControlEngine::CapitalControlEngine(
    const ICapitalStateSource& state, IBreachStore& breaches,
    IOverrideStore& overrides, RiskConfigProvider& config,
    const ITimeProvider& time, std::string ipc_cmd_endpoint,
    std::string ipc_pub_endpoint)
    : state_(state),
      breaches_(breaches),
      overrides_(overrides),
      config_(config),
      time_(time),
      ipc_cmd_endpoint_(std::move(ipc_cmd_endpoint)),
      ipc_pub_endpoint_(std::move(ipc_pub_endpoint)),
      audit_(bus_),
      governor_(overrides_, audit_) {}

CapitalControlEngine::~CapitalControlEngine() { stop(); }

// -----------------------------------------------------------------------------
// start() / stop()
// -----------------------------------------------------------------------------
void CapitalControlEngine::start() {
  if (running_) {
    return;
  }

  if (!ipc_cmd_endpoint_.empty() && !ipc_pub_endpoint_.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        ipc_cmd_endpoint_, ipc_pub_endpoint_);

    // Telemetry bridge: every audit event goes out on the PUB socket.
    IpcServer* server = ipc_server_.get();
    telemetry_subscription_ =
        bus_.subscribe([server](const Event& e) { server->pushTelemetry(e); });

    ipc_server_->start();
  }

  running_ = true;

  std::cout << "[CapitalControlEngine] started"
            << (ipc_server_ ? " with control gateway" : "") << ".\n";
}

void CapitalControlEngine::stop() {
  if (!running_) {
    return;
  }

  // Join the gateway thread before dropping the bridge it publishes through.
  if (ipc_server_) {
    ipc_server_->stop();
    bus_.unsubscribe(telemetry_subscription_);
    ipc_server_.reset();
  }

  running_ = false;

  std::cout << "[CapitalControlEngine] stopped.\n";
}

// -----------------------------------------------------------------------------
// Snapshot and decision
// -----------------------------------------------------------------------------
CapitalSnapshot CapitalControlEngine::snapshotAt(std::int64_t now_ms,
                                                 const RiskConfig& config) const {
  CapitalInputs inputs = state_.load();
  inputs.now_ms = now_ms;
  return computeCapitalSnapshot(expireLapsedReservations(std::move(inputs)),
                                config);
}

std::vector<BreachEvent> CapitalControlEngine::recentBreaches(
    std::int64_t now_ms, const RiskConfig& config) const {
  try {
    return breaches_.since(now_ms - config.buffer_negative_lookback_ms);
  } catch (const StoreUnavailableError& e) {
    std::cerr << "[CapitalControlEngine] breach history unavailable, "
                 "evaluating on snapshot alone: "
              << e.what() << "\n";
    return {};
  }
}

ControlDecision CapitalControlEngine::decisionAt(std::int64_t now_ms,
                                                 const RiskConfig& config) {
  CapitalSnapshot snap;
  try {
    snap = snapshotAt(now_ms, config);
  } catch (const std::exception& e) {
    std::cerr << "[CapitalControlEngine] snapshot failed, failing closed to "
                 "EMERGENCY_HALT: "
              << e.what() << "\n";
    return unavailableDecision(now_ms);
  }
  return decisionFor(snap, now_ms, config);
}

ControlDecision CapitalControlEngine::decisionFor(const CapitalSnapshot& snap,
                                                  std::int64_t now_ms,
                                                  const RiskConfig& config) {
  try {
    return evaluateControlMode(snap, recentBreaches(now_ms, config), config);
  } catch (const std::exception& e) {
    std::cerr << "[CapitalControlEngine] decision failed, failing closed to "
                 "EMERGENCY_HALT: "
              << e.what() << "\n";
    return unavailableDecision(now_ms);
  }
}

CapitalSnapshot CapitalControlEngine::snapshot() {
  return snapshotAt(time_.now_ms(), config_.current());
}

ControlDecision CapitalControlEngine::decision() {
  return decisionAt(time_.now_ms(), config_.current());
}

std::vector<CapitalOverride> CapitalControlEngine::overridesOrEmpty(
    std::int64_t now_ms) {
  try {
    return governor_.list(now_ms);
  } catch (const StoreUnavailableError& e) {
    std::cerr << "[CapitalControlEngine] override store unavailable, no "
                 "overrides apply: "
              << e.what() << "\n";
    return {};
  }
}

// -----------------------------------------------------------------------------
// checkAction(): the action gate
// -----------------------------------------------------------------------------
ActionCheckResult CapitalControlEngine::checkAction(ActionKey action,
                                                    const ActorContext& actor) {
  const std::int64_t now = time_.now_ms();
  const ControlDecision d = decisionAt(now, config_.current());

  ActionCheckResult r;
  r.action = action;
  r.mode = d.mode;
  r.reasons = d.reasons;

  if (!d.blocks.blocked(action)) {
    return r;
  }

  if (auto id = coveringOverride(action, d, overridesOrEmpty(now), now)) {
    r.override_id = std::move(id);
    return r;
  }

  r.allowed = false;
  r.message = std::string("[CAPITAL_CONTROL] Action ") + toString(action) +
              " is blocked under mode " + toString(d.mode) +
              ". Reasons: " + joinReasons(d.reasons);

  const std::string minute = minuteBucket(now);
  const std::string actor_key = actor.user_id.empty() ? "anon" : actor.user_id;

  ActionBlockedEvent event;
  event.id = "CC-BLOCK-" + fingerprintParts({toString(action), toString(d.mode),
                                             minute, actor_key});
  event.occurred_at_ms = now;
  event.action = action;
  event.mode = d.mode;
  event.reasons = d.reasons;
  event.snapshot_hash = d.snapshot_hash;
  event.actor_role = actor.role;
  event.actor_user_id = actor.user_id;
  audit_.emit(event);

  r.audit_event_id = event.id;
  return r;
}

// -----------------------------------------------------------------------------
// Sweeps
// -----------------------------------------------------------------------------
BreachSweepResult CapitalControlEngine::runBreachSweep() {
  std::lock_guard<std::mutex> lock(sweep_mutex_);

  const std::int64_t now = time_.now_ms();
  const RiskConfig config = config_.current();

  BreachSweepResult result;
  result.snapshot = snapshotAt(now, config);

  BreachClassifier classifier(breaches_, audit_, config);
  result.new_events = classifier.evaluate(result.snapshot);

  try {
    result.all_events = breaches_.list();
    std::reverse(result.all_events.begin(), result.all_events.end());
  } catch (const StoreUnavailableError& e) {
    std::cerr << "[CapitalControlEngine] breach log unavailable: " << e.what()
              << "\n";
    result.all_events = result.new_events;
  }

  if (!result.new_events.empty()) {
    std::cout << "[CapitalControlEngine] breach sweep recorded "
              << result.new_events.size() << " new event(s), level "
              << toString(result.snapshot.breach_level) << "\n";
  }
  return result;
}

ControlsSweepResult CapitalControlEngine::runControlsSweep() {
  std::lock_guard<std::mutex> lock(sweep_mutex_);

  const std::int64_t now = time_.now_ms();

  ControlsSweepResult result;
  result.decision = decisionAt(now, config_.current());

  try {
    result.expired = governor_.sweepExpired(now);
  } catch (const StoreUnavailableError& e) {
    std::cerr << "[CapitalControlEngine] override expiry sweep skipped: "
              << e.what() << "\n";
  }

  result.previous_mode = last_mode_;
  if (last_mode_ && *last_mode_ != result.decision.mode) {
    ControlModeChangedEvent event;
    event.id = "CC-MODE-" + fingerprintParts({toString(*last_mode_),
                                              toString(result.decision.mode),
                                              result.decision.snapshot_hash});
    event.occurred_at_ms = now;
    event.previous_mode = *last_mode_;
    event.new_mode = result.decision.mode;
    event.reasons = result.decision.reasons;
    event.snapshot_hash = result.decision.snapshot_hash;
    audit_.emit(event);
    result.mode_changed = true;

    std::cout << "[CapitalControlEngine] control mode " << toString(*last_mode_)
              << " -> " << toString(result.decision.mode) << "\n";
  }
  last_mode_ = result.decision.mode;

  result.overrides = overridesOrEmpty(now);
  return result;
}

// -----------------------------------------------------------------------------
// Overrides
// -----------------------------------------------------------------------------
CreateOverrideResult CapitalControlEngine::createOverride(
    const OverrideRequest& request) {
  const std::int64_t now = time_.now_ms();
  return governor_.create(request, decisionAt(now, config_.current()), now);
}

RevokeOverrideResult CapitalControlEngine::revokeOverride(
    const std::string& override_id, const ActorContext& actor) {
  return governor_.revoke(override_id, actor.role, actor.user_id,
                          time_.now_ms());
}

std::vector<CapitalOverride> CapitalControlEngine::listOverrides() {
  return governor_.list(time_.now_ms());
}

// -----------------------------------------------------------------------------
// Transaction policy
// -----------------------------------------------------------------------------
TransactionPolicyEvaluation CapitalControlEngine::evaluateTransaction(
    const Counterparty& counterparty, const Corridor& corridor, const Hub& hub,
    double amount, std::optional<CapitalPosition> position) {
  const std::int64_t now = time_.now_ms();
  const RiskConfig config = config_.current();

  if (!position) {
    const CapitalSnapshot snap = snapshotAt(now, config);
    position = CapitalPosition{snap.capital_base, snap.gross_exposure_notional,
                               snap.hardstop_limit};
  }
  return capguard::evaluateTransaction(counterparty, corridor, hub, amount,
                                       *position, config, now);
}

// -----------------------------------------------------------------------------
// exportPacket()
// -----------------------------------------------------------------------------
json CapitalControlEngine::exportPacket() {
  const std::int64_t now = time_.now_ms();
  const RiskConfig config = config_.current();

  // One state load: the packet's decision must describe its own snapshot.
  const CapitalSnapshot snap = snapshotAt(now, config);
  const ControlDecision d = decisionFor(snap, now, config);

  std::vector<BreachEvent> recent;
  try {
    recent = breaches_.since(now - kMillisPerDay);
    std::reverse(recent.begin(), recent.end());
  } catch (const StoreUnavailableError& e) {
    std::cerr << "[CapitalControlEngine] export without breach log: "
              << e.what() << "\n";
  }

  try {
    governor_.sweepExpired(now);
  } catch (const StoreUnavailableError& e) {
    std::cerr << "[CapitalControlEngine] export without expiry sweep: "
              << e.what() << "\n";
  }

  std::vector<CapitalOverride> active;
  std::vector<CapitalOverride> inactive;
  for (auto& o : overridesOrEmpty(now)) {
    (o.status == OverrideStatus::Active ? active : inactive)
        .push_back(std::move(o));
  }
  std::stable_sort(inactive.begin(), inactive.end(),
                   [](const CapitalOverride& a, const CapitalOverride& b) {
                     return inactiveSortKey(a) > inactiveSortKey(b);
                   });
  if (inactive.size() > kExportInactiveOverrides) {
    inactive.resize(kExportInactiveOverrides);
  }
  active.insert(active.end(), std::make_move_iterator(inactive.begin()),
                std::make_move_iterator(inactive.end()));

  json packet;
  packet["packet_version"] = kExportPacketVersion;
  packet["generated_at"] = timestampToJson(now);
  packet["snapshot"] = snap;
  packet["breach_events"] = recent;
  packet["control_decision"] = d;
  packet["overrides"] = active;
  packet["audit_event_ids"] = audit_.emittedIdsSince(now - kMillisPerDay);
  return packet;
}

// -----------------------------------------------------------------------------
// executeCommand(): handle gateway requests
// -----------------------------------------------------------------------------
std::string CapitalControlEngine::executeCommand(const std::string& cmd) {
  json request;
  try {
    request = json::parse(cmd);
  } catch (const json::parse_error&) {
    // Bare command name, as sent by simple console clients.
    request = json{{"command", cmd}};
  }
  if (!request.is_object()) {
    return errorResponse("Request must be a JSON object").dump();
  }

  try {
    return dispatch(request).dump();
  } catch (const json::exception& e) {
    return errorResponse(std::string("Malformed request: ") + e.what()).dump();
  } catch (const CodecError& e) {
    return errorResponse(std::string("Malformed request: ") + e.what()).dump();
  } catch (const StoreUnavailableError& e) {
    std::cerr << "[CapitalControlEngine] command failed: " << e.what() << "\n";
    return errorResponse(std::string("Unavailable: ") + e.what()).dump();
  }
}

json CapitalControlEngine::dispatch(const json& request) {
  const std::string command = request.value("command", "");
  json response;
  response["status"] = "ok";

  if (command == "PING") {
    response["response"] = "PONG";
  } else if (command == "SNAPSHOT") {
    response["snapshot"] = snapshot();
  } else if (command == "DECISION") {
    const std::int64_t now = time_.now_ms();
    const ControlDecision d = decisionAt(now, config_.current());
    response["decision"] = d;
    response["effective_blocks"] = applyOverrides(d, overridesOrEmpty(now), now);
  } else if (command == "CHECK_ACTION") {
    const ActionCheckResult r =
        checkAction(actionFrom(request.at("action")), actorFrom(request));
    response["action"] = toString(r.action);
    response["allowed"] = r.allowed;
    response["mode"] = toString(r.mode);
    response["reasons"] = r.reasons;
    response["override_id"] = r.override_id ? json(*r.override_id) : json(nullptr);
    if (!r.allowed) {
      response["message"] = r.message;
      response["audit_event_id"] = *r.audit_event_id;
    }
  } else if (command == "BREACH_SWEEP") {
    BreachSweepResult r = runBreachSweep();
    response["snapshot"] = r.snapshot;
    response["new_events"] = r.new_events;
    response["all_events"] = r.all_events;
  } else if (command == "CONTROLS_SWEEP") {
    ControlsSweepResult r = runControlsSweep();
    response["decision"] = r.decision;
    response["previous_mode"] =
        r.previous_mode ? json(toString(*r.previous_mode)) : json(nullptr);
    response["mode_changed"] = r.mode_changed;
    response["expired"] = r.expired;
    response["overrides"] = r.overrides;
  } else if (command == "LIST_OVERRIDES") {
    response["overrides"] = listOverrides();
  } else if (command == "CREATE_OVERRIDE") {
    const ActorContext actor = actorFrom(request);
    OverrideRequest req;
    req.scope = request.value("scope", "");
    auto key = request.find("action_key");
    if (key != request.end() && !key->is_null()) {
      req.action_key = actionFrom(*key);
    }
    req.reason = request.value("reason", "");
    req.expires_at_ms = timestampFromJson(request.at("expires_at"));
    req.actor_role = actor.role;
    req.actor_user_id = actor.user_id;
    req.actor_name = actor.name;

    CreateOverrideResult r = createOverride(req);
    if (!r.ok()) {
      return errorResponse(r.errors, r.errorMessage());
    }
    response["override"] = *r.record;
    response["is_new"] = r.is_new;
  } else if (command == "REVOKE_OVERRIDE") {
    RevokeOverrideResult r = revokeOverride(
        request.at("override_id").get<std::string>(), actorFrom(request));
    if (!r.ok()) {
      return errorResponse(r.errors, joinReasons(r.errors));
    }
    response["override"] = *r.record;
  } else if (command == "EVALUATE_TRANSACTION") {
    std::optional<CapitalPosition> position;
    auto cap = request.find("capital");
    if (cap != request.end() && !cap->is_null()) {
      position = cap->get<CapitalPosition>();
    }
    response["evaluation"] = evaluateTransaction(
        request.at("counterparty").get<Counterparty>(),
        request.at("corridor").get<Corridor>(), request.at("hub").get<Hub>(),
        request.at("amount").get<double>(), position);
  } else if (command == "EXPORT_PACKET") {
    response["packet"] = exportPacket();
  } else if (command == "RELOAD_CONFIG") {
    config_.invalidate();
    response["config_version"] = config_.current().version;
  } else {
    return errorResponse("Unknown command: " + command);
  }

  return response;
}

}  // namespace capguard
