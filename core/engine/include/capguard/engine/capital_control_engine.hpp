#pragma once

#include "capguard/audit/audit_emitter.hpp"
#include "capguard/config/risk_config_provider.hpp"
#include "capguard/domain/breach_event.hpp"
#include "capguard/domain/capital_override.hpp"
#include "capguard/domain/capital_snapshot.hpp"
#include "capguard/domain/control_decision.hpp"
#include "capguard/domain/transaction_policy.hpp"
#include "capguard/eventbus/event_bus.hpp"
#include "capguard/network/ipc_server.hpp"
#include "capguard/risk/override_governor.hpp"
#include "capguard/state/i_capital_state_source.hpp"
#include "capguard/store/i_breach_store.hpp"
#include "capguard/store/i_override_store.hpp"
#include "capguard/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace capguard {

// Who is asking. Empty fields mean an anonymous or system caller.
struct ActorContext {
  std::string role;
  std::string user_id;
  std::string name;
};

// Outcome of the action gate.
struct ActionCheckResult {
  domain::ActionKey action{domain::ActionKey::CreateReservation};
  bool allowed{true};
  domain::ControlMode mode{domain::ControlMode::Normal};
  std::vector<std::string> reasons;
  std::optional<std::string> override_id;     // set when an override unblocked it
  std::optional<std::string> audit_event_id;  // set when denied
  std::string message;                        // denial text, empty when allowed
};

struct BreachSweepResult {
  domain::CapitalSnapshot snapshot;
  std::vector<domain::BreachEvent> new_events;
  std::vector<domain::BreachEvent> all_events;  // newest first
};

struct ControlsSweepResult {
  domain::ControlDecision decision;
  std::optional<domain::ControlMode> previous_mode;
  bool mode_changed{false};
  std::vector<domain::CapitalOverride> expired;
  std::vector<domain::CapitalOverride> overrides;
};

// -----------------------------------------------------------------------------
// CapitalControlEngine
// -----------------------------------------------------------------------------
//
// @brief  Wires the snapshot calculator, breach classifier, control-mode
//         evaluator, override governor and transaction scorer to their
//         collaborators, and exposes them as operations and gateway commands.
//
// @details
// Every operation reads "now" from the injected ITimeProvider and the active
// thresholds from the RiskConfigProvider, then recomputes from scratch. The
// only state carried between calls is the last observed control mode, used
// by the controls sweep to detect mode changes.
//
// Decision path (decision(), checkAction()):
//   state → expire lapsed reservations → snapshot → breach history
//   (store unavailable ⇒ empty) → control decision. Any failure on this path
//   yields EMERGENCY_HALT with "Capital control decision unavailable".
//
// Gateway commands (executeCommand()):
//   One JSON object per request, {"command": "<NAME>", ...}. A bare command
//   name ("PING") is accepted as well. Every response carries
//   "status": "ok" | "error".
//
//     PING                  → "PONG"
//     SNAPSHOT              → snapshot
//     DECISION              → decision + effective blocks after overrides
//     CHECK_ACTION          action, actor{role,user_id}
//     BREACH_SWEEP          → new_events, all_events, snapshot
//     CONTROLS_SWEEP        → decision, previous_mode, expired, overrides
//     LIST_OVERRIDES
//     CREATE_OVERRIDE       scope, action_key?, reason, expires_at, actor
//     REVOKE_OVERRIDE       override_id, actor
//     EVALUATE_TRANSACTION  counterparty, corridor, hub, amount, capital?
//     EXPORT_PACKET
//     RELOAD_CONFIG
//
// Thread model:
//   Constructed, started and stopped on the main thread. Operations may be
//   called concurrently from the main sweep loop and the gateway thread;
//   the two sweeps are serialized by an internal mutex.
//
// Ownership:
//   CapitalControlEngine
//    ├── bus_          (EventBus, value member)
//    ├── audit_        (AuditEmitter, value member, references bus_)
//    ├── governor_     (OverrideGovernor, value member)
//    ├── ipc_server_   (unique_ptr<IpcServer>, only while started)
//    └── state_, breaches_, overrides_, config_, time_
//                      (non-owning references, must outlive the engine)
// -----------------------------------------------------------------------------
class CapitalControlEngine {
 public:
  // Empty endpoints disable the gateway (tests call operations directly).
  CapitalControlEngine(const ICapitalStateSource& state,
                       IBreachStore& breaches, IOverrideStore& overrides,
                       RiskConfigProvider& config, const ITimeProvider& time,
                       std::string ipc_cmd_endpoint = "tcp://127.0.0.1:5556",
                       std::string ipc_pub_endpoint = "tcp://127.0.0.1:5557");

  ~CapitalControlEngine();

  CapitalControlEngine(const CapitalControlEngine&) = delete;
  CapitalControlEngine& operator=(const CapitalControlEngine&) = delete;
  CapitalControlEngine(CapitalControlEngine&&) = delete;
  CapitalControlEngine& operator=(CapitalControlEngine&&) = delete;

  // Opens the gateway when endpoints are configured. Idempotent.
  void start();
  void stop();
  bool isRunning() const { return running_; }

  // Throws StoreUnavailableError when the aggregate state is unavailable.
  domain::CapitalSnapshot snapshot();

  // Never throws; fails closed.
  domain::ControlDecision decision();

  ActionCheckResult checkAction(domain::ActionKey action,
                                const ActorContext& actor);

  BreachSweepResult runBreachSweep();
  ControlsSweepResult runControlsSweep();

  CreateOverrideResult createOverride(const OverrideRequest& request);
  RevokeOverrideResult revokeOverride(const std::string& override_id,
                                      const ActorContext& actor);
  std::vector<domain::CapitalOverride> listOverrides();

  // position defaults to the live snapshot (capital base, gross exposure,
  // hardstop limit).
  domain::TransactionPolicyEvaluation evaluateTransaction(
      const domain::Counterparty& counterparty,
      const domain::Corridor& corridor, const domain::Hub& hub, double amount,
      std::optional<domain::CapitalPosition> position = std::nullopt);

  // Committee packet, version 2.
  nlohmann::json exportPacket();

  // Gateway entry point. Malformed requests and unavailable collaborators
  // become {"status": "error"} responses.
  std::string executeCommand(const std::string& cmd);

  EventBus& auditBus() { return bus_; }
  AuditEmitter& auditEmitter() { return audit_; }

 private:
  domain::CapitalSnapshot snapshotAt(std::int64_t now_ms,
                                     const domain::RiskConfig& config) const;
  std::vector<domain::BreachEvent> recentBreaches(
      std::int64_t now_ms, const domain::RiskConfig& config) const;
  domain::ControlDecision decisionAt(std::int64_t now_ms,
                                     const domain::RiskConfig& config);
  // Fails closed like decisionAt(), but evaluates a snapshot already taken.
  domain::ControlDecision decisionFor(const domain::CapitalSnapshot& snap,
                                      std::int64_t now_ms,
                                      const domain::RiskConfig& config);
  std::vector<domain::CapitalOverride> overridesOrEmpty(std::int64_t now_ms);

  nlohmann::json dispatch(const nlohmann::json& request);

  const ICapitalStateSource& state_;
  IBreachStore& breaches_;
  IOverrideStore& overrides_;
  RiskConfigProvider& config_;
  const ITimeProvider& time_;

  std::string ipc_cmd_endpoint_;
  std::string ipc_pub_endpoint_;

  EventBus bus_;
  AuditEmitter audit_;
  OverrideGovernor governor_;

  std::mutex sweep_mutex_;
  std::optional<domain::ControlMode> last_mode_;

  std::unique_ptr<IpcServer> ipc_server_;
  EventBus::SubscriptionId telemetry_subscription_{0};
  bool running_{false};
};

}  // namespace capguard
