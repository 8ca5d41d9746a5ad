#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace capguard {
namespace domain {

// -----------------------------------------------------------------------------
// ControlMode: escalating platform-wide severity state
// -----------------------------------------------------------------------------
//
// Declaration order IS the severity order (0..4). severity() relies on it.
// -----------------------------------------------------------------------------
enum class ControlMode {
  Normal,                // 0: nothing blocked
  ThrottleReservations,  // 1: reservation creation blocked
  FreezeConversions,     // 2: + reservation → order conversion
  FreezeMarketplace,     // 3: + listing publication
  EmergencyHalt,         // 4: + settlement opening and DvP execution
};

inline int severity(ControlMode mode) { return static_cast<int>(mode); }

// Modes a GLOBAL override may be created under (one-level downgrade only).
inline bool isGloballyOverridable(ControlMode mode) {
  return mode == ControlMode::ThrottleReservations ||
         mode == ControlMode::FreezeConversions;
}

// -----------------------------------------------------------------------------
// ActionKey: the mutating actions gated by the control mode
// -----------------------------------------------------------------------------
enum class ActionKey {
  CreateReservation,
  ConvertReservation,
  PublishListing,
  OpenSettlement,
  ExecuteDvp,
};

inline constexpr std::size_t kActionKeyCount = 5;

inline constexpr std::array<ActionKey, kActionKeyCount> kAllActionKeys{
    ActionKey::CreateReservation, ActionKey::ConvertReservation,
    ActionKey::PublishListing, ActionKey::OpenSettlement,
    ActionKey::ExecuteDvp};

// -----------------------------------------------------------------------------
// BlockMatrix: per-action block flags
// -----------------------------------------------------------------------------
// Fixed-size, indexed by ActionKey. true == blocked.
// -----------------------------------------------------------------------------
class BlockMatrix {
 public:
  bool blocked(ActionKey key) const {
    return flags_[static_cast<std::size_t>(key)];
  }

  void set(ActionKey key, bool value) {
    flags_[static_cast<std::size_t>(key)] = value;
  }

  bool any() const {
    for (bool f : flags_) {
      if (f) return true;
    }
    return false;
  }

  bool operator==(const BlockMatrix& other) const {
    return flags_ == other.flags_;
  }
  bool operator!=(const BlockMatrix& other) const { return !(*this == other); }

 private:
  std::array<bool, kActionKeyCount> flags_{};
};

// Advisory caps. Only populated under THROTTLE_RESERVATIONS today.
struct ControlLimits {
  std::optional<double> max_reservation_notional;
  std::optional<double> max_reservation_weight_oz;
};

// -----------------------------------------------------------------------------
// ControlDecision: output of the control-mode evaluator
// -----------------------------------------------------------------------------
//
// @brief  The mode, its block matrix, advisory limits and the snapshot hash
//         that binds the decision to one specific risk state.
//
// @details
// Recomputed on every evaluation and never persisted. snapshot_hash covers
// the as-of minute and the key ratios, so an override recorded against one
// hash can be traced back to the exact risk state it was granted under.
// -----------------------------------------------------------------------------
struct ControlDecision {
  std::int64_t as_of_ms{0};
  ControlMode mode{ControlMode::Normal};
  std::vector<std::string> reasons;
  BlockMatrix blocks;
  ControlLimits limits;
  std::string snapshot_hash;
};

}  // namespace domain
}  // namespace capguard
