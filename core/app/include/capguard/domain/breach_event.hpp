#pragma once

#include "capguard/domain/capital_snapshot.hpp"

#include <cstdint>
#include <string>

namespace capguard {
namespace domain {

enum class BreachEventType {
  EcrCaution,
  EcrBreach,
  HardstopCaution,
  HardstopBreach,
  BufferNegative,
};

enum class AlertLevel {
  Info,
  Warn,
  Critical,
};

// -----------------------------------------------------------------------------
// BreachEvent: persisted governance alert
// -----------------------------------------------------------------------------
//
// @brief  One threshold crossing observed in a snapshot.
//
// @details
// The id is content-addressed (see fingerprint.hpp): identical conditions in
// the same minute bucket always produce the same id, so the breach store can
// deduplicate on append without any coordination between callers.
//
// Breach events are append-only. They are never updated or deleted.
// -----------------------------------------------------------------------------
struct BreachEvent {
  std::string id;
  std::int64_t occurred_at_ms{0};
  BreachEventType type{BreachEventType::EcrCaution};
  AlertLevel level{AlertLevel::Info};
  std::string message;
  CapitalSnapshot snapshot;
};

}  // namespace domain
}  // namespace capguard
