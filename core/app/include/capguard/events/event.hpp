#pragma once

#include "capguard/events/audit_events.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace capguard {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope carried by the EventBus. Subscribers dispatch with
// std::get_if or std::visit; adding a kind means extending this variant and
// every visit site, which the compiler enforces.
// -----------------------------------------------------------------------------
using Event = std::variant<
    BreachDetectedEvent,
    ControlModeChangedEvent,
    ActionBlockedEvent,
    OverrideLifecycleEvent>;

// Deterministic id of whichever payload the envelope holds.
inline const std::string& eventId(const Event& event) {
  return std::visit([](const auto& e) -> const std::string& { return e.id; },
                    event);
}

inline std::int64_t eventOccurredAt(const Event& event) {
  return std::visit([](const auto& e) { return e.occurred_at_ms; }, event);
}

}  // namespace capguard
