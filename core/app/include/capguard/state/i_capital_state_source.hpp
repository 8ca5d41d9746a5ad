#pragma once

#include "capguard/domain/capital_inputs.hpp"

namespace capguard {

// -----------------------------------------------------------------------------
// ICapitalStateSource: aggregate exposure state supplied by the platform
// -----------------------------------------------------------------------------
//
// @brief  Returns the current capital base, reservations, orders, allocated
//         inventory and settlement cases.
//
// @details
// The engine treats the source as a black box and calls load() once per
// evaluation. The returned CapitalInputs::now_ms is ignored; the engine
// stamps its own as-of time.
//
// Implementations throw StoreUnavailableError when the state cannot be
// obtained. The engine's decision path turns that into a fail-closed
// decision.
//
// Thread-safety:
//   load() may be called concurrently from the sweep loop and the gateway
//   thread.
// -----------------------------------------------------------------------------
class ICapitalStateSource {
 public:
  virtual ~ICapitalStateSource() = default;

  virtual domain::CapitalInputs load() const = 0;
};

}  // namespace capguard
