#pragma once

#include "capguard/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace capguard {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "current time" is set explicitly by the caller.
//
// @details
// Tests and incident replays pin the clock to a known instant, then advance
// it to cross minute buckets, the buffer-negative lookback window or an
// override's expiry. The same inputs at the same simulated time always yield
// the same snapshot hash and breach ids.
//
// Internal storage is a std::atomic<int64_t>, so readers on the gateway
// thread and a writer on the test/replay thread need no extra locking.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the simulated clock to an absolute epoch-ms value.
  //
  // Monotonicity is not enforced; tests may move the clock freely.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace capguard
