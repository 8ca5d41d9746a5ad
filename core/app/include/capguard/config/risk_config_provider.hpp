#pragma once

#include "capguard/domain/risk_config.hpp"
#include "capguard/time/i_time_provider.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>

namespace capguard {

// -----------------------------------------------------------------------------
// RiskConfigProvider: TTL-cached source of the active RiskConfig
// -----------------------------------------------------------------------------
//
// @brief  Hands out the current threshold set, reloading it from its source
//         at most once per TTL window.
//
// @details
// current() returns the cached value while it is younger than the TTL
// (60 s by default, measured on the injected ITimeProvider). Otherwise it
// calls the source:
//
//   - source returns a config      → cache it, stamp the load time
//   - source returns nullopt       → cache the compiled-in defaults
//   - source throws std::exception → log, return the last good value (or the
//                                    defaults), do NOT stamp the load time so
//                                    the next call retries
//
// invalidate() marks the cache stale; the next current() reloads
// unconditionally. The previous value stays available as the fallback.
// Operators call it (RELOAD_CONFIG) after publishing new parameters.
//
// Thread model:
//   current() and invalidate() are safe to call from any thread. The source
//   is invoked under the internal mutex, so at most one reload runs at once.
// -----------------------------------------------------------------------------
class RiskConfigProvider {
 public:
  using Source = std::function<std::optional<domain::RiskConfig>()>;

  static constexpr std::int64_t kDefaultTtlMs = 60 * 1000;

  RiskConfigProvider(Source source, const ITimeProvider& time,
                     std::int64_t ttl_ms = kDefaultTtlMs);

  // Reads a JSON file through loadRiskConfigFile(). A missing file yields
  // the compiled-in defaults.
  RiskConfigProvider(std::filesystem::path path, const ITimeProvider& time,
                     std::int64_t ttl_ms = kDefaultTtlMs);

  RiskConfigProvider(const RiskConfigProvider&) = delete;
  RiskConfigProvider& operator=(const RiskConfigProvider&) = delete;

  domain::RiskConfig current();
  void invalidate();

 private:
  Source source_;
  const ITimeProvider& time_;
  const std::int64_t ttl_ms_;

  std::mutex mutex_;
  std::optional<domain::RiskConfig> cached_;
  std::optional<std::int64_t> cached_at_ms_;
};

}  // namespace capguard
