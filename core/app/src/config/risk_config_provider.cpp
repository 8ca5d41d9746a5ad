#include "capguard/config/risk_config_provider.hpp"

#include "capguard/config/risk_config_loader.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace capguard {

RiskConfigProvider::RiskConfigProvider(Source source, const ITimeProvider& time,
                                       std::int64_t ttl_ms)
    : source_(std::move(source)), time_(time), ttl_ms_(ttl_ms) {}

RiskConfigProvider::RiskConfigProvider(std::filesystem::path path,
                                       const ITimeProvider& time,
                                       std::int64_t ttl_ms)
    : RiskConfigProvider(
          [path = std::move(path)]() { return loadRiskConfigFile(path); },
          time, ttl_ms) {}

domain::RiskConfig RiskConfigProvider::current() {
  std::lock_guard<std::mutex> lock(mutex_);

  const std::int64_t now = time_.now_ms();
  if (cached_ && cached_at_ms_ && now - *cached_at_ms_ < ttl_ms_) {
    return *cached_;
  }

  try {
    auto loaded = source_();
    if (loaded) {
      if (!cached_ || cached_->version != loaded->version) {
        std::cout << "[RiskConfigProvider] Loaded risk config version "
                  << loaded->version << "\n";
      }
      cached_ = *loaded;
    } else {
      std::cout << "[RiskConfigProvider] No risk config source, using "
                   "defaults\n";
      cached_ = domain::RiskConfig{};
    }
    cached_at_ms_ = now;
    return *cached_;
  } catch (const std::exception& e) {
    std::cerr << "[RiskConfigProvider] Reload failed, using "
              << (cached_ ? "last good config" : "defaults") << ": "
              << e.what() << "\n";
    return cached_ ? *cached_ : domain::RiskConfig{};
  }
}

void RiskConfigProvider::invalidate() {
  std::lock_guard<std::mutex> lock(mutex_);
  cached_at_ms_.reset();
}

}  // namespace capguard
