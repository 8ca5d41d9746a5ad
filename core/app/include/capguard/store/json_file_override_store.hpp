#pragma once

#include "capguard/store/i_override_store.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace capguard {

// -----------------------------------------------------------------------------
// JsonFileOverrideStore: IOverrideStore persisted as one JSON document
// -----------------------------------------------------------------------------
// Layout: {"version": 1, "overrides": [CapitalOverride, ...]}.
// Same durability and failure rules as JsonFileBreachStore: temp + rename on
// every mutation, in-memory rollback when the write fails, and a store that
// refuses all calls if its file was unreadable at startup.
// -----------------------------------------------------------------------------
class JsonFileOverrideStore final : public IOverrideStore {
 public:
  explicit JsonFileOverrideStore(std::filesystem::path path);

  JsonFileOverrideStore(const JsonFileOverrideStore&) = delete;
  JsonFileOverrideStore& operator=(const JsonFileOverrideStore&) = delete;

  bool insertIfAbsent(const domain::CapitalOverride& record) override;
  std::optional<domain::CapitalOverride> find(
      const std::string& id) const override;
  std::vector<domain::CapitalOverride> list() const override;
  bool compareAndSetStatus(const std::string& id,
                           domain::OverrideStatus expected,
                           domain::OverrideStatus next,
                           std::int64_t at_ms) override;

 private:
  void ensureAvailable() const;
  void persist() const;

  std::filesystem::path path_;
  mutable std::mutex mutex_;
  std::vector<domain::CapitalOverride> records_;
  std::string load_error_;
};

}  // namespace capguard
