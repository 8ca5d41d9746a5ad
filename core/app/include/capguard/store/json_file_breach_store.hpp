#pragma once

#include "capguard/store/i_breach_store.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace capguard {

// -----------------------------------------------------------------------------
// JsonFileBreachStore: IBreachStore persisted as one JSON document
// -----------------------------------------------------------------------------
//
// @brief  Durable append-only breach log that survives process restarts.
//
// @details
// Layout: {"version": 1, "events": [BreachEvent, ...]}. The whole document
// is rewritten on every successful append via temp file + rename. A missing
// file is a valid cold start.
//
// If the file exists but cannot be parsed at construction, the store keeps
// it untouched and every call throws StoreUnavailableError until the file
// is repaired and the process restarted. A failed write rolls the in-memory
// append back before rethrowing.
//
// Thread model:
//   One mutex serializes reads, appends and file writes. The store assumes
//   it is the only writer of its file.
// -----------------------------------------------------------------------------
class JsonFileBreachStore final : public IBreachStore {
 public:
  explicit JsonFileBreachStore(std::filesystem::path path);

  JsonFileBreachStore(const JsonFileBreachStore&) = delete;
  JsonFileBreachStore& operator=(const JsonFileBreachStore&) = delete;

  bool append(const domain::BreachEvent& event) override;
  std::vector<domain::BreachEvent> list() const override;
  std::vector<domain::BreachEvent> since(std::int64_t cutoff_ms) const override;

 private:
  void ensureAvailable() const;
  void persist() const;

  std::filesystem::path path_;
  mutable std::mutex mutex_;
  std::vector<domain::BreachEvent> events_;
  std::unordered_set<std::string> ids_;
  std::string load_error_;  // non-empty → unavailable
};

}  // namespace capguard
