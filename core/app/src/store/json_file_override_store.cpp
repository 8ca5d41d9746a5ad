#include "capguard/store/json_file_override_store.hpp"

#include "capguard/serialization/json_codec.hpp"
#include "capguard/store/in_memory_override_store.hpp"
#include "capguard/store/json_file_io.hpp"
#include "capguard/store/store_error.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace capguard {

JsonFileOverrideStore::JsonFileOverrideStore(std::filesystem::path path)
    : path_(std::move(path)) {
  try {
    auto doc = readJsonFile(path_);
    if (!doc) {
      std::cout << "[JsonFileOverrideStore] " << path_.string()
                << " not found, starting empty.\n";
      return;
    }
    records_ = doc->at("overrides").get<std::vector<domain::CapitalOverride>>();
    std::cout << "[JsonFileOverrideStore] loaded " << records_.size()
              << " override(s) from " << path_.string() << "\n";
  } catch (const StoreUnavailableError& e) {
    load_error_ = e.what();
  } catch (const nlohmann::json::exception& e) {
    load_error_ = std::string("malformed override file: ") + e.what();
  } catch (const CodecError& e) {
    load_error_ = std::string("malformed override file: ") + e.what();
  }

  if (!load_error_.empty()) {
    records_.clear();
    std::cerr << "[JsonFileOverrideStore] UNAVAILABLE: " << load_error_
              << "\n";
  }
}

void JsonFileOverrideStore::ensureAvailable() const {
  if (!load_error_.empty()) {
    throw StoreUnavailableError(load_error_);
  }
}

void JsonFileOverrideStore::persist() const {
  nlohmann::json doc;
  doc["version"] = 1;
  doc["overrides"] = records_;
  writeJsonFileAtomic(path_, doc);
}

bool JsonFileOverrideStore::insertIfAbsent(
    const domain::CapitalOverride& record) {
  std::lock_guard lock(mutex_);
  ensureAvailable();

  auto it = std::find_if(records_.begin(), records_.end(),
                         [&](const auto& r) { return r.id == record.id; });
  if (it != records_.end()) {
    return false;
  }

  records_.push_back(record);
  try {
    persist();
  } catch (const StoreUnavailableError&) {
    records_.pop_back();
    throw;
  }
  return true;
}

std::optional<domain::CapitalOverride> JsonFileOverrideStore::find(
    const std::string& id) const {
  std::lock_guard lock(mutex_);
  ensureAvailable();
  for (const auto& r : records_) {
    if (r.id == id) {
      return r;
    }
  }
  return std::nullopt;
}

std::vector<domain::CapitalOverride> JsonFileOverrideStore::list() const {
  std::lock_guard lock(mutex_);
  ensureAvailable();
  return records_;
}

bool JsonFileOverrideStore::compareAndSetStatus(
    const std::string& id, domain::OverrideStatus expected,
    domain::OverrideStatus next, std::int64_t at_ms) {
  std::lock_guard lock(mutex_);
  ensureAvailable();

  for (auto& r : records_) {
    if (r.id != id) continue;

    const domain::CapitalOverride before = r;
    if (!applyStatusTransition(r, expected, next, at_ms)) {
      return false;
    }
    try {
      persist();
    } catch (const StoreUnavailableError&) {
      r = before;
      throw;
    }
    return true;
  }
  return false;
}

}  // namespace capguard
