#include "capguard/store/json_file_breach_store.hpp"

#include "capguard/serialization/json_codec.hpp"
#include "capguard/store/json_file_io.hpp"
#include "capguard/store/store_error.hpp"

#include <iostream>
#include <utility>

namespace capguard {

JsonFileBreachStore::JsonFileBreachStore(std::filesystem::path path)
    : path_(std::move(path)) {
  try {
    auto doc = readJsonFile(path_);
    if (!doc) {
      std::cout << "[JsonFileBreachStore] " << path_.string()
                << " not found, starting empty.\n";
      return;
    }
    for (const auto& j : doc->at("events")) {
      auto event = j.get<domain::BreachEvent>();
      if (ids_.insert(event.id).second) {
        events_.push_back(std::move(event));
      }
    }
    std::cout << "[JsonFileBreachStore] loaded " << events_.size()
              << " event(s) from " << path_.string() << "\n";
  } catch (const StoreUnavailableError& e) {
    load_error_ = e.what();
  } catch (const nlohmann::json::exception& e) {
    load_error_ = std::string("malformed breach log: ") + e.what();
  } catch (const CodecError& e) {
    load_error_ = std::string("malformed breach log: ") + e.what();
  }

  if (!load_error_.empty()) {
    events_.clear();
    ids_.clear();
    std::cerr << "[JsonFileBreachStore] UNAVAILABLE: " << load_error_ << "\n";
  }
}

void JsonFileBreachStore::ensureAvailable() const {
  if (!load_error_.empty()) {
    throw StoreUnavailableError(load_error_);
  }
}

void JsonFileBreachStore::persist() const {
  nlohmann::json doc;
  doc["version"] = 1;
  doc["events"] = events_;
  writeJsonFileAtomic(path_, doc);
}

bool JsonFileBreachStore::append(const domain::BreachEvent& event) {
  std::lock_guard lock(mutex_);
  ensureAvailable();

  if (ids_.count(event.id) != 0) {
    return false;
  }

  events_.push_back(event);
  ids_.insert(event.id);
  try {
    persist();
  } catch (const StoreUnavailableError&) {
    events_.pop_back();
    ids_.erase(event.id);
    throw;
  }
  return true;
}

std::vector<domain::BreachEvent> JsonFileBreachStore::list() const {
  std::lock_guard lock(mutex_);
  ensureAvailable();
  return events_;
}

std::vector<domain::BreachEvent> JsonFileBreachStore::since(
    std::int64_t cutoff_ms) const {
  std::lock_guard lock(mutex_);
  ensureAvailable();
  std::vector<domain::BreachEvent> out;
  for (const auto& e : events_) {
    if (e.occurred_at_ms >= cutoff_ms) {
      out.push_back(e);
    }
  }
  return out;
}

}  // namespace capguard
