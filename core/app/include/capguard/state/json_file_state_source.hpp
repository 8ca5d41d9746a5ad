#pragma once

#include "capguard/state/i_capital_state_source.hpp"

#include <filesystem>

namespace capguard {

// Reads the aggregate state from a JSON document on every load():
//
//   { "capital": { "capital_base": ..., "hardstop_limit": ..., "tvar99": ... },
//     "reservations": [...], "orders": [...], "inventory": [...],
//     "settlements": [...] }
//
// The file is re-read each time so an external exporter can replace it
// atomically between evaluations. A missing, unreadable or malformed file
// throws StoreUnavailableError.
class JsonFileStateSource final : public ICapitalStateSource {
 public:
  explicit JsonFileStateSource(std::filesystem::path path);

  domain::CapitalInputs load() const override;

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

}  // namespace capguard
