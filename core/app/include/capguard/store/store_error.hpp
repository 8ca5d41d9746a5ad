#pragma once

#include <stdexcept>
#include <string>

namespace capguard {

// Raised by any IBreachStore / IOverrideStore method when the backing
// storage cannot be read or written. Evaluators catch it at their boundary
// and degrade instead of failing the whole evaluation.
class StoreUnavailableError : public std::runtime_error {
 public:
  explicit StoreUnavailableError(const std::string& what)
      : std::runtime_error(what) {}
};

}  // namespace capguard
