#pragma once

#include "capguard/domain/risk_config.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace capguard {

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// Risk configuration file format
// -----------------------------------------------------------------------------
//
// A flat JSON object whose keys are the snake_case names of the RiskConfig
// members, e.g.
//
//   { "version": 3, "target_ecr": 7.5, "hardstop_breach": 0.94,
//     "auto_approval_limit_cents": 2000000000 }
//
// Keys that are absent keep their compiled-in default. Unknown keys are
// ignored. A key with the wrong JSON type, or a document that violates the
// band ordering checked by validateRiskConfig(), raises ConfigError.
// -----------------------------------------------------------------------------

domain::RiskConfig parseRiskConfig(const nlohmann::json& doc);

nlohmann::json riskConfigToJson(const domain::RiskConfig& config);

// Empty when the thresholds are internally consistent.
std::vector<std::string> validateRiskConfig(const domain::RiskConfig& config);

// nullopt when the file does not exist. Throws ConfigError when it exists
// but cannot be read, parsed or validated.
std::optional<domain::RiskConfig> loadRiskConfigFile(
    const std::filesystem::path& path);

}  // namespace capguard
