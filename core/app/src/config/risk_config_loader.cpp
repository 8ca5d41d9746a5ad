#include "capguard/config/risk_config_loader.hpp"

#include "capguard/store/json_file_io.hpp"
#include "capguard/store/store_error.hpp"

#include <cstdint>
#include <type_traits>

namespace capguard {

using nlohmann::json;

namespace {

template <typename T>
void readKey(const json& doc, const char* key, T& out) {
  auto it = doc.find(key);
  if (it == doc.end()) {
    return;
  }
  if constexpr (std::is_integral_v<T>) {
    if (!it->is_number_integer()) {
      throw ConfigError(std::string("risk config key '") + key +
                        "' must be an integer");
    }
  } else {
    if (!it->is_number()) {
      throw ConfigError(std::string("risk config key '") + key +
                        "' must be a number");
    }
  }
  out = it->get<T>();
}

void requirePositive(double value, const char* key,
                     std::vector<std::string>& errors) {
  if (!(value > 0.0)) {
    errors.push_back(std::string(key) + " must be positive");
  }
}

}  // namespace

domain::RiskConfig parseRiskConfig(const json& doc) {
  if (!doc.is_object()) {
    throw ConfigError("risk config document must be a JSON object");
  }

  domain::RiskConfig c;
  readKey(doc, "version", c.version);

  readKey(doc, "reserve_haircut", c.reserve_haircut);
  readKey(doc, "tvar_addon_factor", c.tvar_addon_factor);
  readKey(doc, "target_ecr", c.target_ecr);
  readKey(doc, "top_driver_count", c.top_driver_count);

  readKey(doc, "hardstop_caution", c.hardstop_caution);
  readKey(doc, "hardstop_breach", c.hardstop_breach);
  readKey(doc, "hardstop_exceeded", c.hardstop_exceeded);
  readKey(doc, "hardstop_throttle", c.hardstop_throttle);
  readKey(doc, "hardstop_freeze", c.hardstop_freeze);

  readKey(doc, "ecr_freeze_multiplier", c.ecr_freeze_multiplier);
  readKey(doc, "ecr_critical_multiplier", c.ecr_critical_multiplier);

  readKey(doc, "buffer_negative_lookback_ms", c.buffer_negative_lookback_ms);
  readKey(doc, "throttle_capacity_fraction", c.throttle_capacity_fraction);

  readKey(doc, "max_ecr_ratio", c.max_ecr_ratio);
  readKey(doc, "ecr_warn_ratio", c.ecr_warn_ratio);
  readKey(doc, "hardstop_util_fail", c.hardstop_util_fail);
  readKey(doc, "hardstop_util_warn", c.hardstop_util_warn);

  readKey(doc, "tri_critical_threshold", c.tri_critical_threshold);
  readKey(doc, "tri_elevated_threshold", c.tri_elevated_threshold);
  readKey(doc, "tri_warn_threshold", c.tri_warn_threshold);
  readKey(doc, "tri_concentration_factor", c.tri_concentration_factor);

  readKey(doc, "auto_approval_max_tri", c.auto_approval_max_tri);
  readKey(doc, "desk_head_max_tri", c.desk_head_max_tri);
  readKey(doc, "credit_committee_max_tri", c.credit_committee_max_tri);

  readKey(doc, "auto_approval_limit_cents", c.auto_approval_limit_cents);
  readKey(doc, "desk_head_limit_cents", c.desk_head_limit_cents);
  readKey(doc, "credit_committee_limit_cents", c.credit_committee_limit_cents);

  auto errors = validateRiskConfig(c);
  if (!errors.empty()) {
    std::string msg = "invalid risk config:";
    for (const auto& e : errors) {
      msg += " " + e + ";";
    }
    msg.pop_back();
    throw ConfigError(msg);
  }
  return c;
}

json riskConfigToJson(const domain::RiskConfig& c) {
  return json{
      {"version", c.version},
      {"reserve_haircut", c.reserve_haircut},
      {"tvar_addon_factor", c.tvar_addon_factor},
      {"target_ecr", c.target_ecr},
      {"top_driver_count", c.top_driver_count},
      {"hardstop_caution", c.hardstop_caution},
      {"hardstop_breach", c.hardstop_breach},
      {"hardstop_exceeded", c.hardstop_exceeded},
      {"hardstop_throttle", c.hardstop_throttle},
      {"hardstop_freeze", c.hardstop_freeze},
      {"ecr_freeze_multiplier", c.ecr_freeze_multiplier},
      {"ecr_critical_multiplier", c.ecr_critical_multiplier},
      {"buffer_negative_lookback_ms", c.buffer_negative_lookback_ms},
      {"throttle_capacity_fraction", c.throttle_capacity_fraction},
      {"max_ecr_ratio", c.max_ecr_ratio},
      {"ecr_warn_ratio", c.ecr_warn_ratio},
      {"hardstop_util_fail", c.hardstop_util_fail},
      {"hardstop_util_warn", c.hardstop_util_warn},
      {"tri_critical_threshold", c.tri_critical_threshold},
      {"tri_elevated_threshold", c.tri_elevated_threshold},
      {"tri_warn_threshold", c.tri_warn_threshold},
      {"tri_concentration_factor", c.tri_concentration_factor},
      {"auto_approval_max_tri", c.auto_approval_max_tri},
      {"desk_head_max_tri", c.desk_head_max_tri},
      {"credit_committee_max_tri", c.credit_committee_max_tri},
      {"auto_approval_limit_cents", c.auto_approval_limit_cents},
      {"desk_head_limit_cents", c.desk_head_limit_cents},
      {"credit_committee_limit_cents", c.credit_committee_limit_cents},
  };
}

std::vector<std::string> validateRiskConfig(const domain::RiskConfig& c) {
  std::vector<std::string> errors;

  if (c.reserve_haircut < 0.0 || c.reserve_haircut > 1.0) {
    errors.push_back("reserve_haircut must be within [0, 1]");
  }
  if (c.tvar_addon_factor < 0.0) {
    errors.push_back("tvar_addon_factor must not be negative");
  }
  requirePositive(c.target_ecr, "target_ecr", errors);
  if (c.top_driver_count < 0) {
    errors.push_back("top_driver_count must not be negative");
  }

  if (!(c.hardstop_caution <= c.hardstop_throttle &&
        c.hardstop_throttle <= c.hardstop_freeze &&
        c.hardstop_freeze <= c.hardstop_breach &&
        c.hardstop_breach <= c.hardstop_exceeded)) {
    errors.push_back(
        "hardstop bands must satisfy caution <= throttle <= freeze <= breach "
        "<= exceeded");
  }
  if (c.ecr_freeze_multiplier < 1.0 ||
      c.ecr_critical_multiplier < c.ecr_freeze_multiplier) {
    errors.push_back(
        "ECR multipliers must satisfy 1 <= freeze multiplier <= critical "
        "multiplier");
  }
  if (c.buffer_negative_lookback_ms < 0) {
    errors.push_back("buffer_negative_lookback_ms must not be negative");
  }
  if (c.throttle_capacity_fraction < 0.0 || c.throttle_capacity_fraction > 1.0) {
    errors.push_back("throttle_capacity_fraction must be within [0, 1]");
  }

  requirePositive(c.max_ecr_ratio, "max_ecr_ratio", errors);
  if (c.ecr_warn_ratio > c.max_ecr_ratio) {
    errors.push_back("ecr_warn_ratio must not exceed max_ecr_ratio");
  }
  if (c.hardstop_util_warn > c.hardstop_util_fail) {
    errors.push_back("hardstop_util_warn must not exceed hardstop_util_fail");
  }
  if (c.tri_warn_threshold > c.tri_critical_threshold) {
    errors.push_back("tri_warn_threshold must not exceed tri_critical_threshold");
  }
  if (!(c.auto_approval_max_tri <= c.desk_head_max_tri &&
        c.desk_head_max_tri <= c.credit_committee_max_tri)) {
    errors.push_back("approval TRI ceilings must be non-decreasing");
  }
  if (!(c.auto_approval_limit_cents <= c.desk_head_limit_cents &&
        c.desk_head_limit_cents <= c.credit_committee_limit_cents)) {
    errors.push_back("approval amount limits must be non-decreasing");
  }

  return errors;
}

std::optional<domain::RiskConfig> loadRiskConfigFile(
    const std::filesystem::path& path) {
  std::optional<json> doc;
  try {
    doc = readJsonFile(path);
  } catch (const StoreUnavailableError& e) {
    throw ConfigError(e.what());
  }
  if (!doc) {
    return std::nullopt;
  }
  try {
    return parseRiskConfig(*doc);
  } catch (const json::exception& e) {
    throw ConfigError(path.string() + ": " + e.what());
  }
}

}  // namespace capguard
