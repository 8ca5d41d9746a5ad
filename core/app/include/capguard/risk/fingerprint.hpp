#pragma once

#include "capguard/domain/breach_event.hpp"
#include "capguard/domain/capital_snapshot.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace capguard {

using EventId = std::string;

// -----------------------------------------------------------------------------
// Content-addressed identifiers
// -----------------------------------------------------------------------------
//
// @brief  The single place that decides how ids are hashed.
//
// @details
// Every id that must be reproducible across processes (breach events,
// snapshot hashes, audit ids) is derived here from a canonical text form of
// the conditions it describes. The hash is 32-bit FNV-1a rendered as eight
// lowercase hex digits. Call sites never hash directly, so swapping the
// algorithm is a change to this file only.
//
// Metric values are rendered with fixed decimals (4 for ratios, 2 for money)
// before hashing. Two snapshots that agree to that precision in the same
// minute bucket therefore collapse to the same id.
// -----------------------------------------------------------------------------

// Raw FNV-1a over the bytes of text, as 8 hex digits.
std::string fnv1aHex(std::string_view text);

// Joins parts with '|' and hashes the result.
std::string fingerprintParts(std::initializer_list<std::string_view> parts);

// Inputs that identify one breach condition.
struct BreachConditions {
  domain::BreachEventType type{domain::BreachEventType::EcrCaution};
  std::int64_t as_of_ms{0};
  domain::BreachLevel breach_level{domain::BreachLevel::Clear};
  double hardstop_utilization{0.0};
  double ecr{0.0};
};

// "brch-" + hash(type | minute | level | hu.4 | ecr.4)
EventId fingerprint(const BreachConditions& conditions);

// hash(minute | ecr.4 | hu.4 | level | gross.2 | capital.2)
std::string snapshotHash(const domain::CapitalSnapshot& snapshot);

}  // namespace capguard
