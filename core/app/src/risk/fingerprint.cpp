#include "capguard/risk/fingerprint.hpp"

#include "capguard/domain/names.hpp"
#include "capguard/time/time_utils.hpp"
#include "capguard/util/number_format.hpp"

#include <cstdio>

namespace capguard {

namespace {

constexpr std::uint32_t kFnvOffsetBasis = 0x811c9dc5u;
constexpr std::uint32_t kFnvPrime = 0x01000193u;

}  // namespace

std::string fnv1aHex(std::string_view text) {
  std::uint32_t hash = kFnvOffsetBasis;
  for (unsigned char c : text) {
    hash ^= c;
    hash *= kFnvPrime;
  }
  char buf[9];
  std::snprintf(buf, sizeof(buf), "%08x", static_cast<unsigned>(hash));
  return buf;
}

std::string fingerprintParts(std::initializer_list<std::string_view> parts) {
  std::string joined;
  bool first = true;
  for (std::string_view p : parts) {
    if (!first) {
      joined += '|';
    }
    joined.append(p.data(), p.size());
    first = false;
  }
  return fnv1aHex(joined);
}

EventId fingerprint(const BreachConditions& c) {
  const std::string minute = minuteBucket(c.as_of_ms);
  const std::string hu = formatFixed(c.hardstop_utilization, 4);
  const std::string ecr = formatFixed(c.ecr, 4);
  return "brch-" + fingerprintParts({domain::toString(c.type), minute,
                                     domain::toString(c.breach_level), hu,
                                     ecr});
}

std::string snapshotHash(const domain::CapitalSnapshot& s) {
  const std::string minute = minuteBucket(s.as_of_ms);
  const std::string ecr = formatFixed(s.ecr, 4);
  const std::string hu = formatFixed(s.hardstop_utilization, 4);
  const std::string gross = formatFixed(s.gross_exposure_notional, 2);
  const std::string capital = formatFixed(s.capital_base, 2);
  return fingerprintParts({minute, ecr, hu, domain::toString(s.breach_level),
                           gross, capital});
}

}  // namespace capguard
