#include "capguard/util/number_format.hpp"

#include <cmath>
#include <cstdio>

namespace capguard {

std::string formatFixed(double value, int decimals) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
  return buf;
}

std::string formatNumber(double value) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.12g", value);
  return buf;
}

std::string formatGrouped(double value) {
  const double rounded = std::round(value);
  std::string digits = formatFixed(std::fabs(rounded), 0);

  std::string out;
  out.reserve(digits.size() + digits.size() / 3 + 1);
  const std::size_t lead = digits.size() % 3;
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if (i != 0 && (i % 3) == lead % 3) {
      out += ',';
    }
    out += digits[i];
  }
  if (rounded < 0) {
    out.insert(out.begin(), '-');
  }
  return out;
}

}  // namespace capguard
