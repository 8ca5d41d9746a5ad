#pragma once

#include <string>

namespace capguard {

// Number rendering for reason strings, formulas and ids. All functions use
// '.' as the decimal point regardless of the global locale.

// Fixed decimals: formatFixed(8.5, 4) == "8.5000".
std::string formatFixed(double value, int decimals);

// Shortest form without trailing zeros: 100.0 → "100", 12.5 → "12.5".
std::string formatNumber(double value);

// Rounded to whole units with thousands separators: 1234567.8 → "1,234,568".
std::string formatGrouped(double value);

}  // namespace capguard
