#ifndef HASHCALC_ROUNDING_HPP
#define HASHCALC_ROUNDING_HPP

#include <cmath>
#include <string>

namespace hashcalc {

// Output precision is part of the result contract:
// USD 2 decimals, BTC 8, APRs and ratios 4.
inline double round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

inline double round_usd(double value) { return round_to(value, 2); }
inline double round_btc(double value) { return round_to(value, 8); }
inline double round_ratio(double value) { return round_to(value, 4); }

// printf-style fixed-point text, used in warning and reason messages
std::string format_fixed(double value, int decimals);

constexpr double DAYS_PER_MONTH = 30.44;
constexpr double BLOCKS_PER_DAY = 144.0;
constexpr double HOURS_PER_DAY = 24.0;

} // namespace hashcalc

#endif // HASHCALC_ROUNDING_HPP
