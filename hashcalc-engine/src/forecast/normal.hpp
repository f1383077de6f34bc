#ifndef HASHCALC_FORECAST_NORMAL_HPP
#define HASHCALC_FORECAST_NORMAL_HPP

namespace hashcalc {
namespace forecast {

// Inverse of the standard normal CDF for p in (0, 1).
// Rational approximation (Acklam), relative error below 1.2e-9.
double normal_quantile(double p);

// Two-sided critical value for a confidence level, e.g. 0.95 -> 1.96
double two_sided_z(double confidence);

} // namespace forecast
} // namespace hashcalc

#endif // HASHCALC_FORECAST_NORMAL_HPP
