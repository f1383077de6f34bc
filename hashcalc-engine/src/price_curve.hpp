#ifndef HASHCALC_PRICE_CURVE_HPP
#define HASHCALC_PRICE_CURVE_HPP

#include "forecast/forecast_dispatcher.hpp"
#include "market_history.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace hashcalc {

enum class InterpolationMode {
    LINEAR,
    STEP,
    CUSTOM
};

InterpolationMode parse_interpolation_mode(const std::string& name);
std::string to_string(InterpolationMode mode);

// Year index (0..10) -> target BTC/USD price
using AnchorSet = std::map<int, double>;

struct PriceCurveParams {
    double start_price;
    int months;
    AnchorSet anchors;
    InterpolationMode mode;
    std::vector<double> custom_prices;   // CUSTOM only
    bool noise_enabled;
    uint64_t noise_seed;
    double noise_amplitude;              // fraction, 0.05 = +/-5%

    PriceCurveParams();
};

// Month-indexed breakpoints. Month 0 is always present (start price unless
// year 0 is anchored); a year landing exactly on the horizon is pinned to the
// last month, later years are dropped.
std::map<int, double> build_month_anchors(double start_price, int months,
                                          const AnchorSet& anchors);

// Bounded perturbation in [-1, 1] from (seed, index) via integer bit mixing
double deterministic_noise(uint64_t seed, uint64_t index);

// Monthly BTC/USD prices rounded to cents
std::vector<double> generate_price_curve(const PriceCurveParams& params);

struct PriceModelInfo {
    size_t training_months;
    std::string training_start;
    std::string training_end;
    double last_historical_price;
    double confidence;
    int forecast_months;
};

struct PriceForecast {
    std::vector<double> prices;
    std::vector<double> lower_bound;
    std::vector<double> upper_bound;
    forecast::ForecastDiagnostics diagnostics;
    PriceModelInfo model_info;
};

// Forecast-mode price curve: fits `request.model` on the log of monthly
// closes fetched from `source` and forecasts `request.horizon` months.
PriceForecast generate_price_forecast(MarketHistorySource& source,
                                      const forecast::ForecastRequest& request);

// Same, on an already fetched monthly series
PriceForecast generate_price_forecast(const HistoricalSeries& monthly_prices,
                                      const forecast::ForecastRequest& request);

} // namespace hashcalc

#endif // HASHCALC_PRICE_CURVE_HPP
