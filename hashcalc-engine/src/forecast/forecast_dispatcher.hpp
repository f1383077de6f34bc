#ifndef HASHCALC_FORECAST_DISPATCHER_HPP
#define HASHCALC_FORECAST_DISPATCHER_HPP

#include "arima.hpp"
#include <string>
#include <vector>

namespace hashcalc {
namespace forecast {

enum class ForecastModel {
    AUTO_ARIMA,
    HOLT_WINTERS,
    SARIMAX
};

// Throws ValidationError naming the available models
ForecastModel parse_forecast_model(const std::string& name);
std::string to_string(ForecastModel model);
std::vector<std::string> available_models();

constexpr size_t MIN_HISTORY_MONTHS = 24;
constexpr size_t MIN_SEASONAL_SEARCH_MONTHS = 36;
constexpr double FORECAST_FLOOR = 0.01;

struct ForecastRequest {
    ForecastModel model;
    int horizon;                  // months to forecast
    double confidence;            // interval coverage, e.g. 0.95
    bool log_transform;
    ArimaOrder sarimax_order;     // used by SARIMAX only
    SeasonalOrder sarimax_seasonal_order;

    ForecastRequest();
};

struct ForecastDiagnostics {
    std::string model;
    std::string order;            // ARIMA family only
    std::string seasonal_order;   // ARIMA family only
    double aic;
    double bic;
    bool seasonal;                // Holt-Winters only
    int models_evaluated;
    bool log_transformed;
    size_t training_points;

    ForecastDiagnostics();
};

struct ForecastResult {
    std::vector<double> forecast;
    std::vector<double> lower_bound;
    std::vector<double> upper_bound;
    ForecastDiagnostics diagnostics;
};

// Fit the requested model to a monthly history and forecast `horizon` months.
// Every value in the result is floored at FORECAST_FLOOR and
// lower_bound[i] <= forecast[i] <= upper_bound[i].
//
// Throws DataInsufficiencyError below MIN_HISTORY_MONTHS, ModelFitError when
// no candidate fits, ValidationError on a bad horizon or confidence.
ForecastResult run_forecast(const std::vector<double>& history,
                            const ForecastRequest& request);

} // namespace forecast
} // namespace hashcalc

#endif // HASHCALC_FORECAST_DISPATCHER_HPP
