#include "forecast_dispatcher.hpp"
#include "holt_winters.hpp"
#include "normal.hpp"
#include "../errors.hpp"
#include <algorithm>
#include <cmath>
#include <memory>
#include <string>

namespace hashcalc {
namespace forecast {

namespace {

constexpr double LOG_INPUT_FLOOR = 1e-8;
constexpr int SEASON_LENGTH = 12;

const std::vector<ArimaOrder>& candidate_orders() {
    static const std::vector<ArimaOrder> orders = {
        {0, 1, 0}, {1, 1, 0}, {0, 1, 1}, {1, 1, 1}, {2, 1, 0}, {0, 1, 2},
        {2, 1, 1}, {1, 1, 2}, {2, 1, 2}, {1, 0, 0}, {0, 0, 1}, {1, 0, 1}
    };
    return orders;
}

const std::vector<SeasonalOrder>& candidate_seasonal_orders() {
    static const std::vector<SeasonalOrder> orders = {
        {0, 0, 0, SEASON_LENGTH}, {1, 0, 0, SEASON_LENGTH}, {0, 0, 1, SEASON_LENGTH},
        {1, 0, 1, SEASON_LENGTH}, {0, 1, 0, SEASON_LENGTH}, {1, 1, 0, SEASON_LENGTH},
        {0, 1, 1, SEASON_LENGTH}, {1, 1, 1, SEASON_LENGTH}
    };
    return orders;
}

bool all_finite(const std::vector<double>& values) {
    return std::all_of(values.begin(), values.end(),
                       [](double v) { return std::isfinite(v); });
}

struct Fitted {
    std::vector<double> mean;
    std::vector<double> std_error;
    ForecastDiagnostics diagnostics;
};

Fitted fit_auto_arima(const std::vector<double>& y, int horizon) {
    std::vector<SeasonalOrder> seasonal_orders;
    if (y.size() >= MIN_SEASONAL_SEARCH_MONTHS) {
        seasonal_orders = candidate_seasonal_orders();
    } else {
        seasonal_orders.push_back({0, 0, 0, SEASON_LENGTH});
    }

    std::unique_ptr<SarimaModel> best;
    Fitted fitted;
    std::vector<std::string> attempted;
    int evaluated = 0;

    for (const auto& order : candidate_orders()) {
        for (const auto& seasonal : seasonal_orders) {
            auto model = std::make_unique<SarimaModel>(order, seasonal);
            attempted.push_back(model->name());
            if (!model->fit(y)) {
                continue;
            }
            ++evaluated;
            if (best && model->aic() >= best->aic()) {
                continue;
            }
            // Explosive fits grow without bound over long horizons
            if (!model->is_stationary()) {
                continue;
            }
            std::vector<double> mean;
            std::vector<double> std_error;
            model->forecast(horizon, mean, std_error);
            if (!all_finite(mean) || !all_finite(std_error)) {
                continue;
            }
            best = std::move(model);
            fitted.mean = std::move(mean);
            fitted.std_error = std::move(std_error);
        }
    }

    if (!best) {
        throw ModelFitError("auto_arima: no valid model found", attempted);
    }

    fitted.diagnostics.model = "auto_arima";
    fitted.diagnostics.order = format_order(best->order());
    fitted.diagnostics.seasonal_order = format_seasonal_order(best->seasonal_order());
    fitted.diagnostics.aic = best->aic();
    fitted.diagnostics.bic = best->bic();
    fitted.diagnostics.models_evaluated = evaluated;
    return fitted;
}

Fitted fit_sarimax(const std::vector<double>& y, int horizon,
                   const ArimaOrder& order, const SeasonalOrder& seasonal) {
    SarimaModel model(order, seasonal);
    if (!model.fit(y)) {
        throw ModelFitError("sarimax: model failed to converge", {model.name()});
    }

    Fitted fitted;
    model.forecast(horizon, fitted.mean, fitted.std_error);
    fitted.diagnostics.model = "sarimax";
    fitted.diagnostics.order = format_order(order);
    fitted.diagnostics.seasonal_order = format_seasonal_order(seasonal);
    fitted.diagnostics.aic = model.aic();
    fitted.diagnostics.bic = model.bic();
    fitted.diagnostics.models_evaluated = 1;
    return fitted;
}

Fitted fit_holt_winters(const std::vector<double>& y, int horizon) {
    bool seasonal = y.size() >= static_cast<size_t>(2 * SEASON_LENGTH);
    HoltWinters model(seasonal, SEASON_LENGTH);
    if (!model.fit(y)) {
        throw ModelFitError("holt_winters: model failed to converge",
                            {seasonal ? "holt_winters(additive, seasonal)" : "holt_winters(additive)"});
    }

    Fitted fitted;
    fitted.mean = model.forecast(horizon);
    fitted.std_error.resize(horizon);
    for (int h = 0; h < horizon; ++h) {
        // Interval widens with the square root of elapsed years
        fitted.std_error[h] = model.residual_std() * std::sqrt((h + 1) / 12.0);
    }
    fitted.diagnostics.model = "holt_winters";
    fitted.diagnostics.aic = model.aic();
    fitted.diagnostics.bic = model.bic();
    fitted.diagnostics.seasonal = seasonal;
    fitted.diagnostics.models_evaluated = 1;
    return fitted;
}

} // anonymous namespace

ForecastModel parse_forecast_model(const std::string& name) {
    if (name == "auto_arima") return ForecastModel::AUTO_ARIMA;
    if (name == "holt_winters") return ForecastModel::HOLT_WINTERS;
    if (name == "sarimax") return ForecastModel::SARIMAX;

    std::string available;
    for (const auto& m : available_models()) {
        if (!available.empty()) available += ", ";
        available += m;
    }
    throw ValidationError("Unknown forecast model '" + name + "'. Available: " + available);
}

std::string to_string(ForecastModel model) {
    switch (model) {
        case ForecastModel::AUTO_ARIMA: return "auto_arima";
        case ForecastModel::HOLT_WINTERS: return "holt_winters";
        case ForecastModel::SARIMAX: return "sarimax";
    }
    return "unknown";
}

std::vector<std::string> available_models() {
    return {"auto_arima", "holt_winters", "sarimax"};
}

ForecastRequest::ForecastRequest()
    : model(ForecastModel::AUTO_ARIMA), horizon(12), confidence(0.95),
      log_transform(true), sarimax_order{1, 1, 1},
      sarimax_seasonal_order{1, 1, 1, SEASON_LENGTH} {}

ForecastDiagnostics::ForecastDiagnostics()
    : aic(0.0), bic(0.0), seasonal(false), models_evaluated(0),
      log_transformed(false), training_points(0) {}

ForecastResult run_forecast(const std::vector<double>& history,
                            const ForecastRequest& request) {
    if (history.size() < MIN_HISTORY_MONTHS) {
        throw DataInsufficiencyError(history.size(), MIN_HISTORY_MONTHS);
    }
    if (request.horizon < 1) {
        throw ValidationError("Forecast horizon must be at least 1 month");
    }
    if (!(request.confidence > 0.0 && request.confidence < 1.0)) {
        throw ValidationError("Confidence level must be between 0 and 1");
    }

    std::vector<double> y = history;
    if (request.log_transform) {
        for (double& v : y) {
            v = std::log(std::max(v, LOG_INPUT_FLOOR));
        }
    }

    Fitted fitted;
    switch (request.model) {
        case ForecastModel::AUTO_ARIMA:
            fitted = fit_auto_arima(y, request.horizon);
            break;
        case ForecastModel::HOLT_WINTERS:
            fitted = fit_holt_winters(y, request.horizon);
            break;
        case ForecastModel::SARIMAX:
            fitted = fit_sarimax(y, request.horizon, request.sarimax_order,
                                 request.sarimax_seasonal_order);
            break;
    }

    const double z = two_sided_z(request.confidence);

    ForecastResult result;
    result.forecast.resize(request.horizon);
    result.lower_bound.resize(request.horizon);
    result.upper_bound.resize(request.horizon);

    for (int h = 0; h < request.horizon; ++h) {
        double mid = fitted.mean[h];
        double lo = mid - z * fitted.std_error[h];
        double hi = mid + z * fitted.std_error[h];
        if (request.log_transform) {
            mid = std::exp(mid);
            lo = std::exp(lo);
            hi = std::exp(hi);
        }
        if (!std::isfinite(mid) || !std::isfinite(lo) || !std::isfinite(hi)) {
            throw ModelFitError(fitted.diagnostics.model + ": forecast diverged at month " +
                                    std::to_string(h + 1),
                                {fitted.diagnostics.model});
        }
        result.forecast[h] = std::max(mid, FORECAST_FLOOR);
        result.lower_bound[h] = std::max(lo, FORECAST_FLOOR);
        result.upper_bound[h] = std::max(hi, FORECAST_FLOOR);
    }

    result.diagnostics = fitted.diagnostics;
    result.diagnostics.log_transformed = request.log_transform;
    result.diagnostics.training_points = history.size();
    return result;
}

} // namespace forecast
} // namespace hashcalc
