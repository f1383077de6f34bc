#include "price_curve.hpp"
#include "errors.hpp"
#include "rounding.hpp"
#include <algorithm>
#include <iterator>

namespace hashcalc {

namespace {

constexpr uint64_t GOLDEN_RATIO_MULTIPLIER = 2654435761ULL;
constexpr uint64_t MASK_32 = 0xFFFFFFFFULL;

double interpolate_linear(const std::map<int, double>& anchors, int month) {
    auto upper = anchors.lower_bound(month);
    if (upper != anchors.end() && upper->first == month) {
        return upper->second;
    }
    if (upper == anchors.end()) {
        return std::prev(upper)->second;        // past the last anchor
    }
    if (upper == anchors.begin()) {
        return upper->second;                   // before the first anchor
    }
    auto lower = std::prev(upper);
    double fraction = static_cast<double>(month - lower->first) /
                      static_cast<double>(upper->first - lower->first);
    return round_usd(lower->second + fraction * (upper->second - lower->second));
}

double interpolate_step(const std::map<int, double>& anchors, int month) {
    auto it = anchors.upper_bound(month);
    if (it == anchors.begin()) {
        return it->second;
    }
    return std::prev(it)->second;
}

} // anonymous namespace

InterpolationMode parse_interpolation_mode(const std::string& name) {
    if (name == "linear") return InterpolationMode::LINEAR;
    if (name == "step") return InterpolationMode::STEP;
    if (name == "custom") return InterpolationMode::CUSTOM;
    throw ValidationError("Unknown interpolation mode '" + name +
                          "'. Expected linear, step or custom");
}

std::string to_string(InterpolationMode mode) {
    switch (mode) {
        case InterpolationMode::LINEAR: return "linear";
        case InterpolationMode::STEP: return "step";
        case InterpolationMode::CUSTOM: return "custom";
    }
    return "unknown";
}

PriceCurveParams::PriceCurveParams()
    : start_price(0.0), months(120), mode(InterpolationMode::LINEAR),
      noise_enabled(false), noise_seed(42), noise_amplitude(0.05) {}

std::map<int, double> build_month_anchors(double start_price, int months,
                                          const AnchorSet& anchors) {
    std::map<int, double> month_anchors;
    for (const auto& [year, price] : anchors) {
        int month = year * 12;
        if (month < months) {
            month_anchors[month] = price;
        } else if (month == months) {
            month_anchors[months - 1] = price;
        }
    }
    if (month_anchors.find(0) == month_anchors.end()) {
        month_anchors[0] = start_price;
    }
    return month_anchors;
}

double deterministic_noise(uint64_t seed, uint64_t index) {
    uint64_t x = seed ^ (index * GOLDEN_RATIO_MULTIPLIER);
    for (int round = 0; round < 3; ++round) {
        x = ((x ^ (x >> 16)) * 0x85ebca6bULL) & MASK_32;
        x = ((x ^ (x >> 13)) * 0xc2b2ae35ULL) & MASK_32;
        x = (x ^ (x >> 16)) & MASK_32;
    }
    return static_cast<double>(x) / static_cast<double>(MASK_32) * 2.0 - 1.0;
}

std::vector<double> generate_price_curve(const PriceCurveParams& params) {
    if (params.months < 1) {
        throw ValidationError("Price curve needs at least 1 month");
    }
    if (params.start_price < 0.0) {
        throw ValidationError("Start price must be non-negative");
    }

    const size_t months = static_cast<size_t>(params.months);
    std::vector<double> prices;
    prices.reserve(months);

    if (params.mode == InterpolationMode::CUSTOM) {
        prices.assign(params.custom_prices.begin(),
                      params.custom_prices.begin() +
                          std::min(months, params.custom_prices.size()));
        double pad = prices.empty() ? params.start_price : prices.back();
        prices.resize(months, pad);
    } else {
        auto anchors = build_month_anchors(params.start_price, params.months, params.anchors);
        for (int m = 0; m < params.months; ++m) {
            prices.push_back(params.mode == InterpolationMode::STEP
                                 ? interpolate_step(anchors, m)
                                 : interpolate_linear(anchors, m));
        }
    }

    if (params.noise_enabled) {
        for (size_t i = 0; i < prices.size(); ++i) {
            double factor = 1.0 + deterministic_noise(params.noise_seed, i) * params.noise_amplitude;
            prices[i] = prices[i] * factor;
        }
    }

    for (double& p : prices) {
        p = round_usd(p);
    }
    return prices;
}

PriceForecast generate_price_forecast(const HistoricalSeries& monthly_prices,
                                      const forecast::ForecastRequest& request) {
    forecast::ForecastRequest log_request = request;
    log_request.log_transform = true;

    auto fc = forecast::run_forecast(series_values(monthly_prices), log_request);

    PriceForecast result;
    for (size_t i = 0; i < fc.forecast.size(); ++i) {
        result.prices.push_back(round_usd(fc.forecast[i]));
        result.lower_bound.push_back(round_usd(fc.lower_bound[i]));
        result.upper_bound.push_back(round_usd(fc.upper_bound[i]));
    }
    result.diagnostics = fc.diagnostics;
    result.model_info.training_months = monthly_prices.size();
    result.model_info.training_start = monthly_prices.front().date;
    result.model_info.training_end = monthly_prices.back().date;
    result.model_info.last_historical_price = round_usd(monthly_prices.back().value);
    result.model_info.confidence = request.confidence;
    result.model_info.forecast_months = request.horizon;
    return result;
}

PriceForecast generate_price_forecast(MarketHistorySource& source,
                                      const forecast::ForecastRequest& request) {
    return generate_price_forecast(source.monthly_btc_prices(), request);
}

} // namespace hashcalc
