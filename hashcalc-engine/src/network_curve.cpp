#include "network_curve.hpp"
#include "errors.hpp"
#include "rounding.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace hashcalc {

namespace {

constexpr double TWO_POW_32 = 4294967296.0;
constexpr double SECONDS_PER_BLOCK = 600.0;
constexpr double HASHPRICE_JUMP = 0.10;
constexpr double MIN_FORECAST_HASHRATE_EH = 0.001;

std::string format_subsidy(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

void note_halving(NetworkCurve& curve, int month_index, const YearMonth& current) {
    for (const auto& entry : halving_schedule()) {
        if (entry.date == current) {
            curve.halving_months.push_back(current.to_string());
            curve.warnings.push_back(
                "Halving at month " + std::to_string(month_index) + " (" + current.to_string() +
                "): subsidy drops to " + format_subsidy(entry.subsidy_btc) + " BTC");
        }
    }
}

} // anonymous namespace

// ============================================================================
// Calendar and halving schedule
// ============================================================================

YearMonth YearMonth::parse(const std::string& text) {
    int year = 0;
    int month = 0;
    char dash = 0;
    std::istringstream iss(text);
    if (!(iss >> year >> dash >> month) || dash != '-' || month < 1 || month > 12) {
        throw ValidationError("Invalid month '" + text + "', expected YYYY-MM");
    }
    return {year, month};
}

YearMonth YearMonth::plus_months(int offset) const {
    int index = year * 12 + (month - 1) + offset;
    return {index / 12, index % 12 + 1};
}

std::string YearMonth::to_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d", year, month);
    return buf;
}

const std::vector<HalvingEntry>& halving_schedule() {
    static const std::vector<HalvingEntry> schedule = {
        {{2024, 4}, 3.125},
        {{2028, 4}, 1.5625},
        {{2032, 4}, 0.78125},
        {{2036, 4}, 0.390625},
    };
    return schedule;
}

double block_subsidy(const YearMonth& month, bool halving_enabled) {
    if (!halving_enabled) {
        return POST_2024_SUBSIDY;
    }
    double subsidy = POST_2024_SUBSIDY;
    for (const auto& entry : halving_schedule()) {
        if (entry.date <= month) {
            subsidy = entry.subsidy_btc;
        }
    }
    return subsidy;
}

FeeRegime parse_fee_regime(const std::string& name) {
    if (name == "low") return FeeRegime::LOW;
    if (name == "base") return FeeRegime::BASE;
    if (name == "high") return FeeRegime::HIGH;
    throw ValidationError("Unknown fee regime '" + name + "'. Expected low, base or high");
}

std::string to_string(FeeRegime regime) {
    switch (regime) {
        case FeeRegime::LOW: return "low";
        case FeeRegime::BASE: return "base";
        case FeeRegime::HIGH: return "high";
    }
    return "unknown";
}

double fee_multiplier(FeeRegime regime) {
    switch (regime) {
        case FeeRegime::LOW: return 0.5;
        case FeeRegime::BASE: return 1.0;
        case FeeRegime::HIGH: return 2.0;
    }
    return 1.0;
}

NetworkCurveParams::NetworkCurveParams()
    : start_date("2025-01"), months(120), starting_hashrate_eh(700.0),
      monthly_hashrate_growth(0.02), starting_fees_per_block(0.1),
      fee_regime(FeeRegime::BASE), halving_enabled(true) {}

// ============================================================================
// Deterministic curve
// ============================================================================

double compute_hashprice(double subsidy, double fees_per_block, double hashrate_eh) {
    double hashrate_th = hashrate_eh * 1e6;
    if (hashrate_th <= 0.0) {
        return 0.0;
    }
    return (subsidy + fees_per_block) * BLOCKS_PER_DAY / hashrate_th * 1000.0;
}

double difficulty_from_hashrate(double hashrate_eh) {
    return hashrate_eh * 1e6 * TWO_POW_32 / SECONDS_PER_BLOCK;
}

NetworkCurve generate_network_curve(const NetworkCurveParams& params) {
    if (params.months < 1) {
        throw ValidationError("Network curve needs at least 1 month");
    }
    if (params.starting_hashrate_eh <= 0.0) {
        throw ValidationError("Starting hashrate must be positive");
    }

    const YearMonth start = YearMonth::parse(params.start_date);
    const double multiplier = fee_multiplier(params.fee_regime);

    NetworkCurve curve;
    double previous_hashprice = 0.0;

    for (int m = 0; m < params.months; ++m) {
        YearMonth current = start.plus_months(m);
        double hashrate = params.starting_hashrate_eh *
                          std::pow(1.0 + params.monthly_hashrate_growth, m);
        double subsidy = block_subsidy(current, params.halving_enabled);
        double fees = round_to(params.starting_fees_per_block * multiplier *
                               std::pow(1.0 + MONTHLY_FEE_GROWTH, m), 6);
        double hashprice = compute_hashprice(subsidy, fees, hashrate);

        curve.hashrate_eh.push_back(round_to(hashrate, 2));
        curve.difficulty.push_back(round_to(difficulty_from_hashrate(hashrate), 0));
        curve.fees_per_block.push_back(round_to(fees, 6));
        curve.hashprice_btc_per_ph_day.push_back(round_btc(hashprice));
        curve.subsidy_btc.push_back(subsidy);

        if (m > 0 && previous_hashprice > 0.0 &&
            hashprice > previous_hashprice * (1.0 + HASHPRICE_JUMP) &&
            params.monthly_hashrate_growth > 0.0) {
            double change = (hashprice / previous_hashprice - 1.0) * 100.0;
            curve.warnings.push_back(
                "Month " + std::to_string(m) + ": hashprice rising (+" +
                format_fixed(change, 1) + "%) while difficulty also rising; check fee assumptions");
        }
        previous_hashprice = hashprice;

        if (params.halving_enabled) {
            note_halving(curve, m, current);
        }
    }

    return curve;
}

// ============================================================================
// Forecast mode
// ============================================================================

NetworkForecast::NetworkForecast()
    : training_months(0), confidence(0.0), forecast_months(0) {}

NetworkForecast generate_network_forecast(const NetworkHistory& history,
                                          const std::string& start_date,
                                          bool halving_enabled,
                                          const forecast::ForecastRequest& request) {
    forecast::ForecastRequest log_request = request;
    log_request.log_transform = true;

    auto hashrate_fc = forecast::run_forecast(history.hashrate_eh, log_request);
    auto fee_fc = forecast::run_forecast(history.fees_per_block_btc, log_request);

    const YearMonth start = YearMonth::parse(start_date);

    NetworkForecast result;
    result.training_months = history.size();
    if (!history.months.empty()) {
        result.training_start = history.months.front();
        result.training_end = history.months.back();
    }
    result.confidence = request.confidence;
    result.forecast_months = request.horizon;
    result.hashrate_diagnostics = hashrate_fc.diagnostics;
    result.fee_diagnostics = fee_fc.diagnostics;

    for (int m = 0; m < request.horizon; ++m) {
        YearMonth current = start.plus_months(m);
        double subsidy = block_subsidy(current, halving_enabled);
        double hashrate = hashrate_fc.forecast[m];
        double fees = fee_fc.forecast[m];

        double hp = compute_hashprice(subsidy, fees, hashrate);
        double hp_upper = compute_hashprice(
            subsidy, fee_fc.upper_bound[m],
            std::max(hashrate_fc.lower_bound[m], MIN_FORECAST_HASHRATE_EH));
        double hp_lower = compute_hashprice(subsidy, fee_fc.lower_bound[m],
                                            hashrate_fc.upper_bound[m]);

        result.curve.hashrate_eh.push_back(round_to(hashrate, 2));
        result.curve.difficulty.push_back(round_to(difficulty_from_hashrate(hashrate), 0));
        result.curve.fees_per_block.push_back(round_to(fees, 6));
        result.curve.hashprice_btc_per_ph_day.push_back(round_btc(hp));
        result.curve.subsidy_btc.push_back(subsidy);
        result.hashrate_lower.push_back(round_to(hashrate_fc.lower_bound[m], 2));
        result.hashrate_upper.push_back(round_to(hashrate_fc.upper_bound[m], 2));
        result.difficulty_lower.push_back(
            round_to(difficulty_from_hashrate(hashrate_fc.lower_bound[m]), 0));
        result.difficulty_upper.push_back(
            round_to(difficulty_from_hashrate(hashrate_fc.upper_bound[m]), 0));
        result.fees_lower.push_back(round_to(fee_fc.lower_bound[m], 6));
        result.fees_upper.push_back(round_to(fee_fc.upper_bound[m], 6));
        result.hashprice_lower.push_back(round_btc(hp_lower));
        result.hashprice_upper.push_back(round_btc(hp_upper));

        if (halving_enabled) {
            note_halving(result.curve, m, current);
        }
    }

    return result;
}

NetworkForecast generate_network_forecast(MarketHistorySource& source,
                                          const std::string& start_date,
                                          bool halving_enabled,
                                          const forecast::ForecastRequest& request) {
    return generate_network_forecast(source.monthly_network_history(), start_date,
                                     halving_enabled, request);
}

} // namespace hashcalc
