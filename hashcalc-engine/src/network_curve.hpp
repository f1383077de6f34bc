#ifndef HASHCALC_NETWORK_CURVE_HPP
#define HASHCALC_NETWORK_CURVE_HPP

#include "forecast/forecast_dispatcher.hpp"
#include "market_history.hpp"
#include <string>
#include <vector>

namespace hashcalc {

// Calendar month, comparable and offsettable
struct YearMonth {
    int year;
    int month;   // 1..12

    static YearMonth parse(const std::string& text);   // "YYYY-MM"
    YearMonth plus_months(int offset) const;
    std::string to_string() const;

    bool operator<(const YearMonth& other) const {
        return year < other.year || (year == other.year && month < other.month);
    }
    bool operator<=(const YearMonth& other) const { return !(other < *this); }
    bool operator==(const YearMonth& other) const {
        return year == other.year && month == other.month;
    }
};

struct HalvingEntry {
    YearMonth date;
    double subsidy_btc;
};

const std::vector<HalvingEntry>& halving_schedule();

constexpr double POST_2024_SUBSIDY = 3.125;

// Subsidy in effect at `month`: the last schedule entry dated <= month
double block_subsidy(const YearMonth& month, bool halving_enabled);

enum class FeeRegime {
    LOW,
    BASE,
    HIGH
};

FeeRegime parse_fee_regime(const std::string& name);
std::string to_string(FeeRegime regime);
double fee_multiplier(FeeRegime regime);

constexpr double MONTHLY_FEE_GROWTH = 0.001;

struct NetworkCurveParams {
    std::string start_date;           // "YYYY-MM"
    int months;
    double starting_hashrate_eh;
    double monthly_hashrate_growth;   // fraction per month
    double starting_fees_per_block;   // BTC
    FeeRegime fee_regime;
    bool halving_enabled;

    NetworkCurveParams();
};

struct NetworkCurve {
    std::vector<double> difficulty;
    std::vector<double> hashrate_eh;
    std::vector<double> fees_per_block;
    std::vector<double> hashprice_btc_per_ph_day;
    std::vector<double> subsidy_btc;
    std::vector<std::string> halving_months;   // halvings within the horizon
    std::vector<std::string> warnings;
};

// BTC earned per PH/s per day
double compute_hashprice(double subsidy, double fees_per_block, double hashrate_eh);

// difficulty ~= hashrate[H/s] * 2^32 / 600
double difficulty_from_hashrate(double hashrate_eh);

NetworkCurve generate_network_curve(const NetworkCurveParams& params);

struct NetworkForecast {
    NetworkCurve curve;                        // point forecast
    std::vector<double> difficulty_lower;
    std::vector<double> difficulty_upper;
    std::vector<double> hashrate_lower;
    std::vector<double> hashrate_upper;
    std::vector<double> fees_lower;
    std::vector<double> fees_upper;
    std::vector<double> hashprice_lower;
    std::vector<double> hashprice_upper;
    forecast::ForecastDiagnostics hashrate_diagnostics;
    forecast::ForecastDiagnostics fee_diagnostics;
    size_t training_months;
    std::string training_start;
    std::string training_end;
    double confidence;
    int forecast_months;

    NetworkForecast();
};

// Forecast hashrate and fees independently (log scale). Difficulty bounds
// follow the hashrate bounds. The upper hashprice bound pairs the upper fee
// bound with the lower hashrate bound, the lower hashprice bound the reverse.
NetworkForecast generate_network_forecast(const NetworkHistory& history,
                                          const std::string& start_date,
                                          bool halving_enabled,
                                          const forecast::ForecastRequest& request);

NetworkForecast generate_network_forecast(MarketHistorySource& source,
                                          const std::string& start_date,
                                          bool halving_enabled,
                                          const forecast::ForecastRequest& request);

} // namespace hashcalc

#endif // HASHCALC_NETWORK_CURVE_HPP
