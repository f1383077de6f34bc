#include "ops_calibration.hpp"
#include "rounding.hpp"
#include <algorithm>

namespace hashcalc {

namespace {

double average(const std::vector<double>& v, double fallback) {
    if (v.empty()) return fallback;
    double s = 0.0;
    for (double x : v) s += x;
    return s / static_cast<double>(v.size());
}

} // anonymous namespace

CalibrationResult calibrate_ops(const std::vector<OpsHistoryEntry>& history,
                                const std::vector<double>& btc_prices,
                                const std::vector<double>& hashprices,
                                const MinerSpec& miner,
                                double assumed_uptime) {
    CalibrationResult result;

    std::vector<double> actual_uptimes;
    std::vector<double> actual_production;
    std::vector<double> predicted_production;
    std::vector<double> efficiency_ratios;

    const double miner_ph = miner.hashrate_th / 1000.0;
    const double predicted_energy = monthly_energy_kwh(miner.power_w, assumed_uptime);

    for (size_t i = 0; i < history.size(); ++i) {
        if (i >= btc_prices.size() || i >= hashprices.size()) {
            break;
        }
        const OpsHistoryEntry& entry = history[i];

        double predicted_btc = hashprices[i] * miner_ph * DAYS_PER_MONTH * assumed_uptime;
        double variance = predicted_btc > 0.0
                              ? (entry.btc_produced - predicted_btc) / predicted_btc * 100.0
                              : 0.0;

        actual_uptimes.push_back(entry.uptime);
        actual_production.push_back(entry.btc_produced);
        predicted_production.push_back(predicted_btc);

        // Energy the rated efficiency implies at the observed uptime vs energy drawn
        double rated_energy = monthly_energy_kwh(miner.power_w, entry.uptime);
        if (entry.energy_kwh > 0.0 && rated_energy > 0.0) {
            efficiency_ratios.push_back(rated_energy / entry.energy_kwh);
        }

        OpsMonthComparison row;
        row.month = entry.month;
        row.predicted_btc = round_btc(predicted_btc);
        row.actual_btc = round_btc(entry.btc_produced);
        row.variance_pct = round_to(variance, 2);
        row.predicted_energy_kwh = round_to(predicted_energy, 2);
        row.actual_energy_kwh = round_to(entry.energy_kwh, 2);
        row.actual_uptime = round_ratio(entry.uptime);
        result.monthly_comparison.push_back(row);
    }

    double avg_uptime = average(actual_uptimes, assumed_uptime);
    double avg_actual = average(actual_production, 0.0);
    double avg_predicted = average(predicted_production, 0.0);

    double uptime_factor = assumed_uptime > 0.0 ? avg_uptime / assumed_uptime : 1.0;
    double production = avg_predicted > 0.0 ? avg_actual / avg_predicted : 1.0;
    double efficiency = efficiency_ratios.empty() ? production : average(efficiency_ratios, 1.0);

    if (uptime_factor < UPTIME_FACTOR_WARN) {
        result.flags.push_back("WARNING: Realized uptime factor " + format_fixed(uptime_factor, 2) +
                               " is below 0.90; model is optimistic");
    }
    if (production < PRODUCTION_SHORTFALL_FLAG) {
        result.flags.push_back("RED FLAG: Production is " + format_fixed((1.0 - production) * 100.0, 0) +
                               "% below model; significant gap");
    }
    if (production > PRODUCTION_SURPLUS_FLAG) {
        result.flags.push_back("INFO: Production is " + format_fixed((production - 1.0) * 100.0, 0) +
                               "% above model; model may be conservative");
    }

    if (!result.monthly_comparison.empty()) {
        std::vector<double> variances;
        for (const auto& row : result.monthly_comparison) {
            variances.push_back(row.variance_pct);
        }
        std::sort(variances.begin(), variances.end());
        size_t n = variances.size();
        size_t p90_idx = std::min(static_cast<size_t>(static_cast<double>(n) * 0.9), n - 1);
        result.variance_p50 = round_to(variances[n / 2], 2);
        result.variance_p90 = round_to(variances[p90_idx], 2);
    } else {
        result.variance_p50 = 0.0;
        result.variance_p90 = 0.0;
    }

    result.realized_uptime_factor = round_ratio(uptime_factor);
    result.realized_efficiency_factor = round_ratio(efficiency);
    result.production_adjustment = round_ratio(production);
    return result;
}

} // namespace hashcalc
