#ifndef HASHCALC_OPS_CALIBRATION_HPP
#define HASHCALC_OPS_CALIBRATION_HPP

#include "miner.hpp"
#include <string>
#include <vector>

namespace hashcalc {

// One month of observed fleet operations
struct OpsHistoryEntry {
    std::string month;       // label, e.g. "2025-03"
    double btc_produced;
    double uptime;           // fraction
    double energy_kwh;
};

struct OpsMonthComparison {
    std::string month;
    double predicted_btc;
    double actual_btc;
    double variance_pct;
    double predicted_energy_kwh;
    double actual_energy_kwh;
    double actual_uptime;
};

// Multiplicative corrections fed into later waterfall runs
struct CalibrationFactors {
    double uptime_factor;
    double production_adjustment;

    CalibrationFactors() : uptime_factor(1.0), production_adjustment(1.0) {}
    CalibrationFactors(double uptime, double production)
        : uptime_factor(uptime), production_adjustment(production) {}
};

struct CalibrationResult {
    double realized_uptime_factor;
    double realized_efficiency_factor;
    double production_adjustment;
    double variance_p50;
    double variance_p90;
    std::vector<OpsMonthComparison> monthly_comparison;
    std::vector<std::string> flags;

    CalibrationFactors factors() const {
        return CalibrationFactors(realized_uptime_factor, production_adjustment);
    }
};

constexpr double UPTIME_FACTOR_WARN = 0.90;
constexpr double PRODUCTION_SHORTFALL_FLAG = 0.85;
constexpr double PRODUCTION_SURPLUS_FLAG = 1.10;

// Compare observed history with what the deterministic model predicts for a
// fleet of `miner` at `assumed_uptime`. History beyond the supplied curves is
// ignored.
CalibrationResult calibrate_ops(const std::vector<OpsHistoryEntry>& history,
                                const std::vector<double>& btc_prices,
                                const std::vector<double>& hashprices,
                                const MinerSpec& miner,
                                double assumed_uptime);

} // namespace hashcalc

#endif // HASHCALC_OPS_CALIBRATION_HPP
