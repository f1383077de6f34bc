#ifndef HASHCALC_MINER_HPP
#define HASHCALC_MINER_HPP

#include <optional>
#include <string>
#include <vector>

namespace hashcalc {

struct MinerSpec {
    std::string name;
    double hashrate_th;
    double power_w;
    double price_usd;
    int lifetime_months;
    double maintenance_pct;    // fraction of monthly revenue

    MinerSpec();

    double efficiency_j_th() const {
        return hashrate_th > 0.0 ? power_w / hashrate_th : 0.0;
    }
};

struct HostingSiteSpec {
    std::string name;
    double electricity_rate;            // USD per kWh
    double hosting_fee_per_kw_month;    // USD
    double uptime_expectation;          // fraction
    double curtailment_pct;             // fraction of time curtailed
    double capacity_mw;

    HostingSiteSpec();
};

struct MinerMonth {
    int month;
    double btc_price_usd;
    double hashprice_btc_per_ph_day;
    double btc_mined;
    double revenue_usd;
    double electricity_cost_usd;
    double maintenance_usd;
    double depreciation_usd;
    double net_usd;
    double ebit_usd;
    double net_btc;                // mined BTC less BTC sold for electricity
    double cumulative_net_usd;
    double cumulative_ebit_usd;
};

struct MinerTotals {
    double btc_mined;
    double revenue_usd;
    double electricity_cost_usd;
    double net_usd;
    double ebit_usd;
};

struct MinerSimulationResult {
    std::vector<MinerMonth> monthly;
    MinerTotals totals;
    std::optional<int> break_even_month;   // first month cumulative EBIT >= 0
};

// Monthly electricity draw in kWh at the given uptime
double monthly_energy_kwh(double power_w, double uptime);

// Per-month economics of a single miner. The horizon is truncated to the
// shortest of `months` and the two curve lengths.
MinerSimulationResult simulate_miner(const MinerSpec& miner,
                                     const std::vector<double>& btc_prices,
                                     const std::vector<double>& hashprices,
                                     double electricity_rate,
                                     double uptime,
                                     int months);

} // namespace hashcalc

#endif // HASHCALC_MINER_HPP
