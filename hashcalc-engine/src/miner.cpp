#include "miner.hpp"
#include "errors.hpp"
#include "rounding.hpp"
#include <algorithm>

namespace hashcalc {

MinerSpec::MinerSpec()
    : hashrate_th(0.0), power_w(0.0), price_usd(0.0),
      lifetime_months(36), maintenance_pct(0.0) {}

HostingSiteSpec::HostingSiteSpec()
    : electricity_rate(0.0), hosting_fee_per_kw_month(0.0),
      uptime_expectation(0.95), curtailment_pct(0.0), capacity_mw(0.0) {}

double monthly_energy_kwh(double power_w, double uptime) {
    return power_w / 1000.0 * HOURS_PER_DAY * DAYS_PER_MONTH * uptime;
}

MinerSimulationResult simulate_miner(const MinerSpec& miner,
                                     const std::vector<double>& btc_prices,
                                     const std::vector<double>& hashprices,
                                     double electricity_rate,
                                     double uptime,
                                     int months) {
    if (miner.hashrate_th <= 0.0) {
        throw ValidationError("Miner hashrate must be positive");
    }
    if (months < 0) {
        throw ValidationError("Months must be non-negative");
    }

    size_t horizon = std::min({static_cast<size_t>(months), btc_prices.size(), hashprices.size()});
    double depreciation = miner.lifetime_months > 0
                              ? miner.price_usd / miner.lifetime_months
                              : 0.0;
    double elec_cost = monthly_energy_kwh(miner.power_w, uptime) * electricity_rate;

    MinerSimulationResult result;
    result.totals = {0.0, 0.0, 0.0, 0.0, 0.0};
    double cumulative_net = 0.0;
    double cumulative_ebit = 0.0;

    for (size_t t = 0; t < horizon; ++t) {
        double price = btc_prices[t];
        double hp = hashprices[t];

        double btc_mined = hp * (miner.hashrate_th / 1000.0) * DAYS_PER_MONTH * uptime;
        double revenue = btc_mined * price;
        double maintenance = revenue * miner.maintenance_pct;
        double dep = static_cast<int>(t) < miner.lifetime_months ? depreciation : 0.0;
        double net = revenue - elec_cost - maintenance;
        double ebit = net - dep;
        double net_btc = price > 0.0 ? btc_mined - elec_cost / price : 0.0;

        cumulative_net += net;
        cumulative_ebit += ebit;

        MinerMonth row;
        row.month = static_cast<int>(t);
        row.btc_price_usd = round_usd(price);
        row.hashprice_btc_per_ph_day = round_btc(hp);
        row.btc_mined = round_btc(btc_mined);
        row.revenue_usd = round_usd(revenue);
        row.electricity_cost_usd = round_usd(elec_cost);
        row.maintenance_usd = round_usd(maintenance);
        row.depreciation_usd = round_usd(dep);
        row.net_usd = round_usd(net);
        row.ebit_usd = round_usd(ebit);
        row.net_btc = round_btc(net_btc);
        row.cumulative_net_usd = round_usd(cumulative_net);
        row.cumulative_ebit_usd = round_usd(cumulative_ebit);
        result.monthly.push_back(row);

        if (!result.break_even_month && cumulative_ebit >= 0.0) {
            result.break_even_month = static_cast<int>(t);
        }

        result.totals.btc_mined += btc_mined;
        result.totals.revenue_usd += revenue;
        result.totals.electricity_cost_usd += elec_cost;
        result.totals.net_usd += net;
        result.totals.ebit_usd += ebit;
    }

    result.totals.btc_mined = round_btc(result.totals.btc_mined);
    result.totals.revenue_usd = round_usd(result.totals.revenue_usd);
    result.totals.electricity_cost_usd = round_usd(result.totals.electricity_cost_usd);
    result.totals.net_usd = round_usd(result.totals.net_usd);
    result.totals.ebit_usd = round_usd(result.totals.ebit_usd);
    return result;
}

} // namespace hashcalc
