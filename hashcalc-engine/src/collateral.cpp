#include "collateral.hpp"
#include "errors.hpp"
#include "rounding.hpp"
#include <algorithm>

namespace hashcalc {

namespace {

void validate(const CollateralProductConfig& config) {
    if (config.capital_raised_usd < 0.0) {
        throw ValidationError("Capital raised must be non-negative");
    }
    if (config.tenor_months < 0) {
        throw ValidationError("Tenor must be non-negative");
    }
    if (config.miner_count < 0) {
        throw ValidationError("Miner count must be non-negative");
    }
    if (config.btc_allocation_pct < 0.0 || config.btc_allocation_pct > 100.0) {
        throw ValidationError("BTC allocation must be between 0 and 100 percent");
    }
    if (config.collateral_ltv_pct < 0.0) {
        throw ValidationError("Collateral LTV must be non-negative");
    }
    for (const auto& s : config.strike_ladder) {
        if (s.btc_sell_pct < 0.0 || s.btc_sell_pct > 100.0) {
            throw ValidationError("Strike sell share must be between 0 and 100 percent");
        }
    }
}

} // anonymous namespace

CollateralProductConfig::CollateralProductConfig()
    : capital_raised_usd(0.0), tenor_months(36), btc_allocation_pct(50.0),
      buying_price_usd(0.0), collateral_ltv_pct(50.0), borrowing_apr(0.08),
      liquidation_ltv_pct(80.0), miner_count(0), reserve_yield_apr(0.04),
      base_yield_apr(0.08), bonus_yield_apr(0.04), early_close_threshold_pct(0.36),
      upfront_commercial_pct(0.0), management_fees_pct(0.0), performance_fees_pct(0.0) {}

CollateralState::CollateralState()
    : stablecoin_reserve(0.0), stablecoin_debt(0.0), btc_collateral(0.0) {}

double loan_to_value_pct(double debt_usd, double collateral_value_usd) {
    if (collateral_value_usd <= 0.0) {
        return NO_COLLATERAL_LTV;
    }
    return std::min(NO_COLLATERAL_LTV, debt_usd / collateral_value_usd * 100.0);
}

// ============================================================================
// Simulation
// ============================================================================

CollateralResult simulate_collateral_product(const CollateralProductConfig& config,
                                             const std::vector<double>& btc_prices,
                                             const std::vector<double>& hashprices) {
    validate(config);

    CollateralResult result;
    CollateralState state;
    CollateralMetrics& m = result.metrics;

    // Inception: fee, split, BTC purchase, capex minted against collateral
    const double upfront_fee = config.capital_raised_usd * config.upfront_commercial_pct / 100.0;
    const double effective_capital = config.capital_raised_usd - upfront_fee;
    const double btc_capital = effective_capital * config.btc_allocation_pct / 100.0;
    state.stablecoin_reserve = effective_capital - btc_capital;

    const double btc_purchased = config.buying_price_usd > 0.0
                                     ? btc_capital / config.buying_price_usd
                                     : 0.0;
    state.btc_collateral = btc_purchased;

    const double max_mintable = btc_purchased * config.buying_price_usd *
                                config.collateral_ltv_pct / 100.0;
    const double miner_capex = config.miner_count * config.miner.price_usd;
    const double minted_for_capex = std::min(miner_capex, std::max(0.0, max_mintable));
    state.stablecoin_debt += minted_for_capex;
    const double capex_shortfall = miner_capex - minted_for_capex;
    if (capex_shortfall > 0.0) {
        result.warnings.push_back("Miner capex exceeds mintable headroom by " +
                                  format_fixed(capex_shortfall, 2) + " USD");
    }

    for (const auto& s : config.strike_ladder) {
        state.strikes.push_back({s.strike_price, s.btc_sell_pct, false, std::nullopt, 0.0, 0.0, 0.0});
    }

    const double effective_uptime = config.site.uptime_expectation *
                                    (1.0 - config.site.curtailment_pct);
    const double fleet_ph = config.miner.hashrate_th * config.miner_count / 1000.0;
    const double fleet_kw = config.miner.power_w * config.miner_count / 1000.0;

    double total_btc_mined = 0.0;
    double total_opex = 0.0;
    double total_interest = 0.0;
    double total_debt_repaid = 0.0;
    double total_mgmt_fees = 0.0;
    double total_reserve_yield = 0.0;
    double cumulative_yield_paid = 0.0;
    int liquidation_months = 0;
    bool bonus_active = false;
    std::optional<int> early_close_month;

    const int months = static_cast<int>(std::min({static_cast<size_t>(config.tenor_months),
                                                  btc_prices.size(), hashprices.size()}));

    for (int t = 0; t < months; ++t) {
        const double spot = btc_prices[t];
        const double hashprice = hashprices[t];

        // 0. Reserve earns yield
        double reserve_yield = state.stablecoin_reserve * config.reserve_yield_apr / 12.0;
        state.stablecoin_reserve += reserve_yield;
        total_reserve_yield += reserve_yield;

        // 1. Production goes to the collateral pool
        double btc_produced = hashprice * fleet_ph * DAYS_PER_MONTH * effective_uptime;
        total_btc_mined += btc_produced;
        state.btc_collateral += btc_produced;

        // 2. OPEX
        double elec_cost = fleet_kw * HOURS_PER_DAY * DAYS_PER_MONTH * effective_uptime *
                           config.site.electricity_rate;
        double hosting_fee = fleet_kw * config.site.hosting_fee_per_kw_month;
        double maintenance = btc_produced * spot * config.miner.maintenance_pct;
        double opex = elec_cost + hosting_fee + maintenance;
        total_opex += opex;

        // 3. Reserve first, then mint within LTV headroom
        double opex_from_reserve = std::min(state.stablecoin_reserve, opex);
        state.stablecoin_reserve -= opex_from_reserve;
        double opex_remaining = opex - opex_from_reserve;

        double minted_for_opex = 0.0;
        bool opex_shortfall = false;
        if (opex_remaining > 0.0) {
            double headroom = std::max(0.0, state.btc_collateral * spot *
                                                config.collateral_ltv_pct / 100.0 -
                                            state.stablecoin_debt);
            minted_for_opex = std::min(opex_remaining, headroom);
            state.stablecoin_debt += minted_for_opex;
            if (minted_for_opex < opex_remaining) {
                opex_shortfall = true;
                result.warnings.push_back("Month " + std::to_string(t) +
                                          ": OPEX shortfall of " +
                                          format_fixed(opex_remaining - minted_for_opex, 2) +
                                          " USD, no reserve or mint headroom left");
            }
        }

        // 4. Interest on outstanding debt
        double interest = state.stablecoin_debt * config.borrowing_apr / 12.0;
        state.stablecoin_debt += interest;
        total_interest += interest;

        // 5. Management fee is added to debt
        double mgmt_fee = 0.0;
        if (config.management_fees_pct > 0.0) {
            mgmt_fee = config.capital_raised_usd * config.management_fees_pct / 100.0 / 12.0;
            state.stablecoin_debt += mgmt_fee;
            total_mgmt_fees += mgmt_fee;
        }

        // 6. Investor yield: reserve first, then sell collateral
        double apr = config.base_yield_apr + (bonus_active ? config.bonus_yield_apr : 0.0);
        double obligation = config.capital_raised_usd * apr / 12.0;
        double yield_from_reserve = 0.0;
        double yield_from_sale = 0.0;
        double yield_btc_sold = 0.0;
        double yield_paid = 0.0;

        if (!early_close_month) {
            yield_from_reserve = std::min(state.stablecoin_reserve, obligation);
            state.stablecoin_reserve -= yield_from_reserve;
            double yield_remaining = obligation - yield_from_reserve;

            if (yield_remaining > 0.0 && spot > 0.0 && state.btc_collateral > 0.0) {
                yield_btc_sold = std::min(yield_remaining / spot, state.btc_collateral);
                yield_from_sale = yield_btc_sold * spot;
                state.btc_collateral -= yield_btc_sold;
            }

            yield_paid = yield_from_reserve + yield_from_sale;
            cumulative_yield_paid += yield_paid;

            if (config.early_close_threshold_pct > 0.0 && config.capital_raised_usd > 0.0 &&
                cumulative_yield_paid >= config.early_close_threshold_pct * config.capital_raised_usd) {
                early_close_month = t;
            }
        }
        double fulfillment = obligation > 0.0 ? yield_paid / obligation : 1.0;

        // 7. Liquidation check before strikes
        double ltv = loan_to_value_pct(state.stablecoin_debt, state.btc_collateral * spot);
        bool liquidation_risk = ltv >= config.liquidation_ltv_pct;
        if (liquidation_risk) {
            ++liquidation_months;
            result.warnings.push_back("Month " + std::to_string(t) + ": LIQUIDATION RISK, LTV " +
                                      format_fixed(ltv, 2) + "% >= " +
                                      format_fixed(config.liquidation_ltv_pct, 2) + "%");
        }

        // 8. Strike ladder repays debt, surplus to reserve
        double strike_btc = 0.0;
        double strike_usd = 0.0;
        double strike_repaid = 0.0;
        for (auto& strike : state.strikes) {
            if (strike.triggered || spot < strike.strike_price || state.btc_collateral <= 0.0) {
                continue;
            }
            double sell = state.btc_collateral * strike.btc_sell_pct / 100.0;
            double proceeds = sell * spot;
            double repay = std::min(proceeds, state.stablecoin_debt);
            double surplus = proceeds - repay;
            state.stablecoin_debt -= repay;
            state.stablecoin_reserve += surplus;
            state.btc_collateral -= sell;

            strike_btc += sell;
            strike_usd += proceeds;
            strike_repaid += repay;
            total_debt_repaid += repay;

            strike.triggered = true;
            strike.trigger_month = t;
            strike.btc_sold = round_btc(sell);
            strike.usd_received = round_usd(proceeds);
            strike.debt_repaid = round_usd(repay);
            bonus_active = true;

            StrikeEvent event;
            event.month = t;
            event.strike_price = strike.strike_price;
            event.btc_price_usd = round_usd(spot);
            event.btc_sold = round_btc(sell);
            event.usd_received = round_usd(proceeds);
            event.debt_repaid = round_usd(repay);
            event.surplus_to_reserve = round_usd(surplus);
            event.remaining_debt = round_usd(state.stablecoin_debt);
            event.remaining_btc = round_btc(state.btc_collateral);
            result.strike_events.push_back(event);
        }

        double collateral_value = state.btc_collateral * spot;
        ltv = loan_to_value_pct(state.stablecoin_debt, collateral_value);
        double net_equity = collateral_value - state.stablecoin_debt + state.stablecoin_reserve;

        CollateralMonth row;
        row.month = t;
        row.btc_price_usd = round_usd(spot);
        row.btc_mined = round_btc(btc_produced);
        row.btc_collateral = round_btc(state.btc_collateral);
        row.collateral_value_usd = round_usd(collateral_value);
        row.stablecoin_reserve = round_usd(state.stablecoin_reserve);
        row.stablecoin_debt = round_usd(state.stablecoin_debt);
        row.minted_for_opex = round_usd(minted_for_opex);
        row.interest_usd = round_usd(interest);
        row.mgmt_fee_usd = round_usd(mgmt_fee);
        row.reserve_yield_usd = round_usd(reserve_yield);
        row.cumulative_reserve_yield_usd = round_usd(total_reserve_yield);
        row.yield_paid_usd = round_usd(yield_paid);
        row.yield_from_reserve_usd = round_usd(yield_from_reserve);
        row.yield_from_btc_sale_usd = round_usd(yield_from_sale);
        row.yield_btc_sold = round_btc(yield_btc_sold);
        row.yield_obligation_usd = round_usd(obligation);
        row.yield_apr_applied = round_ratio(apr);
        row.yield_fulfillment = round_ratio(fulfillment);
        row.cumulative_yield_paid_usd = round_usd(cumulative_yield_paid);
        row.bonus_yield_active = bonus_active;
        row.opex_usd = round_usd(opex);
        row.elec_cost_usd = round_usd(elec_cost);
        row.hosting_fee_usd = round_usd(hosting_fee);
        row.maintenance_usd = round_usd(maintenance);
        row.opex_from_reserve = round_usd(opex_from_reserve);
        row.opex_shortfall = opex_shortfall;
        row.ltv_pct = round_usd(ltv);
        row.liquidation_risk = liquidation_risk;
        row.net_equity_usd = round_usd(net_equity);
        row.strike_sold_btc = round_btc(strike_btc);
        row.strike_received_usd = round_usd(strike_usd);
        row.strike_debt_repaid = round_usd(strike_repaid);
        result.monthly.push_back(row);
    }

    // Run-level metrics
    m.capital_raised_usd = round_usd(config.capital_raised_usd);
    m.effective_capital_usd = round_usd(effective_capital);
    m.btc_purchased = round_btc(btc_purchased);
    m.btc_purchase_price_usd = round_usd(config.buying_price_usd);
    m.initial_stablecoin_reserve = round_usd(effective_capital - btc_capital);
    m.miner_capex_usd = round_usd(miner_capex);
    m.minted_for_capex_usd = round_usd(minted_for_capex);
    m.capex_shortfall_usd = round_usd(capex_shortfall);

    if (result.monthly.empty()) {
        m.final_btc_collateral = 0.0;
        m.final_collateral_value_usd = 0.0;
        m.final_stablecoin_debt = 0.0;
        m.final_stablecoin_reserve = 0.0;
        m.final_net_equity_usd = 0.0;
        m.final_ltv_pct = 0.0;
        m.max_ltv_pct = 0.0;
        m.min_ltv_pct = 0.0;
    } else {
        const CollateralMonth& last = result.monthly.back();
        m.final_btc_collateral = last.btc_collateral;
        m.final_collateral_value_usd = last.collateral_value_usd;
        m.final_stablecoin_debt = last.stablecoin_debt;
        m.final_stablecoin_reserve = last.stablecoin_reserve;
        m.final_net_equity_usd = last.net_equity_usd;
        m.final_ltv_pct = last.ltv_pct;
        auto by_ltv = [](const CollateralMonth& a, const CollateralMonth& b) {
            return a.ltv_pct < b.ltv_pct;
        };
        m.max_ltv_pct = std::max_element(result.monthly.begin(), result.monthly.end(), by_ltv)->ltv_pct;
        m.min_ltv_pct = std::min_element(result.monthly.begin(), result.monthly.end(), by_ltv)->ltv_pct;
    }

    m.total_btc_mined = round_btc(total_btc_mined);
    m.total_opex_paid_usd = round_usd(total_opex);
    m.total_interest_paid_usd = round_usd(total_interest);
    m.total_debt_repaid_usd = round_usd(total_debt_repaid);
    m.total_reserve_yield_usd = round_usd(total_reserve_yield);
    m.total_return_pct = config.capital_raised_usd > 0.0
                             ? round_ratio((m.final_net_equity_usd - config.capital_raised_usd) /
                                           config.capital_raised_usd)
                             : 0.0;

    m.total_yield_paid_usd = round_usd(cumulative_yield_paid);
    m.effective_yield_apr = (config.capital_raised_usd > 0.0 && months > 0)
                                ? round_ratio(cumulative_yield_paid / config.capital_raised_usd /
                                              (months / 12.0))
                                : 0.0;
    m.early_close_triggered = early_close_month.has_value();
    m.early_close_month = early_close_month;

    m.liquidation_risk_months = liquidation_months;
    m.strikes_total = static_cast<int>(state.strikes.size());
    m.strikes_triggered = static_cast<int>(std::count_if(
        state.strikes.begin(), state.strikes.end(),
        [](const CollateralStrikeStatus& s) { return s.triggered; }));

    double net_gain = std::max(0.0, m.final_net_equity_usd - config.capital_raised_usd);
    double performance_fee = net_gain * config.performance_fees_pct / 100.0;
    m.upfront_fee_usd = round_usd(upfront_fee);
    m.total_mgmt_fees_usd = round_usd(total_mgmt_fees);
    m.performance_fee_usd = round_usd(performance_fee);
    m.total_commercial_usd = round_usd(upfront_fee + total_mgmt_fees + performance_fee);
    m.months_simulated = months;

    result.strike_ladder = state.strikes;
    return result;
}

} // namespace hashcalc
