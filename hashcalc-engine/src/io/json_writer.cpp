#include "json_writer.hpp"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace hashcalc {

namespace {

template <typename T>
json opt(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

json strike_json(const StrikeStatus& s) {
    return {
        {"strike_price", s.strike_price},
        {"btc_amount", s.btc_amount},
        {"triggered", s.triggered},
        {"trigger_month", opt(s.trigger_month)},
        {"usd_received", s.usd_received},
    };
}

json take_profit_json(const TakeProfitStatus& s) {
    return {
        {"price_trigger", s.price_trigger},
        {"sell_pct", s.sell_pct},
        {"triggered", s.triggered},
        {"trigger_month", opt(s.trigger_month)},
        {"btc_sold", s.btc_sold},
        {"usd_received", s.usd_received},
    };
}

json decision_json(const DecisionOutcome& d) {
    return {{"decision", to_string(d.decision)}, {"reasons", d.reasons}};
}

} // anonymous namespace

// ============================================================================
// Curves and forecasts
// ============================================================================

namespace forecast {

void to_json(json& j, const ForecastDiagnostics& d) {
    j = {
        {"model", d.model},
        {"aic", d.aic},
        {"bic", d.bic},
        {"models_evaluated", d.models_evaluated},
        {"log_transformed", d.log_transformed},
        {"training_points", d.training_points},
    };
    if (!d.order.empty()) {
        j["order"] = d.order;
        j["seasonal_order"] = d.seasonal_order;
    } else {
        j["seasonal"] = d.seasonal;
    }
}

} // namespace forecast

void to_json(json& j, const PriceModelInfo& info) {
    j = {
        {"training_months", info.training_months},
        {"training_start", info.training_start},
        {"training_end", info.training_end},
        {"last_historical_price", info.last_historical_price},
        {"confidence", info.confidence},
        {"forecast_months", info.forecast_months},
    };
}

void to_json(json& j, const PriceForecast& fc) {
    j = {
        {"monthly_prices", fc.prices},
        {"lower_bound", fc.lower_bound},
        {"upper_bound", fc.upper_bound},
        {"diagnostics", fc.diagnostics},
        {"model_info", fc.model_info},
    };
}

void to_json(json& j, const NetworkCurve& curve) {
    j = {
        {"difficulty", curve.difficulty},
        {"network_hashrate_eh", curve.hashrate_eh},
        {"fees_per_block_btc", curve.fees_per_block},
        {"hashprice_btc_per_ph_day", curve.hashprice_btc_per_ph_day},
        {"block_subsidy_btc", curve.subsidy_btc},
        {"halving_months", curve.halving_months},
        {"warnings", curve.warnings},
    };
}

void to_json(json& j, const NetworkForecast& fc) {
    j = fc.curve;
    j["difficulty_lower"] = fc.difficulty_lower;
    j["difficulty_upper"] = fc.difficulty_upper;
    j["hashrate_lower"] = fc.hashrate_lower;
    j["hashrate_upper"] = fc.hashrate_upper;
    j["fees_lower"] = fc.fees_lower;
    j["fees_upper"] = fc.fees_upper;
    j["hashprice_lower"] = fc.hashprice_lower;
    j["hashprice_upper"] = fc.hashprice_upper;
    j["model_info"] = {
        {"training_months", fc.training_months},
        {"training_start", fc.training_start},
        {"training_end", fc.training_end},
        {"confidence_interval", fc.confidence},
        {"forecast_months", fc.forecast_months},
        {"hashrate", fc.hashrate_diagnostics},
        {"fees", fc.fee_diagnostics},
    };
}

void to_json(json& j, const ScenarioCurves& curves) {
    j = {
        {"scenario", curves.name},
        {"btc_prices", curves.btc_prices},
        {"hashprice_btc_per_ph_day", curves.hashprices},
    };
}

// ============================================================================
// Miner, hosting, calibration
// ============================================================================

void to_json(json& j, const MinerSimulationResult& result) {
    json monthly = json::array();
    for (const auto& m : result.monthly) {
        monthly.push_back({
            {"month", m.month},
            {"btc_price_usd", m.btc_price_usd},
            {"hashprice_btc_per_ph_day", m.hashprice_btc_per_ph_day},
            {"btc_mined", m.btc_mined},
            {"revenue_usd", m.revenue_usd},
            {"electricity_cost_usd", m.electricity_cost_usd},
            {"maintenance_usd", m.maintenance_usd},
            {"depreciation_usd", m.depreciation_usd},
            {"net_usd", m.net_usd},
            {"ebit_usd", m.ebit_usd},
            {"net_btc", m.net_btc},
            {"cumulative_net_usd", m.cumulative_net_usd},
            {"cumulative_ebit_usd", m.cumulative_ebit_usd},
        });
    }
    j = {
        {"monthly_cashflows", monthly},
        {"total_btc_mined", result.totals.btc_mined},
        {"total_revenue_usd", result.totals.revenue_usd},
        {"total_electricity_cost_usd", result.totals.electricity_cost_usd},
        {"total_net_usd", result.totals.net_usd},
        {"total_ebit_usd", result.totals.ebit_usd},
        {"break_even_month", opt(result.break_even_month)},
    };
}

void to_json(json& j, const HostingAllocationResult& result) {
    json sites = json::array();
    for (const auto& s : result.sites) {
        json miners = json::array();
        for (const auto& m : s.miners) {
            miners.push_back({
                {"miner_id", m.miner_id},
                {"miner_name", m.miner_name},
                {"count", m.count},
                {"power_kw", m.power_kw},
            });
        }
        sites.push_back({
            {"site_id", s.site_id},
            {"site_name", s.site_name},
            {"allocated_power_kw", s.allocated_power_kw},
            {"capacity_kw", s.capacity_kw},
            {"electricity_rate", s.electricity_rate},
            {"uptime_expectation", s.uptime_expectation},
            {"miners", miners},
        });
    }
    j = {
        {"total_power_kw", result.total_power_kw},
        {"blended_electricity_rate", result.blended_electricity_rate},
        {"blended_uptime", result.blended_uptime},
        {"blended_hosting_fee_per_kw_month", result.blended_hosting_fee_per_kw_month},
        {"blended_curtailment_pct", result.blended_curtailment_pct},
        {"sites", sites},
        {"warnings", result.warnings},
    };
}

void to_json(json& j, const CalibrationResult& result) {
    json monthly = json::array();
    for (const auto& m : result.monthly_comparison) {
        monthly.push_back({
            {"month", m.month},
            {"predicted_btc", m.predicted_btc},
            {"actual_btc", m.actual_btc},
            {"variance_pct", m.variance_pct},
            {"predicted_energy_kwh", m.predicted_energy_kwh},
            {"actual_energy_kwh", m.actual_energy_kwh},
            {"actual_uptime", m.actual_uptime},
        });
    }
    j = {
        {"realized_uptime_factor", result.realized_uptime_factor},
        {"realized_efficiency_factor", result.realized_efficiency_factor},
        {"production_adjustment", result.production_adjustment},
        {"variance_p50", result.variance_p50},
        {"variance_p90", result.variance_p90},
        {"flags", result.flags},
        {"monthly_comparison", monthly},
    };
}

// ============================================================================
// Products
// ============================================================================

void to_json(json& j, const WaterfallResult& result) {
    json monthly = json::array();
    for (const auto& m : result.monthly) {
        monthly.push_back({
            {"month", m.month},
            {"btc_price_usd", m.btc_price_usd},
            {"btc_produced", m.btc_produced},
            {"btc_required_for_opex", m.btc_required_for_opex},
            {"btc_sell_opex", m.btc_sell_opex},
            {"btc_for_yield", m.btc_for_yield},
            {"btc_to_capitalization", m.btc_to_capitalization},
            {"opex_usd", m.opex_usd},
            {"yield_paid_usd", m.yield_paid_usd},
            {"yield_apr_applied", m.yield_apr_applied},
            {"take_profit_btc_sold", m.take_profit_btc_sold},
            {"take_profit_sold_usd", m.take_profit_sold_usd},
            {"capitalization_btc", m.capitalization_btc},
            {"capitalization_usd", m.capitalization_usd},
            {"opex_coverage_ratio", m.opex_coverage_ratio},
            {"yield_fulfillment", m.yield_fulfillment},
            {"health_score", m.health_score},
            {"flag", to_string(m.flag)},
        });
    }

    json ladder = json::array();
    for (const auto& s : result.take_profit_ladder) {
        ladder.push_back(take_profit_json(s));
    }

    const WaterfallMetrics& m = result.metrics;
    j = {
        {"monthly_waterfall", monthly},
        {"metrics", {
            {"final_health_score", m.final_health_score},
            {"total_btc_produced", m.total_btc_produced},
            {"total_btc_sold", m.total_btc_sold},
            {"cumulative_yield_paid_usd", m.cumulative_yield_paid_usd},
            {"avg_monthly_yield_usd", m.avg_monthly_yield_usd},
            {"effective_apr", m.effective_apr},
            {"red_flag_months", m.red_flag_months},
            {"months_simulated", m.months_simulated},
            {"capitalization_btc_final", m.capitalization_btc_final},
            {"capitalization_usd_final", m.capitalization_usd_final},
            {"avg_opex_coverage_ratio", m.avg_opex_coverage_ratio},
        }},
        {"flags", result.flags},
        {"take_profit_ladder", ladder},
        {"decision", to_string(result.decision.decision)},
        {"decision_reasons", result.decision.reasons},
    };
}

void to_json(json& j, const YieldBucketResult& result) {
    json monthly = json::array();
    for (const auto& m : result.monthly) {
        monthly.push_back({
            {"month", m.month},
            {"apr_applied", m.apr_applied},
            {"monthly_yield_usd", m.monthly_yield_usd},
            {"cumulative_yield_usd", m.cumulative_yield_usd},
            {"bucket_value_usd", m.bucket_value_usd},
        });
    }
    j = {
        {"allocated_usd", result.allocated_usd},
        {"final_value_usd", result.final_value_usd},
        {"total_yield_usd", result.total_yield_usd},
        {"effective_apr", result.effective_apr},
        {"monthly_data", monthly},
    };
}

void to_json(json& j, const HoldingBucketResult& result) {
    json monthly = json::array();
    for (const auto& m : result.monthly) {
        monthly.push_back({
            {"month", m.month},
            {"btc_price_usd", m.btc_price_usd},
            {"btc_quantity", m.btc_quantity},
            {"capital_recon_btc", m.capital_recon_btc},
            {"extra_yield_btc", m.extra_yield_btc},
            {"bucket_value_usd", m.bucket_value_usd},
            {"unrealized_pnl_usd", m.unrealized_pnl_usd},
            {"recon_realized_usd", m.recon_realized_usd},
            {"extra_yield_realized_usd", m.extra_yield_realized_usd},
            {"extra_yield_this_month_usd", m.extra_yield_this_month_usd},
            {"recon_sold", m.recon_sold},
            {"recon_sold_this_month", m.recon_sold_this_month},
        });
    }

    json strikes = json::array();
    for (const auto& s : result.strikes) {
        strikes.push_back(strike_json(s));
    }

    j = {
        {"allocated_usd", result.allocated_usd},
        {"buying_price_usd", result.buying_price_usd},
        {"target_sell_price_usd", result.target_sell_price_usd},
        {"btc_quantity", result.btc_quantity},
        {"capital_recon_btc", result.capital_recon_btc},
        {"extra_yield_btc", result.extra_yield_btc},
        {"target_hit", result.target_hit},
        {"holding_target_hit_month", opt(result.sell_month)},
        {"sell_price_usd", opt(result.sell_price_usd)},
        {"recon_realized_usd", result.recon_realized_usd},
        {"extra_yield_strikes", strikes},
        {"extra_yield_total_usd", result.extra_yield_total_usd},
        {"final_value_usd", result.final_value_usd},
        {"total_return_pct", result.total_return_pct},
        {"monthly_data", monthly},
    };
}

void to_json(json& j, const CommercialFees& fees) {
    j = {
        {"upfront_fee_usd", fees.upfront_fee_usd},
        {"yield_deduction_usd", fees.yield_deduction_usd},
        {"holding_deduction_usd", fees.holding_deduction_usd},
        {"mining_deduction_usd", fees.mining_deduction_usd},
        {"management_fees_monthly", fees.management_fees_monthly},
        {"management_fees_total_usd", fees.management_fees_total_usd},
        {"performance_fee_usd", fees.performance_fee_usd},
        {"performance_fee_base_usd", fees.performance_fee_base_usd},
        {"total_commercial_value_usd", fees.total_commercial_value_usd},
    };
}

void to_json(json& j, const ProductResult& result) {
    json portfolio = json::array();
    for (const auto& p : result.portfolio) {
        portfolio.push_back({
            {"month", p.month},
            {"yield_value_usd", p.yield_value_usd},
            {"holding_value_usd", p.holding_value_usd},
            {"mining_value_usd", p.mining_value_usd},
            {"total_portfolio_usd", p.total_portfolio_usd},
        });
    }

    json bum = json::array();
    for (const auto& b : result.btc_under_management) {
        bum.push_back({
            {"month", b.month},
            {"btc_price_usd", b.btc_price_usd},
            {"holding_btc", b.holding_btc},
            {"holding_value_usd", b.holding_value_usd},
            {"holding_sold", b.holding_sold},
            {"holding_strike_this_month", b.holding_strike_this_month},
            {"mining_cap_btc", b.mining_cap_btc},
            {"mining_cap_value_usd", b.mining_cap_value_usd},
            {"total_btc", b.total_btc},
            {"total_value_usd", b.total_value_usd},
            {"holding_appreciation_usd", b.holding_appreciation_usd},
            {"holding_appreciation_pct", b.holding_appreciation_pct},
        });
    }

    const BtcUnderManagementMetrics& bm = result.btc_under_management_metrics;
    const PortfolioMetrics& pm = result.metrics;
    j = {
        {"yield_bucket", result.yield_bucket},
        {"btc_holding_bucket", result.holding_bucket},
        {"mining_bucket", result.mining_bucket},
        {"aggregated", {
            {"capital_raised_usd", pm.capital_raised_usd},
            {"final_portfolio_usd", pm.final_portfolio_usd},
            {"total_return_pct", pm.total_return_pct},
            {"total_yield_paid_usd", pm.total_yield_paid_usd},
            {"effective_apr", pm.effective_apr},
            {"capital_preservation_ratio", pm.capital_preservation_ratio},
            {"gross_final_portfolio_usd", pm.gross_final_portfolio_usd},
            {"gross_total_return_pct", pm.gross_total_return_pct},
            {"holding_target_hit_month", opt(result.holding_bucket.sell_month)},
            {"monthly_portfolio", portfolio},
        }},
        {"btc_under_management", {
            {"monthly", bum},
            {"final_total_btc", bm.final_total_btc},
            {"final_total_value_usd", bm.final_total_value_usd},
            {"final_holding_btc", bm.final_holding_btc},
            {"final_mining_cap_btc", bm.final_mining_cap_btc},
            {"peak_btc_qty", bm.peak_btc_qty},
            {"peak_btc_value_usd", bm.peak_btc_value_usd},
            {"holding_target_struck", bm.holding_target_struck},
            {"holding_strike_month", opt(bm.holding_strike_month)},
            {"holding_strike_price_usd", opt(bm.holding_strike_price_usd)},
            {"mining_total_btc_accumulated", bm.mining_total_btc_accumulated},
        }},
        {"decision", decision_json(result.decision)},
    };
    if (result.commercial) {
        j["commercial"] = *result.commercial;
    }
}

void to_json(json& j, const CollateralResult& result) {
    json monthly = json::array();
    for (const auto& m : result.monthly) {
        monthly.push_back({
            {"month", m.month},
            {"btc_price_usd", m.btc_price_usd},
            {"btc_mined", m.btc_mined},
            {"btc_collateral", m.btc_collateral},
            {"collateral_value_usd", m.collateral_value_usd},
            {"stablecoin_reserve", m.stablecoin_reserve},
            {"stablecoin_debt", m.stablecoin_debt},
            {"minted_for_opex", m.minted_for_opex},
            {"interest_usd", m.interest_usd},
            {"mgmt_fee_usd", m.mgmt_fee_usd},
            {"reserve_yield_usd", m.reserve_yield_usd},
            {"cumulative_reserve_yield_usd", m.cumulative_reserve_yield_usd},
            {"yield_paid_usd", m.yield_paid_usd},
            {"yield_from_reserve_usd", m.yield_from_reserve_usd},
            {"yield_from_btc_sale_usd", m.yield_from_btc_sale_usd},
            {"yield_btc_sold", m.yield_btc_sold},
            {"yield_obligation_usd", m.yield_obligation_usd},
            {"yield_apr_applied", m.yield_apr_applied},
            {"yield_fulfillment", m.yield_fulfillment},
            {"cumulative_yield_paid_usd", m.cumulative_yield_paid_usd},
            {"bonus_yield_active", m.bonus_yield_active},
            {"opex_usd", m.opex_usd},
            {"elec_cost_usd", m.elec_cost_usd},
            {"hosting_fee_usd", m.hosting_fee_usd},
            {"maintenance_usd", m.maintenance_usd},
            {"opex_from_reserve", m.opex_from_reserve},
            {"opex_shortfall", m.opex_shortfall},
            {"ltv_pct", m.ltv_pct},
            {"liquidation_risk", m.liquidation_risk},
            {"net_equity_usd", m.net_equity_usd},
            {"strike_sold_btc", m.strike_sold_btc},
            {"strike_received_usd", m.strike_received_usd},
            {"strike_debt_repaid", m.strike_debt_repaid},
        });
    }

    json events = json::array();
    for (const auto& e : result.strike_events) {
        events.push_back({
            {"month", e.month},
            {"strike_price", e.strike_price},
            {"btc_price_usd", e.btc_price_usd},
            {"btc_sold", e.btc_sold},
            {"usd_received", e.usd_received},
            {"debt_repaid", e.debt_repaid},
            {"surplus_to_reserve", e.surplus_to_reserve},
            {"remaining_debt", e.remaining_debt},
            {"remaining_btc", e.remaining_btc},
        });
    }

    json ladder = json::array();
    for (const auto& s : result.strike_ladder) {
        ladder.push_back({
            {"strike_price", s.strike_price},
            {"btc_sell_pct", s.btc_sell_pct},
            {"triggered", s.triggered},
            {"trigger_month", opt(s.trigger_month)},
            {"btc_sold", s.btc_sold},
            {"usd_received", s.usd_received},
            {"debt_repaid", s.debt_repaid},
        });
    }

    const CollateralMetrics& m = result.metrics;
    j = {
        {"monthly_data", monthly},
        {"strike_events", events},
        {"strike_ladder_status", ladder},
        {"warnings", result.warnings},
        {"metrics", {
            {"capital_raised_usd", m.capital_raised_usd},
            {"effective_capital_usd", m.effective_capital_usd},
            {"btc_purchased", m.btc_purchased},
            {"btc_purchase_price_usd", m.btc_purchase_price_usd},
            {"initial_stablecoin_reserve", m.initial_stablecoin_reserve},
            {"miner_capex_usd", m.miner_capex_usd},
            {"minted_for_capex_usd", m.minted_for_capex_usd},
            {"capex_shortfall_usd", m.capex_shortfall_usd},
            {"final_btc_collateral", m.final_btc_collateral},
            {"final_collateral_value_usd", m.final_collateral_value_usd},
            {"final_stablecoin_debt", m.final_stablecoin_debt},
            {"final_stablecoin_reserve", m.final_stablecoin_reserve},
            {"final_net_equity_usd", m.final_net_equity_usd},
            {"final_ltv_pct", m.final_ltv_pct},
            {"total_btc_mined", m.total_btc_mined},
            {"total_opex_paid_usd", m.total_opex_paid_usd},
            {"total_interest_paid_usd", m.total_interest_paid_usd},
            {"total_debt_repaid_usd", m.total_debt_repaid_usd},
            {"total_reserve_yield_usd", m.total_reserve_yield_usd},
            {"total_return_pct", m.total_return_pct},
            {"total_yield_paid_usd", m.total_yield_paid_usd},
            {"effective_yield_apr", m.effective_yield_apr},
            {"early_close_triggered", m.early_close_triggered},
            {"early_close_month", opt(m.early_close_month)},
            {"liquidation_risk_months", m.liquidation_risk_months},
            {"max_ltv_pct", m.max_ltv_pct},
            {"min_ltv_pct", m.min_ltv_pct},
            {"strikes_triggered", m.strikes_triggered},
            {"strikes_total", m.strikes_total},
            {"upfront_fee_usd", m.upfront_fee_usd},
            {"total_mgmt_fees_usd", m.total_mgmt_fees_usd},
            {"performance_fee_usd", m.performance_fee_usd},
            {"total_commercial_usd", m.total_commercial_usd},
            {"effective_months", m.months_simulated},
        }},
    };
}

json scenario_results_json(const ProductScenarioResults& results) {
    json j = json::object();
    for (const auto& outcome : results) {
        j[outcome.scenario] = outcome.result;
    }
    return j;
}

json scenario_results_json(const CollateralScenarioResults& results) {
    json j = json::object();
    for (const auto& outcome : results) {
        j[outcome.scenario] = outcome.result;
    }
    return j;
}

// ============================================================================
// Output
// ============================================================================

namespace io {

void write_json(std::ostream& os, const json& document, bool pretty_print) {
    os << (pretty_print ? document.dump(2) : document.dump()) << "\n";
}

void write_json(const std::string& filepath, const json& document, bool pretty_print) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + filepath);
    }
    write_json(file, document, pretty_print);
}

} // namespace io
} // namespace hashcalc
