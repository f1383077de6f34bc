#ifndef HASHCALC_COLLATERAL_HPP
#define HASHCALC_COLLATERAL_HPP

#include "miner.hpp"
#include <optional>
#include <string>
#include <vector>

namespace hashcalc {

// Sell a share of the BTC collateral once spot reaches the strike.
struct CollateralStrikeEntry {
    double strike_price;
    double btc_sell_pct;        // percent of collateral, 25.0 means 25%
};

// Single-fire latch: a strike never triggers twice
struct CollateralStrikeStatus {
    double strike_price;
    double btc_sell_pct;
    bool triggered;
    std::optional<int> trigger_month;
    double btc_sold;
    double usd_received;
    double debt_repaid;
};

/**
 * BTC-as-collateral product.
 *
 * Percent fields (btc_allocation_pct, collateral_ltv_pct, liquidation_ltv_pct
 * and the commercial fees) are expressed as percentages; APRs are fractions.
 */
struct CollateralProductConfig {
    double capital_raised_usd;
    int tenor_months;
    double btc_allocation_pct;
    double buying_price_usd;

    double collateral_ltv_pct;
    double borrowing_apr;
    double liquidation_ltv_pct;

    MinerSpec miner;
    int miner_count;
    HostingSiteSpec site;

    std::vector<CollateralStrikeEntry> strike_ladder;

    double reserve_yield_apr;
    double base_yield_apr;
    double bonus_yield_apr;
    double early_close_threshold_pct;   // fraction of capital, 0 disables

    double upfront_commercial_pct;
    double management_fees_pct;
    double performance_fees_pct;

    CollateralProductConfig();
};

// Mutable state carried month to month
struct CollateralState {
    double stablecoin_reserve;
    double stablecoin_debt;
    double btc_collateral;
    std::vector<CollateralStrikeStatus> strikes;

    CollateralState();
};

struct CollateralMonth {
    int month;
    double btc_price_usd;

    double btc_mined;
    double btc_collateral;
    double collateral_value_usd;

    double stablecoin_reserve;
    double stablecoin_debt;
    double minted_for_opex;
    double interest_usd;
    double mgmt_fee_usd;

    double reserve_yield_usd;
    double cumulative_reserve_yield_usd;

    double yield_paid_usd;
    double yield_from_reserve_usd;
    double yield_from_btc_sale_usd;
    double yield_btc_sold;
    double yield_obligation_usd;
    double yield_apr_applied;
    double yield_fulfillment;
    double cumulative_yield_paid_usd;
    bool bonus_yield_active;

    double opex_usd;
    double elec_cost_usd;
    double hosting_fee_usd;
    double maintenance_usd;
    double opex_from_reserve;
    bool opex_shortfall;

    double ltv_pct;
    bool liquidation_risk;
    double net_equity_usd;

    double strike_sold_btc;
    double strike_received_usd;
    double strike_debt_repaid;
};

struct StrikeEvent {
    int month;
    double strike_price;
    double btc_price_usd;
    double btc_sold;
    double usd_received;
    double debt_repaid;
    double surplus_to_reserve;
    double remaining_debt;
    double remaining_btc;
};

struct CollateralMetrics {
    double capital_raised_usd;
    double effective_capital_usd;
    double btc_purchased;
    double btc_purchase_price_usd;
    double initial_stablecoin_reserve;
    double miner_capex_usd;
    double minted_for_capex_usd;
    double capex_shortfall_usd;

    double final_btc_collateral;
    double final_collateral_value_usd;
    double final_stablecoin_debt;
    double final_stablecoin_reserve;
    double final_net_equity_usd;
    double final_ltv_pct;

    double total_btc_mined;
    double total_opex_paid_usd;
    double total_interest_paid_usd;
    double total_debt_repaid_usd;
    double total_reserve_yield_usd;
    double total_return_pct;

    double total_yield_paid_usd;
    double effective_yield_apr;
    bool early_close_triggered;
    std::optional<int> early_close_month;

    int liquidation_risk_months;
    double max_ltv_pct;
    double min_ltv_pct;
    int strikes_triggered;
    int strikes_total;

    double upfront_fee_usd;
    double total_mgmt_fees_usd;
    double performance_fee_usd;
    double total_commercial_usd;

    int months_simulated;
};

struct CollateralResult {
    std::vector<CollateralMonth> monthly;
    std::vector<StrikeEvent> strike_events;
    std::vector<CollateralStrikeStatus> strike_ladder;
    std::vector<std::string> warnings;
    CollateralMetrics metrics;
};

constexpr double NO_COLLATERAL_LTV = 999.0;

// Debt over collateral value in percent; NO_COLLATERAL_LTV when nothing is posted
double loan_to_value_pct(double debt_usd, double collateral_value_usd);

CollateralResult simulate_collateral_product(const CollateralProductConfig& config,
                                             const std::vector<double>& btc_prices,
                                             const std::vector<double>& hashprices);

} // namespace hashcalc

#endif // HASHCALC_COLLATERAL_HPP
