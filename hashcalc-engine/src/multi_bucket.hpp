#ifndef HASHCALC_MULTI_BUCKET_HPP
#define HASHCALC_MULTI_BUCKET_HPP

#include "buckets.hpp"
#include "waterfall.hpp"
#include <optional>
#include <vector>

namespace hashcalc {

// Percent inputs: 2.0 means 2%
struct CommercialFeeConfig {
    double upfront_commercial_pct;
    double management_fees_pct;      // annual, on capital raised
    double performance_fees_pct;     // on capitalization above the mining allocation

    CommercialFeeConfig();

    bool any() const {
        return upfront_commercial_pct > 0.0 || management_fees_pct > 0.0 ||
               performance_fees_pct > 0.0;
    }
};

struct CommercialFees {
    double upfront_fee_usd;
    double yield_deduction_usd;
    double holding_deduction_usd;
    double mining_deduction_usd;
    std::vector<double> management_fees_monthly;
    double management_fees_total_usd;
    double performance_fee_usd;
    double performance_fee_base_usd;
    double total_commercial_value_usd;

    CommercialFees();
};

// Three-bucket product. The mining bucket's capital base and tenor are taken
// from mining_allocated_usd and tenor_months.
struct ProductConfig {
    double capital_raised_usd;
    int tenor_months;
    YieldBucketConfig yield_bucket;
    HoldingBucketConfig holding_bucket;
    double mining_allocated_usd;
    MiningBucketConfig mining_bucket;
    CommercialFeeConfig commercial;

    ProductConfig();
};

constexpr double ALLOCATION_TOLERANCE_USD = 0.01;

// Throws ValidationError unless yield + holding + mining == capital raised
void validate_allocation(const ProductConfig& config);

CommercialFees calculate_commercial_fees(double capital_raised_usd,
                                         const CommercialFeeConfig& fees,
                                         const std::vector<double>& capitalization_monthly_usd,
                                         double yield_allocated_usd,
                                         double holding_allocated_usd,
                                         double mining_allocated_usd);

struct PortfolioMonth {
    int month;
    double yield_value_usd;
    double holding_value_usd;
    double mining_value_usd;
    double total_portfolio_usd;
};

struct BtcUnderManagementMonth {
    int month;
    double btc_price_usd;
    double holding_btc;
    double holding_value_usd;
    bool holding_sold;
    bool holding_strike_this_month;
    double mining_cap_btc;
    double mining_cap_value_usd;
    double total_btc;
    double total_value_usd;
    double holding_appreciation_usd;
    double holding_appreciation_pct;
};

struct BtcUnderManagementMetrics {
    double final_total_btc;
    double final_total_value_usd;
    double final_holding_btc;
    double final_mining_cap_btc;
    double peak_btc_qty;
    double peak_btc_value_usd;
    bool holding_target_struck;
    std::optional<int> holding_strike_month;
    std::optional<double> holding_strike_price_usd;
    double mining_total_btc_accumulated;
};

struct PortfolioMetrics {
    double capital_raised_usd;
    double final_portfolio_usd;          // net of management and performance fees
    double total_return_pct;
    double total_yield_paid_usd;
    double effective_apr;
    double capital_preservation_ratio;
    double gross_final_portfolio_usd;
    double gross_total_return_pct;
};

struct ProductResult {
    YieldBucketResult yield_bucket;
    HoldingBucketResult holding_bucket;
    WaterfallResult mining_bucket;
    std::optional<CommercialFees> commercial;
    std::vector<PortfolioMonth> portfolio;
    std::vector<BtcUnderManagementMonth> btc_under_management;
    BtcUnderManagementMetrics btc_under_management_metrics;
    PortfolioMetrics metrics;
    DecisionOutcome decision;            // mirrors the mining bucket
};

// Run holding -> mining (with the holding sell month as bonus signal) and
// the independent yield bucket, then aggregate. Validates the allocation
// first; nothing runs if it is rejected.
ProductResult simulate_product(const ProductConfig& config,
                               const std::vector<double>& btc_prices,
                               const std::vector<double>& hashprices);

} // namespace hashcalc

#endif // HASHCALC_MULTI_BUCKET_HPP
