#include "multi_bucket.hpp"
#include "errors.hpp"
#include "rounding.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace hashcalc {

CommercialFeeConfig::CommercialFeeConfig()
    : upfront_commercial_pct(0.0), management_fees_pct(0.0), performance_fees_pct(0.0) {}

CommercialFees::CommercialFees()
    : upfront_fee_usd(0.0), yield_deduction_usd(0.0), holding_deduction_usd(0.0),
      mining_deduction_usd(0.0), management_fees_total_usd(0.0),
      performance_fee_usd(0.0), performance_fee_base_usd(0.0),
      total_commercial_value_usd(0.0) {}

ProductConfig::ProductConfig()
    : capital_raised_usd(0.0), tenor_months(36), mining_allocated_usd(0.0) {}

void validate_allocation(const ProductConfig& config) {
    if (config.capital_raised_usd <= 0.0) {
        throw ValidationError("Capital raised must be positive");
    }
    if (config.tenor_months <= 0) {
        throw ValidationError("Tenor must be at least 1 month");
    }
    if (config.yield_bucket.allocated_usd < 0.0 || config.holding_bucket.allocated_usd < 0.0 ||
        config.mining_allocated_usd < 0.0) {
        throw ValidationError("Bucket allocations must be non-negative");
    }

    double total = config.yield_bucket.allocated_usd + config.holding_bucket.allocated_usd +
                   config.mining_allocated_usd;
    if (std::fabs(total - config.capital_raised_usd) > ALLOCATION_TOLERANCE_USD) {
        std::ostringstream oss;
        oss.setf(std::ios::fixed);
        oss.precision(2);
        oss << "Bucket allocations (" << total << ") must equal capital raised ("
            << config.capital_raised_usd << ")";
        throw ValidationError(oss.str());
    }
}

CommercialFees calculate_commercial_fees(double capital_raised_usd,
                                         const CommercialFeeConfig& fees,
                                         const std::vector<double>& capitalization_monthly_usd,
                                         double yield_allocated_usd,
                                         double holding_allocated_usd,
                                         double mining_allocated_usd) {
    CommercialFees result;

    if (fees.upfront_commercial_pct > 0.0) {
        double total = yield_allocated_usd + holding_allocated_usd + mining_allocated_usd;
        if (total > 0.0) {
            double upfront = capital_raised_usd * fees.upfront_commercial_pct / 100.0;
            result.upfront_fee_usd = round_usd(upfront);
            result.yield_deduction_usd = round_usd(upfront * yield_allocated_usd / total);
            result.holding_deduction_usd = round_usd(upfront * holding_allocated_usd / total);
            result.mining_deduction_usd = round_usd(upfront * mining_allocated_usd / total);
        }
    }

    if (fees.management_fees_pct > 0.0 && !capitalization_monthly_usd.empty()) {
        // Charged on capital raised, taken from capitalization, never more than exists
        double monthly_fee = capital_raised_usd * fees.management_fees_pct / 100.0 / 12.0;
        double total = 0.0;
        for (double cap : capitalization_monthly_usd) {
            double fee = round_usd(std::min(monthly_fee, std::max(0.0, cap)));
            result.management_fees_monthly.push_back(fee);
            total += fee;
        }
        result.management_fees_total_usd = round_usd(total);
    }

    if (fees.performance_fees_pct > 0.0 && !capitalization_monthly_usd.empty()) {
        double overhead = std::max(0.0, capitalization_monthly_usd.back() - mining_allocated_usd);
        if (overhead > 0.0) {
            result.performance_fee_usd = round_usd(overhead * fees.performance_fees_pct / 100.0);
            result.performance_fee_base_usd = round_usd(overhead);
        }
    }

    result.total_commercial_value_usd = round_usd(result.upfront_fee_usd +
                                                  result.management_fees_total_usd +
                                                  result.performance_fee_usd);
    return result;
}

ProductResult simulate_product(const ProductConfig& config,
                               const std::vector<double>& btc_prices,
                               const std::vector<double>& hashprices) {
    validate_allocation(config);

    YieldBucketConfig yield_cfg = config.yield_bucket;
    HoldingBucketConfig holding_cfg = config.holding_bucket;
    MiningBucketConfig mining_cfg = config.mining_bucket;
    double mining_alloc = config.mining_allocated_usd;

    if (holding_cfg.target_sell_price_usd <= 0.0) {
        holding_cfg.target_sell_price_usd = default_target_sell_price(
            config.holding_bucket.allocated_usd, config.mining_allocated_usd,
            config.holding_bucket.buying_price_usd);
    }

    // Upfront fee comes out of every bucket in proportion to its allocation
    if (config.commercial.upfront_commercial_pct > 0.0) {
        double total = yield_cfg.allocated_usd + holding_cfg.allocated_usd + mining_alloc;
        if (total > 0.0) {
            double upfront = config.capital_raised_usd * config.commercial.upfront_commercial_pct / 100.0;
            yield_cfg.allocated_usd -= upfront * config.yield_bucket.allocated_usd / total;
            holding_cfg.allocated_usd -= upfront * config.holding_bucket.allocated_usd / total;
            mining_alloc -= upfront * config.mining_allocated_usd / total;
        }
    }
    mining_cfg.capital_raised_usd = mining_alloc;
    mining_cfg.tenor_months = config.tenor_months;

    ProductResult result;
    result.yield_bucket = simulate_yield_bucket(yield_cfg, config.tenor_months);
    result.holding_bucket = simulate_holding_bucket(holding_cfg, btc_prices, config.tenor_months);
    result.mining_bucket = simulate_waterfall(mining_cfg, btc_prices, hashprices,
                                              result.holding_bucket.sell_month);

    const int months = static_cast<int>(std::min(static_cast<size_t>(config.tenor_months),
                                                 btc_prices.size()));
    const double buy = holding_cfg.buying_price_usd > 0.0 ? holding_cfg.buying_price_usd
                                                          : FALLBACK_BUYING_PRICE;
    std::vector<double> capitalization_usd;
    double peak_qty = 0.0;
    double peak_value = 0.0;

    for (int t = 0; t < months; ++t) {
        const double spot = btc_prices[t];
        double y_val = t < static_cast<int>(result.yield_bucket.monthly.size())
                           ? result.yield_bucket.monthly[t].bucket_value_usd : 0.0;

        const HoldingBucketMonth* h_row = t < static_cast<int>(result.holding_bucket.monthly.size())
                                              ? &result.holding_bucket.monthly[t] : nullptr;
        const WaterfallMonth* m_row = t < static_cast<int>(result.mining_bucket.monthly.size())
                                          ? &result.mining_bucket.monthly[t] : nullptr;

        double h_val = h_row ? h_row->bucket_value_usd : 0.0;
        double m_val = m_row ? m_row->capitalization_usd : 0.0;
        capitalization_usd.push_back(m_val);

        result.portfolio.push_back({t, round_usd(y_val), round_usd(h_val), round_usd(m_val),
                                    round_usd(y_val + h_val + m_val)});

        double holding_btc = h_row ? h_row->btc_quantity : 0.0;
        double mining_btc = m_row ? m_row->capitalization_btc : 0.0;
        double total_btc = holding_btc + mining_btc;
        double cost_basis = holding_btc * buy;
        double appreciation = holding_btc > 0.0 ? holding_btc * spot - cost_basis : 0.0;

        BtcUnderManagementMonth bum;
        bum.month = t;
        bum.btc_price_usd = round_usd(spot);
        bum.holding_btc = round_btc(holding_btc);
        bum.holding_value_usd = round_usd(holding_btc * spot);
        bum.holding_sold = h_row ? h_row->recon_sold : false;
        bum.holding_strike_this_month = h_row ? h_row->recon_sold_this_month : false;
        bum.mining_cap_btc = round_btc(mining_btc);
        bum.mining_cap_value_usd = round_usd(m_val);
        bum.total_btc = round_btc(total_btc);
        bum.total_value_usd = round_usd(total_btc * spot);
        bum.holding_appreciation_usd = round_usd(appreciation);
        bum.holding_appreciation_pct = cost_basis > 0.0 ? round_to(appreciation / cost_basis * 100.0, 2)
                                                        : 0.0;
        result.btc_under_management.push_back(bum);

        peak_qty = std::max(peak_qty, bum.total_btc);
        peak_value = std::max(peak_value, bum.total_value_usd);
    }

    if (config.commercial.any()) {
        result.commercial = calculate_commercial_fees(
            config.capital_raised_usd, config.commercial, capitalization_usd,
            config.yield_bucket.allocated_usd, config.holding_bucket.allocated_usd,
            config.mining_allocated_usd);
    }

    // Aggregate
    const WaterfallMetrics& mining = result.mining_bucket.metrics;
    const double capital = config.capital_raised_usd;
    double gross = result.yield_bucket.final_value_usd + result.holding_bucket.final_value_usd +
                   mining.capitalization_usd_final;
    double deductions = result.commercial
                            ? result.commercial->management_fees_total_usd +
                                  result.commercial->performance_fee_usd
                            : 0.0;
    double net = gross - deductions;
    double total_yield = result.yield_bucket.total_yield_usd + mining.cumulative_yield_paid_usd;

    PortfolioMetrics& pm = result.metrics;
    pm.capital_raised_usd = round_usd(capital);
    pm.final_portfolio_usd = round_usd(net);
    pm.total_return_pct = round_ratio((net - capital) / capital);
    pm.total_yield_paid_usd = round_usd(total_yield);
    pm.effective_apr = months > 0 ? round_ratio(total_yield / capital / (months / 12.0)) : 0.0;
    pm.capital_preservation_ratio = round_ratio(net / capital);
    pm.gross_final_portfolio_usd = round_usd(gross);
    pm.gross_total_return_pct = round_ratio((gross - capital) / capital);

    BtcUnderManagementMetrics& bm = result.btc_under_management_metrics;
    if (!result.btc_under_management.empty()) {
        const auto& last = result.btc_under_management.back();
        bm.final_total_btc = last.total_btc;
        bm.final_total_value_usd = last.total_value_usd;
        bm.final_holding_btc = last.holding_btc;
        bm.final_mining_cap_btc = last.mining_cap_btc;
    } else {
        bm.final_total_btc = 0.0;
        bm.final_total_value_usd = 0.0;
        bm.final_holding_btc = 0.0;
        bm.final_mining_cap_btc = 0.0;
    }
    bm.peak_btc_qty = peak_qty;
    bm.peak_btc_value_usd = peak_value;
    bm.holding_target_struck = result.holding_bucket.target_hit;
    bm.holding_strike_month = result.holding_bucket.sell_month;
    bm.holding_strike_price_usd = result.holding_bucket.sell_price_usd;
    bm.mining_total_btc_accumulated = mining.capitalization_btc_final;

    result.decision = result.mining_bucket.decision;
    return result;
}

} // namespace hashcalc
