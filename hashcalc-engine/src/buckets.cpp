#include "buckets.hpp"
#include "errors.hpp"
#include "rounding.hpp"
#include <algorithm>

namespace hashcalc {

// ============================================================================
// Yield bucket
// ============================================================================

YieldBucketConfig::YieldBucketConfig()
    : allocated_usd(0.0), base_apr(0.0) {}

double scheduled_apr(const YieldBucketConfig& config, int month) {
    for (const auto& entry : config.apr_schedule) {
        if (entry.from_month <= month && month <= entry.to_month) {
            return entry.apr;
        }
    }
    return config.base_apr;
}

YieldBucketResult simulate_yield_bucket(const YieldBucketConfig& config, int tenor_months) {
    if (config.allocated_usd < 0.0) {
        throw ValidationError("Yield allocation must be non-negative");
    }

    YieldBucketResult result;
    double value = config.allocated_usd;
    double cumulative = 0.0;

    for (int t = 0; t < tenor_months; ++t) {
        double apr = scheduled_apr(config, t);
        double monthly_yield = value * apr / 12.0;
        cumulative += monthly_yield;
        value += monthly_yield;

        result.monthly.push_back({t, round_ratio(apr), round_usd(monthly_yield),
                                  round_usd(cumulative), round_usd(value)});
    }

    result.allocated_usd = round_usd(config.allocated_usd);
    result.final_value_usd = round_usd(value);
    result.total_yield_usd = round_usd(cumulative);
    result.effective_apr = (config.allocated_usd > 0.0 && tenor_months > 0)
                               ? round_ratio(cumulative / config.allocated_usd / (tenor_months / 12.0))
                               : 0.0;
    return result;
}

// ============================================================================
// BTC holding bucket
// ============================================================================

HoldingBucketConfig::HoldingBucketConfig()
    : allocated_usd(0.0), buying_price_usd(0.0), target_sell_price_usd(0.0),
      capital_recon_pct(100.0) {}

double default_target_sell_price(double holding_allocated_usd,
                                 double mining_allocated_usd,
                                 double buying_price_usd) {
    if (holding_allocated_usd <= 0.0 || buying_price_usd <= 0.0) {
        return buying_price_usd;
    }
    double btc = holding_allocated_usd / buying_price_usd;
    return (holding_allocated_usd + mining_allocated_usd) / btc;
}

HoldingBucketResult simulate_holding_bucket(const HoldingBucketConfig& config,
                                            const std::vector<double>& btc_prices,
                                            int tenor_months) {
    if (config.allocated_usd < 0.0) {
        throw ValidationError("Holding allocation must be non-negative");
    }
    if (config.capital_recon_pct < 0.0 || config.capital_recon_pct > 100.0) {
        throw ValidationError("Capital reconstitution percent must be between 0 and 100");
    }

    const double buy = config.buying_price_usd > 0.0 ? config.buying_price_usd
                                                     : FALLBACK_BUYING_PRICE;
    const double target = config.target_sell_price_usd > 0.0
                              ? config.target_sell_price_usd
                              : default_target_sell_price(config.allocated_usd, 0.0, buy);
    const double total_btc = config.allocated_usd / buy;
    const double recon_btc = total_btc * config.capital_recon_pct / 100.0;
    const double extra_btc = total_btc * (100.0 - config.capital_recon_pct) / 100.0;

    HoldingBucketResult result;
    for (const auto& strike : config.extra_yield_strikes) {
        result.strikes.push_back({strike.strike_price,
                                  extra_btc * strike.btc_share_pct / 100.0,
                                  false, std::nullopt, 0.0});
    }

    bool recon_sold = false;
    double recon_realized = 0.0;
    double extra_realized = 0.0;

    auto unsold_extra = [&result]() {
        double btc = 0.0;
        for (const auto& s : result.strikes) {
            if (!s.triggered) btc += s.btc_amount;
        }
        return btc;
    };

    const int months = static_cast<int>(std::min(static_cast<size_t>(std::max(tenor_months, 0)),
                                                 btc_prices.size()));
    for (int t = 0; t < months; ++t) {
        const double spot = btc_prices[t];
        bool sold_now = false;

        if (!recon_sold && recon_btc > 0.0 && spot >= target) {
            recon_sold = true;
            sold_now = true;
            recon_realized = recon_btc * spot;
            result.sell_month = t;
            result.sell_price_usd = round_usd(spot);
        }

        double extra_this_month = 0.0;
        for (auto& strike : result.strikes) {
            if (strike.triggered || strike.btc_amount <= 0.0 || spot < strike.strike_price) {
                continue;
            }
            strike.triggered = true;
            strike.trigger_month = t;
            strike.usd_received = strike.btc_amount * spot;
            extra_realized += strike.usd_received;
            extra_this_month += strike.usd_received;
        }

        double remaining_recon = recon_sold ? 0.0 : recon_btc;
        double remaining_extra = unsold_extra();
        double unsold = remaining_recon + remaining_extra;
        double value = unsold * spot + recon_realized + extra_realized;
        double unrealized = unsold > 0.0 ? unsold * (spot - buy) : 0.0;

        HoldingBucketMonth row;
        row.month = t;
        row.btc_price_usd = round_usd(spot);
        row.btc_quantity = round_btc(unsold);
        row.capital_recon_btc = round_btc(remaining_recon);
        row.extra_yield_btc = round_btc(remaining_extra);
        row.bucket_value_usd = round_usd(value);
        row.unrealized_pnl_usd = round_usd(unrealized);
        row.recon_realized_usd = round_usd(recon_realized);
        row.extra_yield_realized_usd = round_usd(extra_realized);
        row.extra_yield_this_month_usd = round_usd(extra_this_month);
        row.recon_sold = recon_sold;
        row.recon_sold_this_month = sold_now;
        result.monthly.push_back(row);
    }

    double final_unsold = (recon_sold ? 0.0 : recon_btc) + unsold_extra();
    double final_spot = months > 0 ? btc_prices[months - 1] : buy;
    double final_value = final_unsold * final_spot + recon_realized + extra_realized;

    for (auto& strike : result.strikes) {
        strike.btc_amount = round_btc(strike.btc_amount);
        strike.usd_received = round_usd(strike.usd_received);
    }

    result.allocated_usd = round_usd(config.allocated_usd);
    result.buying_price_usd = round_usd(buy);
    result.target_sell_price_usd = round_usd(target);
    result.btc_quantity = round_btc(total_btc);
    result.capital_recon_btc = round_btc(recon_btc);
    result.extra_yield_btc = round_btc(extra_btc);
    result.target_hit = recon_sold;
    result.recon_realized_usd = round_usd(recon_realized);
    result.extra_yield_total_usd = round_usd(extra_realized);
    result.final_value_usd = round_usd(final_value);
    result.total_return_pct = config.allocated_usd > 0.0
                                  ? round_ratio((final_value - config.allocated_usd) / config.allocated_usd)
                                  : 0.0;
    return result;
}

} // namespace hashcalc
