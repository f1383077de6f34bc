#ifndef HASHCALC_BUCKETS_HPP
#define HASHCALC_BUCKETS_HPP

#include <optional>
#include <vector>

namespace hashcalc {

// ============================================================================
// Yield bucket: compounding at a scheduled APR
// ============================================================================

// APR override for months [from_month, to_month]; the first matching entry wins
struct AprScheduleEntry {
    int from_month;
    int to_month;
    double apr;
};

struct YieldBucketConfig {
    double allocated_usd;
    double base_apr;
    std::vector<AprScheduleEntry> apr_schedule;

    YieldBucketConfig();
};

struct YieldBucketMonth {
    int month;
    double apr_applied;
    double monthly_yield_usd;
    double cumulative_yield_usd;
    double bucket_value_usd;
};

struct YieldBucketResult {
    std::vector<YieldBucketMonth> monthly;
    double allocated_usd;
    double final_value_usd;
    double total_yield_usd;
    double effective_apr;
};

double scheduled_apr(const YieldBucketConfig& config, int month);

YieldBucketResult simulate_yield_bucket(const YieldBucketConfig& config, int tenor_months);

// ============================================================================
// BTC holding bucket: reconstitution sale plus extra-yield strike ladder
// ============================================================================

struct StrikeEntry {
    double strike_price;
    double btc_share_pct;      // percent of the extra-yield BTC, 0..100
};

// Single-fire latch for one extra-yield strike
struct StrikeStatus {
    double strike_price;
    double btc_amount;
    bool triggered;
    std::optional<int> trigger_month;
    double usd_received;
};

struct HoldingBucketConfig {
    double allocated_usd;
    double buying_price_usd;
    double target_sell_price_usd;  // <= 0 falls back to default_target_sell_price
    double capital_recon_pct;  // percent of BTC earmarked for reconstitution
    std::vector<StrikeEntry> extra_yield_strikes;

    HoldingBucketConfig();
};

struct HoldingBucketMonth {
    int month;
    double btc_price_usd;
    double btc_quantity;           // unsold BTC
    double capital_recon_btc;
    double extra_yield_btc;
    double bucket_value_usd;
    double unrealized_pnl_usd;
    double recon_realized_usd;
    double extra_yield_realized_usd;
    double extra_yield_this_month_usd;
    bool recon_sold;
    bool recon_sold_this_month;
};

struct HoldingBucketResult {
    std::vector<HoldingBucketMonth> monthly;
    double allocated_usd;
    double buying_price_usd;
    double target_sell_price_usd;
    double btc_quantity;
    double capital_recon_btc;
    double extra_yield_btc;
    bool target_hit;
    std::optional<int> sell_month;   // cross-bucket signal
    std::optional<double> sell_price_usd;
    double recon_realized_usd;
    std::vector<StrikeStatus> strikes;
    double extra_yield_total_usd;
    double final_value_usd;
    double total_return_pct;
};

// Buying price used when the configured one is not positive
constexpr double FALLBACK_BUYING_PRICE = 1.0;

// Price at which selling the reconstitution BTC returns the holding and
// mining allocations: (holding + mining) / (holding / buying_price).
// Falls back to the buying price when there is no holding position.
double default_target_sell_price(double holding_allocated_usd,
                                 double mining_allocated_usd,
                                 double buying_price_usd);

HoldingBucketResult simulate_holding_bucket(const HoldingBucketConfig& config,
                                            const std::vector<double>& btc_prices,
                                            int tenor_months);

} // namespace hashcalc

#endif // HASHCALC_BUCKETS_HPP
