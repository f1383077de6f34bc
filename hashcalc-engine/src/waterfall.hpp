#ifndef HASHCALC_WATERFALL_HPP
#define HASHCALC_WATERFALL_HPP

#include "miner.hpp"
#include "ops_calibration.hpp"
#include <optional>
#include <string>
#include <vector>

namespace hashcalc {

enum class MonthFlag {
    GREEN,
    RED
};

enum class Decision {
    APPROVED,
    ADJUST,
    BLOCKED
};

std::string to_string(MonthFlag flag);
std::string to_string(Decision decision);

// Business thresholds for the deficit rule and the run-level classifier
struct WaterfallThresholds {
    double deficit_coverage;          // RED when produced < required * this
    double blocked_deficit_ratio;     // BLOCKED when red months > total * this
    double adjust_deficit_ratio;      // ADJUST when red months > total * this
    double min_health_score;          // ADJUST when final health below this

    WaterfallThresholds();
};

// Sell a fraction of the capitalization pool once spot reaches a price
struct TakeProfitEntry {
    double price_trigger;
    double sell_pct;                  // fraction of pool, 0..1
};

// Single-fire latch: once triggered it never fires again
struct TakeProfitStatus {
    double price_trigger;
    double sell_pct;
    bool triggered;
    std::optional<int> trigger_month;
    double btc_sold;
    double usd_received;
};

struct MiningBucketConfig {
    MinerSpec miner;
    int miner_count;
    HostingSiteSpec site;
    double capital_raised_usd;        // yield cap base
    int tenor_months;
    double base_yield_apr;
    double bonus_yield_apr;
    CalibrationFactors calibration;
    std::vector<TakeProfitEntry> take_profit_ladder;
    WaterfallThresholds thresholds;

    MiningBucketConfig();
};

// Mutable state carried month to month by one run
struct WaterfallState {
    double capitalization_btc;
    double cumulative_yield_paid_usd;
    double total_btc_produced;
    double total_btc_sold;
    int red_flag_months;
    std::vector<TakeProfitStatus> ladder;

    WaterfallState();
};

struct WaterfallMonth {
    int month;
    double btc_price_usd;
    double btc_produced;
    double btc_required_for_opex;
    double btc_sell_opex;
    double btc_for_yield;
    double btc_to_capitalization;
    double opex_usd;
    double yield_paid_usd;
    double yield_apr_applied;
    double take_profit_btc_sold;
    double take_profit_sold_usd;
    double capitalization_btc;
    double capitalization_usd;
    double opex_coverage_ratio;
    double yield_fulfillment;
    double health_score;
    MonthFlag flag;
};

struct WaterfallMetrics {
    double final_health_score;
    double total_btc_produced;
    double total_btc_sold;
    double cumulative_yield_paid_usd;
    double avg_monthly_yield_usd;
    double effective_apr;
    int red_flag_months;
    int months_simulated;
    double capitalization_btc_final;
    double capitalization_usd_final;
    double avg_opex_coverage_ratio;
};

struct DecisionOutcome {
    Decision decision;
    std::vector<std::string> reasons;    // never empty
};

struct WaterfallResult {
    std::vector<WaterfallMonth> monthly;
    WaterfallMetrics metrics;
    std::vector<std::string> flags;
    std::vector<TakeProfitStatus> take_profit_ladder;
    DecisionOutcome decision;
};

constexpr double NO_OPEX_COVERAGE = 999.0;

// Month health from OPEX coverage, yield fulfillment and the deficit flag,
// clamped to 0..100
double compute_health_score(double opex_coverage_ratio,
                            double yield_fulfillment,
                            MonthFlag flag);

DecisionOutcome classify_decision(int red_months,
                                  int total_months,
                                  double final_health,
                                  const WaterfallThresholds& thresholds = WaterfallThresholds());

// Run the mining waterfall. `bonus_from_month` is the cross-bucket signal:
// from that month on the yield cap uses base + bonus APR.
WaterfallResult simulate_waterfall(const MiningBucketConfig& config,
                                   const std::vector<double>& btc_prices,
                                   const std::vector<double>& hashprices,
                                   std::optional<int> bonus_from_month = std::nullopt);

} // namespace hashcalc

#endif // HASHCALC_WATERFALL_HPP
