#include "waterfall.hpp"
#include "errors.hpp"
#include "rounding.hpp"
#include <algorithm>

namespace hashcalc {

namespace {

std::string ratio_text(int count, int total) {
    return "(" + std::to_string(count) + "/" + std::to_string(total) + ")";
}

void validate(const MiningBucketConfig& config) {
    if (config.miner_count < 0) {
        throw ValidationError("Miner count must be non-negative");
    }
    if (config.tenor_months < 0) {
        throw ValidationError("Tenor must be non-negative");
    }
    if (config.capital_raised_usd < 0.0) {
        throw ValidationError("Mining capital must be non-negative");
    }
    for (const auto& tp : config.take_profit_ladder) {
        if (tp.sell_pct < 0.0 || tp.sell_pct > 1.0) {
            throw ValidationError("Take-profit sell fraction must be between 0 and 1");
        }
    }
}

} // anonymous namespace

std::string to_string(MonthFlag flag) {
    return flag == MonthFlag::RED ? "RED" : "GREEN";
}

std::string to_string(Decision decision) {
    switch (decision) {
        case Decision::APPROVED: return "APPROVED";
        case Decision::ADJUST: return "ADJUST";
        case Decision::BLOCKED: return "BLOCKED";
    }
    return "UNKNOWN";
}

WaterfallThresholds::WaterfallThresholds()
    : deficit_coverage(0.95), blocked_deficit_ratio(0.20),
      adjust_deficit_ratio(0.10), min_health_score(50.0) {}

MiningBucketConfig::MiningBucketConfig()
    : miner_count(0), capital_raised_usd(0.0), tenor_months(36),
      base_yield_apr(0.08), bonus_yield_apr(0.04) {}

WaterfallState::WaterfallState()
    : capitalization_btc(0.0), cumulative_yield_paid_usd(0.0),
      total_btc_produced(0.0), total_btc_sold(0.0), red_flag_months(0) {}

// ============================================================================
// Health and decision
// ============================================================================

double compute_health_score(double opex_coverage_ratio,
                            double yield_fulfillment,
                            MonthFlag flag) {
    double score = 100.0;

    // OPEX coverage: full marks from 1.5x, severe below 1.0x
    if (opex_coverage_ratio < 1.0) {
        score -= 50.0;
    } else if (opex_coverage_ratio < 1.2) {
        score -= 30.0 * (1.2 - opex_coverage_ratio) / 0.2;
    } else if (opex_coverage_ratio < 1.5) {
        score -= 10.0 * (1.5 - opex_coverage_ratio) / 0.3;
    }

    // Yield delivered against the base target
    if (yield_fulfillment < 0.5) {
        score -= 30.0 * (1.0 - yield_fulfillment / 0.5);
    } else if (yield_fulfillment < 1.0) {
        score -= 15.0 * (1.0 - yield_fulfillment);
    }

    if (flag == MonthFlag::RED) {
        score -= 20.0;
    }

    return std::max(0.0, std::min(100.0, score));
}

DecisionOutcome classify_decision(int red_months,
                                  int total_months,
                                  double final_health,
                                  const WaterfallThresholds& thresholds) {
    DecisionOutcome outcome;

    if (red_months > total_months * thresholds.blocked_deficit_ratio) {
        outcome.decision = Decision::BLOCKED;
        outcome.reasons.push_back("Too many deficit months " + ratio_text(red_months, total_months));
        return outcome;
    }

    if (final_health < thresholds.min_health_score) {
        outcome.decision = Decision::ADJUST;
        outcome.reasons.push_back("Health score below target (" + format_fixed(final_health, 0) + "/100)");
        return outcome;
    }

    if (red_months > total_months * thresholds.adjust_deficit_ratio) {
        outcome.decision = Decision::ADJUST;
        outcome.reasons.push_back("Elevated deficit months " + ratio_text(red_months, total_months));
        return outcome;
    }

    outcome.decision = Decision::APPROVED;
    outcome.reasons.push_back("All metrics within acceptable ranges");
    return outcome;
}

// ============================================================================
// Monthly waterfall
// ============================================================================

WaterfallResult simulate_waterfall(const MiningBucketConfig& config,
                                   const std::vector<double>& btc_prices,
                                   const std::vector<double>& hashprices,
                                   std::optional<int> bonus_from_month) {
    validate(config);

    WaterfallResult result;
    WaterfallState state;
    for (const auto& tp : config.take_profit_ladder) {
        state.ladder.push_back({tp.price_trigger, tp.sell_pct, false, std::nullopt, 0.0, 0.0});
    }

    const double effective_uptime = config.site.uptime_expectation *
                                    config.calibration.uptime_factor *
                                    (1.0 - config.site.curtailment_pct);
    const double fleet_ph = config.miner.hashrate_th * config.miner_count / 1000.0;
    const double fleet_kw = config.miner.power_w * config.miner_count / 1000.0;
    const double base_yield_target = config.capital_raised_usd * config.base_yield_apr / 12.0;

    const int months = static_cast<int>(std::min({static_cast<size_t>(config.tenor_months),
                                                  btc_prices.size(), hashprices.size()}));
    double coverage_sum = 0.0;

    for (int t = 0; t < months; ++t) {
        const double spot = btc_prices[t];
        const double hashprice = hashprices[t];

        // 1. Production
        double btc_produced = hashprice * fleet_ph * DAYS_PER_MONTH * effective_uptime *
                              config.calibration.production_adjustment;
        state.total_btc_produced += btc_produced;

        // 2. OPEX
        double elec_cost = fleet_kw * HOURS_PER_DAY * DAYS_PER_MONTH * effective_uptime *
                           config.site.electricity_rate;
        double hosting_fee = fleet_kw * config.site.hosting_fee_per_kw_month;
        double maintenance = btc_produced * spot * config.miner.maintenance_pct;
        double opex = elec_cost + hosting_fee + maintenance;

        // 3. Sell for OPEX at spot
        double btc_for_opex = spot > 0.0 ? opex / spot : 0.0;
        double btc_sell_opex = std::min(btc_produced, btc_for_opex);
        double btc_remaining = btc_produced - btc_sell_opex;
        state.total_btc_sold += btc_sell_opex;

        double coverage = opex > 0.0 ? btc_produced * spot / opex : NO_OPEX_COVERAGE;
        bool bonus_active = bonus_from_month.has_value() && t >= *bonus_from_month;
        double apr = config.base_yield_apr + (bonus_active ? config.bonus_yield_apr : 0.0);

        MonthFlag flag = MonthFlag::GREEN;
        double yield_paid = 0.0;
        double btc_for_yield = 0.0;
        double btc_to_cap = 0.0;

        // 4. Deficit check
        if (btc_produced < btc_for_opex * config.thresholds.deficit_coverage) {
            flag = MonthFlag::RED;
            ++state.red_flag_months;
            result.flags.push_back("Month " + std::to_string(t) + ": DEFICIT, BTC produced (" +
                                   format_fixed(btc_produced, 6) + ") < OPEX required (" +
                                   format_fixed(btc_for_opex, 6) + ")");
        } else {
            // 5. Yield up to the monthly cap
            double yield_cap = config.capital_raised_usd * apr / 12.0;
            yield_paid = std::min(btc_remaining * spot, yield_cap);
            btc_for_yield = spot > 0.0 ? yield_paid / spot : 0.0;
            btc_remaining -= btc_for_yield;
            state.total_btc_sold += btc_for_yield;

            // 6. Capitalization
            if (btc_remaining > 0.0) {
                btc_to_cap = btc_remaining;
                state.capitalization_btc += btc_remaining;
            }
        }
        state.cumulative_yield_paid_usd += yield_paid;

        // 7. Take-profit ladder, each rung fires once
        double tp_btc = 0.0;
        double tp_usd = 0.0;
        for (auto& rung : state.ladder) {
            if (rung.triggered || spot < rung.price_trigger || state.capitalization_btc <= 0.0) {
                continue;
            }
            double sell = state.capitalization_btc * rung.sell_pct;
            rung.triggered = true;
            rung.trigger_month = t;
            rung.btc_sold = round_btc(sell);
            rung.usd_received = round_usd(sell * spot);
            state.capitalization_btc -= sell;
            state.total_btc_sold += sell;
            tp_btc += sell;
            tp_usd += sell * spot;
        }

        // 8. Health
        double fulfillment = base_yield_target > 0.0 ? yield_paid / base_yield_target : 0.0;
        double health = compute_health_score(coverage, fulfillment, flag);
        coverage_sum += round_ratio(coverage);

        WaterfallMonth row;
        row.month = t;
        row.btc_price_usd = round_usd(spot);
        row.btc_produced = round_btc(btc_produced);
        row.btc_required_for_opex = round_btc(btc_for_opex);
        row.btc_sell_opex = round_btc(btc_sell_opex);
        row.btc_for_yield = round_btc(btc_for_yield);
        row.btc_to_capitalization = round_btc(btc_to_cap);
        row.opex_usd = round_usd(opex);
        row.yield_paid_usd = round_usd(yield_paid);
        row.yield_apr_applied = round_ratio(apr);
        row.take_profit_btc_sold = round_btc(tp_btc);
        row.take_profit_sold_usd = round_usd(tp_usd);
        row.capitalization_btc = round_btc(state.capitalization_btc);
        row.capitalization_usd = round_usd(state.capitalization_btc * spot);
        row.opex_coverage_ratio = round_ratio(coverage);
        row.yield_fulfillment = round_ratio(fulfillment);
        row.health_score = round_to(health, 1);
        row.flag = flag;
        result.monthly.push_back(row);
    }

    // 9. Run-level metrics and decision
    WaterfallMetrics& m = result.metrics;
    m.months_simulated = months;
    m.final_health_score = result.monthly.empty() ? 0.0 : result.monthly.back().health_score;
    m.total_btc_produced = round_btc(state.total_btc_produced);
    m.total_btc_sold = round_btc(state.total_btc_sold);
    m.cumulative_yield_paid_usd = round_usd(state.cumulative_yield_paid_usd);
    m.avg_monthly_yield_usd = months > 0 ? round_usd(state.cumulative_yield_paid_usd / months) : 0.0;
    m.effective_apr = (config.capital_raised_usd > 0.0 && months > 0)
                          ? round_ratio(state.cumulative_yield_paid_usd / config.capital_raised_usd /
                                        (months / 12.0))
                          : 0.0;
    m.red_flag_months = state.red_flag_months;
    m.capitalization_btc_final = round_btc(state.capitalization_btc);
    m.capitalization_usd_final = result.monthly.empty() ? 0.0 : result.monthly.back().capitalization_usd;
    m.avg_opex_coverage_ratio = months > 0 ? round_ratio(coverage_sum / months) : 0.0;

    result.take_profit_ladder = state.ladder;
    result.decision = classify_decision(state.red_flag_months, months, m.final_health_score,
                                        config.thresholds);
    return result;
}

} // namespace hashcalc
