#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "multi_bucket.hpp"
#include "errors.hpp"

using namespace hashcalc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::ContainsSubstring;

namespace {

// 200k product: 50k yield, 100k BTC holding at 50k, 50k mining (1 PH, 10 kW)
ProductConfig base_product() {
    ProductConfig config;
    config.capital_raised_usd = 200000.0;
    config.tenor_months = 12;

    config.yield_bucket.allocated_usd = 50000.0;
    config.yield_bucket.base_apr = 0.10;

    config.holding_bucket.allocated_usd = 100000.0;
    config.holding_bucket.buying_price_usd = 50000.0;

    config.mining_allocated_usd = 50000.0;
    config.mining_bucket.miner.name = "Test";
    config.mining_bucket.miner.hashrate_th = 100.0;
    config.mining_bucket.miner.power_w = 1000.0;
    config.mining_bucket.miner_count = 10;
    config.mining_bucket.site.electricity_rate = 0.05;
    config.mining_bucket.site.uptime_expectation = 1.0;
    return config;
}

const std::vector<double> FLAT_PRICES(12, 50000.0);
const std::vector<double> HEALTHY_HASHPRICES(12, 0.001);

} // anonymous namespace

// ============================================================================
// Allocation
// ============================================================================

TEST_CASE("Allocation must add up to capital raised", "[product][allocation]") {
    ProductConfig config = base_product();
    REQUIRE_NOTHROW(validate_allocation(config));

    SECTION("within a cent is accepted") {
        config.mining_allocated_usd += 0.005;
        REQUIRE_NOTHROW(validate_allocation(config));
    }

    SECTION("short allocation is rejected with both totals") {
        config.mining_allocated_usd = 40000.0;
        REQUIRE_THROWS_WITH(validate_allocation(config),
                            ContainsSubstring("Bucket allocations (190000.00) must equal capital raised (200000.00)"));
    }

    SECTION("negative bucket is rejected") {
        config.yield_bucket.allocated_usd = -10000.0;
        config.mining_allocated_usd = 110000.0;
        REQUIRE_THROWS_AS(validate_allocation(config), ValidationError);
    }

    SECTION("zero capital is rejected") {
        config.capital_raised_usd = 0.0;
        REQUIRE_THROWS_AS(validate_allocation(config), ValidationError);
    }
}

TEST_CASE("Rejected allocation runs no simulation", "[product][allocation]") {
    ProductConfig config = base_product();
    config.holding_bucket.allocated_usd = 150000.0;
    REQUIRE_THROWS_AS(simulate_product(config, FLAT_PRICES, HEALTHY_HASHPRICES), ValidationError);
}

// ============================================================================
// Commercial fees
// ============================================================================

TEST_CASE("Commercial fee breakdown", "[product][fees]") {
    CommercialFeeConfig fees;

    SECTION("upfront fee split by allocation") {
        fees.upfront_commercial_pct = 2.0;
        auto result = calculate_commercial_fees(200000.0, fees, {}, 50000.0, 100000.0, 50000.0);
        REQUIRE(result.upfront_fee_usd == 4000.0);
        REQUIRE(result.yield_deduction_usd == 1000.0);
        REQUIRE(result.holding_deduction_usd == 2000.0);
        REQUIRE(result.mining_deduction_usd == 1000.0);
        REQUIRE(result.total_commercial_value_usd == 4000.0);
    }

    SECTION("management fee never exceeds capitalization") {
        fees.management_fees_pct = 1.0;
        auto result = calculate_commercial_fees(200000.0, fees, {1000.0, 100.0, 500.0},
                                                50000.0, 100000.0, 50000.0);
        REQUIRE(result.management_fees_monthly == std::vector<double>{166.67, 100.0, 166.67});
        REQUIRE_THAT(result.management_fees_total_usd, WithinAbs(433.34, 1e-9));
    }

    SECTION("performance fee on capitalization above the mining allocation") {
        fees.performance_fees_pct = 10.0;
        auto result = calculate_commercial_fees(200000.0, fees, {55000.0, 60000.0},
                                                50000.0, 100000.0, 50000.0);
        REQUIRE(result.performance_fee_base_usd == 10000.0);
        REQUIRE(result.performance_fee_usd == 1000.0);
    }

    SECTION("no overhead means no performance fee") {
        fees.performance_fees_pct = 10.0;
        auto result = calculate_commercial_fees(200000.0, fees, {40000.0},
                                                50000.0, 100000.0, 50000.0);
        REQUIRE(result.performance_fee_usd == 0.0);
        REQUIRE(result.total_commercial_value_usd == 0.0);
    }
}

// ============================================================================
// Orchestration
// ============================================================================

TEST_CASE("Flat market keeps the holding unsold and the mining bucket approved", "[product]") {
    auto result = simulate_product(base_product(), FLAT_PRICES, HEALTHY_HASHPRICES);

    REQUIRE(result.holding_bucket.target_sell_price_usd == 75000.0);
    REQUIRE_FALSE(result.holding_bucket.target_hit);
    REQUIRE(result.decision.decision == Decision::APPROVED);
    REQUIRE(result.decision.decision == result.mining_bucket.decision.decision);
    REQUIRE_FALSE(result.commercial.has_value());

    REQUIRE(result.portfolio.size() == 12);
    for (const auto& month : result.portfolio) {
        REQUIRE_THAT(month.total_portfolio_usd,
                     WithinAbs(month.yield_value_usd + month.holding_value_usd + month.mining_value_usd, 0.02));
    }

    // Mining yield cap is based on the mining allocation only
    REQUIRE_THAT(result.mining_bucket.monthly[0].yield_paid_usd, WithinAbs(333.33, 1e-9));

    const auto& m = result.metrics;
    REQUIRE(m.capital_raised_usd == 200000.0);
    REQUIRE_THAT(m.final_portfolio_usd,
                 WithinAbs(result.yield_bucket.final_value_usd + result.holding_bucket.final_value_usd +
                               result.mining_bucket.metrics.capitalization_usd_final, 0.01));
    REQUIRE(m.final_portfolio_usd == m.gross_final_portfolio_usd);
    REQUIRE(m.total_yield_paid_usd > 0.0);
}

TEST_CASE("Holding target hit switches on the mining bonus", "[product][bonus]") {
    std::vector<double> prices{50000.0, 60000.0, 70000.0, 80000.0};
    prices.resize(12, 80000.0);

    auto result = simulate_product(base_product(), prices, HEALTHY_HASHPRICES);

    REQUIRE(result.holding_bucket.target_hit);
    REQUIRE(*result.holding_bucket.sell_month == 3);
    REQUIRE(result.mining_bucket.monthly[2].yield_apr_applied == 0.08);
    REQUIRE(result.mining_bucket.monthly[3].yield_apr_applied == 0.12);

    const auto& bm = result.btc_under_management_metrics;
    REQUIRE(bm.holding_target_struck);
    REQUIRE(*bm.holding_strike_month == 3);
    REQUIRE(*bm.holding_strike_price_usd == 80000.0);

    REQUIRE(result.btc_under_management[3].holding_strike_this_month);
    REQUIRE(result.btc_under_management[3].holding_sold);
    REQUIRE_FALSE(result.btc_under_management[4].holding_strike_this_month);
    REQUIRE(result.btc_under_management[4].holding_btc == 0.0);
}

TEST_CASE("BTC under management tracks holding and mining BTC", "[product][bum]") {
    auto result = simulate_product(base_product(), FLAT_PRICES, HEALTHY_HASHPRICES);

    REQUIRE(result.btc_under_management.size() == 12);
    const auto& first = result.btc_under_management[0];
    REQUIRE(first.holding_btc == 2.0);
    REQUIRE(first.holding_appreciation_usd == 0.0);
    REQUIRE_THAT(first.total_btc, WithinAbs(first.holding_btc + first.mining_cap_btc, 1e-8));

    const auto& bm = result.btc_under_management_metrics;
    REQUIRE(bm.final_holding_btc == 2.0);
    REQUIRE(bm.peak_btc_qty >= bm.final_total_btc);
    REQUIRE(bm.mining_total_btc_accumulated == result.mining_bucket.metrics.capitalization_btc_final);
}

TEST_CASE("Management fees reduce the net portfolio", "[product][fees]") {
    ProductConfig config = base_product();
    config.commercial.management_fees_pct = 1.0;

    auto result = simulate_product(config, FLAT_PRICES, HEALTHY_HASHPRICES);

    REQUIRE(result.commercial.has_value());
    REQUIRE(result.commercial->management_fees_total_usd > 0.0);
    REQUIRE_THAT(result.metrics.final_portfolio_usd,
                 WithinAbs(result.metrics.gross_final_portfolio_usd -
                               result.commercial->management_fees_total_usd, 0.01));
    REQUIRE(result.metrics.total_return_pct < result.metrics.gross_total_return_pct);
}

TEST_CASE("Upfront fee shrinks every bucket", "[product][fees]") {
    ProductConfig config = base_product();
    config.commercial.upfront_commercial_pct = 2.0;

    auto result = simulate_product(config, FLAT_PRICES, HEALTHY_HASHPRICES);

    REQUIRE(result.commercial->upfront_fee_usd == 4000.0);
    REQUIRE(result.yield_bucket.allocated_usd == 49000.0);
    REQUIRE(result.holding_bucket.allocated_usd == 98000.0);
    // Target price is computed from the allocations before fees
    REQUIRE(result.holding_bucket.target_sell_price_usd == 75000.0);
}
