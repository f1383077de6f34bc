#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "miner.hpp"
#include "errors.hpp"

using namespace hashcalc;
using Catch::Matchers::WithinAbs;

namespace {

MinerSpec s21_like() {
    MinerSpec miner;
    miner.name = "S21";
    miner.hashrate_th = 200.0;
    miner.power_w = 3500.0;
    miner.price_usd = 5000.0;
    miner.lifetime_months = 36;
    return miner;
}

} // anonymous namespace

TEST_CASE("Miner efficiency in J/TH", "[miner]") {
    REQUIRE_THAT(s21_like().efficiency_j_th(), WithinAbs(17.5, 1e-12));
    REQUIRE(MinerSpec().efficiency_j_th() == 0.0);
}

TEST_CASE("Monthly energy draw", "[miner]") {
    REQUIRE_THAT(monthly_energy_kwh(1000.0, 1.0), WithinAbs(730.56, 1e-9));
    REQUIRE_THAT(monthly_energy_kwh(1000.0, 0.5), WithinAbs(365.28, 1e-9));
}

TEST_CASE("Single miner month economics", "[miner][economics]") {
    auto result = simulate_miner(s21_like(), {100000.0}, {0.0005}, 0.05, 1.0, 1);

    REQUIRE(result.monthly.size() == 1);
    const auto& row = result.monthly[0];
    REQUIRE_THAT(row.btc_mined, WithinAbs(0.003044, 1e-12));
    REQUIRE_THAT(row.revenue_usd, WithinAbs(304.40, 1e-9));
    REQUIRE_THAT(row.electricity_cost_usd, WithinAbs(127.85, 1e-9));
    REQUIRE_THAT(row.net_usd, WithinAbs(176.55, 1e-9));
    REQUIRE_THAT(row.depreciation_usd, WithinAbs(138.89, 1e-9));
    REQUIRE_THAT(row.ebit_usd, WithinAbs(37.66, 1e-9));
    REQUIRE_THAT(row.net_btc, WithinAbs(0.00176552, 1e-12));

    REQUIRE(result.break_even_month.has_value());
    REQUIRE(*result.break_even_month == 0);
}

TEST_CASE("Monthly inputs are reported at contract precision", "[miner][economics]") {
    auto result = simulate_miner(s21_like(), {100000.126, 0.0}, {0.000512345678, 0.0005},
                                 0.05, 1.0, 2);

    REQUIRE(result.monthly[0].btc_price_usd == 100000.13);
    REQUIRE(result.monthly[0].hashprice_btc_per_ph_day == 0.00051235);

    // No spot price means no BTC is left after electricity
    REQUIRE(result.monthly[1].btc_price_usd == 0.0);
    REQUIRE(result.monthly[1].net_btc == 0.0);
    REQUIRE(result.monthly[1].btc_mined > 0.0);
}

TEST_CASE("Depreciation stops after the miner lifetime", "[miner][economics]") {
    MinerSpec miner = s21_like();
    miner.lifetime_months = 2;
    auto result = simulate_miner(miner, std::vector<double>(4, 100000.0),
                                 std::vector<double>(4, 0.0005), 0.05, 1.0, 4);

    REQUIRE(result.monthly[1].depreciation_usd == 2500.0);
    REQUIRE(result.monthly[2].depreciation_usd == 0.0);
    REQUIRE(result.monthly[3].ebit_usd == result.monthly[3].net_usd);
}

TEST_CASE("Break-even month is the first non-negative cumulative EBIT", "[miner][economics]") {
    MinerSpec miner = s21_like();
    miner.price_usd = 1000.0;
    miner.lifetime_months = 1;   // whole cost in month 0

    auto result = simulate_miner(miner, std::vector<double>(12, 100000.0),
                                 std::vector<double>(12, 0.0005), 0.05, 1.0, 12);

    // Month 0 EBIT is 176.55 - 1000, each later month adds 176.55
    REQUIRE(result.monthly[0].cumulative_ebit_usd < 0.0);
    REQUIRE(result.break_even_month.has_value());
    REQUIRE(*result.break_even_month == 5);
}

TEST_CASE("Unprofitable miner never breaks even", "[miner][economics]") {
    auto result = simulate_miner(s21_like(), std::vector<double>(6, 20000.0),
                                 std::vector<double>(6, 0.0005), 0.10, 1.0, 6);

    REQUIRE_FALSE(result.break_even_month.has_value());
    REQUIRE(result.totals.net_usd < 0.0);
    for (const auto& row : result.monthly) {
        REQUIRE(row.net_btc < 0.0);
    }
}

TEST_CASE("Horizon is the shortest of months and curves", "[miner]") {
    auto result = simulate_miner(s21_like(), std::vector<double>(5, 100000.0),
                                 std::vector<double>(3, 0.0005), 0.05, 0.95, 10);
    REQUIRE(result.monthly.size() == 3);
    REQUIRE_THAT(result.totals.btc_mined, WithinAbs(0.0005 * 0.2 * 30.44 * 0.95 * 3, 1e-8));
}

TEST_CASE("Miner simulation rejects invalid input", "[miner][error]") {
    MinerSpec miner = s21_like();

    SECTION("zero hashrate") {
        miner.hashrate_th = 0.0;
        REQUIRE_THROWS_AS(simulate_miner(miner, {1.0}, {1.0}, 0.05, 1.0, 1), ValidationError);
    }

    SECTION("negative months") {
        REQUIRE_THROWS_AS(simulate_miner(miner, {1.0}, {1.0}, 0.05, 1.0, -1), ValidationError);
    }
}
