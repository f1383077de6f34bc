#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "network_curve.hpp"
#include "errors.hpp"
#include "rounding.hpp"
#include <algorithm>
#include <cmath>

using namespace hashcalc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// ============================================================================
// Calendar
// ============================================================================

TEST_CASE("YearMonth parses, offsets and formats", "[network][calendar]") {
    YearMonth ym = YearMonth::parse("2025-01");
    REQUIRE(ym.year == 2025);
    REQUIRE(ym.month == 1);

    REQUIRE(ym.plus_months(11).to_string() == "2025-12");
    REQUIRE(ym.plus_months(12).to_string() == "2026-01");
    REQUIRE(ym.plus_months(39).to_string() == "2028-04");
    REQUIRE(YearMonth::parse("2024-12") < ym);
}

TEST_CASE("YearMonth rejects malformed text", "[network][calendar][error]") {
    REQUIRE_THROWS_AS(YearMonth::parse("2025/01"), ValidationError);
    REQUIRE_THROWS_AS(YearMonth::parse("2025-13"), ValidationError);
    REQUIRE_THROWS_AS(YearMonth::parse("soon"), ValidationError);
}

// ============================================================================
// Subsidy schedule
// ============================================================================

TEST_CASE("Block subsidy follows the halving schedule", "[network][halving]") {
    REQUIRE(block_subsidy(YearMonth::parse("2025-01"), true) == 3.125);
    REQUIRE(block_subsidy(YearMonth::parse("2028-03"), true) == 3.125);
    REQUIRE(block_subsidy(YearMonth::parse("2028-04"), true) == 1.5625);
    REQUIRE(block_subsidy(YearMonth::parse("2032-04"), true) == 0.78125);
    REQUIRE(block_subsidy(YearMonth::parse("2040-01"), true) == 0.390625);
}

TEST_CASE("Disabled halvings keep the post-2024 subsidy", "[network][halving]") {
    REQUIRE(block_subsidy(YearMonth::parse("2030-01"), false) == POST_2024_SUBSIDY);
}

// ============================================================================
// Formulas
// ============================================================================

TEST_CASE("Hashprice from subsidy, fees and hashrate", "[network][hashprice]") {
    double hp = compute_hashprice(3.125, 0.1, 700.0);
    REQUIRE_THAT(hp, WithinRel(3.225 * 144.0 / 700e6 * 1000.0, 1e-12));
    REQUIRE(compute_hashprice(3.125, 0.1, 0.0) == 0.0);
}

TEST_CASE("Difficulty scales with hashrate", "[network][difficulty]") {
    REQUIRE_THAT(difficulty_from_hashrate(1.0), WithinRel(1e6 * 4294967296.0 / 600.0, 1e-12));
}

TEST_CASE("Fee regime multipliers", "[network][fees]") {
    REQUIRE(fee_multiplier(FeeRegime::LOW) == 0.5);
    REQUIRE(fee_multiplier(FeeRegime::BASE) == 1.0);
    REQUIRE(fee_multiplier(FeeRegime::HIGH) == 2.0);
    REQUIRE(parse_fee_regime("high") == FeeRegime::HIGH);
    REQUIRE(to_string(FeeRegime::LOW) == "low");
    REQUIRE_THROWS_AS(parse_fee_regime("extreme"), ValidationError);
}

// ============================================================================
// Deterministic curve
// ============================================================================

TEST_CASE("Network curve month 0 values", "[network][curve]") {
    NetworkCurveParams params;
    params.months = 12;
    auto curve = generate_network_curve(params);

    REQUIRE(curve.hashrate_eh.size() == 12);
    REQUIRE(curve.difficulty.size() == 12);
    REQUIRE(curve.fees_per_block.size() == 12);
    REQUIRE(curve.hashprice_btc_per_ph_day.size() == 12);

    REQUIRE(curve.hashrate_eh[0] == 700.0);
    REQUIRE(curve.fees_per_block[0] == 0.1);
    REQUIRE_THAT(curve.hashprice_btc_per_ph_day[0], WithinAbs(0.00066343, 1e-12));
}

TEST_CASE("Network curve compounds hashrate and fees", "[network][curve]") {
    NetworkCurveParams params;
    params.months = 13;
    params.fee_regime = FeeRegime::HIGH;
    auto curve = generate_network_curve(params);

    REQUIRE_THAT(curve.hashrate_eh[12], WithinAbs(std::round(700.0 * std::pow(1.02, 12) * 100.0) / 100.0, 1e-9));
    REQUIRE_THAT(curve.fees_per_block[0], WithinAbs(0.2, 1e-12));
    REQUIRE_THAT(curve.fees_per_block[12], WithinAbs(std::round(0.2 * std::pow(1.001, 12) * 1e6) / 1e6, 1e-12));

    // Hashprice is computed from the published fee figure
    double expected = round_btc(compute_hashprice(3.125, curve.fees_per_block[12],
                                                  700.0 * std::pow(1.02, 12)));
    REQUIRE_THAT(curve.hashprice_btc_per_ph_day[12], WithinAbs(expected, 1e-12));
}

TEST_CASE("Halving drops the subsidy at month 39 from a 2025-01 start", "[network][halving]") {
    NetworkCurveParams params;
    params.months = 48;
    params.monthly_hashrate_growth = 0.0;
    auto curve = generate_network_curve(params);

    REQUIRE(curve.subsidy_btc[38] == 3.125);
    REQUIRE(curve.subsidy_btc[39] == 1.5625);
    REQUIRE(curve.hashprice_btc_per_ph_day[39] < curve.hashprice_btc_per_ph_day[38]);

    REQUIRE(curve.halving_months == std::vector<std::string>{"2028-04"});
    bool warned = std::find(curve.warnings.begin(), curve.warnings.end(),
                            "Halving at month 39 (2028-04): subsidy drops to 1.5625 BTC") !=
                  curve.warnings.end();
    REQUIRE(warned);
}

TEST_CASE("Disabled halvings produce no halving months", "[network][halving]") {
    NetworkCurveParams params;
    params.months = 48;
    params.halving_enabled = false;
    auto curve = generate_network_curve(params);

    REQUIRE(curve.halving_months.empty());
    REQUIRE(curve.subsidy_btc[39] == 3.125);
}

TEST_CASE("Network curve rejects invalid parameters", "[network][error]") {
    NetworkCurveParams params;

    SECTION("zero months") {
        params.months = 0;
        REQUIRE_THROWS_AS(generate_network_curve(params), ValidationError);
    }

    SECTION("non-positive hashrate") {
        params.starting_hashrate_eh = 0.0;
        REQUIRE_THROWS_AS(generate_network_curve(params), ValidationError);
    }

    SECTION("bad start date") {
        params.start_date = "January";
        REQUIRE_THROWS_AS(generate_network_curve(params), ValidationError);
    }
}

// ============================================================================
// Forecast mode
// ============================================================================

TEST_CASE("Network forecast keeps every series inside its bounds", "[network][forecast]") {
    NetworkHistory history;
    for (int i = 0; i < 36; ++i) {
        history.months.push_back(YearMonth{2022, 1}.plus_months(i).to_string());
        double eh = 200.0 * std::pow(1.03, i) * (1.0 + 0.02 * std::sin(i * 0.7));
        history.hashrate_eh.push_back(eh);
        history.difficulty.push_back(difficulty_from_hashrate(eh));
        history.fees_per_block_btc.push_back(0.15 + 0.03 * std::cos(i * 0.5));
    }

    forecast::ForecastRequest request;
    request.model = forecast::ForecastModel::HOLT_WINTERS;
    request.horizon = 12;
    auto fc = generate_network_forecast(history, "2025-01", true, request);

    REQUIRE(fc.training_months == 36);
    REQUIRE(fc.training_start == "2022-01");
    REQUIRE(fc.training_end == "2024-12");
    REQUIRE(fc.forecast_months == 12);
    REQUIRE(fc.confidence == request.confidence);
    REQUIRE(fc.curve.hashprice_btc_per_ph_day.size() == 12);
    REQUIRE(fc.hashprice_lower.size() == 12);
    REQUIRE(fc.hashprice_upper.size() == 12);
    REQUIRE(fc.difficulty_lower.size() == 12);
    REQUIRE(fc.difficulty_upper.size() == 12);
    REQUIRE(fc.hashrate_lower.size() == 12);
    REQUIRE(fc.hashrate_upper.size() == 12);
    REQUIRE(fc.fees_lower.size() == 12);
    REQUIRE(fc.fees_upper.size() == 12);
    for (size_t i = 0; i < 12; ++i) {
        REQUIRE(fc.curve.hashrate_eh[i] > 0.0);
        REQUIRE(fc.hashrate_lower[i] <= fc.curve.hashrate_eh[i]);
        REQUIRE(fc.curve.hashrate_eh[i] <= fc.hashrate_upper[i]);
        REQUIRE(fc.difficulty_lower[i] <= fc.curve.difficulty[i]);
        REQUIRE(fc.curve.difficulty[i] <= fc.difficulty_upper[i]);
        REQUIRE(fc.fees_lower[i] <= fc.curve.fees_per_block[i]);
        REQUIRE(fc.curve.fees_per_block[i] <= fc.fees_upper[i]);
        REQUIRE(fc.hashprice_lower[i] <= fc.curve.hashprice_btc_per_ph_day[i] + 1e-8);
        REQUIRE(fc.curve.hashprice_btc_per_ph_day[i] <= fc.hashprice_upper[i] + 1e-8);
    }
}
