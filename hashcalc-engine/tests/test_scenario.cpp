#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "scenario.hpp"
#include "errors.hpp"
#include <cmath>
#include <sstream>

using namespace hashcalc;
using Catch::Matchers::WithinAbs;

namespace {

// In-memory history; counts how often each series is requested
class FakeHistory : public MarketHistorySource {
public:
    int price_calls = 0;
    int network_calls = 0;

    HistoricalSeries monthly_btc_prices() override {
        ++price_calls;
        HistoricalSeries series;
        for (int i = 0; i < 36; ++i) {
            series.push_back({YearMonth{2022, 1}.plus_months(i).to_string(),
                              30000.0 * std::exp(0.02 * i) * (1.0 + 0.05 * std::sin(i * 0.9))});
        }
        return series;
    }

    NetworkHistory monthly_network_history() override {
        ++network_calls;
        NetworkHistory history;
        for (int i = 0; i < 36; ++i) {
            double eh = 200.0 * std::pow(1.03, i) * (1.0 + 0.02 * std::cos(i * 0.8));
            history.months.push_back(YearMonth{2022, 1}.plus_months(i).to_string());
            history.hashrate_eh.push_back(eh);
            history.difficulty.push_back(difficulty_from_hashrate(eh));
            history.fees_per_block_btc.push_back(0.2 + 0.05 * std::sin(i * 0.6));
        }
        return history;
    }
};

ScenarioCurveConfig deterministic_config(const std::string& name, double start_price, int months) {
    ScenarioCurveConfig cfg;
    cfg.name = name;
    cfg.price_curve.params.start_price = start_price;
    cfg.price_curve.params.months = months;
    cfg.network_curve.params.months = months;
    return cfg;
}

ProductConfig small_product() {
    ProductConfig config;
    config.capital_raised_usd = 100000.0;
    config.tenor_months = 12;
    config.yield_bucket.allocated_usd = 30000.0;
    config.yield_bucket.base_apr = 0.08;
    config.holding_bucket.allocated_usd = 40000.0;
    config.holding_bucket.buying_price_usd = 90000.0;
    config.mining_allocated_usd = 30000.0;
    config.mining_bucket.miner.hashrate_th = 200.0;
    config.mining_bucket.miner.power_w = 3500.0;
    config.mining_bucket.miner_count = 20;
    config.mining_bucket.site.electricity_rate = 0.05;
    return config;
}

} // anonymous namespace

// ============================================================================
// ScenarioSet
// ============================================================================

TEST_CASE("ScenarioSet keeps order and replaces by name", "[scenario][set]") {
    ScenarioSet set;
    REQUIRE(set.empty());

    set.add(ScenarioCurves("bear", {1.0}, {0.1}));
    set.add(ScenarioCurves("base", {2.0}, {0.2}));
    set.add(ScenarioCurves("bear", {3.0}, {0.3}));

    REQUIRE(set.size() == 2);
    REQUIRE(set.get(0).name == "bear");
    REQUIRE(set.get(0).btc_prices[0] == 3.0);
    REQUIRE(set.contains("base"));
    REQUIRE_FALSE(set.contains("bull"));
    REQUIRE(set.get("base").hashprices[0] == 0.2);
    REQUIRE_THROWS_AS(set.get("bull"), ValidationError);
    REQUIRE_THROWS_AS(set.get(5), std::out_of_range);
}

TEST_CASE("Confidence band scales bear and bull", "[scenario][band]") {
    ScenarioCurves base("base", {100000.0, 110000.0}, {0.0005, 0.0004});
    auto set = apply_confidence_band(base, 20.0);

    REQUIRE(set.size() == 3);
    REQUIRE(set.get(0).name == "bear");
    REQUIRE(set.get(2).name == "bull");
    REQUIRE_THAT(set.get("bear").btc_prices[0], WithinAbs(80000.0, 1e-9));
    REQUIRE_THAT(set.get("bull").btc_prices[1], WithinAbs(132000.0, 1e-9));
    REQUIRE_THAT(set.get("bear").hashprices[0], WithinAbs(0.0004, 1e-12));
    REQUIRE(set.get("base").btc_prices == base.btc_prices);
}

TEST_CASE("Zero band reuses the base curves", "[scenario][band]") {
    ScenarioCurves base("base", {100000.0}, {0.0005});
    auto set = apply_confidence_band(base, 0.0);
    REQUIRE(set.get("bear").btc_prices == base.btc_prices);
    REQUIRE(set.get("bull").hashprices == base.hashprices);
}

TEST_CASE("Curve source names", "[scenario][source]") {
    REQUIRE(parse_curve_source("forecast") == CurveSource::FORECAST);
    REQUIRE(to_string(CurveSource::DETERMINISTIC) == "deterministic");
    REQUIRE_THROWS_AS(parse_curve_source("magic"), ValidationError);
}

// ============================================================================
// build_scenarios
// ============================================================================

TEST_CASE("Explicit scenarios are generated independently", "[scenario][build]") {
    std::vector<ScenarioCurveConfig> configs{
        deterministic_config("bear", 60000.0, 12),
        deterministic_config("base", 90000.0, 12),
        deterministic_config("bull", 120000.0, 12),
    };

    auto set = build_scenarios(configs, 20.0, nullptr);

    REQUIRE(set.size() == 3);
    REQUIRE(set.get("bear").btc_prices[0] == 60000.0);
    REQUIRE(set.get("bull").btc_prices[0] == 120000.0);
    REQUIRE(set.get("base").hashprices.size() == 12);
}

TEST_CASE("Single deterministic scenario derives bear and bull", "[scenario][build]") {
    auto set = build_scenarios({deterministic_config("base", 100000.0, 12)}, 10.0, nullptr);

    REQUIRE(set.size() == 3);
    REQUIRE_THAT(set.get("bear").btc_prices[0], WithinAbs(90000.0, 1e-9));
    REQUIRE_THAT(set.get("bull").btc_prices[0], WithinAbs(110000.0, 1e-9));
}

TEST_CASE("Forecast scenario uses interval bounds and fetches history once", "[scenario][build][forecast]") {
    ScenarioCurveConfig cfg = deterministic_config("base", 0.0, 12);
    cfg.price_curve.source = CurveSource::FORECAST;
    cfg.price_curve.forecast.model = forecast::ForecastModel::HOLT_WINTERS;
    cfg.network_curve.source = CurveSource::FORECAST;
    cfg.network_curve.forecast.model = forecast::ForecastModel::HOLT_WINTERS;

    FakeHistory history;
    std::ostringstream log_out;
    Logger logger(LoggerConfig(), log_out);
    auto set = build_scenarios({cfg}, 20.0, &history, &logger, RunContext("t", "scenario"));

    REQUIRE(history.price_calls == 1);
    REQUIRE(history.network_calls == 1);
    REQUIRE(set.size() == 3);
    const auto& bear = set.get("bear");
    const auto& base = set.get("base");
    const auto& bull = set.get("bull");
    REQUIRE(base.btc_prices.size() == 12);
    for (size_t i = 0; i < 12; ++i) {
        REQUIRE(bear.btc_prices[i] <= base.btc_prices[i]);
        REQUIRE(base.btc_prices[i] <= bull.btc_prices[i]);
        REQUIRE(bear.hashprices[i] <= base.hashprices[i] + 1e-8);
        REQUIRE(base.hashprices[i] <= bull.hashprices[i] + 1e-8);
    }
    REQUIRE(log_out.str().find("forecast_fit") != std::string::npos);
}

TEST_CASE("Forecast scenario without history is rejected", "[scenario][build][error]") {
    ScenarioCurveConfig cfg = deterministic_config("base", 0.0, 12);
    cfg.price_curve.source = CurveSource::FORECAST;
    REQUIRE_THROWS_AS(build_scenarios({cfg}, 20.0, nullptr), ValidationError);
}

TEST_CASE("No configured scenario is rejected", "[scenario][build][error]") {
    REQUIRE_THROWS_AS(build_scenarios({}, 20.0, nullptr), ValidationError);
}

// ============================================================================
// Runners
// ============================================================================

TEST_CASE("Product runs once per scenario in set order", "[scenario][run]") {
    auto set = build_scenarios({deterministic_config("base", 100000.0, 12)}, 20.0, nullptr);

    std::ostringstream log_out;
    Logger logger(LoggerConfig(), log_out);
    auto results = run_product_scenarios(small_product(), set, &logger, RunContext("t", "scenario"));

    REQUIRE(results.size() == 3);
    REQUIRE(results[0].scenario == "bear");
    REQUIRE(results[1].scenario == "base");
    REQUIRE(results[2].scenario == "bull");
    for (const auto& outcome : results) {
        REQUIRE(outcome.result.portfolio.size() == 12);
    }
    // Higher prices never lower the final portfolio
    REQUIRE(results[0].result.metrics.final_portfolio_usd <= results[2].result.metrics.final_portfolio_usd);

    std::string log = log_out.str();
    REQUIRE(log.find("simulation_start") != std::string::npos);
    REQUIRE(log.find("simulation_complete") != std::string::npos);
}

TEST_CASE("Bad allocation fails before any scenario runs", "[scenario][run][error]") {
    auto set = build_scenarios({deterministic_config("base", 100000.0, 12)}, 20.0, nullptr);
    ProductConfig config = small_product();
    config.mining_allocated_usd = 10.0;

    std::ostringstream log_out;
    Logger logger(LoggerConfig(), log_out);
    REQUIRE_THROWS_AS(run_product_scenarios(config, set, &logger), ValidationError);
    REQUIRE(log_out.str().empty());
}

TEST_CASE("Collateral failure in a scenario is rethrown", "[scenario][run][error]") {
    auto set = build_scenarios({deterministic_config("base", 100000.0, 12)}, 20.0, nullptr);
    CollateralProductConfig config;
    config.capital_raised_usd = 100000.0;
    config.btc_allocation_pct = 150.0;

    std::ostringstream log_out;
    Logger logger(LoggerConfig(), log_out);
    REQUIRE_THROWS_AS(run_collateral_scenarios(config, set, &logger), ValidationError);
    REQUIRE(log_out.str().find("\"event\":\"error\"") != std::string::npos);
}

TEST_CASE("Collateral runs once per scenario", "[scenario][run]") {
    auto set = build_scenarios({deterministic_config("base", 100000.0, 12)}, 20.0, nullptr);
    CollateralProductConfig config;
    config.capital_raised_usd = 100000.0;
    config.tenor_months = 12;
    config.buying_price_usd = 100000.0;

    auto results = run_collateral_scenarios(config, set);
    REQUIRE(results.size() == 3);
    REQUIRE(results[1].scenario == "base");
    REQUIRE(results[1].result.metrics.months_simulated == 12);
}
