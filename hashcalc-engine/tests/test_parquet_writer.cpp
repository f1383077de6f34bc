#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "io/parquet_writer.hpp"
#include <filesystem>

using namespace hashcalc;

namespace {

ScenarioSet flat_scenarios() {
    ScenarioSet set;
    set.add(ScenarioCurves("bear", std::vector<double>(6, 70000.0), std::vector<double>(6, 0.0005)));
    set.add(ScenarioCurves("base", std::vector<double>(6, 80000.0), std::vector<double>(6, 0.0005)));
    return set;
}

ProductConfig small_product() {
    ProductConfig config;
    config.capital_raised_usd = 100000.0;
    config.tenor_months = 6;
    config.yield_bucket.allocated_usd = 30000.0;
    config.holding_bucket.allocated_usd = 40000.0;
    config.holding_bucket.buying_price_usd = 80000.0;
    config.mining_allocated_usd = 30000.0;
    config.mining_bucket.miner.hashrate_th = 200.0;
    config.mining_bucket.miner.power_w = 3500.0;
    config.mining_bucket.miner_count = 20;
    config.mining_bucket.site.electricity_rate = 0.05;
    return config;
}

CollateralProductConfig small_collateral() {
    CollateralProductConfig config;
    config.capital_raised_usd = 100000.0;
    config.tenor_months = 6;
    config.buying_price_usd = 80000.0;
    return config;
}

} // anonymous namespace

#ifdef HAVE_ARROW

TEST_CASE("Parquet export of monthly records", "[parquet][io]") {
    SECTION("waterfall rows for every scenario") {
        const std::string path = "/tmp/hashcalc_test_waterfall.parquet";
        std::filesystem::remove(path);

        ParquetWriter::write_waterfall(run_product_scenarios(small_product(), flat_scenarios()), path);

        REQUIRE(std::filesystem::exists(path));
        REQUIRE(std::filesystem::file_size(path) > 0);
        std::filesystem::remove(path);
    }

    SECTION("collateral rows for every scenario") {
        const std::string path = "/tmp/hashcalc_test_collateral.parquet";
        std::filesystem::remove(path);

        ParquetWriter::write_collateral(run_collateral_scenarios(small_collateral(), flat_scenarios()), path);

        REQUIRE(std::filesystem::exists(path));
        std::filesystem::remove(path);
    }

    SECTION("empty result set is rejected") {
        REQUIRE_THROWS_WITH(ParquetWriter::write_waterfall({}, "/tmp/unused.parquet"),
                            Catch::Matchers::ContainsSubstring("No scenario results"));
    }

    SECTION("unwritable path") {
        REQUIRE_THROWS_AS(ParquetWriter::write_collateral(
                              run_collateral_scenarios(small_collateral(), flat_scenarios()),
                              "/nonexistent/dir/out.parquet"),
                          std::runtime_error);
    }
}

#else // !HAVE_ARROW

TEST_CASE("Parquet export not available without Arrow", "[parquet]") {
    SECTION("write_waterfall throws") {
        REQUIRE_THROWS(ParquetWriter::write_waterfall(
            run_product_scenarios(small_product(), flat_scenarios()), "test.parquet"));
    }

    SECTION("write_collateral throws") {
        REQUIRE_THROWS(ParquetWriter::write_collateral(
            run_collateral_scenarios(small_collateral(), flat_scenarios()), "test.parquet"));
    }
}

#endif // HAVE_ARROW
