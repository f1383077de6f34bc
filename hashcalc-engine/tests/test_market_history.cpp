#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "market_history.hpp"
#include "io/csv_reader.hpp"
#include "errors.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace hashcalc;
using Catch::Matchers::WithinAbs;

namespace {

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

} // anonymous namespace

// ============================================================================
// CSV
// ============================================================================

TEST_CASE("CSV reader trims, unquotes and skips comments", "[history][csv]") {
    std::istringstream in("# generated\n a , \"b,c\" , \"say \"\"hi\"\"\"\r\nlast,row\n");
    CsvReader reader(in);

    auto row = reader.read_row();
    REQUIRE(row == std::vector<std::string>{"a", "b,c", "say \"hi\""});
    row = reader.read_row();
    REQUIRE(row == std::vector<std::string>{"last", "row"});
    REQUIRE(reader.read_row().empty());
}

TEST_CASE("CSV header maps lower-cased names to columns", "[history][csv]") {
    std::istringstream in("Month,BTC_Produced,Uptime\n2025-01,0.5,0.97\n");
    CsvReader reader(in);
    auto columns = reader.read_header();

    REQUIRE(columns.at("month") == 0);
    REQUIRE(columns.at("btc_produced") == 1);
    REQUIRE(columns.at("uptime") == 2);
}

TEST_CASE("Series CSV with and without header", "[history][csv]") {
    SECTION("header row is skipped") {
        std::istringstream in("date,value\n2024-01-01,42000.5\n2024-01-02,43000\n");
        auto series = load_series_csv(in);
        REQUIRE(series.size() == 2);
        REQUIRE(series[0].date == "2024-01-01");
        REQUIRE(series[0].value == 42000.5);
    }

    SECTION("headerless file and blank lines") {
        std::istringstream in("2024-01-01,1\n\n2024-01-02,2\n");
        auto series = load_series_csv(in);
        REQUIRE(series.size() == 2);
    }

    SECTION("non-numeric value after the first row is an error") {
        std::istringstream in("date,value\n2024-01-01,abc\n");
        REQUIRE_THROWS_AS(load_series_csv(in), DataUnavailableError);
    }

    SECTION("single-column row is an error") {
        std::istringstream in("2024-01-01\n");
        REQUIRE_THROWS_AS(load_series_csv(in), DataUnavailableError);
    }

    SECTION("missing file") {
        REQUIRE_THROWS_AS(load_series_csv(std::string("/nonexistent/series.csv")), DataUnavailableError);
    }
}

// ============================================================================
// Resampling
// ============================================================================

TEST_CASE("Monthly resampling keeps month-end for prices", "[history][resample]") {
    HistoricalSeries daily{
        {"2024-01-01", 100.0}, {"2024-01-31", 110.0},
        {"2024-02-01", 120.0}, {"2024-02-29", 90.0},
        {"2024-03-15", 95.0},
    };
    auto monthly = resample_monthly(daily, MonthlyAggregation::LAST);

    REQUIRE(monthly.size() == 3);
    REQUIRE(monthly[0].date == "2024-01");
    REQUIRE(monthly[0].value == 110.0);
    REQUIRE(monthly[1].value == 90.0);
    REQUIRE(monthly[2].date == "2024-03");
}

TEST_CASE("Monthly mean drops non-positive observations", "[history][resample]") {
    HistoricalSeries daily{
        {"2024-01-01", 100.0}, {"2024-01-02", 0.0}, {"2024-01-03", 200.0},
        {"2024-02-01", -5.0},
        {"2024-03-01", 50.0},
    };
    auto monthly = resample_monthly(daily, MonthlyAggregation::MEAN);

    REQUIRE(monthly.size() == 2);
    REQUIRE_THAT(monthly[0].value, WithinAbs(150.0, 1e-12));
    REQUIRE(monthly[1].date == "2024-03");
    REQUIRE(series_values(monthly) == std::vector<double>{150.0, 50.0});
}

TEST_CASE("Monthly input passes through unchanged", "[history][resample]") {
    HistoricalSeries monthly_in{{"2024-01", 1.0}, {"2024-02", 2.0}};
    auto out = resample_monthly(monthly_in, MonthlyAggregation::LAST);
    REQUIRE(out.size() == 2);
    REQUIRE(out[1].date == "2024-02");
}

TEST_CASE("Malformed date is rejected", "[history][resample][error]") {
    REQUIRE_THROWS_AS(resample_monthly({{"2024", 1.0}}, MonthlyAggregation::LAST), DataUnavailableError);
}

TEST_CASE("Network history is an inner join on months", "[history][network]") {
    HistoricalSeries hashrate{{"2024-01", 500.0}, {"2024-02", 510.0}, {"2024-03", 520.0}};
    HistoricalSeries difficulty{{"2024-02", 7e13}, {"2024-03", 7.1e13}};
    HistoricalSeries fees{{"2024-01", 0.1}, {"2024-03", 0.12}};

    auto history = align_network_history(hashrate, difficulty, fees);

    REQUIRE(history.size() == 1);
    REQUIRE(history.months[0] == "2024-03");
    REQUIRE(history.hashrate_eh[0] == 520.0);
    REQUIRE(history.difficulty[0] == 7.1e13);
    REQUIRE(history.fees_per_block_btc[0] == 0.12);
}

// ============================================================================
// Offline source
// ============================================================================

TEST_CASE("CSV history source reads a directory", "[history][offline]") {
    auto dir = std::filesystem::temp_directory_path() / "hashcalc_test_history";
    std::filesystem::create_directories(dir);

    write_file(dir / "btc_price.csv", "date,value\n2024-01-05,40000\n2024-01-31,42000\n2024-02-15,50000\n");
    write_file(dir / "hashrate.csv", "date,value\n2024-01-01,500\n2024-01-02,520\n2024-02-01,540\n");
    write_file(dir / "difficulty.csv", "date,value\n2024-01-01,7e13\n2024-02-01,7.2e13\n");
    write_file(dir / "fees.csv", "date,value\n2024-01-01,0.1\n2024-02-01,0.2\n");

    CsvHistorySource source(dir.string());

    auto prices = source.monthly_btc_prices();
    REQUIRE(prices.size() == 2);
    REQUIRE(prices[0].value == 42000.0);

    auto network = source.monthly_network_history();
    REQUIRE(network.size() == 2);
    REQUIRE_THAT(network.hashrate_eh[0], WithinAbs(510.0, 1e-12));
    REQUIRE(network.fees_per_block_btc[1] == 0.2);

    std::filesystem::remove_all(dir);
}

TEST_CASE("CSV history source reports missing files", "[history][offline][error]") {
    CsvHistorySource source("/nonexistent/history");
    REQUIRE_THROWS_AS(source.monthly_btc_prices(), DataUnavailableError);
}
