#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/wait.h>

using json = nlohmann::json;

namespace {

struct CommandResult {
    int exit_code;
    std::string stdout_output;
    std::string stderr_output;
};

std::string read_all(const std::string& path) {
    std::ifstream in(path);
    std::ostringstream ss;
    if (in) {
        ss << in.rdbuf();
    }
    return ss.str();
}

CommandResult run_cli(const std::string& arguments) {
    const std::string stdout_file = "/tmp/hashcalc_test_stdout.txt";
    const std::string stderr_file = "/tmp/hashcalc_test_stderr.txt";

    std::string cmd = std::string("\"") + HASHCALC_CLI_PATH + "\" " + arguments +
                      " >" + stdout_file + " 2>" + stderr_file;
    int status = std::system(cmd.c_str());

    CommandResult result;
    result.exit_code = WEXITSTATUS(status);
    result.stdout_output = read_all(stdout_file);
    result.stderr_output = read_all(stderr_file);
    return result;
}

std::string example(const std::string& name) {
    return std::string(HASHCALC_EXAMPLES_DIR) + "/" + name;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

// ============================================================================
// Arguments
// ============================================================================

TEST_CASE("CLI help shows usage", "[cli]") {
    auto result = run_cli("--help");
    REQUIRE(result.exit_code == 0);
    REQUIRE(contains(result.stderr_output, "Usage:"));
    REQUIRE(contains(result.stderr_output, "--config"));
    REQUIRE(contains(result.stderr_output, "--offline-history"));
    REQUIRE(contains(result.stderr_output, "collateral"));
}

TEST_CASE("CLI no args shows usage", "[cli]") {
    auto result = run_cli("");
    REQUIRE(result.exit_code == 0);
    REQUIRE(contains(result.stderr_output, "Usage:"));
}

TEST_CASE("CLI argument errors exit with 1", "[cli][error]") {
    SECTION("missing config") {
        auto result = run_cli("product");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "--config is required"));
    }

    SECTION("missing command") {
        auto result = run_cli("--config " + example("project.json"));
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "a command is required"));
    }

    SECTION("unknown option") {
        auto result = run_cli("product --frobnicate");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "Unknown option or missing argument: --frobnicate"));
    }

    SECTION("parquet on a command without monthly records") {
        auto result = run_cli("miner --config " + example("project.json") + " --parquet /tmp/x.parquet");
        REQUIRE(result.exit_code == 1);
        REQUIRE(contains(result.stderr_output, "--parquet is only supported"));
    }
}

TEST_CASE("CLI runtime errors exit with 2", "[cli][error]") {
    SECTION("missing config file") {
        auto result = run_cli("product --config /nonexistent/project.json");
        REQUIRE(result.exit_code == 2);
        REQUIRE(contains(result.stderr_output, "Error: Failed to open config file"));
    }

    SECTION("command section absent from the project") {
        auto result = run_cli("product --config " + example("forecast.json") +
                              " --offline-history " + example("history"));
        REQUIRE(result.exit_code == 2);
        REQUIRE(contains(result.stderr_output, "Missing required section: product"));
    }
}

// ============================================================================
// Commands
// ============================================================================

TEST_CASE("CLI product run over three scenarios", "[cli][product]") {
    auto result = run_cli("product --config " + example("project.json") + " --log-level WARN");
    REQUIRE(result.exit_code == 0);

    json out = json::parse(result.stdout_output);
    REQUIRE(out["scenarios"].size() == 3);
    for (const char* name : {"bear", "base", "bull"}) {
        const json& s = out["scenarios"][name];
        REQUIRE(s["aggregated"]["monthly_portfolio"].size() == 36);
        REQUIRE(s.contains("commercial"));
        REQUIRE(s["decision"].contains("decision"));
    }
    REQUIRE(out.contains("ops_calibration"));
    REQUIRE(out["ops_calibration"]["monthly_comparison"].size() == 6);
    REQUIRE_FALSE(contains(result.stderr_output, "simulation_start"));
}

TEST_CASE("CLI collateral run writes an output file", "[cli][collateral]") {
    const std::string output = "/tmp/hashcalc_test_collateral.json";
    std::remove(output.c_str());

    auto result = run_cli("collateral --config " + example("project.json") + " --output " + output);
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stdout_output.empty());
    REQUIRE(contains(result.stderr_output, "Output written to: " + output));
    REQUIRE(contains(result.stderr_output, "\"event\":\"simulation_complete\""));

    std::ifstream in(output);
    json out = json::parse(in);
    REQUIRE(out["scenarios"]["base"]["metrics"]["capital_raised_usd"] == 1000000.0);
    REQUIRE(out["scenarios"]["bear"]["monthly_data"].size() == 36);
    std::remove(output.c_str());
}

TEST_CASE("CLI miner and hosting commands", "[cli]") {
    SECTION("miner economics per scenario") {
        auto result = run_cli("miner --config " + example("project.json"));
        REQUIRE(result.exit_code == 0);
        json out = json::parse(result.stdout_output);
        REQUIRE(out.size() == 3);
        REQUIRE(out["base"]["monthly_cashflows"].size() == 36);
    }

    SECTION("hosting allocation") {
        auto result = run_cli("hosting --config " + example("project.json"));
        REQUIRE(result.exit_code == 0);
        json out = json::parse(result.stdout_output);
        REQUIRE(out["total_power_kw"] == 2286.0);
        REQUIRE(out["sites"].size() == 2);
    }

    SECTION("calibration against the base scenario") {
        auto result = run_cli("calibrate --config " + example("project.json"));
        REQUIRE(result.exit_code == 0);
        json out = json::parse(result.stdout_output);
        REQUIRE(out.contains("realized_uptime_factor"));
        REQUIRE(out["monthly_comparison"].size() == 6);
    }
}

TEST_CASE("CLI curves from offline history", "[cli][forecast]") {
    SECTION("deterministic price curves") {
        auto result = run_cli("price-curve --config " + example("project.json"));
        REQUIRE(result.exit_code == 0);
        json out = json::parse(result.stdout_output);
        REQUIRE(out["bear"]["source"] == "deterministic");
        REQUIRE(out["bear"]["monthly_prices"][0] == 95000.0);
        REQUIRE(out["base"]["monthly_prices"][12] == 120000.0);
    }

    SECTION("forecast network curve") {
        auto result = run_cli("network-curve --config " + example("forecast.json") + " --log-text");
        REQUIRE(result.exit_code == 0);
        json out = json::parse(result.stdout_output);
        REQUIRE(out["base"]["source"] == "forecast");
        REQUIRE(out["base"]["hashprice_btc_per_ph_day"].size() == 24);
        REQUIRE(out["base"]["hashprice_lower"].size() == 24);
        REQUIRE(out["base"]["difficulty_upper"].size() == 24);
        REQUIRE(out["base"]["fees_lower"].size() == 24);
        REQUIRE(out["base"]["model_info"]["forecast_months"] == 24);
        REQUIRE(contains(result.stderr_output, "[INFO]"));
    }

    SECTION("forecast miner run") {
        auto result = run_cli("miner --config " + example("forecast.json") + " --log-level ERROR");
        REQUIRE(result.exit_code == 0);
        json out = json::parse(result.stdout_output);
        REQUIRE(out.size() == 3);
        REQUIRE(out["bull"]["monthly_cashflows"].size() == 24);
    }
}

TEST_CASE("CLI log file receives events", "[cli][logging]") {
    const std::string log_path = "/tmp/hashcalc_test_cli.log";
    std::remove(log_path.c_str());

    auto result = run_cli("collateral --config " + example("project.json") + " --log-file " + log_path);
    REQUIRE(result.exit_code == 0);

    std::istringstream lines(read_all(log_path));
    std::string line;
    int starts = 0;
    while (std::getline(lines, line)) {
        json event = json::parse(line);
        REQUIRE(event.contains("run_id"));
        if (event["event"] == "simulation_start") {
            ++starts;
        }
    }
    REQUIRE(starts == 3);
    std::remove(log_path.c_str());
}
