#include <chrono>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include "hosting_allocation.hpp"
#include "logger.hpp"
#include "market_history.hpp"
#include "miner.hpp"
#include "network_curve.hpp"
#include "ops_calibration.hpp"
#include "price_curve.hpp"
#include "scenario.hpp"
#include "io/config_parser.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"
#include "client/market_data_client.hpp"

#include <nlohmann/json.hpp>
using json = nlohmann::json;

namespace {

const char* const COMMANDS[] = {"price-curve", "network-curve", "miner", "hosting",
                                "calibrate", "product", "collateral"};

struct CLIArgs {
    std::string command;
    std::string config_path;
    std::string output_path;
    std::string parquet_path;
    std::string log_level = "INFO";
    std::string log_file;
    std::string offline_history_dir;
    bool log_text = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "HashCalc v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " <command> --config <path> [options]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  price-curve                 BTC price curve per scenario\n";
    std::cerr << "  network-curve               Hashrate, fees and hashprice per scenario\n";
    std::cerr << "  miner                       Single-miner economics per scenario\n";
    std::cerr << "  hosting                     Validate the fleet allocation across sites\n";
    std::cerr << "  calibrate                   Compare ops history with the base scenario\n";
    std::cerr << "  product                     Multi-bucket product across scenarios\n";
    std::cerr << "  collateral                  BTC-collateral product across scenarios\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config <path>             JSON project file (required)\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --parquet <path>            Monthly records as Parquet (product, collateral)\n";
    std::cerr << "  --offline-history <dir>     Read history CSVs instead of fetching\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Also append log lines to a file\n";
    std::cerr << "  --log-text                  Plain-text log lines instead of JSON\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " product --config examples/product.json \\\n";
    std::cerr << "      --output results.json --log-level WARN\n";
}

bool is_command(const std::string& arg) {
    for (const char* c : COMMANDS) {
        if (arg == c) return true;
    }
    return false;
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--parquet" && i + 1 < argc) {
            args.parquet_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else if (arg == "--offline-history" && i + 1 < argc) {
            args.offline_history_dir = argv[++i];
        } else if (arg == "--log-text") {
            args.log_text = true;
        } else if (args.command.empty() && is_command(arg)) {
            args.command = arg;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.command.empty()) {
        std::cerr << "Error: a command is required\n";
        valid = false;
    }
    if (args.config_path.empty()) {
        std::cerr << "Error: --config is required\n";
        valid = false;
    }
    if (!args.parquet_path.empty() && args.command != "product" &&
        args.command != "collateral") {
        std::cerr << "Error: --parquet is only supported by product and collateral\n";
        valid = false;
    }
    return valid;
}

std::string make_run_id() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    std::ostringstream oss;
    oss << "run-" << std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
    return oss.str();
}

template <typename T>
const T& require_section(const std::optional<T>& section, const std::string& name) {
    if (!section) {
        throw hashcalc::ConfigParseError("Missing required section: " + name);
    }
    return *section;
}

// Everything a command needs besides its own config section
class CommandContext {
public:
    CommandContext(const CLIArgs& args, const hashcalc::ProjectConfig& project,
                   hashcalc::Logger& logger)
        : args_(args), project_(project), logger_(logger),
          ctx_(make_run_id(), "cli") {}

    const hashcalc::ProjectConfig& project() const { return project_; }
    hashcalc::Logger& logger() { return logger_; }
    const hashcalc::RunContext& ctx() const { return ctx_; }

    // Offline CSVs win over the network; the source is created on first use
    hashcalc::MarketHistorySource* history() {
        if (!history_) {
            std::string offline = args_.offline_history_dir.empty()
                ? project_.market_data.offline_history_dir
                : args_.offline_history_dir;
            if (!offline.empty()) {
                history_ = std::make_unique<hashcalc::CsvHistorySource>(offline);
            } else {
                hashcalc::marketdata::MarketDataClientConfig config;
                config.cache_dir = project_.market_data.cache_dir;
                config.ttl_hours = project_.market_data.ttl_hours;
                config.timeout_ms = project_.market_data.timeout_ms;
                history_ = std::make_unique<hashcalc::marketdata::MarketDataClient>(
                    config, &logger_, hashcalc::RunContext(ctx_.run_id, "marketdata"));
            }
        }
        return history_.get();
    }

    hashcalc::ScenarioSet scenarios() {
        if (project_.scenarios.empty()) {
            throw hashcalc::ConfigParseError("Missing required section: scenarios");
        }
        bool needs_history = false;
        for (const auto& s : project_.scenarios) {
            if (s.price_curve.source == hashcalc::CurveSource::FORECAST ||
                s.network_curve.source == hashcalc::CurveSource::FORECAST) {
                needs_history = true;
            }
        }
        return hashcalc::build_scenarios(project_.scenarios, project_.confidence_band_pct,
                                         needs_history ? history() : nullptr, &logger_,
                                         hashcalc::RunContext(ctx_.run_id, "scenario"));
    }

    const hashcalc::ScenarioCurves& base(const hashcalc::ScenarioSet& set) const {
        return set.contains("base") ? set.get("base") : set.get(size_t{0});
    }

private:
    const CLIArgs& args_;
    const hashcalc::ProjectConfig& project_;
    hashcalc::Logger& logger_;
    hashcalc::RunContext ctx_;
    std::unique_ptr<hashcalc::MarketHistorySource> history_;
};

// ============================================================================
// Commands
// ============================================================================

json run_price_curve(CommandContext& cc) {
    const auto& project = cc.project();
    if (project.scenarios.empty()) {
        throw hashcalc::ConfigParseError("Missing required section: scenarios");
    }

    json out = json::object();
    for (const auto& s : project.scenarios) {
        const hashcalc::PriceCurveConfig& pc = s.price_curve;
        if (pc.source == hashcalc::CurveSource::DETERMINISTIC) {
            out[s.name] = {
                {"source", "deterministic"},
                {"monthly_prices", hashcalc::generate_price_curve(pc.params)},
            };
        } else {
            hashcalc::forecast::ForecastRequest request = pc.forecast;
            request.horizon = pc.params.months;
            hashcalc::PriceForecast fc = hashcalc::generate_price_forecast(*cc.history(), request);
            cc.logger().log_forecast_fit(cc.ctx().with_scenario(s.name), "btc_price",
                                         fc.diagnostics.model, fc.diagnostics.aic,
                                         fc.diagnostics.models_evaluated);
            out[s.name] = fc;
            out[s.name]["source"] = "forecast";
        }
    }
    return out;
}

json run_network_curve(CommandContext& cc) {
    const auto& project = cc.project();
    if (project.scenarios.empty()) {
        throw hashcalc::ConfigParseError("Missing required section: scenarios");
    }

    json out = json::object();
    for (const auto& s : project.scenarios) {
        const hashcalc::NetworkCurveConfig& nc = s.network_curve;
        hashcalc::RunContext ctx = cc.ctx().with_scenario(s.name);
        if (nc.source == hashcalc::CurveSource::DETERMINISTIC) {
            hashcalc::NetworkCurve curve = hashcalc::generate_network_curve(nc.params);
            for (const auto& w : curve.warnings) {
                cc.logger().log_warning(ctx, w);
            }
            out[s.name] = curve;
            out[s.name]["source"] = "deterministic";
        } else {
            hashcalc::forecast::ForecastRequest request = nc.forecast;
            request.horizon = nc.params.months;
            hashcalc::NetworkForecast fc = hashcalc::generate_network_forecast(
                *cc.history(), nc.params.start_date, nc.params.halving_enabled, request);
            cc.logger().log_forecast_fit(ctx, "hashrate", fc.hashrate_diagnostics.model,
                                         fc.hashrate_diagnostics.aic,
                                         fc.hashrate_diagnostics.models_evaluated);
            cc.logger().log_forecast_fit(ctx, "fees", fc.fee_diagnostics.model,
                                         fc.fee_diagnostics.aic,
                                         fc.fee_diagnostics.models_evaluated);
            out[s.name] = fc;
            out[s.name]["source"] = "forecast";
        }
    }
    return out;
}

json run_miner(CommandContext& cc) {
    const auto& project = cc.project();
    const hashcalc::MinerSpec& miner = require_section(project.miner, "miner");
    const hashcalc::HostingSiteSpec& site = require_section(project.hosting_site, "hosting_site");

    hashcalc::ScenarioSet scenarios = cc.scenarios();
    json out = json::object();
    for (const auto& curves : scenarios.scenarios()) {
        out[curves.name] = hashcalc::simulate_miner(miner, curves.btc_prices, curves.hashprices,
                                                    site.electricity_rate,
                                                    site.uptime_expectation, project.months);
    }
    return out;
}

json run_hosting(CommandContext& cc) {
    const hashcalc::HostingConfig& hosting = require_section(cc.project().hosting, "hosting");
    hashcalc::HostingAllocationResult result = hashcalc::validate_hosting_allocation(
        hosting.allocations, hosting.sites, hosting.miners);
    for (const auto& w : result.warnings) {
        cc.logger().log_warning(cc.ctx(), w);
    }
    return result;
}

hashcalc::CalibrationResult calibrate(CommandContext& cc, const hashcalc::ScenarioCurves& base,
                                      const hashcalc::MinerSpec& miner, double assumed_uptime) {
    const auto& history = require_section(cc.project().ops_history, "ops_history");
    hashcalc::CalibrationResult result = hashcalc::calibrate_ops(
        history, base.btc_prices, base.hashprices, miner, assumed_uptime);
    for (const auto& flag : result.flags) {
        cc.logger().log_warning(cc.ctx(), flag);
    }
    return result;
}

json run_calibrate(CommandContext& cc) {
    const auto& project = cc.project();
    const hashcalc::MinerSpec& miner = require_section(project.miner, "miner");
    const hashcalc::HostingSiteSpec& site = require_section(project.hosting_site, "hosting_site");

    hashcalc::ScenarioSet scenarios = cc.scenarios();
    return calibrate(cc, cc.base(scenarios), miner, site.uptime_expectation);
}

json run_product(CommandContext& cc, const std::string& parquet_path) {
    const auto& project = cc.project();
    hashcalc::ProductConfig config = require_section(project.product, "product");
    hashcalc::ScenarioSet scenarios = cc.scenarios();

    json calibration;
    if (project.apply_ops_calibration && project.ops_history) {
        const hashcalc::MiningBucketConfig& mb = config.mining_bucket;
        hashcalc::CalibrationResult cal =
            calibrate(cc, cc.base(scenarios), mb.miner, mb.site.uptime_expectation);
        config.mining_bucket.calibration = hashcalc::CalibrationFactors(
            cal.realized_uptime_factor, cal.production_adjustment);
        calibration = cal;
    }

    hashcalc::ProductScenarioResults results = hashcalc::run_product_scenarios(
        config, scenarios, &cc.logger(), hashcalc::RunContext(cc.ctx().run_id, "scenario"));

    if (!parquet_path.empty()) {
        hashcalc::ParquetWriter::write_waterfall(results, parquet_path);
    }

    json out = {{"scenarios", hashcalc::scenario_results_json(results)}};
    if (!calibration.is_null()) {
        out["ops_calibration"] = calibration;
    }
    return out;
}

json run_collateral(CommandContext& cc, const std::string& parquet_path) {
    const hashcalc::CollateralProductConfig& config =
        require_section(cc.project().collateral_product, "collateral_product");
    hashcalc::ScenarioSet scenarios = cc.scenarios();

    hashcalc::CollateralScenarioResults results = hashcalc::run_collateral_scenarios(
        config, scenarios, &cc.logger(), hashcalc::RunContext(cc.ctx().run_id, "scenario"));

    if (!parquet_path.empty()) {
        hashcalc::ParquetWriter::write_collateral(results, parquet_path);
    }
    return {{"scenarios", hashcalc::scenario_results_json(results)}};
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help || argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    hashcalc::LoggerConfig log_config;
    log_config.min_level = hashcalc::string_to_level(args.log_level);
    log_config.enable_json = !args.log_text;
    if (!args.log_file.empty()) {
        log_config.enable_file = true;
        log_config.log_file_path = args.log_file;
    }
    hashcalc::Logger logger(log_config);

    try {
        hashcalc::ProjectConfig project =
            hashcalc::parse_project_config_from_file(args.config_path);
        CommandContext cc(args, project, logger);
        logger.log_debug(cc.ctx(), "Loaded project config " + args.config_path);

        json result;
        if (args.command == "price-curve") {
            result = run_price_curve(cc);
        } else if (args.command == "network-curve") {
            result = run_network_curve(cc);
        } else if (args.command == "miner") {
            result = run_miner(cc);
        } else if (args.command == "hosting") {
            result = run_hosting(cc);
        } else if (args.command == "calibrate") {
            result = run_calibrate(cc);
        } else if (args.command == "product") {
            result = run_product(cc, args.parquet_path);
        } else {
            result = run_collateral(cc, args.parquet_path);
        }

        if (args.output_path.empty()) {
            hashcalc::io::write_json(std::cout, result);
        } else {
            hashcalc::io::write_json(args.output_path, result);
            std::cerr << "Output written to: " << args.output_path << "\n";
        }
        logger.flush();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        logger.flush();
        return 2;
    }
}
