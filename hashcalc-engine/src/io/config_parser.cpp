#include "config_parser.hpp"
#include "csv_reader.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace hashcalc {

namespace {

// ============================================================================
// Leaf sections
// ============================================================================

MinerSpec parse_miner(const json& j) {
    MinerSpec miner;
    miner.name = j.value("name", miner.name);
    miner.hashrate_th = j.value("hashrate_th", miner.hashrate_th);
    miner.power_w = j.value("power_w", miner.power_w);
    miner.price_usd = j.value("price_usd", miner.price_usd);
    miner.lifetime_months = j.value("lifetime_months", miner.lifetime_months);
    miner.maintenance_pct = j.value("maintenance_pct", miner.maintenance_pct);
    return miner;
}

HostingSiteSpec parse_site(const json& j) {
    HostingSiteSpec site;
    site.name = j.value("name", site.name);
    site.electricity_rate = j.value("electricity_rate", site.electricity_rate);
    site.hosting_fee_per_kw_month = j.value("hosting_fee_per_kw_month", site.hosting_fee_per_kw_month);
    site.uptime_expectation = j.value("uptime_expectation", site.uptime_expectation);
    site.curtailment_pct = j.value("curtailment_pct", site.curtailment_pct);
    site.capacity_mw = j.value("capacity_mw", site.capacity_mw);
    return site;
}

// Reads [p, d, q] or [P, D, Q, m]
std::vector<int> parse_int_list(const json& j, size_t expected, const std::string& field) {
    if (!j.is_array() || j.size() != expected) {
        throw ConfigParseError(field + " must be an array of " + std::to_string(expected) +
                               " integers");
    }
    return j.get<std::vector<int>>();
}

void parse_forecast_request(const json& j, forecast::ForecastRequest& request) {
    if (j.contains("model")) {
        request.model = forecast::parse_forecast_model(j["model"].get<std::string>());
    }
    request.confidence = j.value("confidence", request.confidence);
    if (j.contains("order")) {
        auto o = parse_int_list(j["order"], 3, "order");
        request.sarimax_order = {o[0], o[1], o[2]};
    }
    if (j.contains("seasonal_order")) {
        auto o = parse_int_list(j["seasonal_order"], 4, "seasonal_order");
        request.sarimax_seasonal_order = {o[0], o[1], o[2], o[3]};
    }
}

PriceCurveConfig parse_price_curve(const json& j, int months) {
    PriceCurveConfig cfg;
    cfg.source = parse_curve_source(j.value("source", std::string("deterministic")));

    PriceCurveParams& p = cfg.params;
    p.months = months;
    p.start_price = j.value("start_price", p.start_price);
    if (j.contains("anchors")) {
        for (auto it = j["anchors"].begin(); it != j["anchors"].end(); ++it) {
            int year = 0;
            try {
                year = std::stoi(it.key());
            } catch (const std::exception&) {
                throw ConfigParseError("Anchor key '" + it.key() + "' is not a year index");
            }
            p.anchors[year] = it.value().get<double>();
        }
    }
    if (j.contains("interpolation")) {
        p.mode = parse_interpolation_mode(j["interpolation"].get<std::string>());
    }
    if (j.contains("custom_prices")) {
        p.custom_prices = j["custom_prices"].get<std::vector<double>>();
    }
    if (j.contains("noise")) {
        const json& n = j["noise"];
        p.noise_enabled = n.value("enabled", p.noise_enabled);
        p.noise_seed = n.value("seed", p.noise_seed);
        p.noise_amplitude = n.value("amplitude", p.noise_amplitude);
    }

    parse_forecast_request(j, cfg.forecast);
    return cfg;
}

NetworkCurveConfig parse_network_curve(const json& j, const std::string& start_date, int months) {
    NetworkCurveConfig cfg;
    cfg.source = parse_curve_source(j.value("source", std::string("deterministic")));

    NetworkCurveParams& p = cfg.params;
    p.start_date = start_date;
    p.months = months;
    p.starting_hashrate_eh = j.value("starting_hashrate_eh", p.starting_hashrate_eh);
    p.monthly_hashrate_growth = j.value("monthly_hashrate_growth", p.monthly_hashrate_growth);
    p.starting_fees_per_block = j.value("starting_fees_per_block", p.starting_fees_per_block);
    if (j.contains("fee_regime")) {
        p.fee_regime = parse_fee_regime(j["fee_regime"].get<std::string>());
    }
    p.halving_enabled = j.value("halving_enabled", p.halving_enabled);

    parse_forecast_request(j, cfg.forecast);
    return cfg;
}

// ============================================================================
// Products
// ============================================================================

// A miner or site is either given inline or as an id into the hosting catalog;
// when absent the top-level miner/hosting_site is used.
template <typename Spec, typename Parse>
Spec resolve_spec(const json& parent, const std::string& key,
                  const std::map<std::string, Spec>* catalog,
                  const std::optional<Spec>& fallback,
                  Parse parse) {
    if (parent.contains(key)) {
        const json& ref = parent[key];
        if (ref.is_string()) {
            std::string id = ref.get<std::string>();
            if (!catalog || catalog->find(id) == catalog->end()) {
                throw ConfigParseError("Unknown " + key + " id '" + id + "'");
            }
            return catalog->at(id);
        }
        return parse(ref);
    }
    if (fallback) {
        return *fallback;
    }
    throw ConfigParseError("Missing required field: " + key);
}

std::vector<TakeProfitEntry> parse_take_profit(const json& j) {
    std::vector<TakeProfitEntry> ladder;
    for (const auto& e : j) {
        ladder.push_back({e.at("price_trigger").get<double>(), e.at("sell_pct").get<double>()});
    }
    return ladder;
}

void parse_commercial(const json& j, CommercialFeeConfig& fees) {
    fees.upfront_commercial_pct = j.value("upfront_commercial_pct", fees.upfront_commercial_pct);
    fees.management_fees_pct = j.value("management_fees_pct", fees.management_fees_pct);
    fees.performance_fees_pct = j.value("performance_fees_pct", fees.performance_fees_pct);
}

ProductConfig parse_product(const json& j, const ProjectConfig& project) {
    ProductConfig cfg;
    cfg.capital_raised_usd = j.value("capital_raised_usd", cfg.capital_raised_usd);
    cfg.tenor_months = j.value("tenor_months", cfg.tenor_months);

    if (j.contains("yield_bucket")) {
        const json& y = j["yield_bucket"];
        cfg.yield_bucket.allocated_usd = y.value("allocated_usd", 0.0);
        cfg.yield_bucket.base_apr = y.value("base_apr", 0.08);
        if (y.contains("apr_schedule")) {
            for (const auto& e : y["apr_schedule"]) {
                cfg.yield_bucket.apr_schedule.push_back({e.at("from_month").get<int>(),
                                                         e.at("to_month").get<int>(),
                                                         e.at("apr").get<double>()});
            }
        }
    }

    if (j.contains("holding_bucket")) {
        const json& h = j["holding_bucket"];
        HoldingBucketConfig& hb = cfg.holding_bucket;
        hb.allocated_usd = h.value("allocated_usd", hb.allocated_usd);
        hb.buying_price_usd = h.value("buying_price_usd", hb.buying_price_usd);
        hb.target_sell_price_usd = h.value("target_sell_price_usd", hb.target_sell_price_usd);
        hb.capital_recon_pct = h.value("capital_recon_pct", hb.capital_recon_pct);
        if (h.contains("extra_yield_strikes")) {
            for (const auto& e : h["extra_yield_strikes"]) {
                hb.extra_yield_strikes.push_back({e.at("strike_price").get<double>(),
                                                  e.at("btc_share_pct").get<double>()});
            }
        }
    }

    if (j.contains("mining_bucket")) {
        const json& m = j["mining_bucket"];
        const HostingConfig* hosting = project.hosting ? &*project.hosting : nullptr;
        MiningBucketConfig& mb = cfg.mining_bucket;

        cfg.mining_allocated_usd = m.value("allocated_usd", cfg.mining_allocated_usd);
        mb.miner = resolve_spec<MinerSpec>(m, "miner", hosting ? &hosting->miners : nullptr,
                                           project.miner, parse_miner);
        mb.site = resolve_spec<HostingSiteSpec>(m, "site", hosting ? &hosting->sites : nullptr,
                                                project.hosting_site, parse_site);
        mb.miner_count = m.value("miner_count", mb.miner_count);
        mb.base_yield_apr = m.value("base_yield_apr", mb.base_yield_apr);
        mb.bonus_yield_apr = m.value("bonus_yield_apr", mb.bonus_yield_apr);
        if (m.contains("take_profit_ladder")) {
            mb.take_profit_ladder = parse_take_profit(m["take_profit_ladder"]);
        }
        if (m.contains("calibration")) {
            const json& c = m["calibration"];
            mb.calibration.uptime_factor = c.value("uptime_factor", 1.0);
            mb.calibration.production_adjustment = c.value("production_adjustment", 1.0);
        }
        mb.thresholds = project.thresholds;
    }

    if (j.contains("commercial")) {
        parse_commercial(j["commercial"], cfg.commercial);
    }
    return cfg;
}

CollateralProductConfig parse_collateral(const json& j, const ProjectConfig& project) {
    CollateralProductConfig cfg;
    const HostingConfig* hosting = project.hosting ? &*project.hosting : nullptr;

    cfg.capital_raised_usd = j.value("capital_raised_usd", cfg.capital_raised_usd);
    cfg.tenor_months = j.value("tenor_months", cfg.tenor_months);
    cfg.btc_allocation_pct = j.value("btc_allocation_pct", cfg.btc_allocation_pct);
    cfg.buying_price_usd = j.value("buying_price_usd", cfg.buying_price_usd);
    cfg.collateral_ltv_pct = j.value("collateral_ltv_pct", cfg.collateral_ltv_pct);
    cfg.borrowing_apr = j.value("borrowing_apr", cfg.borrowing_apr);
    cfg.liquidation_ltv_pct = j.value("liquidation_ltv_pct", cfg.liquidation_ltv_pct);

    cfg.miner = resolve_spec<MinerSpec>(j, "miner", hosting ? &hosting->miners : nullptr,
                                        project.miner, parse_miner);
    cfg.site = resolve_spec<HostingSiteSpec>(j, "site", hosting ? &hosting->sites : nullptr,
                                             project.hosting_site, parse_site);
    cfg.miner_count = j.value("miner_count", cfg.miner_count);

    if (j.contains("strike_ladder")) {
        for (const auto& e : j["strike_ladder"]) {
            cfg.strike_ladder.push_back({e.at("strike_price").get<double>(),
                                         e.at("btc_sell_pct").get<double>()});
        }
    }

    cfg.reserve_yield_apr = j.value("reserve_yield_apr", cfg.reserve_yield_apr);
    cfg.base_yield_apr = j.value("base_yield_apr", cfg.base_yield_apr);
    cfg.bonus_yield_apr = j.value("bonus_yield_apr", cfg.bonus_yield_apr);
    cfg.early_close_threshold_pct = j.value("early_close_threshold_pct", cfg.early_close_threshold_pct);

    if (j.contains("commercial")) {
        const json& c = j["commercial"];
        cfg.upfront_commercial_pct = c.value("upfront_commercial_pct", cfg.upfront_commercial_pct);
        cfg.management_fees_pct = c.value("management_fees_pct", cfg.management_fees_pct);
        cfg.performance_fees_pct = c.value("performance_fees_pct", cfg.performance_fees_pct);
    }
    return cfg;
}

OpsHistoryEntry parse_ops_entry(const json& j) {
    OpsHistoryEntry e;
    e.month = j.at("month").get<std::string>();
    e.btc_produced = j.at("btc_produced").get<double>();
    e.uptime = j.at("uptime").get<double>();
    e.energy_kwh = j.value("energy_kwh", 0.0);
    return e;
}

} // anonymous namespace

MarketDataConfig::MarketDataConfig()
    : ttl_hours(24.0), timeout_ms(60000) {}

ProjectConfig::ProjectConfig()
    : start_date("2025-01"), months(120), confidence_band_pct(0.0),
      apply_ops_calibration(false) {}

// ============================================================================
// Path helpers
// ============================================================================

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++;  // Skip '$'

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces && pos < result.size() && result[pos] == '}') {
            pos++;
        }

        if (var_name.empty()) {
            // Lone '$' is kept literally
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";
        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    if (path.empty()) {
        return path;
    }
    fs::path p(path);
    if (p.is_absolute()) {
        return path;
    }
    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

// ============================================================================
// Parsing
// ============================================================================

ProjectConfig parse_project_config_from_string(const std::string& json_string) {
    ProjectConfig config;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Project configuration must be a JSON object");
        }

        config.start_date = j.value("start_date", config.start_date);
        YearMonth::parse(config.start_date);  // reject malformed dates early
        config.months = j.value("months", config.months);
        if (config.months <= 0) {
            throw ValidationError("months must be positive");
        }
        config.confidence_band_pct = j.value("confidence_band_pct", config.confidence_band_pct);

        if (j.contains("thresholds")) {
            const json& t = j["thresholds"];
            WaterfallThresholds& th = config.thresholds;
            th.deficit_coverage = t.value("deficit_coverage", th.deficit_coverage);
            th.blocked_deficit_ratio = t.value("blocked_deficit_ratio", th.blocked_deficit_ratio);
            th.adjust_deficit_ratio = t.value("adjust_deficit_ratio", th.adjust_deficit_ratio);
            th.min_health_score = t.value("min_health_score", th.min_health_score);
        }

        if (j.contains("scenarios")) {
            const json& s = j["scenarios"];
            std::vector<std::string> names = standard_scenario_names();
            for (auto it = s.begin(); it != s.end(); ++it) {
                if (std::find(names.begin(), names.end(), it.key()) == names.end()) {
                    names.push_back(it.key());
                }
            }
            for (const auto& name : names) {
                if (!s.contains(name)) {
                    continue;
                }
                const json& sc = s[name];
                ScenarioCurveConfig scenario;
                scenario.name = name;
                scenario.price_curve = parse_price_curve(
                    sc.value("price_curve", json::object()), config.months);
                scenario.network_curve = parse_network_curve(
                    sc.value("network_curve", json::object()), config.start_date, config.months);
                config.scenarios.push_back(std::move(scenario));
            }
        }

        if (j.contains("miner")) {
            config.miner = parse_miner(j["miner"]);
        }
        if (j.contains("hosting_site")) {
            config.hosting_site = parse_site(j["hosting_site"]);
        }

        if (j.contains("hosting")) {
            const json& h = j["hosting"];
            HostingConfig hosting;
            if (h.contains("sites")) {
                for (auto it = h["sites"].begin(); it != h["sites"].end(); ++it) {
                    hosting.sites[it.key()] = parse_site(it.value());
                }
            }
            if (h.contains("miners")) {
                for (auto it = h["miners"].begin(); it != h["miners"].end(); ++it) {
                    hosting.miners[it.key()] = parse_miner(it.value());
                }
            }
            if (h.contains("allocations")) {
                for (const auto& a : h["allocations"]) {
                    hosting.allocations.push_back({a.at("site_id").get<std::string>(),
                                                   a.at("miner_id").get<std::string>(),
                                                   a.at("count").get<int>()});
                }
            }
            config.hosting = std::move(hosting);
        }

        if (j.contains("ops_history")) {
            const json& o = j["ops_history"];
            if (o.is_string()) {
                config.ops_history_path = expand_environment_variables(o.get<std::string>());
            } else {
                std::vector<OpsHistoryEntry> history;
                for (const auto& e : o) {
                    history.push_back(parse_ops_entry(e));
                }
                config.ops_history = std::move(history);
            }
        }

        // Products last: they may reference miner, site and hosting catalogs
        if (j.contains("product")) {
            config.product = parse_product(j["product"], config);
            config.apply_ops_calibration = j["product"].value("apply_ops_calibration", false);
        }
        if (j.contains("collateral_product")) {
            config.collateral_product = parse_collateral(j["collateral_product"], config);
        }

        if (j.contains("market_data")) {
            const json& m = j["market_data"];
            if (m.contains("cache_dir")) {
                config.market_data.cache_dir =
                    expand_environment_variables(m["cache_dir"].get<std::string>());
            }
            if (m.contains("offline_history_dir")) {
                config.market_data.offline_history_dir =
                    expand_environment_variables(m["offline_history_dir"].get<std::string>());
            }
            config.market_data.ttl_hours = m.value("ttl_hours", config.market_data.ttl_hours);
            config.market_data.timeout_ms = m.value("timeout_ms", config.market_data.timeout_ms);
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw ConfigParseError(std::string("JSON missing field: ") + e.what());
    }

    return config;
}

ProjectConfig parse_project_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    ProjectConfig config = parse_project_config_from_string(buffer.str());

    config.market_data.cache_dir = resolve_relative_path(config.market_data.cache_dir, file_path);
    config.market_data.offline_history_dir =
        resolve_relative_path(config.market_data.offline_history_dir, file_path);

    if (!config.ops_history_path.empty()) {
        config.ops_history_path = resolve_relative_path(config.ops_history_path, file_path);
        config.ops_history = load_ops_history_csv(config.ops_history_path);
    }

    return config;
}

std::vector<OpsHistoryEntry> load_ops_history_csv(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open ops history file: " + file_path);
    }

    CsvReader reader(file);
    auto header = reader.read_header();
    for (const char* column : {"month", "btc_produced", "uptime"}) {
        if (header.find(column) == header.end()) {
            throw ConfigParseError("Ops history file missing column: " + std::string(column));
        }
    }
    auto energy_col = header.find("energy_kwh");

    std::vector<OpsHistoryEntry> history;
    size_t line = 1;
    while (reader.has_more()) {
        auto row = reader.read_row();
        ++line;
        if (row.empty() || (row.size() == 1 && row[0].empty())) {
            continue;
        }
        try {
            OpsHistoryEntry e;
            e.month = row.at(header["month"]);
            e.btc_produced = std::stod(row.at(header["btc_produced"]));
            e.uptime = std::stod(row.at(header["uptime"]));
            e.energy_kwh = energy_col != header.end() && energy_col->second < row.size()
                               ? std::stod(row[energy_col->second])
                               : 0.0;
            history.push_back(e);
        } catch (const std::exception&) {
            throw ConfigParseError("Malformed ops history row " + std::to_string(line) +
                                   " in " + file_path);
        }
    }
    return history;
}

} // namespace hashcalc
