#include "scenario.hpp"
#include "errors.hpp"
#include "rounding.hpp"
#include <exception>
#include <optional>
#include <utility>

#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace hashcalc {

namespace {

std::vector<double> scaled(const std::vector<double>& values, double factor, int decimals) {
    std::vector<double> out;
    out.reserve(values.size());
    for (double v : values) {
        out.push_back(round_to(v * factor, decimals));
    }
    return out;
}

size_t warning_count(const ProductResult& result) {
    return result.mining_bucket.flags.size();
}

size_t warning_count(const CollateralResult& result) {
    return result.warnings.size();
}

std::string decision_label(const ProductResult& result) {
    return to_string(result.decision.decision);
}

std::string decision_label(const CollateralResult&) {
    return "";
}

int months_simulated(const ProductResult& result) {
    return result.mining_bucket.metrics.months_simulated;
}

int months_simulated(const CollateralResult& result) {
    return result.metrics.months_simulated;
}

// Fetches each history series at most once per build
class LazyHistory {
public:
    explicit LazyHistory(MarketHistorySource* source) : source_(source) {}

    const HistoricalSeries& prices() {
        if (!prices_) {
            prices_ = require().monthly_btc_prices();
        }
        return *prices_;
    }

    const NetworkHistory& network() {
        if (!network_) {
            network_ = require().monthly_network_history();
        }
        return *network_;
    }

private:
    MarketHistorySource* source_;
    std::optional<HistoricalSeries> prices_;
    std::optional<NetworkHistory> network_;

    MarketHistorySource& require() {
        if (!source_) {
            throw ValidationError("Forecast curves need a market history source");
        }
        return *source_;
    }
};

struct CurveBand {
    std::vector<double> point;
    std::vector<double> lower;
    std::vector<double> upper;
    bool has_bounds = false;
};

CurveBand build_price_curve(const PriceCurveConfig& config, LazyHistory& history,
                            Logger* logger, const RunContext& ctx) {
    CurveBand band;
    if (config.source == CurveSource::DETERMINISTIC) {
        band.point = generate_price_curve(config.params);
        return band;
    }

    forecast::ForecastRequest request = config.forecast;
    request.horizon = config.params.months;
    PriceForecast fc = generate_price_forecast(history.prices(), request);
    if (logger) {
        logger->log_forecast_fit(ctx, "btc_price", fc.diagnostics.model, fc.diagnostics.aic,
                                 fc.diagnostics.models_evaluated);
    }
    band.point = std::move(fc.prices);
    band.lower = std::move(fc.lower_bound);
    band.upper = std::move(fc.upper_bound);
    band.has_bounds = true;
    return band;
}

CurveBand build_hashprice_curve(const NetworkCurveConfig& config, LazyHistory& history,
                                Logger* logger, const RunContext& ctx) {
    CurveBand band;
    if (config.source == CurveSource::DETERMINISTIC) {
        NetworkCurve curve = generate_network_curve(config.params);
        if (logger) {
            for (const auto& w : curve.warnings) {
                logger->log_warning(ctx, w);
            }
        }
        band.point = std::move(curve.hashprice_btc_per_ph_day);
        return band;
    }

    forecast::ForecastRequest request = config.forecast;
    request.horizon = config.params.months;
    NetworkForecast fc = generate_network_forecast(history.network(), config.params.start_date,
                                                   config.params.halving_enabled, request);
    if (logger) {
        logger->log_forecast_fit(ctx, "hashrate", fc.hashrate_diagnostics.model,
                                 fc.hashrate_diagnostics.aic,
                                 fc.hashrate_diagnostics.models_evaluated);
        logger->log_forecast_fit(ctx, "fees", fc.fee_diagnostics.model, fc.fee_diagnostics.aic,
                                 fc.fee_diagnostics.models_evaluated);
        for (const auto& w : fc.curve.warnings) {
            logger->log_warning(ctx, w);
        }
    }
    band.point = std::move(fc.curve.hashprice_btc_per_ph_day);
    band.lower = std::move(fc.hashprice_lower);
    band.upper = std::move(fc.hashprice_upper);
    band.has_bounds = true;
    return band;
}

// Runs `simulate` for every scenario into a pre-sized vector so parallel
// iterations never share a slot. Exceptions are captured per slot.
template <typename Result, typename Simulate>
std::vector<ScenarioOutcome<Result>> run_all(const ScenarioSet& scenarios,
                                             const std::string& simulation,
                                             int tenor_months,
                                             Logger* logger,
                                             const RunContext& ctx,
                                             Simulate simulate) {
    const size_t n = scenarios.size();
    std::vector<ScenarioOutcome<Result>> outcomes(n);
    std::vector<std::exception_ptr> failures(n);

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(static)
#endif
    for (long i = 0; i < static_cast<long>(n); ++i) {
        const ScenarioCurves& curves = scenarios.get(static_cast<size_t>(i));
        RunContext scenario_ctx = ctx.with_scenario(curves.name);
        try {
            if (logger) {
                logger->log_simulation_start(scenario_ctx, simulation, tenor_months);
            }
            outcomes[i].scenario = curves.name;
            outcomes[i].result = simulate(curves);
            if (logger) {
                logger->log_simulation_complete(scenario_ctx, simulation,
                                                months_simulated(outcomes[i].result),
                                                warning_count(outcomes[i].result),
                                                decision_label(outcomes[i].result));
            }
        } catch (const std::exception& e) {
            if (logger) {
                logger->log_error(scenario_ctx, e.what());
            }
            failures[i] = std::current_exception();
        }
    }

    for (const auto& failure : failures) {
        if (failure) {
            std::rethrow_exception(failure);
        }
    }
    return outcomes;
}

} // anonymous namespace

// ============================================================================
// ScenarioCurves / ScenarioSet
// ============================================================================

ScenarioCurves::ScenarioCurves() = default;

ScenarioCurves::ScenarioCurves(const std::string& n, std::vector<double> prices,
                               std::vector<double> hp)
    : name(n), btc_prices(std::move(prices)), hashprices(std::move(hp)) {}

ScenarioSet::ScenarioSet() = default;

void ScenarioSet::add(const ScenarioCurves& scenario) {
    ScenarioCurves copy = scenario;
    add(std::move(copy));
}

void ScenarioSet::add(ScenarioCurves&& scenario) {
    for (auto& existing : scenarios_) {
        if (existing.name == scenario.name) {
            existing = std::move(scenario);
            return;
        }
    }
    scenarios_.push_back(std::move(scenario));
}

const ScenarioCurves& ScenarioSet::get(size_t index) const {
    if (index >= scenarios_.size()) {
        throw std::out_of_range("Scenario index out of range");
    }
    return scenarios_[index];
}

const ScenarioCurves& ScenarioSet::get(const std::string& name) const {
    for (const auto& s : scenarios_) {
        if (s.name == name) {
            return s;
        }
    }
    throw ValidationError("Unknown scenario: " + name);
}

bool ScenarioSet::contains(const std::string& name) const {
    for (const auto& s : scenarios_) {
        if (s.name == name) {
            return true;
        }
    }
    return false;
}

size_t ScenarioSet::size() const {
    return scenarios_.size();
}

bool ScenarioSet::empty() const {
    return scenarios_.empty();
}

const std::vector<std::string>& standard_scenario_names() {
    static const std::vector<std::string> names = {"bear", "base", "bull"};
    return names;
}

ScenarioSet apply_confidence_band(const ScenarioCurves& base, double band_pct) {
    ScenarioSet set;
    double band = band_pct > 0.0 ? band_pct / 100.0 : 0.0;

    set.add(ScenarioCurves("bear", scaled(base.btc_prices, 1.0 - band, 2),
                           scaled(base.hashprices, 1.0 - band, 10)));
    set.add(ScenarioCurves("base", base.btc_prices, base.hashprices));
    set.add(ScenarioCurves("bull", scaled(base.btc_prices, 1.0 + band, 2),
                           scaled(base.hashprices, 1.0 + band, 10)));
    return set;
}

// ============================================================================
// Curve generation
// ============================================================================

CurveSource parse_curve_source(const std::string& name) {
    if (name == "deterministic") return CurveSource::DETERMINISTIC;
    if (name == "forecast") return CurveSource::FORECAST;
    throw ValidationError("Unknown curve source '" + name +
                          "'; expected deterministic or forecast");
}

std::string to_string(CurveSource source) {
    return source == CurveSource::FORECAST ? "forecast" : "deterministic";
}

PriceCurveConfig::PriceCurveConfig() : source(CurveSource::DETERMINISTIC) {}

NetworkCurveConfig::NetworkCurveConfig() : source(CurveSource::DETERMINISTIC) {}

ScenarioSet build_scenarios(const std::vector<ScenarioCurveConfig>& configs,
                            double band_pct,
                            MarketHistorySource* history,
                            Logger* logger,
                            const RunContext& ctx) {
    if (configs.empty()) {
        throw ValidationError("At least one scenario must be configured");
    }

    LazyHistory lazy(history);
    ScenarioSet set;

    if (configs.size() > 1) {
        for (const auto& cfg : configs) {
            RunContext scenario_ctx = ctx.with_scenario(cfg.name);
            CurveBand prices = build_price_curve(cfg.price_curve, lazy, logger, scenario_ctx);
            CurveBand hashprices = build_hashprice_curve(cfg.network_curve, lazy, logger,
                                                         scenario_ctx);
            set.add(ScenarioCurves(cfg.name, std::move(prices.point),
                                   std::move(hashprices.point)));
        }
        return set;
    }

    // Single path: derive bear/bull around it
    const ScenarioCurveConfig& cfg = configs.front();
    RunContext base_ctx = ctx.with_scenario("base");
    CurveBand prices = build_price_curve(cfg.price_curve, lazy, logger, base_ctx);
    CurveBand hashprices = build_hashprice_curve(cfg.network_curve, lazy, logger, base_ctx);

    ScenarioSet banded = apply_confidence_band(
        ScenarioCurves("base", prices.point, hashprices.point), band_pct);
    for (const auto& name : standard_scenario_names()) {
        ScenarioCurves curves = banded.get(name);
        if (name != "base") {
            bool bear = name == "bear";
            if (prices.has_bounds) {
                curves.btc_prices = scaled(bear ? prices.lower : prices.upper, 1.0, 2);
            }
            if (hashprices.has_bounds) {
                curves.hashprices = bear ? hashprices.lower : hashprices.upper;
            }
        }
        set.add(std::move(curves));
    }
    return set;
}

// ============================================================================
// Runners
// ============================================================================

ProductScenarioResults run_product_scenarios(const ProductConfig& config,
                                             const ScenarioSet& scenarios,
                                             Logger* logger,
                                             const RunContext& ctx) {
    // Reject a bad allocation once, before any scenario runs
    validate_allocation(config);

    return run_all<ProductResult>(
        scenarios, "product", config.tenor_months, logger, ctx,
        [&config](const ScenarioCurves& curves) {
            return simulate_product(config, curves.btc_prices, curves.hashprices);
        });
}

CollateralScenarioResults run_collateral_scenarios(const CollateralProductConfig& config,
                                                   const ScenarioSet& scenarios,
                                                   Logger* logger,
                                                   const RunContext& ctx) {
    return run_all<CollateralResult>(
        scenarios, "collateral", config.tenor_months, logger, ctx,
        [&config](const ScenarioCurves& curves) {
            return simulate_collateral_product(config, curves.btc_prices, curves.hashprices);
        });
}

} // namespace hashcalc
