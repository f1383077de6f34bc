#ifndef HASHCALC_SCENARIO_HPP
#define HASHCALC_SCENARIO_HPP

#include "collateral.hpp"
#include "logger.hpp"
#include "market_history.hpp"
#include "multi_bucket.hpp"
#include "network_curve.hpp"
#include "price_curve.hpp"
#include <string>
#include <vector>

namespace hashcalc {

// One market path: monthly BTC/USD prices and hashprice (BTC/PH/day)
struct ScenarioCurves {
    std::string name;
    std::vector<double> btc_prices;
    std::vector<double> hashprices;

    ScenarioCurves();
    ScenarioCurves(const std::string& n, std::vector<double> prices, std::vector<double> hp);
};

// Ordered collection of named scenarios (bear, base, bull by convention)
class ScenarioSet {
public:
    ScenarioSet();

    // Replaces an existing scenario with the same name
    void add(const ScenarioCurves& scenario);
    void add(ScenarioCurves&& scenario);

    const ScenarioCurves& get(size_t index) const;
    // Throws ValidationError when no scenario has this name
    const ScenarioCurves& get(const std::string& name) const;
    bool contains(const std::string& name) const;

    size_t size() const;
    bool empty() const;

    const std::vector<ScenarioCurves>& scenarios() const { return scenarios_; }

private:
    std::vector<ScenarioCurves> scenarios_;
};

// Scenario names in reporting order
const std::vector<std::string>& standard_scenario_names();

// Derive bear and bull from a single base path: bear = base * (1 - band),
// bull = base * (1 + band), band = band_pct / 100. Prices are rounded to
// cents and hashprices to 10 decimals. A non-positive band reuses the base
// curves unchanged for all three scenarios.
ScenarioSet apply_confidence_band(const ScenarioCurves& base, double band_pct);

// ============================================================================
// Curve sources
// ============================================================================

enum class CurveSource {
    DETERMINISTIC,   // parameter-driven generators
    FORECAST         // fitted on market history
};

CurveSource parse_curve_source(const std::string& name);
std::string to_string(CurveSource source);

struct PriceCurveConfig {
    CurveSource source;
    PriceCurveParams params;              // DETERMINISTIC
    forecast::ForecastRequest forecast;   // FORECAST; horizon is taken from params.months

    PriceCurveConfig();
};

struct NetworkCurveConfig {
    CurveSource source;
    NetworkCurveParams params;            // DETERMINISTIC; start_date and halving also used by FORECAST
    forecast::ForecastRequest forecast;   // FORECAST; horizon is taken from params.months

    NetworkCurveConfig();
};

struct ScenarioCurveConfig {
    std::string name;
    PriceCurveConfig price_curve;
    NetworkCurveConfig network_curve;
};

/**
 * Generate the curves of every configured scenario.
 *
 * With a single configured scenario, bear and bull are derived from it:
 * forecast curves use their lower and upper bounds, deterministic curves
 * use apply_confidence_band with band_pct. Forecast curves need `history`;
 * ValidationError is thrown when it is null. Network warnings are reported
 * through `logger`.
 */
ScenarioSet build_scenarios(const std::vector<ScenarioCurveConfig>& configs,
                            double band_pct,
                            MarketHistorySource* history,
                            Logger* logger = nullptr,
                            const RunContext& ctx = RunContext());

template <typename Result>
struct ScenarioOutcome {
    std::string scenario;
    Result result;
};

using ProductScenarioResults = std::vector<ScenarioOutcome<ProductResult>>;
using CollateralScenarioResults = std::vector<ScenarioOutcome<CollateralResult>>;

// Run the multi-bucket product once per scenario. Scenarios are independent
// and run in parallel when built with OpenMP; results keep the set's order.
// The first failing scenario's exception is rethrown after all runs finish.
ProductScenarioResults run_product_scenarios(const ProductConfig& config,
                                             const ScenarioSet& scenarios,
                                             Logger* logger = nullptr,
                                             const RunContext& ctx = RunContext());

CollateralScenarioResults run_collateral_scenarios(const CollateralProductConfig& config,
                                                   const ScenarioSet& scenarios,
                                                   Logger* logger = nullptr,
                                                   const RunContext& ctx = RunContext());

} // namespace hashcalc

#endif // HASHCALC_SCENARIO_HPP
