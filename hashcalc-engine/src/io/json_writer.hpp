#ifndef HASHCALC_IO_JSON_WRITER_HPP
#define HASHCALC_IO_JSON_WRITER_HPP

#include "../collateral.hpp"
#include "../hosting_allocation.hpp"
#include "../miner.hpp"
#include "../multi_bucket.hpp"
#include "../network_curve.hpp"
#include "../ops_calibration.hpp"
#include "../price_curve.hpp"
#include "../scenario.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace hashcalc {

// nlohmann/json conversions, found by ADL from `nlohmann::json j = result;`
namespace forecast {
void to_json(nlohmann::json& j, const ForecastDiagnostics& d);
} // namespace forecast

void to_json(nlohmann::json& j, const PriceModelInfo& info);
void to_json(nlohmann::json& j, const PriceForecast& fc);
void to_json(nlohmann::json& j, const NetworkCurve& curve);
void to_json(nlohmann::json& j, const NetworkForecast& fc);
void to_json(nlohmann::json& j, const MinerSimulationResult& result);
void to_json(nlohmann::json& j, const HostingAllocationResult& result);
void to_json(nlohmann::json& j, const CalibrationResult& result);
void to_json(nlohmann::json& j, const WaterfallResult& result);
void to_json(nlohmann::json& j, const YieldBucketResult& result);
void to_json(nlohmann::json& j, const HoldingBucketResult& result);
void to_json(nlohmann::json& j, const CommercialFees& fees);
void to_json(nlohmann::json& j, const ProductResult& result);
void to_json(nlohmann::json& j, const CollateralResult& result);
void to_json(nlohmann::json& j, const ScenarioCurves& curves);

// {"bear": {...}, "base": {...}, "bull": {...}} keyed in run order
nlohmann::json scenario_results_json(const ProductScenarioResults& results);
nlohmann::json scenario_results_json(const CollateralScenarioResults& results);

namespace io {

// Write a document to a stream, two-space indented unless compact
void write_json(std::ostream& os, const nlohmann::json& document, bool pretty_print = true);

// Write a document to a file
// Throws std::runtime_error if the file cannot be opened
void write_json(const std::string& filepath, const nlohmann::json& document,
                bool pretty_print = true);

} // namespace io
} // namespace hashcalc

#endif // HASHCALC_IO_JSON_WRITER_HPP
