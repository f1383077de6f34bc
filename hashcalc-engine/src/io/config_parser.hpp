#ifndef HASHCALC_CONFIG_PARSER_HPP
#define HASHCALC_CONFIG_PARSER_HPP

#include "../collateral.hpp"
#include "../errors.hpp"
#include "../hosting_allocation.hpp"
#include "../multi_bucket.hpp"
#include "../ops_calibration.hpp"
#include "../scenario.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hashcalc {

/**
 * @brief Exception thrown when a project file cannot be read or decoded
 */
class ConfigParseError : public HashCalcError {
public:
    explicit ConfigParseError(const std::string& message)
        : HashCalcError(message) {}
};

/**
 * @brief Market data fetching and caching settings
 */
struct MarketDataConfig {
    std::string cache_dir;           ///< Empty disables the on-disk cache
    double ttl_hours;                ///< Freshness window of cached series
    long timeout_ms;                 ///< Per-request HTTP timeout
    std::string offline_history_dir; ///< CSV directory used instead of the network

    MarketDataConfig();
};

/**
 * @brief Named site and miner catalogs plus the fleet allocation across them
 */
struct HostingConfig {
    std::map<std::string, HostingSiteSpec> sites;
    std::map<std::string, MinerSpec> miners;
    std::vector<Allocation> allocations;
};

/**
 * @brief Whole project file
 *
 * Every section is optional; each CLI command checks for the sections it
 * consumes.
 */
struct ProjectConfig {
    std::string start_date;                       ///< "YYYY-MM", first simulated month
    int months;                                   ///< Curve horizon
    std::vector<ScenarioCurveConfig> scenarios;   ///< bear/base/bull order when present
    double confidence_band_pct;                   ///< Used when one scenario is configured

    std::optional<MinerSpec> miner;
    std::optional<HostingSiteSpec> hosting_site;
    std::optional<HostingConfig> hosting;
    std::optional<ProductConfig> product;
    std::optional<CollateralProductConfig> collateral_product;

    std::optional<std::vector<OpsHistoryEntry>> ops_history;
    std::string ops_history_path;                 ///< Set when ops_history names a CSV file
    bool apply_ops_calibration;                   ///< Feed calibrate results into the mining bucket

    MarketDataConfig market_data;
    WaterfallThresholds thresholds;

    ProjectConfig();
};

/**
 * @brief Parses a project configuration from a JSON string
 *
 * Relative paths are left as written. An ops_history given as a path is
 * recorded in ops_history_path but not loaded.
 *
 * @throws ConfigParseError if JSON is invalid or a field has the wrong type
 * @throws ValidationError if a value is out of range (unknown enum, ...)
 */
ProjectConfig parse_project_config_from_string(const std::string& json_string);

/**
 * @brief Parses a project configuration from a JSON file
 *
 * Paths (cache_dir, offline_history_dir, ops_history) are resolved against
 * the directory of the file and an ops_history CSV is loaded.
 *
 * @throws ConfigParseError if the file cannot be read or JSON is invalid
 */
ProjectConfig parse_project_config_from_file(const std::string& file_path);

/**
 * @brief Reads ops history from CSV with columns month,btc_produced,uptime,energy_kwh
 *
 * @throws ConfigParseError if the file is missing or a row is malformed
 */
std::vector<OpsHistoryEntry> load_ops_history_csv(const std::string& file_path);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a path relative to the configuration file's directory
 *
 * Absolute and empty paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace hashcalc

#endif // HASHCALC_CONFIG_PARSER_HPP
