/**
 * @file logger.hpp
 * @brief Structured run logging with JSON or plain-text output
 *
 * The Logger emits one line per event with:
 * - Log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON or plain-text formatting
 * - A run context (run id, component, scenario) on every event
 *
 * Loggers are ordinary objects passed by pointer to the components that log
 * (scenario runner, forecast entry points, market data client, CLI). Pure
 * simulation functions never log. All sinks are guarded by one mutex so
 * scenario runs may log from parallel threads.
 */

#ifndef HASHCALC_LOGGER_HPP
#define HASHCALC_LOGGER_HPP

#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace hashcalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Intermediate values, cache lookups
    INFO,    ///< Run start/end, fitted models, fetched series
    WARN,    ///< Soft conditions surfaced by a simulation
    ERROR    ///< Failures that abort a command
};

std::string level_to_string(LogLevel level);

/**
 * @brief Parse a level name (case-insensitive); unknown names map to INFO
 */
LogLevel string_to_level(const std::string& level_str);

/**
 * @brief Context attached to every event
 */
struct RunContext {
    std::string run_id;              ///< Identifier of one CLI invocation
    std::string component;           ///< Emitting component (scenario, forecast, marketdata, cli)
    std::string scenario;            ///< bear/base/bull, empty when not scenario-scoped

    RunContext() = default;

    RunContext(const std::string& id, const std::string& comp)
        : run_id(id), component(comp) {}

    RunContext with_scenario(const std::string& name) const {
        RunContext ctx = *this;
        ctx.scenario = name;
        return ctx;
    }
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum level to output
    bool enable_console;             ///< Log to stderr
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs (appended)
    bool enable_json;                ///< JSON lines vs. plain text

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("hashcalc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger logger(config);
 *
 *   RunContext ctx("run-42", "scenario");
 *   logger.log_simulation_start(ctx.with_scenario("base"), "product", 36);
 *   @endcode
 */
class Logger {
public:
    Logger();
    explicit Logger(const LoggerConfig& config);

    /**
     * @brief Log to an arbitrary stream instead of stderr (tests, embedding)
     */
    Logger(const LoggerConfig& config, std::ostream& console);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void configure(const LoggerConfig& config);

    /**
     * @brief A simulation is about to run
     *
     * @param ctx Run context
     * @param simulation Simulation kind (product, collateral, miner, ...)
     * @param months Requested horizon
     */
    void log_simulation_start(const RunContext& ctx,
                              const std::string& simulation,
                              int months);

    /**
     * @brief A simulation finished
     *
     * @param ctx Run context
     * @param simulation Simulation kind
     * @param months_simulated Months actually simulated
     * @param warning_count Soft warnings and flags returned
     * @param decision Decision label, empty when the simulation has none
     */
    void log_simulation_complete(const RunContext& ctx,
                                 const std::string& simulation,
                                 int months_simulated,
                                 size_t warning_count,
                                 const std::string& decision = "");

    /**
     * @brief A forecast model was selected
     */
    void log_forecast_fit(const RunContext& ctx,
                          const std::string& series,
                          const std::string& model,
                          double aic,
                          int models_evaluated);

    /**
     * @brief A historical series was obtained
     */
    void log_series_fetched(const RunContext& ctx,
                            const std::string& series,
                            size_t rows,
                            bool cache_hit);

    void log_warning(const RunContext& ctx, const std::string& warning_message);

    void log_error(const RunContext& ctx, const std::string& error_message);

    void log_debug(const RunContext& ctx, const std::string& message);

    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    LoggerConfig config_;
    std::ostream* console_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    void log(LogLevel level, const std::string& message,
             const RunContext& ctx, std::map<std::string, std::string> fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    void open_file();
};

} // namespace hashcalc

#endif // HASHCALC_LOGGER_HPP
