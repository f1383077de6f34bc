/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace hashcalc {

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel string_to_level(const std::string& level_str) {
    std::string upper = level_str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

Logger::Logger() : Logger(LoggerConfig()) {}

Logger::Logger(const LoggerConfig& config) : Logger(config, std::cerr) {}

Logger::Logger(const LoggerConfig& config, std::ostream& console)
    : config_(config), console_(&console) {
    open_file();
}

Logger::~Logger() {
    flush();
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();
    open_file();
}

void Logger::open_file() {
    if (!config_.enable_file) {
        return;
    }
    file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
    if (!file_stream_->is_open()) {
        *console_ << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        file_stream_.reset();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

// ============================================================================
// Events
// ============================================================================

void Logger::log_simulation_start(const RunContext& ctx,
                                  const std::string& simulation,
                                  int months) {
    std::map<std::string, std::string> fields;
    fields["event"] = "simulation_start";
    fields["simulation"] = simulation;
    fields["months"] = std::to_string(months);

    log(LogLevel::INFO, "Starting " + simulation + " simulation", ctx, std::move(fields));
}

void Logger::log_simulation_complete(const RunContext& ctx,
                                     const std::string& simulation,
                                     int months_simulated,
                                     size_t warning_count,
                                     const std::string& decision) {
    std::map<std::string, std::string> fields;
    fields["event"] = "simulation_complete";
    fields["simulation"] = simulation;
    fields["months_simulated"] = std::to_string(months_simulated);
    fields["warning_count"] = std::to_string(warning_count);
    if (!decision.empty()) {
        fields["decision"] = decision;
    }

    log(LogLevel::INFO, "Completed " + simulation + " simulation", ctx, std::move(fields));
}

void Logger::log_forecast_fit(const RunContext& ctx,
                              const std::string& series,
                              const std::string& model,
                              double aic,
                              int models_evaluated) {
    std::map<std::string, std::string> fields;
    fields["event"] = "forecast_fit";
    fields["series"] = series;
    fields["model"] = model;
    fields["aic"] = std::to_string(aic);
    fields["models_evaluated"] = std::to_string(models_evaluated);

    log(LogLevel::INFO, "Fitted " + model + " to " + series, ctx, std::move(fields));
}

void Logger::log_series_fetched(const RunContext& ctx,
                                const std::string& series,
                                size_t rows,
                                bool cache_hit) {
    std::map<std::string, std::string> fields;
    fields["event"] = "series_fetched";
    fields["series"] = series;
    fields["rows"] = std::to_string(rows);
    fields["cache_hit"] = cache_hit ? "true" : "false";

    log(LogLevel::INFO, "Loaded series " + series, ctx, std::move(fields));
}

void Logger::log_warning(const RunContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, ctx, std::move(fields));
}

void Logger::log_error(const RunContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Run failed", ctx, std::move(fields));
}

void Logger::log_debug(const RunContext& ctx, const std::string& message) {
    log(LogLevel::DEBUG, message, ctx, {});
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        console_->flush();
    }
    if (file_stream_) {
        file_stream_->flush();
    }
}

// ============================================================================
// Formatting and sinks
// ============================================================================

void Logger::log(LogLevel level,
                 const std::string& message,
                 const RunContext& ctx,
                 std::map<std::string, std::string> fields) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    if (!ctx.run_id.empty()) fields["run_id"] = ctx.run_id;
    if (!ctx.component.empty()) fields["component"] = ctx.component;
    if (!ctx.scenario.empty()) fields["scenario"] = ctx.scenario;

    std::string output;
    if (config_.enable_json) {
        fields["timestamp"] = get_timestamp();
        fields["level"] = level_to_string(level);
        fields["message"] = message;
        output = format_json(fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;
        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }
        output = oss.str();
    }

    if (config_.enable_console) {
        *console_ << output << std::endl;
    }
    if (file_stream_) {
        *file_stream_ << output << std::endl;
    }
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    nlohmann::json line(fields);
    return line.dump();
}

} // namespace hashcalc
