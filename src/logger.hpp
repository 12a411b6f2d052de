/**
 * @file logger.hpp
 * @brief Structured logging for conversion and reconciliation runs
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted or plain-text output
 * - Run context tracking (command, input file)
 * - One event per pipeline step (load, convert, reconcile, write)
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef PAYLINE_LOGGER_HPP
#define PAYLINE_LOGGER_HPP

#include "converter.hpp"
#include "reconciler.hpp"
#include <string>
#include <map>
#include <memory>
#include <chrono>
#include <fstream>

namespace payline {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-record detail (skipped rows)
    INFO,    ///< Pipeline steps (files loaded, lines written)
    WARN,    ///< Findings (anomalies, risky input rows)
    ERROR    ///< Failures that end the run
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string
 *
 * @param level_str "DEBUG", "INFO", "WARN" or "ERROR"
 * @param level Receives the parsed level
 * @return false if the name is not a level
 */
inline bool parse_level(const std::string& level_str, LogLevel& level) {
    if (level_str == "DEBUG") { level = LogLevel::DEBUG; return true; }
    if (level_str == "INFO") { level = LogLevel::INFO; return true; }
    if (level_str == "WARN") { level = LogLevel::WARN; return true; }
    if (level_str == "ERROR") { level = LogLevel::ERROR; return true; }
    return false;
}

/**
 * @brief Parse log level from string, INFO when unrecognised
 */
inline LogLevel string_to_level(const std::string& level_str) {
    LogLevel level = LogLevel::INFO;
    parse_level(level_str, level);
    return level;
}

/**
 * @brief Context attached to every event of one CLI run
 */
struct RunContext {
    std::string command;             ///< "convert" or "reconcile"
    std::string input_path;          ///< Timesheet file being processed

    RunContext() = default;

    RunContext(const std::string& cmd, const std::string& input)
        : command(cmd), input_path(input) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("payline.log"),
          enable_json(false) {}
};

/**
 * @brief Structured logger
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_json = true;
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   RunContext ctx("convert", "timesheet.csv");
 *   logger.log_input_loaded(ctx, "timesheet.csv", records.size());
 *   logger.log_conversion_complete(ctx, result);
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * @param config Logger configuration
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the start of a run with its effective settings
     *
     * @param ctx Run context
     * @param settings Effective settings (flag name -> value)
     */
    void log_run_start(
        const RunContext& ctx,
        const std::map<std::string, std::string>& settings
    );

    /**
     * @brief Log a table loaded from disk
     *
     * @param ctx Run context
     * @param path File that was read
     * @param rows Data rows read (header excluded)
     */
    void log_input_loaded(
        const RunContext& ctx,
        const std::string& path,
        size_t rows
    );

    /**
     * @brief Log a record the converter skipped (DEBUG)
     */
    void log_record_skipped(
        const RunContext& ctx,
        const SkippedRecord& skipped
    );

    /**
     * @brief Log conversion completion
     *
     * @param ctx Run context
     * @param result Conversion result
     */
    void log_conversion_complete(
        const RunContext& ctx,
        const ConversionResult& result
    );

    /**
     * @brief Log an input row likely to produce a fabricated line
     */
    void log_input_risk(
        const RunContext& ctx,
        const InputRisk& risk
    );

    /**
     * @brief Log one reconciliation finding
     */
    void log_anomaly(
        const RunContext& ctx,
        const Anomaly& anomaly
    );

    /**
     * @brief Log reconciliation completion with per-kind counts
     *
     * @param ctx Run context
     * @param result Reconciliation result
     */
    void log_reconcile_complete(
        const RunContext& ctx,
        const ReconcileResult& result
    );

    /**
     * @brief Log an output file written
     *
     * @param ctx Run context
     * @param path File written
     * @param format "csv", "parquet" or "json"
     * @param rows Rows written
     */
    void log_output_written(
        const RunContext& ctx,
        const std::string& path,
        const std::string& format,
        size_t rows
    );

    /**
     * @brief Log error with context
     *
     * @param ctx Run context
     * @param error_message Error message
     */
    void log_error(
        const RunContext& ctx,
        const std::string& error_message
    );

    /**
     * @brief Log warning message
     *
     * @param ctx Run context
     * @param warning_message Warning message
     */
    void log_warning(
        const RunContext& ctx,
        const std::string& warning_message
    );

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    // Helper methods
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::map<std::string, std::string> context_fields(const RunContext& ctx, const std::string& event) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace payline

#endif // PAYLINE_LOGGER_HPP
