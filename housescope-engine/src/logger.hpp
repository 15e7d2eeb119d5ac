/**
 * @file logger.hpp
 * @brief Structured logging for the housescope CLI with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted or plain text lines
 * - Console (stderr) and file sinks
 * - One event type per pipeline stage (config, snapshot, metrics, solver)
 *
 * The calculation functions never log; only the command-line layer does.
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef HOUSESCOPE_LOGGER_HPP
#define HOUSESCOPE_LOGGER_HPP

#include "metrics_calculator.hpp"
#include "price_solver.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <string>

namespace housescope {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Intermediate values (per-category totals, solver internals)
    INFO,    ///< Pipeline progress (config loaded, snapshot loaded, results)
    WARN,    ///< Non-fatal issues (solver did not converge, affordability warnings)
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
 * @brief Parse log level from string (unknown names map to INFO)
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

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
          log_file_path("housescope.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "housescope.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   logger.log_snapshot_loaded("accounts", "data/accounts.csv", accounts.size());
 *   logger.log_solver_result(options, result);
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
     * Opens the log file when file output is enabled. A file that cannot be
     * opened is reported on stderr and file output is skipped.
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log a configuration file being applied
     *
     * @param path Config file path, or empty for built-in defaults
     * @param solver_method Solver the run will use
     */
    void log_config_loaded(const std::string& path, const std::string& solver_method);

    /**
     * @brief Log a snapshot file being read
     *
     * @param kind "accounts", "transactions" or "profile"
     * @param path Source file
     * @param rows Records loaded
     */
    void log_snapshot_loaded(const std::string& kind, const std::string& path, size_t rows);

    /**
     * @brief Log the headline dashboard figures
     */
    void log_metrics_computed(const FinancialMetrics& metrics, const std::string& as_of);

    /**
     * @brief Log the price search outcome (WARN when it did not converge)
     */
    void log_solver_result(const SolverOptions& options, const SolverResult& result);

    /**
     * @brief Log one affordability warning
     */
    void log_affordability_warning(const std::string& warning);

    /**
     * @brief Log error with context
     *
     * @param error_message Error message
     * @param phase Pipeline phase that failed (e.g. "load", "analyze")
     */
    void log_error(const std::string& error_message, const std::string& phase = "");

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
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    void write_output(const std::string& output);
};

} // namespace housescope

#endif // HOUSESCOPE_LOGGER_HPP
