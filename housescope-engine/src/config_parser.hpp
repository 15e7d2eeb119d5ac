#ifndef HOUSESCOPE_CONFIG_PARSER_HPP
#define HOUSESCOPE_CONFIG_PARSER_HPP

#include "affordability_engine.hpp"
#include "logger.hpp"
#include "metrics_calculator.hpp"
#include "price_solver.hpp"
#include <stdexcept>
#include <string>

namespace housescope {

/**
 * @brief Exception thrown when config file parsing fails
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Everything a run can be configured with
 *
 * Each section is optional in the file; missing sections and keys keep the
 * built-in defaults.
 */
struct EngineConfig {
    AffordabilityDefaults defaults;
    SolverOptions solver;
    MetricsConfig metrics;
    LoggerConfig logging;
};

/**
 * @brief Parses an engine configuration from a JSON file
 *
 * Relative log file paths are resolved against the config file directory.
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed configuration
 * @throws ConfigParseError if the file cannot be read, the JSON is invalid or
 *         a value is out of range
 */
EngineConfig parse_engine_config_from_file(const std::string& file_path);

/**
 * @brief Parses an engine configuration from a JSON string
 *
 * Example:
 *   @code
 *   {
 *     "affordability": {"interest_rate": 0.065, "loan_term_years": 15},
 *     "solver": {"method": "newton", "tolerance": 0.5},
 *     "metrics": {"window_months": 6, "income_categories": ["salary", "bonus"],
 *                 "income_account_types": ["checking", "savings"]},
 *     "logging": {"level": "DEBUG", "json": false, "file": "${HOME}/housescope.log"}
 *   }
 *   @endcode
 *
 * @throws ConfigParseError if the JSON is invalid or a value is out of range
 */
EngineConfig parse_engine_config_from_string(const std::string& json_string);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace housescope

#endif // HOUSESCOPE_CONFIG_PARSER_HPP
