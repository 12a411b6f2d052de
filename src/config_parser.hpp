#ifndef PAYLINE_CONFIG_PARSER_HPP
#define PAYLINE_CONFIG_PARSER_HPP

#include "logger.hpp"
#include "reconciler.hpp"
#include <stdexcept>
#include <string>

namespace payline {

/**
 * @brief Exception thrown when config file parsing fails
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Settings read from a payline JSON configuration file
 *
 * reconcile.conversion is also the conversion rule set for `convert`.
 */
struct PaylineConfig {
    ReconcileConfig reconcile;
    LoggerConfig logging;
};

/**
 * @brief Parses a configuration from a JSON file
 *
 * A relative logging.file path is resolved against the directory of the
 * configuration file.
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed configuration, defaults for absent keys
 * @throws ConfigParseError if the file cannot be read or a value is invalid
 */
PaylineConfig parse_config_from_file(const std::string& file_path);

/**
 * @brief Parses a configuration from a JSON string
 *
 * @param json_string JSON configuration as string
 * @param config_file_path Used to resolve relative paths; empty leaves them as written
 * @return Parsed configuration
 * @throws ConfigParseError if JSON is invalid or a value has the wrong type
 */
PaylineConfig parse_config_from_string(const std::string& json_string,
                                       const std::string& config_file_path = "");

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 *
 * @param value String potentially containing variable references
 * @return String with variables expanded
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute paths are returned unchanged.
 *
 * @param path File path to resolve
 * @param config_file_path Path to the configuration file
 * @return Resolved path
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace payline

#endif // PAYLINE_CONFIG_PARSER_HPP
