#ifndef SRTCALC_CONFIG_PARSER_HPP
#define SRTCALC_CONFIG_PARSER_HPP

#include "deal.hpp"
#include "logger.hpp"
#include "scenario.hpp"
#include "stress_analysis.hpp"
#include <stdexcept>
#include <string>

namespace srtcalc {

/**
 * @brief Exception thrown when a run configuration cannot be read or is malformed
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Where and how results are written
 */
struct OutputConfig {
    std::string format;              ///< "json", "csv" or "parquet"
    std::string path;                ///< Empty = stdout (json/csv only)

    OutputConfig() : format("json") {}
};

/**
 * @brief A complete stress run: deal, scenarios, analysis, output and logging settings
 */
struct RunConfig {
    std::string description;
    DealParameters deal;
    ScenarioSet scenarios;
    StressAnalysisConfig analysis;
    int time_series_trigger_year;    ///< Trigger year for the PnL time series (0 = none)
    OutputConfig output;
    LoggerConfig logging;

    RunConfig() : time_series_trigger_year(0) {}
};

/**
 * @brief Parses a run configuration from a JSON file
 *
 * Relative scenario_file, output.path and logging.file paths are resolved
 * against the directory containing the configuration file.
 *
 * @throws ConfigParseError if the file cannot be read or the JSON is invalid
 * @throws ConfigurationError if the deal terms are invalid
 */
RunConfig parse_run_config_from_file(const std::string& file_path);

/**
 * @brief Parses a run configuration from a JSON string
 *
 * @param json_string JSON configuration
 * @param base_dir Directory relative paths are resolved against (empty = as written)
 * @throws ConfigParseError if the JSON is invalid or required sections are missing
 * @throws ConfigurationError if the deal terms are invalid
 */
RunConfig parse_run_config_from_string(const std::string& json_string,
                                       const std::string& base_dir = "");

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a path relative to a base directory; absolute paths are unchanged
 */
std::string resolve_relative_path(const std::string& path, const std::string& base_dir);

} // namespace srtcalc

#endif // SRTCALC_CONFIG_PARSER_HPP
