/**
 * @file logger.hpp
 * @brief Structured logging for the stress engine
 *
 * The Logger provides:
 * - Log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted or plain-text lines
 * - Console (stderr) and append-mode file sinks
 * - Typed events for the stress run lifecycle
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef SRTCALC_LOGGER_HPP
#define SRTCALC_LOGGER_HPP

#include "deal.hpp"
#include "projection.hpp"
#include "waterfall.hpp"
#include <cstddef>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace srtcalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-period detail (regime transitions)
    INFO,    ///< Run and scenario lifecycle
    WARN,    ///< Non-fatal conditions (wiped-out tranche)
    ERROR    ///< Failures (scenario configuration errors)
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
 * @brief Parse log level from string (unknown values map to INFO)
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
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
          log_file_path("srtcalc.log"),
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
 *   config.log_file_path = "srtcalc.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *   logger.log_run_start(deal, scenarios.size());
 *   @endcode
 *
 * Event methods are safe to call from concurrent scenario workers.
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log a parsed run configuration
     *
     * @param config_path Path the configuration was read from
     * @param description Free-text description from the configuration
     * @param scenario_count Number of scenarios configured
     */
    void log_config_loaded(
        const std::string& config_path,
        const std::string& description,
        size_t scenario_count
    );

    /**
     * @brief Log the start of a stress run with the deal terms
     */
    void log_run_start(const DealParameters& deal, size_t scenario_count);

    /**
     * @brief Log a finished scenario
     */
    void log_scenario_complete(const ScenarioSummary& summary, double execution_time_ms);

    /**
     * @brief Log a scenario that could not be run
     */
    void log_scenario_failed(
        size_t scenario_index,
        const std::string& scenario_id,
        const std::string& error_message
    );

    /**
     * @brief Warn that a scenario drove tranche exposure negative
     */
    void log_tranche_wiped_out(const ScenarioSummary& summary);

    void log_regime_transition(
        const std::string& scenario_id,
        int period,
        AmortisationRegime old_regime,
        AmortisationRegime new_regime
    );

    void log_run_complete(
        size_t scenarios_run,
        size_t scenarios_failed,
        size_t records,
        double execution_time_ms
    );

    /**
     * @brief Log a result file written by an output writer
     */
    void log_output_written(const std::string& path, const std::string& format, size_t rows);

    void log_error(const std::string& error_message);
    void log_warning(const std::string& warning_message);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    bool enabled(LogLevel level) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace srtcalc

#endif // SRTCALC_LOGGER_HPP
