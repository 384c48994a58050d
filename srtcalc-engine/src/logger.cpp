/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace srtcalc {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
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

void Logger::log_config_loaded(
    const std::string& config_path,
    const std::string& description,
    size_t scenario_count
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "config_loaded";
    fields["config_path"] = config_path;
    fields["scenario_count"] = std::to_string(scenario_count);
    if (!description.empty()) {
        fields["description"] = description;
    }

    log(LogLevel::INFO, "Configuration loaded", fields);
}

void Logger::log_run_start(const DealParameters& deal, size_t scenario_count) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_start";
    fields["scenario_count"] = std::to_string(scenario_count);
    fields["tranche_size"] = std::to_string(deal.tranche_size);
    fields["notional_amount"] = std::to_string(deal.notional_amount);
    fields["coupon_rate"] = std::to_string(deal.coupon_rate);
    fields["annual_loss_rate"] = std::to_string(deal.annual_loss_rate);
    fields["cln_price"] = std::to_string(deal.cln_price);
    fields["amortisation_rate"] = std::to_string(deal.amortisation_rate);
    fields["maturity"] = std::to_string(deal.maturity);
    fields["replenishment_period"] = std::to_string(deal.replenishment_period);
    fields["periods_per_year"] = std::to_string(deal.periods_per_year);
    fields["coupon_basis"] = coupon_basis_to_string(deal.coupon_basis);

    log(LogLevel::INFO, "Starting stress run", fields);
}

void Logger::log_scenario_complete(const ScenarioSummary& summary, double execution_time_ms) {
    std::map<std::string, std::string> fields;
    fields["event"] = "scenario_complete";
    fields["scenario_id"] = summary.scenario_id;
    fields["scenario_index"] = std::to_string(summary.scenario_index);
    fields["stress_multiplier"] = std::to_string(summary.stress_multiplier);
    fields["trigger_year"] = std::to_string(summary.trigger_year);
    fields["final_pnl"] = std::to_string(summary.final_cumulative_pnl);
    fields["final_risk_adjusted_pnl"] = std::to_string(summary.final_risk_adjusted_pnl);
    fields["first_sequential_period"] = std::to_string(summary.first_sequential_period);
    fields["execution_time_ms"] = std::to_string(execution_time_ms);

    log(LogLevel::INFO, "Scenario completed", fields);
}

void Logger::log_scenario_failed(
    size_t scenario_index,
    const std::string& scenario_id,
    const std::string& error_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "scenario_failed";
    fields["scenario_index"] = std::to_string(scenario_index);
    fields["scenario_id"] = scenario_id;
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Scenario failed", fields);
}

void Logger::log_tranche_wiped_out(const ScenarioSummary& summary) {
    std::map<std::string, std::string> fields;
    fields["event"] = "tranche_wiped_out";
    fields["scenario_id"] = summary.scenario_id;
    fields["stress_multiplier"] = std::to_string(summary.stress_multiplier);
    fields["trigger_year"] = std::to_string(summary.trigger_year);
    fields["first_negative_period"] = std::to_string(summary.first_negative_exposure_period);

    log(LogLevel::WARN, "Tranche exposure went negative", fields);
}

void Logger::log_regime_transition(
    const std::string& scenario_id,
    int period,
    AmortisationRegime old_regime,
    AmortisationRegime new_regime
) {
    if (!enabled(LogLevel::DEBUG)) {
        return;
    }

    std::map<std::string, std::string> fields;
    fields["event"] = "regime_transition";
    fields["scenario_id"] = scenario_id;
    fields["period"] = std::to_string(period);
    fields["old_regime"] = regime_to_string(old_regime);
    fields["new_regime"] = regime_to_string(new_regime);

    log(LogLevel::DEBUG, "Regime transition", fields);
}

void Logger::log_run_complete(
    size_t scenarios_run,
    size_t scenarios_failed,
    size_t records,
    double execution_time_ms
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_complete";
    fields["scenarios_run"] = std::to_string(scenarios_run);
    fields["scenarios_failed"] = std::to_string(scenarios_failed);
    fields["records"] = std::to_string(records);
    fields["execution_time_ms"] = std::to_string(execution_time_ms);

    log(scenarios_failed == 0 ? LogLevel::INFO : LogLevel::WARN, "Stress run completed", fields);
}

void Logger::log_output_written(const std::string& path, const std::string& format, size_t rows) {
    std::map<std::string, std::string> fields;
    fields["event"] = "output_written";
    fields["path"] = path;
    fields["format"] = format;
    fields["rows"] = std::to_string(rows);

    log(LogLevel::INFO, "Output written", fields);
}

void Logger::log_error(const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, error_message, fields);
}

void Logger::log_warning(const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= config_.min_level;
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
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

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace srtcalc
