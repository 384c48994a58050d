#include "config_parser.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace srtcalc {

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        size_t name_end = pos;

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                // Unterminated ${ : leave the text as written
                pos = start + 1;
                continue;
            }
            pos++; // Skip '}'
        }

        if (name_end == name_start) {
            // Lone '$' is literal
            pos = start + 1;
            continue;
        }

        std::string var_name = result.substr(name_start, name_end - name_start);
        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& base_dir) {
    fs::path p(path);

    if (p.is_absolute() || base_dir.empty()) {
        return path;
    }

    return (fs::path(base_dir) / p).string();
}

namespace {

double require_number(const json& j, const std::string& key, const std::string& context) {
    if (!j.contains(key)) {
        throw ConfigParseError(context + " missing required field: " + key);
    }
    if (!j[key].is_number()) {
        throw ConfigParseError(context + " field '" + key + "' must be a number");
    }
    return j[key].get<double>();
}

int optional_int(const json& j, const std::string& key, int fallback, const std::string& context) {
    if (!j.contains(key)) {
        return fallback;
    }
    if (!j[key].is_number_integer()) {
        throw ConfigParseError(context + " field '" + key + "' must be an integer");
    }
    return j[key].get<int>();
}

std::string optional_string(const json& j, const std::string& key, const std::string& fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    return expand_environment_variables(j[key].get<std::string>());
}

DealParameters parse_deal(const json& j) {
    DealParameters deal;
    deal.tranche_size = require_number(j, "tranche_size", "deal");
    deal.notional_amount = require_number(j, "notional_amount", "deal");
    deal.coupon_rate = require_number(j, "coupon_rate", "deal");
    deal.annual_loss_rate = require_number(j, "annual_loss_rate", "deal");
    deal.cln_price = require_number(j, "cln_price", "deal");
    deal.amortisation_rate = require_number(j, "amortisation_rate", "deal");
    deal.maturity = optional_int(j, "maturity", deal.maturity, "deal");
    deal.replenishment_period = optional_int(j, "replenishment_period", deal.replenishment_period, "deal");
    deal.periods_per_year = optional_int(j, "periods_per_year", deal.periods_per_year, "deal");
    if (j.contains("coupon_basis")) {
        deal.coupon_basis = coupon_basis_from_string(j["coupon_basis"].get<std::string>());
    }
    return deal;
}

RateCurve parse_rates(const json& j, const std::string& base_dir) {
    if (j.is_string()) {
        std::string path = resolve_relative_path(expand_environment_variables(j.get<std::string>()), base_dir);
        try {
            return RateCurve::load_from_csv(path);
        } catch (const std::runtime_error& e) {
            throw ConfigParseError(std::string("risk_free_rates: ") + e.what());
        }
    }
    if (!j.is_array()) {
        throw ConfigParseError("risk_free_rates must be an array of annual rates or a CSV path");
    }
    RateCurve curve;
    for (const auto& rate : j) {
        if (!rate.is_number()) {
            throw ConfigParseError("risk_free_rates entries must be numbers");
        }
        curve.add_rate(rate.get<double>());
    }
    return curve;
}

ScenarioInput parse_scenario(const json& j) {
    ScenarioInput scenario;
    scenario.stress_multiplier = require_number(j, "stress_multiplier", "scenario");
    if (!j.contains("trigger_year")) {
        throw ConfigParseError("scenario missing required field: trigger_year");
    }
    if (!j["trigger_year"].is_number_integer()) {
        throw ConfigParseError("scenario field 'trigger_year' must be an integer");
    }
    scenario.trigger_year = j["trigger_year"].get<int>();
    scenario.scenario_id = optional_string(j, "id", "");
    return scenario;
}

void append(ScenarioSet& target, const ScenarioSet& source) {
    for (size_t i = 0; i < source.size(); ++i) {
        // Generated labels are positional, so relabel in the combined set
        ScenarioInput copy = source.get(i);
        if (copy.scenario_id == "Stress " + std::to_string(i + 1)) {
            copy.scenario_id.clear();
        }
        target.add(std::move(copy));
    }
}

ScenarioSet parse_scenario_grid(const json& j) {
    if (!j.contains("stress_multipliers") || !j.contains("trigger_years")) {
        throw ConfigParseError("scenario_grid requires stress_multipliers and trigger_years");
    }
    std::vector<double> stresses = j["stress_multipliers"].get<std::vector<double>>();
    std::vector<int> triggers = j["trigger_years"].get<std::vector<int>>();

    std::string mode = optional_string(j, "mode", "grid");
    if (mode == "grid") {
        return ScenarioSet::grid(stresses, triggers);
    }
    if (mode == "paired") {
        if (stresses.size() != triggers.size()) {
            throw ConfigParseError("scenario_grid mode 'paired' needs equal-length stress_multipliers and trigger_years");
        }
        return ScenarioSet::paired(stresses, triggers);
    }
    throw ConfigParseError("scenario_grid mode must be 'grid' or 'paired', got '" + mode + "'");
}

} // anonymous namespace

RunConfig parse_run_config_from_string(const std::string& json_string, const std::string& base_dir) {
    RunConfig config;

    try {
        json j = json::parse(json_string);

        if (j.contains("description")) {
            config.description = expand_environment_variables(j["description"].get<std::string>());
        }

        // Deal terms (required)
        if (!j.contains("deal")) {
            throw ConfigParseError("Missing required field: deal");
        }
        config.deal = parse_deal(j["deal"]);

        // Risk-free curve: top level, or inside the deal block
        if (j.contains("risk_free_rates")) {
            config.deal.risk_free_rates = parse_rates(j["risk_free_rates"], base_dir);
        } else if (j["deal"].contains("risk_free_rates")) {
            config.deal.risk_free_rates = parse_rates(j["deal"]["risk_free_rates"], base_dir);
        } else {
            throw ConfigParseError("Missing required field: risk_free_rates");
        }

        // Scenarios: explicit list, then grid, then file
        if (j.contains("scenarios")) {
            for (const auto& scenario_json : j["scenarios"]) {
                config.scenarios.add(parse_scenario(scenario_json));
            }
        }
        if (j.contains("scenario_grid")) {
            append(config.scenarios, parse_scenario_grid(j["scenario_grid"]));
        }
        if (j.contains("scenario_file")) {
            std::string path = resolve_relative_path(
                optional_string(j, "scenario_file", ""), base_dir);
            ScenarioSet from_file;
            try {
                from_file = ScenarioSet::load_from_csv(path);
            } catch (const std::runtime_error& e) {
                throw ConfigParseError(std::string("scenario_file: ") + e.what());
            }
            append(config.scenarios, from_file);
        }
        if (config.scenarios.empty()) {
            throw ConfigParseError("No scenarios configured (use scenarios, scenario_grid or scenario_file)");
        }

        if (j.contains("analysis")) {
            const auto& analysis = j["analysis"];
            if (analysis.contains("parallel")) {
                config.analysis.parallel = analysis["parallel"].get<bool>();
            }
            if (analysis.contains("log_scenarios")) {
                config.analysis.log_scenarios = analysis["log_scenarios"].get<bool>();
            }
            config.time_series_trigger_year =
                optional_int(analysis, "time_series_trigger_year", 0, "analysis");
        }

        if (j.contains("output")) {
            const auto& output = j["output"];
            config.output.format = optional_string(output, "format", config.output.format);
            std::transform(config.output.format.begin(), config.output.format.end(),
                           config.output.format.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            std::string path = optional_string(output, "path", "");
            if (!path.empty()) {
                config.output.path = resolve_relative_path(path, base_dir);
            }
        }
        if (config.output.format != "json" && config.output.format != "csv" &&
            config.output.format != "parquet") {
            throw ConfigParseError("output.format must be json, csv or parquet, got '"
                                   + config.output.format + "'");
        }

        if (j.contains("logging")) {
            const auto& logging = j["logging"];
            if (logging.contains("level")) {
                config.logging.min_level = string_to_level(logging["level"].get<std::string>());
            }
            if (logging.contains("json")) {
                config.logging.enable_json = logging["json"].get<bool>();
            }
            if (logging.contains("console")) {
                config.logging.enable_console = logging["console"].get<bool>();
            }
            std::string file = optional_string(logging, "file", "");
            if (!file.empty()) {
                config.logging.enable_file = true;
                config.logging.log_file_path = resolve_relative_path(file, base_dir);
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw ConfigParseError(std::string("JSON value out of range: ") + e.what());
    }

    config.deal.validate();

    return config;
}

RunConfig parse_run_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    std::string base_dir = fs::path(file_path).parent_path().string();
    return parse_run_config_from_string(buffer.str(), base_dir);
}

} // namespace srtcalc
