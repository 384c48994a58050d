#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include "config_parser.hpp"
#include "logger.hpp"
#include "scenario.hpp"
#include "stress_analysis.hpp"
#include "io/csv_writer.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"

namespace {

struct CLIArgs {
    std::string config_path;
    std::string output_path;
    std::string format;
    std::string log_level;
    int trigger_year = 0;               // Time-series trigger year override
    double stress = 0.0;                // Ad-hoc scenario stress (0 = use config)
    int trigger = 0;                    // Ad-hoc scenario trigger year
    bool parallel = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "SRT Stress Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --config <path>             JSON run configuration (deal, rates, scenarios)\n\n";
    std::cerr << "Scenario options:\n";
    std::cerr << "  --stress <m>                Run a single scenario with this stress multiplier\n";
    std::cerr << "  --trigger <year>            Trigger year for the single scenario (with --stress)\n";
    std::cerr << "  --parallel                  Run scenarios in parallel where supported\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             Output file (default: stdout, json/csv only)\n";
    std::cerr << "  --format <fmt>              json, csv or parquet (default: from config, else json)\n";
    std::cerr << "  --trigger-year <year>       Trigger year for the PnL time series (json)\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Configured stress grid to JSON:\n";
    std::cerr << "     " << program_name << " --config stress_config.json --output results.json\n\n";
    std::cerr << "  2. One ad-hoc scenario as CSV:\n";
    std::cerr << "     " << program_name << " --config stress_config.json \\\n";
    std::cerr << "         --stress 2.5 --trigger 7 --format csv\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--format" && i + 1 < argc) {
                args.format = argv[++i];
            } else if (arg == "--log-level" && i + 1 < argc) {
                args.log_level = argv[++i];
            } else if (arg == "--trigger-year" && i + 1 < argc) {
                args.trigger_year = std::stoi(argv[++i]);
            } else if (arg == "--stress" && i + 1 < argc) {
                args.stress = std::stod(argv[++i]);
            } else if (arg == "--trigger" && i + 1 < argc) {
                args.trigger = std::stoi(argv[++i]);
            } else if (arg == "--parallel") {
                args.parallel = true;
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        } catch (const std::logic_error&) {
            std::cerr << "Error: Invalid numeric value for " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.config_path.empty()) {
        std::cerr << "Error: --config is required\n";
        valid = false;
    } else if (!file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }

    if (!args.format.empty() && args.format != "json" && args.format != "csv" &&
        args.format != "parquet") {
        std::cerr << "Error: --format must be json, csv or parquet\n";
        valid = false;
    }

    if (args.format == "parquet" && args.output_path.empty()) {
        std::cerr << "Error: --output is required for parquet format\n";
        valid = false;
    }

    if ((args.stress != 0.0) != (args.trigger != 0)) {
        std::cerr << "Error: --stress and --trigger must be given together\n";
        valid = false;
    }

    if (!args.log_level.empty() && args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    return valid;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help || argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    try {
        srtcalc::RunConfig config = srtcalc::parse_run_config_from_file(args.config_path);

        // Command-line settings override the configuration
        if (!args.log_level.empty()) {
            config.logging.min_level = srtcalc::string_to_level(args.log_level);
        }
        if (!args.format.empty()) {
            config.output.format = args.format;
        }
        if (!args.output_path.empty()) {
            config.output.path = args.output_path;
        }
        if (args.trigger_year != 0) {
            config.time_series_trigger_year = args.trigger_year;
        }
        if (args.parallel) {
            config.analysis.parallel = true;
        }
        if (args.stress != 0.0) {
            config.scenarios.clear();
            config.scenarios.add(args.stress, args.trigger);
        }

        if (config.output.format == "parquet" && config.output.path.empty()) {
            std::cerr << "Error: parquet output needs an output path\n";
            return 1;
        }

        srtcalc::Logger& logger = srtcalc::Logger::get_instance();
        logger.configure(config.logging);
        logger.log_config_loaded(args.config_path, config.description, config.scenarios.size());

        srtcalc::StressAnalysisResult result =
            srtcalc::run_stress_analysis(config.deal, config.scenarios, config.analysis);

        const std::string& format = config.output.format;
        const std::string& path = config.output.path;

        if (format == "csv") {
            if (path.empty()) {
                srtcalc::io::write_records_csv(std::cout, result.records());
            } else {
                srtcalc::io::write_records_csv(path, result.records());
            }
        } else if (format == "parquet") {
            srtcalc::ParquetWriter::write_records(result.records(), path);
        } else {
            if (path.empty()) {
                srtcalc::io::write_stress_result_json(std::cout, result, config.time_series_trigger_year);
            } else {
                srtcalc::io::write_stress_result_json(path, result, config.time_series_trigger_year);
            }
        }
        if (!path.empty()) {
            logger.log_output_written(path, format, result.records().size());
        }
        logger.flush();

        return result.scenarios_failed() == 0 ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
