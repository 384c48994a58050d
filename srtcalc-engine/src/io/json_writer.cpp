#include "json_writer.hpp"
#include <fstream>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace srtcalc {
namespace io {

namespace {

std::string quote(const std::string& str) {
    std::ostringstream oss;
    oss << '"';
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                        << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    oss << '"';
    return oss.str();
}

// Stress multipliers as object keys: shortest form ("1", "1.5")
std::string stress_key(double stress) {
    std::ostringstream oss;
    oss << stress;
    return oss.str();
}

struct Layout {
    std::string indent;
    std::string newline;
    std::string space;

    explicit Layout(bool pretty)
        : indent(pretty ? "  " : ""), newline(pretty ? "\n" : ""), space(pretty ? " " : "") {}

    std::string at(int depth) const {
        std::string out;
        for (int i = 0; i < depth; ++i) out += indent;
        return out;
    }
};

void write_series(std::ostream& os, const Layout& l, const std::string& name,
                  const std::map<double, std::vector<double>>& series, bool last) {
    os << l.at(2) << quote(name) << ":" << l.space << "{";
    bool first = true;
    for (const auto& [stress, values] : series) {
        os << (first ? "" : ",") << l.newline;
        os << l.at(3) << quote(stress_key(stress)) << ":" << l.space << "[";
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) os << "," << l.space;
            os << values[i];
        }
        os << "]";
        first = false;
    }
    if (!series.empty()) {
        os << l.newline << l.at(2);
    }
    os << "}" << (last ? "" : ",") << l.newline;
}

} // anonymous namespace

void write_stress_result_json(std::ostream& os, const StressAnalysisResult& result,
                              int time_series_trigger_year, bool pretty_print) {
    const Layout l(pretty_print);

    const std::ios_base::fmtflags saved_flags = os.flags();
    const std::streamsize saved_precision = os.precision();
    os << std::fixed << std::setprecision(6);

    os << "{" << l.newline;

    // Run metadata
    os << l.at(1) << "\"scenario_count\":" << l.space << result.scenarios_run() << "," << l.newline;
    os << l.at(1) << "\"scenarios_failed\":" << l.space << result.scenarios_failed() << "," << l.newline;
    os << l.at(1) << "\"periods_per_scenario\":" << l.space << result.periods_per_scenario() << "," << l.newline;
    os << l.at(1) << "\"execution_time_ms\":" << l.space << std::setprecision(2)
       << result.execution_time_ms() << "," << l.newline;
    os << std::setprecision(6);

    // Per-scenario summaries
    os << l.at(1) << "\"summaries\":" << l.space << "[";
    for (size_t i = 0; i < result.summaries().size(); ++i) {
        const ScenarioSummary& s = result.summaries()[i];
        os << (i > 0 ? "," : "") << l.newline << l.at(2) << "{"
           << "\"scenario_id\":" << l.space << quote(s.scenario_id) << "," << l.space
           << "\"scenario_index\":" << l.space << s.scenario_index << "," << l.space
           << "\"stress_multiplier\":" << l.space << s.stress_multiplier << "," << l.space
           << "\"trigger_year\":" << l.space << s.trigger_year << "," << l.space
           << "\"final_pnl\":" << l.space << s.final_cumulative_pnl << "," << l.space
           << "\"final_risk_adjusted_pnl\":" << l.space << s.final_risk_adjusted_pnl << "," << l.space
           << "\"total_losses\":" << l.space << s.total_losses << "," << l.space
           << "\"total_principal\":" << l.space << s.total_principal << "," << l.space
           << "\"total_coupon\":" << l.space << s.total_coupon << "," << l.space
           << "\"first_sequential_period\":" << l.space << s.first_sequential_period << "," << l.space
           << "\"first_negative_exposure_period\":" << l.space << s.first_negative_exposure_period << "," << l.space
           << "\"tranche_wiped_out\":" << l.space << (s.tranche_wiped_out ? "true" : "false")
           << "}";
    }
    if (!result.summaries().empty()) {
        os << l.newline << l.at(1);
    }
    os << "]," << l.newline;

    // Failures
    os << l.at(1) << "\"failures\":" << l.space << "[";
    for (size_t i = 0; i < result.failures().size(); ++i) {
        const ScenarioFailure& f = result.failures()[i];
        os << (i > 0 ? "," : "") << l.newline << l.at(2) << "{"
           << "\"scenario_index\":" << l.space << f.scenario_index << "," << l.space
           << "\"scenario_id\":" << l.space << quote(f.scenario_id) << "," << l.space
           << "\"message\":" << l.space << quote(f.message) << "}";
    }
    if (!result.failures().empty()) {
        os << l.newline << l.at(1);
    }
    os << "]," << l.newline;

    // Time series for the chosen trigger year
    if (time_series_trigger_year > 0) {
        os << l.at(1) << "\"time_series\":" << l.space << "{" << l.newline;
        os << l.at(2) << "\"trigger_year\":" << l.space << time_series_trigger_year << "," << l.newline;
        write_series(os, l, "cumulative_pnl", result.pnl_time_series(time_series_trigger_year), false);
        write_series(os, l, "risk_adjusted_pnl",
                     result.risk_adjusted_time_series(time_series_trigger_year), true);
        os << l.at(1) << "}," << l.newline;
    }

    // Full record table
    os << l.at(1) << "\"records\":" << l.space << "[";
    for (size_t i = 0; i < result.records().size(); ++i) {
        const PeriodRecord& r = result.records()[i];
        os << (i > 0 ? "," : "") << l.newline << l.at(2) << "{"
           << "\"scenario_id\":" << l.space << quote(r.scenario_id) << "," << l.space
           << "\"period\":" << l.space << r.period << "," << l.space
           << "\"year\":" << l.space << r.year << "," << l.space
           << "\"quarter\":" << l.space << r.quarter << "," << l.space
           << "\"trigger_year\":" << l.space << r.trigger_year << "," << l.space
           << "\"stress_multiplier\":" << l.space << r.stress_multiplier << "," << l.space
           << "\"period_losses\":" << l.space << r.period_losses << "," << l.space
           << "\"remaining_notional\":" << l.space << r.remaining_notional << "," << l.space
           << "\"tranche_exposure\":" << l.space << r.tranche_exposure << "," << l.space
           << "\"principal_payment\":" << l.space << r.principal_payment << "," << l.space
           << "\"coupon_payment\":" << l.space << r.coupon_payment << "," << l.space
           << "\"quarterly_cashflow\":" << l.space << r.quarterly_cashflow << "," << l.space
           << "\"amortisation_regime\":" << l.space << quote(regime_to_string(r.amortisation_regime)) << "," << l.space
           << "\"cumulative_pnl\":" << l.space << r.cumulative_pnl << "," << l.space
           << "\"risk_adjusted_pnl\":" << l.space << r.risk_adjusted_pnl
           << "}";
    }
    if (!result.records().empty()) {
        os << l.newline << l.at(1);
    }
    os << "]" << l.newline;

    os << "}" << l.newline;

    os.flags(saved_flags);
    os.precision(saved_precision);
}

void write_stress_result_json(const std::string& filepath, const StressAnalysisResult& result,
                              int time_series_trigger_year, bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_stress_result_json(file, result, time_series_trigger_year, pretty_print);
}

} // namespace io
} // namespace srtcalc
