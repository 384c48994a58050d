#ifndef SRTCALC_STRESS_ANALYSIS_HPP
#define SRTCALC_STRESS_ANALYSIS_HPP

#include "deal.hpp"
#include "projection.hpp"
#include "scenario.hpp"
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace srtcalc {

// A scenario that could not be run; other scenarios are unaffected
struct ScenarioFailure {
    size_t scenario_index;
    std::string scenario_id;
    std::string message;
};

// Configuration options for a stress run
struct StressAnalysisConfig {
    bool parallel;                      // Run scenarios on OpenMP threads when available
    bool log_scenarios;                 // Emit a log event per scenario

    StressAnalysisConfig();
};

// Result table of a stress run: records in scenario order, then chronological order
class StressAnalysisResult {
public:
    StressAnalysisResult();

    const std::vector<PeriodRecord>& records() const { return records_; }
    const std::vector<ScenarioSummary>& summaries() const { return summaries_; }
    const std::vector<ScenarioFailure>& failures() const { return failures_; }

    size_t scenarios_run() const { return summaries_.size(); }
    size_t scenarios_failed() const { return failures_.size(); }
    int periods_per_scenario() const { return periods_per_scenario_; }
    double execution_time_ms() const { return execution_time_ms_; }

    // Cumulative PnL by global period (index 0 = period 1) for every scenario with
    // the given trigger year, keyed by stress multiplier. A later scenario with the
    // same stress and trigger replaces an earlier one.
    std::map<double, std::vector<double>> pnl_time_series(int trigger_year) const;

    // Same shape as pnl_time_series, for risk-adjusted PnL
    std::map<double, std::vector<double>> risk_adjusted_time_series(int trigger_year) const;

    // Records of every scenario matching both trigger year and stress multiplier
    std::vector<PeriodRecord> select(int trigger_year, double stress_multiplier) const;

    // Records of one scenario by its position in the scenario set
    std::vector<PeriodRecord> scenario_records(size_t scenario_index) const;

private:
    friend StressAnalysisResult run_stress_analysis(const DealParameters&, const ScenarioSet&,
                                                    const StressAnalysisConfig&);

    std::vector<PeriodRecord> records_;
    std::vector<ScenarioSummary> summaries_;
    std::vector<ScenarioFailure> failures_;
    int periods_per_scenario_;
    double execution_time_ms_;

    std::map<double, std::vector<double>> time_series(int trigger_year, bool risk_adjusted) const;
};

// Run every scenario against the deal.
//
// The deal is validated first and a ConfigurationError is thrown if it is invalid.
// Each scenario is then validated and run independently: a scenario that fails is
// recorded in failures() and the remaining scenarios still complete.
StressAnalysisResult run_stress_analysis(
    const DealParameters& deal,
    const ScenarioSet& scenarios,
    const StressAnalysisConfig& config = StressAnalysisConfig()
);

} // namespace srtcalc

#endif // SRTCALC_STRESS_ANALYSIS_HPP
