#include "stress_analysis.hpp"
#include "logger.hpp"
#include <chrono>
#include <exception>
#include <utility>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace srtcalc {

// ============================================================================
// Config / Result Implementation
// ============================================================================

StressAnalysisConfig::StressAnalysisConfig()
    : parallel(false),
      log_scenarios(true) {}

StressAnalysisResult::StressAnalysisResult()
    : periods_per_scenario_(0),
      execution_time_ms_(0.0) {}

std::map<double, std::vector<double>> StressAnalysisResult::time_series(
    int trigger_year, bool risk_adjusted) const
{
    std::map<double, std::vector<double>> series;

    // Records of one scenario are contiguous, so each scenario restarts its row
    size_t current_scenario = 0;
    std::vector<double>* row = nullptr;

    for (const PeriodRecord& record : records_) {
        if (record.trigger_year != trigger_year) {
            continue;
        }
        if (row == nullptr || record.scenario_index != current_scenario) {
            current_scenario = record.scenario_index;
            row = &series[record.stress_multiplier];
            row->assign(static_cast<size_t>(periods_per_scenario_), 0.0);
        }
        size_t slot = static_cast<size_t>(record.period - 1);
        if (slot < row->size()) {
            (*row)[slot] = risk_adjusted ? record.risk_adjusted_pnl : record.cumulative_pnl;
        }
    }

    return series;
}

std::map<double, std::vector<double>> StressAnalysisResult::pnl_time_series(int trigger_year) const {
    return time_series(trigger_year, false);
}

std::map<double, std::vector<double>> StressAnalysisResult::risk_adjusted_time_series(
    int trigger_year) const
{
    return time_series(trigger_year, true);
}

std::vector<PeriodRecord> StressAnalysisResult::select(int trigger_year,
                                                       double stress_multiplier) const {
    std::vector<PeriodRecord> selected;
    for (const PeriodRecord& record : records_) {
        if (record.trigger_year == trigger_year && record.stress_multiplier == stress_multiplier) {
            selected.push_back(record);
        }
    }
    return selected;
}

std::vector<PeriodRecord> StressAnalysisResult::scenario_records(size_t scenario_index) const {
    std::vector<PeriodRecord> selected;
    for (const PeriodRecord& record : records_) {
        if (record.scenario_index == scenario_index) {
            selected.push_back(record);
        }
    }
    return selected;
}

// ============================================================================
// Stress run
// ============================================================================

namespace {

struct ScenarioOutcome {
    bool ok;
    ScenarioResult result;
    std::string error;
    double execution_time_ms;

    ScenarioOutcome() : ok(false), execution_time_ms(0.0) {}
};

ScenarioOutcome run_one(const DealParameters& deal, const ScenarioInput& scenario, size_t index) {
    ScenarioOutcome outcome;
    auto start = std::chrono::high_resolution_clock::now();
    try {
        outcome.result = run_scenario(deal, scenario, index);
        outcome.ok = true;
    } catch (const std::exception& e) {
        outcome.error = e.what();
    }
    auto end = std::chrono::high_resolution_clock::now();
    outcome.execution_time_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return outcome;
}

} // anonymous namespace

StressAnalysisResult run_stress_analysis(
    const DealParameters& deal,
    const ScenarioSet& scenarios,
    const StressAnalysisConfig& config)
{
    deal.validate();

    Logger& logger = Logger::get_instance();
    StressAnalysisResult result;
    result.periods_per_scenario_ = deal.total_periods();

    auto start_time = std::chrono::high_resolution_clock::now();
    logger.log_run_start(deal, scenarios.size());

    // One slot per scenario so a parallel run keeps scenario order
    std::vector<ScenarioOutcome> outcomes(scenarios.size());
    const long scenario_count = static_cast<long>(scenarios.size());

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic, 1) if (config.parallel)
    for (long s = 0; s < scenario_count; ++s) {
        outcomes[static_cast<size_t>(s)] =
            run_one(deal, scenarios.get(static_cast<size_t>(s)), static_cast<size_t>(s));
    }
#else
    for (long s = 0; s < scenario_count; ++s) {
        outcomes[static_cast<size_t>(s)] =
            run_one(deal, scenarios.get(static_cast<size_t>(s)), static_cast<size_t>(s));
    }
#endif

    result.records_.reserve(scenarios.size() * static_cast<size_t>(result.periods_per_scenario_));

    for (size_t s = 0; s < outcomes.size(); ++s) {
        ScenarioOutcome& outcome = outcomes[s];
        const ScenarioInput& scenario = scenarios.get(s);

        if (!outcome.ok) {
            logger.log_scenario_failed(s, scenario.scenario_id, outcome.error);
            result.failures_.push_back(ScenarioFailure{s, scenario.scenario_id, outcome.error});
            continue;
        }

        const ScenarioSummary& summary = outcome.result.summary;
        if (config.log_scenarios) {
            logger.log_scenario_complete(summary, outcome.execution_time_ms);
        }
        if (summary.tranche_wiped_out) {
            logger.log_tranche_wiped_out(summary);
        }

        result.summaries_.push_back(summary);
        for (PeriodRecord& record : outcome.result.records) {
            result.records_.push_back(std::move(record));
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms_ = std::chrono::duration<double, std::milli>(
        end_time - start_time).count();

    logger.log_run_complete(result.scenarios_run(), result.scenarios_failed(),
                            result.records_.size(), result.execution_time_ms_);

    return result;
}

} // namespace srtcalc
