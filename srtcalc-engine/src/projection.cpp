#include "projection.hpp"
#include "logger.hpp"
#include <stdexcept>
#include <utility>

namespace srtcalc {

// ============================================================================
// PeriodRecord / ScenarioSummary Implementation
// ============================================================================

bool PeriodRecord::operator==(const PeriodRecord& other) const {
    return scenario_id == other.scenario_id &&
           scenario_index == other.scenario_index &&
           period == other.period &&
           year == other.year &&
           quarter == other.quarter &&
           trigger_year == other.trigger_year &&
           stress_multiplier == other.stress_multiplier &&
           period_losses == other.period_losses &&
           remaining_notional == other.remaining_notional &&
           tranche_exposure == other.tranche_exposure &&
           principal_payment == other.principal_payment &&
           coupon_payment == other.coupon_payment &&
           quarterly_cashflow == other.quarterly_cashflow &&
           amortisation_regime == other.amortisation_regime &&
           cumulative_pnl == other.cumulative_pnl &&
           risk_adjusted_pnl == other.risk_adjusted_pnl;
}

ScenarioSummary::ScenarioSummary()
    : scenario_index(0),
      stress_multiplier(0.0),
      trigger_year(0),
      final_cumulative_pnl(0.0),
      final_risk_adjusted_pnl(0.0),
      total_losses(0.0),
      total_principal(0.0),
      total_coupon(0.0),
      first_sequential_period(0),
      first_negative_exposure_period(0),
      tranche_wiped_out(false) {}

// ============================================================================
// ScenarioRunner Implementation
// ============================================================================

namespace {

const DealParameters& validated(const DealParameters& deal, const ScenarioInput& scenario) {
    deal.validate();
    scenario.validate(deal);
    return deal;
}

} // anonymous namespace

ScenarioRunner::ScenarioRunner(const DealParameters& deal, const ScenarioInput& scenario,
                               size_t scenario_index)
    : engine_(validated(deal, scenario), scenario),
      state_(deal),
      accumulator_(deal.risk_free_rates, deal.periods_per_year, deal.cln_price),
      scenario_index_(scenario_index),
      total_periods_(deal.total_periods()),
      has_regime_(false),
      last_regime_(AmortisationRegime::Replenishment) {}

bool ScenarioRunner::has_next() const {
    return state_.period_index < total_periods_;
}

PeriodRecord ScenarioRunner::next() {
    if (!has_next()) {
        throw std::out_of_range("Scenario '" + engine_.scenario().scenario_id
                                + "' has no periods left");
    }

    const int period = state_.period_index + 1;
    PeriodOutcome outcome = engine_.step(state_);
    double risk_adjusted = accumulator_.accumulate(outcome.year, outcome.cashflow);

    const ScenarioInput& scenario = engine_.scenario();

    if (has_regime_ && outcome.regime != last_regime_) {
        Logger::get_instance().log_regime_transition(
            scenario.scenario_id, period, last_regime_, outcome.regime);
    }
    has_regime_ = true;
    last_regime_ = outcome.regime;

    PeriodRecord record;
    record.scenario_id = scenario.scenario_id;
    record.scenario_index = scenario_index_;
    record.period = period;
    record.year = outcome.year;
    record.quarter = outcome.quarter;
    record.trigger_year = scenario.trigger_year;
    record.stress_multiplier = scenario.stress_multiplier;
    record.period_losses = outcome.period_losses;
    record.remaining_notional = state_.remaining_notional;
    record.tranche_exposure = state_.tranche_exposure;
    record.principal_payment = outcome.principal_payment;
    record.coupon_payment = outcome.coupon_payment;
    record.quarterly_cashflow = outcome.cashflow;
    record.amortisation_regime = outcome.regime;
    record.cumulative_pnl = state_.cumulative_pnl;
    record.risk_adjusted_pnl = risk_adjusted;
    return record;
}

// ============================================================================
// Scenario helpers
// ============================================================================

ScenarioResult run_scenario(const DealParameters& deal, const ScenarioInput& scenario,
                            size_t scenario_index) {
    ScenarioRunner runner(deal, scenario, scenario_index);

    ScenarioResult result;
    result.records.reserve(static_cast<size_t>(runner.total_periods()));
    while (runner.has_next()) {
        result.records.push_back(runner.next());
    }
    result.summary = summarize_scenario(result.records);

    // Summary fields that do not depend on any record
    result.summary.scenario_id = scenario.scenario_id;
    result.summary.scenario_index = scenario_index;
    result.summary.stress_multiplier = scenario.stress_multiplier;
    result.summary.trigger_year = scenario.trigger_year;
    return result;
}

ScenarioSummary summarize_scenario(const std::vector<PeriodRecord>& records) {
    ScenarioSummary summary;
    if (records.empty()) {
        return summary;
    }

    const PeriodRecord& first = records.front();
    summary.scenario_id = first.scenario_id;
    summary.scenario_index = first.scenario_index;
    summary.stress_multiplier = first.stress_multiplier;
    summary.trigger_year = first.trigger_year;

    for (const PeriodRecord& record : records) {
        summary.total_losses += record.period_losses;
        summary.total_principal += record.principal_payment;
        summary.total_coupon += record.coupon_payment;

        if (summary.first_sequential_period == 0 &&
            record.amortisation_regime == AmortisationRegime::Sequential) {
            summary.first_sequential_period = record.period;
        }
        if (summary.first_negative_exposure_period == 0 && record.tranche_exposure < 0.0) {
            summary.first_negative_exposure_period = record.period;
        }
    }

    const PeriodRecord& last = records.back();
    summary.final_cumulative_pnl = last.cumulative_pnl;
    summary.final_risk_adjusted_pnl = last.risk_adjusted_pnl;
    summary.tranche_wiped_out = summary.first_negative_exposure_period != 0;
    return summary;
}

} // namespace srtcalc
