#ifndef SRTCALC_PROJECTION_HPP
#define SRTCALC_PROJECTION_HPP

#include "deal.hpp"
#include "discounting.hpp"
#include "scenario.hpp"
#include "waterfall.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace srtcalc {

// One row of the cash-flow ledger: a single (scenario, year, quarter)
struct PeriodRecord {
    std::string scenario_id;
    size_t scenario_index;              // Position in the scenario set (0-based)
    int period;                         // Global period number (1-based)
    int year;
    int quarter;
    int trigger_year;
    double stress_multiplier;
    double period_losses;
    double remaining_notional;          // After this period's update
    double tranche_exposure;            // After this period's update
    double principal_payment;
    double coupon_payment;
    double quarterly_cashflow;          // coupon + principal
    AmortisationRegime amortisation_regime;
    double cumulative_pnl;              // Net of the upfront CLN price
    double risk_adjusted_pnl;           // Compounded cash flow net of the CLN price

    bool operator==(const PeriodRecord& other) const;
    bool operator!=(const PeriodRecord& other) const { return !(*this == other); }
};

// Headline figures for one scenario
struct ScenarioSummary {
    std::string scenario_id;
    size_t scenario_index;
    double stress_multiplier;
    int trigger_year;
    double final_cumulative_pnl;
    double final_risk_adjusted_pnl;
    double total_losses;
    double total_principal;
    double total_coupon;
    int first_sequential_period;        // 0 if the scenario never went sequential
    int first_negative_exposure_period; // 0 if the tranche was never wiped out
    bool tranche_wiped_out;

    ScenarioSummary();
};

// Records for one scenario plus its summary
struct ScenarioResult {
    std::vector<PeriodRecord> records;
    ScenarioSummary summary;
};

// ScenarioRunner: lazy, ordered, finite sequence of period records for one scenario.
//
// Owns its SimulationState and DiscountingAccumulator; each next() advances both
// by one period. Not restartable: construct a new runner to re-run a scenario.
//
// Usage:
//   ScenarioRunner runner(deal, scenario);
//   while (runner.has_next()) {
//       PeriodRecord record = runner.next();
//   }
class ScenarioRunner {
public:
    // Throws ConfigurationError if the deal or scenario is invalid
    ScenarioRunner(const DealParameters& deal, const ScenarioInput& scenario,
                   size_t scenario_index = 0);

    bool has_next() const;

    // Throws std::out_of_range once all periods have been emitted
    PeriodRecord next();

    int periods_emitted() const { return state_.period_index; }
    int total_periods() const { return total_periods_; }

    // Read-only view of the carried state
    const SimulationState& state() const { return state_; }

private:
    WaterfallEngine engine_;
    SimulationState state_;
    DiscountingAccumulator accumulator_;
    size_t scenario_index_;
    int total_periods_;
    bool has_regime_;
    AmortisationRegime last_regime_;
};

// Run a whole scenario and collect its records
ScenarioResult run_scenario(const DealParameters& deal, const ScenarioInput& scenario,
                            size_t scenario_index = 0);

// Headline figures from a scenario's records (in chronological order)
ScenarioSummary summarize_scenario(const std::vector<PeriodRecord>& records);

} // namespace srtcalc

#endif // SRTCALC_PROJECTION_HPP
