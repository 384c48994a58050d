#ifndef SRTCALC_WATERFALL_HPP
#define SRTCALC_WATERFALL_HPP

#include "deal.hpp"
#include "scenario.hpp"
#include <cstdint>
#include <string>

namespace srtcalc {

enum class AmortisationRegime : uint8_t {
    Replenishment = 0,
    ProRata = 1,
    Sequential = 2
};

// "Replenishment", "Pro-rata", "Sequential"
std::string regime_to_string(AmortisationRegime regime);
AmortisationRegime regime_from_string(const std::string& value);

// Mutable state of one scenario run. Created fresh per scenario.
struct SimulationState {
    double remaining_notional;
    double tranche_exposure;
    double cumulative_pnl;              // Starts at -cln_price
    bool sequential_mode;               // Latch: once set, never cleared
    int period_index;                   // Periods already simulated

    explicit SimulationState(const DealParameters& deal);
};

// Cash-flow outcome of a single period
struct PeriodOutcome {
    int year;                           // 1-based
    int quarter;                        // 1-based period within the year
    AmortisationRegime regime;
    double period_losses;
    double principal_payment;
    double coupon_payment;
    double cashflow;                    // coupon + principal
};

// WaterfallEngine: advances one scenario's state one period at a time.
//
// Regime selection:
// - Replenishment while year <= replenishment_period
// - After replenishment, the trigger latch is set when year == trigger_year and is
//   never cleared; a trigger year inside replenishment never fires
// - After replenishment: Sequential if latched, else ProRata
//
// Per period (q = periods_per_year):
// 1. losses = remaining_notional * annual_loss_rate * stress / q
// 2. ProRata: principal = share of (remaining_notional * amortisation_rate / q),
//    exposure -= principal, notional amortises
// 3. Sequential: no principal, exposure -= losses, notional amortises
// 4. Every regime: exposure -= losses
// 5. coupon = exposure * coupon_rate / q, cashflow = coupon + principal
//
// Negative exposure or notional is carried forward unclamped.
class WaterfallEngine {
public:
    WaterfallEngine(const DealParameters& deal, const ScenarioInput& scenario);

    // Simulate the next period, updating state in place
    PeriodOutcome step(SimulationState& state) const;

    // Regime the next step() would use for the given year, latching
    // the trigger into state when it fires
    AmortisationRegime select_regime(SimulationState& state, int year) const;

    const DealParameters& deal() const { return deal_; }
    const ScenarioInput& scenario() const { return scenario_; }

private:
    DealParameters deal_;
    ScenarioInput scenario_;
};

} // namespace srtcalc

#endif // SRTCALC_WATERFALL_HPP
