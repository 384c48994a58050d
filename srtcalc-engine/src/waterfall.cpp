#include "waterfall.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace srtcalc {

std::string regime_to_string(AmortisationRegime regime) {
    switch (regime) {
        case AmortisationRegime::Replenishment: return "Replenishment";
        case AmortisationRegime::ProRata: return "Pro-rata";
        case AmortisationRegime::Sequential: return "Sequential";
    }
    return "Unknown";
}

AmortisationRegime regime_from_string(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "replenishment") return AmortisationRegime::Replenishment;
    if (lower == "pro-rata" || lower == "prorata" || lower == "pro_rata") return AmortisationRegime::ProRata;
    if (lower == "sequential") return AmortisationRegime::Sequential;
    throw std::invalid_argument("Unknown amortisation regime: " + value);
}

SimulationState::SimulationState(const DealParameters& deal)
    : remaining_notional(deal.notional_amount),
      tranche_exposure(deal.tranche_size),
      cumulative_pnl(-deal.cln_price),
      sequential_mode(false),
      period_index(0) {}

WaterfallEngine::WaterfallEngine(const DealParameters& deal, const ScenarioInput& scenario)
    : deal_(deal), scenario_(scenario) {}

AmortisationRegime WaterfallEngine::select_regime(SimulationState& state, int year) const {
    if (year <= deal_.replenishment_period) {
        return AmortisationRegime::Replenishment;
    }

    // The trigger only fires once amortisation has started; a trigger year
    // inside the replenishment period never arms the latch
    if (year == scenario_.trigger_year) {
        state.sequential_mode = true;
    }
    return state.sequential_mode ? AmortisationRegime::Sequential : AmortisationRegime::ProRata;
}

PeriodOutcome WaterfallEngine::step(SimulationState& state) const {
    const double q = static_cast<double>(deal_.periods_per_year);

    PeriodOutcome outcome;
    outcome.year = state.period_index / deal_.periods_per_year + 1;
    outcome.quarter = state.period_index % deal_.periods_per_year + 1;
    outcome.regime = select_regime(state, outcome.year);

    outcome.period_losses =
        state.remaining_notional * deal_.annual_loss_rate * scenario_.stress_multiplier / q;
    outcome.principal_payment = 0.0;

    const double amortisation_factor = 1.0 - deal_.amortisation_rate / q;

    switch (outcome.regime) {
        case AmortisationRegime::Replenishment:
            break;

        case AmortisationRegime::ProRata: {
            // Tranche's share of the structural amortisation; a wiped-out
            // structure has no share to pay
            if (state.remaining_notional > 0.0) {
                double share = state.tranche_exposure / state.remaining_notional;
                double structural_amortisation =
                    state.remaining_notional * deal_.amortisation_rate / q;
                outcome.principal_payment = share * structural_amortisation;
            }
            state.tranche_exposure -= outcome.principal_payment;
            state.remaining_notional *= amortisation_factor;
            break;
        }

        case AmortisationRegime::Sequential:
            // First loss absorbs the period's losses in full
            state.tranche_exposure -= outcome.period_losses;
            state.remaining_notional *= amortisation_factor;
            break;
    }

    const double pre_loss_exposure = state.tranche_exposure;
    state.tranche_exposure -= outcome.period_losses;

    const double coupon_exposure = (deal_.coupon_basis == CouponBasis::PreLoss)
        ? pre_loss_exposure
        : state.tranche_exposure;
    outcome.coupon_payment = coupon_exposure * deal_.coupon_rate / q;
    outcome.cashflow = outcome.coupon_payment + outcome.principal_payment;

    state.cumulative_pnl += outcome.cashflow;
    ++state.period_index;

    return outcome;
}

} // namespace srtcalc
