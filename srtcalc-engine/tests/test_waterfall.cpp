#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include "waterfall.hpp"
#include "test_fixtures.hpp"

using namespace srtcalc;
using srtcalc::testing::make_reference_deal;
using Catch::Approx;

// ============================================================================
// Regime string conversion
// ============================================================================

TEST_CASE("AmortisationRegime string conversion", "[waterfall]") {
    REQUIRE(regime_to_string(AmortisationRegime::Replenishment) == "Replenishment");
    REQUIRE(regime_to_string(AmortisationRegime::ProRata) == "Pro-rata");
    REQUIRE(regime_to_string(AmortisationRegime::Sequential) == "Sequential");

    REQUIRE(regime_from_string("pro-rata") == AmortisationRegime::ProRata);
    REQUIRE(regime_from_string("SEQUENTIAL") == AmortisationRegime::Sequential);
    REQUIRE_THROWS_AS(regime_from_string("s\xC3\xA9quentiel"), std::invalid_argument);
    REQUIRE_THROWS_AS(regime_from_string("turbo"), std::invalid_argument);
}

// ============================================================================
// SimulationState
// ============================================================================

TEST_CASE("SimulationState starts from the deal", "[waterfall]") {
    DealParameters deal = make_reference_deal();
    SimulationState state(deal);

    REQUIRE(state.remaining_notional == 500000000.0);
    REQUIRE(state.tranche_exposure == 50000000.0);
    REQUIRE(state.cumulative_pnl == -45000000.0);
    REQUIRE_FALSE(state.sequential_mode);
    REQUIRE(state.period_index == 0);
}

// ============================================================================
// Single-period behaviour
// ============================================================================

TEST_CASE("WaterfallEngine first replenishment period", "[waterfall]") {
    DealParameters deal = make_reference_deal();
    WaterfallEngine engine(deal, ScenarioInput(1.0, 4));
    SimulationState state(deal);

    PeriodOutcome out = engine.step(state);

    REQUIRE(out.year == 1);
    REQUIRE(out.quarter == 1);
    REQUIRE(out.regime == AmortisationRegime::Replenishment);
    REQUIRE(out.period_losses == Approx(75000.0));
    REQUIRE(out.principal_payment == 0.0);
    REQUIRE(out.coupon_payment == Approx(1372937.5));
    REQUIRE(out.cashflow == Approx(1372937.5));

    REQUIRE(state.remaining_notional == 500000000.0);
    REQUIRE(state.tranche_exposure == Approx(49925000.0));
    REQUIRE(state.cumulative_pnl == Approx(-43627062.5));
    REQUIRE(state.period_index == 1);
}

TEST_CASE("WaterfallEngine replenishment keeps the notional and pays no principal", "[waterfall]") {
    DealParameters deal = make_reference_deal();
    WaterfallEngine engine(deal, ScenarioInput(1.0, 8));
    SimulationState state(deal);

    for (int p = 0; p < 12; ++p) {
        PeriodOutcome out = engine.step(state);
        REQUIRE(out.regime == AmortisationRegime::Replenishment);
        REQUIRE(out.principal_payment == 0.0);
        REQUIRE(state.remaining_notional == 500000000.0);
    }
    // Twelve periods of 75k losses
    REQUIRE(state.tranche_exposure == Approx(49100000.0));
    REQUIRE(state.cumulative_pnl == Approx(-28660875.0));
}

TEST_CASE("WaterfallEngine year and quarter numbering", "[waterfall]") {
    DealParameters deal = make_reference_deal();
    WaterfallEngine engine(deal, ScenarioInput(1.0, 8));
    SimulationState state(deal);

    for (int p = 1; p <= deal.total_periods(); ++p) {
        PeriodOutcome out = engine.step(state);
        REQUIRE(out.year == (p - 1) / 4 + 1);
        REQUIRE(out.quarter == (p - 1) % 4 + 1);
    }
}

TEST_CASE("WaterfallEngine pro-rata period pays the tranche share", "[waterfall]") {
    DealParameters deal = make_reference_deal();
    WaterfallEngine engine(deal, ScenarioInput(1.0, 7));
    SimulationState state(deal);

    for (int p = 0; p < 12; ++p) {
        engine.step(state);
    }
    const double exposure_before = state.tranche_exposure;
    const double notional_before = state.remaining_notional;

    PeriodOutcome out = engine.step(state);

    REQUIRE(out.year == 4);
    REQUIRE(out.regime == AmortisationRegime::ProRata);
    // Losses are measured on the notional before amortisation
    REQUIRE(out.period_losses == Approx(notional_before * 0.0006 / 4.0));

    const double expected_principal =
        (exposure_before / notional_before) * notional_before * 0.33 / 4.0;
    REQUIRE(out.principal_payment == Approx(expected_principal));
    REQUIRE(out.principal_payment == Approx(4050750.0));

    REQUIRE(state.remaining_notional == Approx(458750000.0));
    REQUIRE(state.tranche_exposure == Approx(49100000.0 - 4050750.0 - 75000.0));
    REQUIRE(out.coupon_payment == Approx(state.tranche_exposure * 0.11 / 4.0));
    REQUIRE(out.cashflow == Approx(out.coupon_payment + out.principal_payment));
}

TEST_CASE("WaterfallEngine sequential period absorbs losses and pays no principal", "[waterfall]") {
    DealParameters deal = make_reference_deal();
    WaterfallEngine engine(deal, ScenarioInput(1.0, 4));
    SimulationState state(deal);

    for (int p = 0; p < 12; ++p) {
        engine.step(state);
    }

    PeriodOutcome out = engine.step(state);

    REQUIRE(out.regime == AmortisationRegime::Sequential);
    REQUIRE(out.principal_payment == 0.0);
    REQUIRE(state.remaining_notional == Approx(458750000.0));
    // Losses are deducted in the sequential step and again in the common step
    REQUIRE(state.tranche_exposure == Approx(48950000.0));
    REQUIRE(out.cashflow == Approx(1346125.0));
    REQUIRE(state.cumulative_pnl == Approx(-27314750.0));
}

// ============================================================================
// Regime selection
// ============================================================================

TEST_CASE("WaterfallEngine sequential mode is sticky", "[waterfall][regime]") {
    DealParameters deal = make_reference_deal();
    WaterfallEngine engine(deal, ScenarioInput(2.5, 7));
    SimulationState state(deal);

    for (int p = 1; p <= deal.total_periods(); ++p) {
        PeriodOutcome out = engine.step(state);
        if (p <= 12) {
            REQUIRE(out.regime == AmortisationRegime::Replenishment);
        } else if (p <= 24) {
            REQUIRE(out.regime == AmortisationRegime::ProRata);
        } else {
            REQUIRE(out.regime == AmortisationRegime::Sequential);
            REQUIRE(state.sequential_mode);
        }
    }
}

TEST_CASE("WaterfallEngine trigger inside replenishment never arms sequential", "[waterfall][regime]") {
    DealParameters deal = make_reference_deal();

    for (int trigger = 1; trigger <= deal.replenishment_period; ++trigger) {
        WaterfallEngine engine(deal, ScenarioInput(1.0, trigger));
        SimulationState state(deal);

        for (int p = 1; p <= deal.total_periods(); ++p) {
            PeriodOutcome out = engine.step(state);
            if (p <= 12) {
                REQUIRE(out.regime == AmortisationRegime::Replenishment);
            } else {
                REQUIRE(out.regime == AmortisationRegime::ProRata);
            }
        }
        REQUIRE_FALSE(state.sequential_mode);
    }
}

TEST_CASE("WaterfallEngine trigger in the first amortising year goes straight to sequential", "[waterfall][regime]") {
    DealParameters deal = make_reference_deal();
    WaterfallEngine engine(deal, ScenarioInput(1.0, deal.replenishment_period + 1));
    SimulationState state(deal);

    for (int p = 1; p <= deal.total_periods(); ++p) {
        PeriodOutcome out = engine.step(state);
        if (p <= 12) {
            REQUIRE(out.regime == AmortisationRegime::Replenishment);
        } else {
            REQUIRE(out.regime == AmortisationRegime::Sequential);
        }
    }
}

TEST_CASE("WaterfallEngine select_regime sets the latch at the trigger year", "[waterfall][regime]") {
    DealParameters deal = make_reference_deal();
    WaterfallEngine engine(deal, ScenarioInput(1.0, 5));
    SimulationState state(deal);

    REQUIRE(engine.select_regime(state, 4) == AmortisationRegime::ProRata);
    REQUIRE_FALSE(state.sequential_mode);
    REQUIRE(engine.select_regime(state, 5) == AmortisationRegime::Sequential);
    REQUIRE(state.sequential_mode);
    // Latch survives later years and an earlier year being asked again
    REQUIRE(engine.select_regime(state, 6) == AmortisationRegime::Sequential);
    REQUIRE(engine.select_regime(state, 4) == AmortisationRegime::Sequential);
}

TEST_CASE("WaterfallEngine select_regime ignores a trigger during replenishment", "[waterfall][regime]") {
    DealParameters deal = make_reference_deal();
    WaterfallEngine engine(deal, ScenarioInput(1.0, 2));
    SimulationState state(deal);

    REQUIRE(engine.select_regime(state, 2) == AmortisationRegime::Replenishment);
    REQUIRE_FALSE(state.sequential_mode);
    REQUIRE(engine.select_regime(state, 4) == AmortisationRegime::ProRata);
    REQUIRE_FALSE(state.sequential_mode);
}

TEST_CASE("WaterfallEngine zero replenishment period starts amortising immediately", "[waterfall][boundary]") {
    DealParameters deal = make_reference_deal();
    deal.replenishment_period = 0;
    WaterfallEngine engine(deal, ScenarioInput(1.0, 8));
    SimulationState state(deal);

    PeriodOutcome out = engine.step(state);
    REQUIRE(out.regime == AmortisationRegime::ProRata);
    REQUIRE(out.principal_payment > 0.0);
}

// ============================================================================
// Edge cases
// ============================================================================

TEST_CASE("WaterfallEngine pro-rata with exhausted notional pays nothing", "[waterfall][boundary]") {
    DealParameters deal = make_reference_deal();
    deal.replenishment_period = 0;
    deal.amortisation_rate = 4.0;           // One period wipes the whole notional
    WaterfallEngine engine(deal, ScenarioInput(1.0, 8));
    SimulationState state(deal);

    engine.step(state);
    REQUIRE(state.remaining_notional == 0.0);

    PeriodOutcome out = engine.step(state);
    REQUIRE(out.regime == AmortisationRegime::ProRata);
    REQUIRE(out.principal_payment == 0.0);
    REQUIRE(out.period_losses == 0.0);
    REQUIRE(std::isfinite(state.tranche_exposure));
    REQUIRE(std::isfinite(state.cumulative_pnl));
}

TEST_CASE("WaterfallEngine exposure can go negative and keeps propagating", "[waterfall][boundary]") {
    DealParameters deal = make_reference_deal();
    WaterfallEngine engine(deal, ScenarioInput(200.0, 4));
    SimulationState state(deal);

    // 15m losses per period against a 50m tranche
    for (int p = 0; p < 3; ++p) {
        engine.step(state);
    }
    REQUIRE(state.tranche_exposure == Approx(5000000.0));

    PeriodOutcome out = engine.step(state);
    REQUIRE(state.tranche_exposure == Approx(-10000000.0));
    // Coupon follows the exposure sign
    REQUIRE(out.coupon_payment < 0.0);
    REQUIRE(out.coupon_payment == Approx(-275000.0));
}

TEST_CASE("WaterfallEngine pre-loss coupon basis", "[waterfall]") {
    DealParameters deal = make_reference_deal();
    deal.coupon_basis = CouponBasis::PreLoss;
    WaterfallEngine engine(deal, ScenarioInput(1.0, 4));
    SimulationState state(deal);

    PeriodOutcome out = engine.step(state);

    // Coupon accrues on the exposure before this period's losses
    REQUIRE(out.coupon_payment == Approx(50000000.0 * 0.11 / 4.0));
    REQUIRE(state.tranche_exposure == Approx(49925000.0));
}

TEST_CASE("WaterfallEngine leaves inputs untouched", "[waterfall]") {
    DealParameters deal = make_reference_deal();
    ScenarioInput scenario(1.5, 5, "Moderate");
    WaterfallEngine engine(deal, scenario);
    SimulationState state(deal);

    while (state.period_index < deal.total_periods()) {
        engine.step(state);
    }

    REQUIRE(engine.deal().tranche_size == 50000000.0);
    REQUIRE(engine.deal().notional_amount == 500000000.0);
    REQUIRE(engine.scenario().scenario_id == "Moderate");
}
