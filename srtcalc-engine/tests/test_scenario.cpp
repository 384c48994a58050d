#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <sstream>
#include "scenario.hpp"
#include "test_fixtures.hpp"

using namespace srtcalc;
using srtcalc::testing::make_reference_deal;
using Catch::Matchers::ContainsSubstring;

// ============================================================================
// ScenarioInput Tests
// ============================================================================

TEST_CASE("ScenarioInput defaults", "[scenario]") {
    ScenarioInput s;
    REQUIRE(s.stress_multiplier == 1.0);
    REQUIRE(s.trigger_year == 1);
    REQUIRE(s.scenario_id.empty());
}

TEST_CASE("ScenarioInput validation", "[scenario][error]") {
    DealParameters deal = make_reference_deal();

    REQUIRE_NOTHROW(ScenarioInput(2.5, 7).validate(deal));
    REQUIRE_NOTHROW(ScenarioInput(1.0, 1).validate(deal));
    REQUIRE_NOTHROW(ScenarioInput(1.0, 8).validate(deal));

    SECTION("stress multiplier must be positive") {
        REQUIRE_THROWS_AS(ScenarioInput(0.0, 4).validate(deal), ConfigurationError);
        REQUIRE_THROWS_WITH(ScenarioInput(-1.0, 4).validate(deal), ContainsSubstring("stress_multiplier"));
    }

    SECTION("trigger year must fall inside the deal") {
        REQUIRE_THROWS_AS(ScenarioInput(1.0, 0).validate(deal), ConfigurationError);
        REQUIRE_THROWS_WITH(ScenarioInput(1.0, 9).validate(deal),
                            ContainsSubstring("trigger_year") && ContainsSubstring("9"));
    }
}

// ============================================================================
// ScenarioSet Tests
// ============================================================================

TEST_CASE("ScenarioSet labels unnamed scenarios by position", "[scenario]") {
    ScenarioSet set;
    set.add(1.0, 4);
    set.add(ScenarioInput(2.0, 5, "Severe"));
    set.add(3.0, 6);

    REQUIRE(set.size() == 3);
    REQUIRE(set.get(0).scenario_id == "Stress 1");
    REQUIRE(set.get(1).scenario_id == "Severe");
    REQUIRE(set.get(2).scenario_id == "Stress 3");
}

TEST_CASE("ScenarioSet get out of range throws", "[scenario][error]") {
    ScenarioSet set;
    REQUIRE(set.empty());
    REQUIRE_THROWS_AS(set.get(0), std::out_of_range);

    set.add(1.0, 4);
    REQUIRE_THROWS_AS(set.get(1), std::out_of_range);
}

TEST_CASE("ScenarioSet grid is stress-major", "[scenario]") {
    ScenarioSet set = ScenarioSet::grid({1.0, 2.0}, {4, 5, 6});

    REQUIRE(set.size() == 6);
    REQUIRE(set.get(0).stress_multiplier == 1.0);
    REQUIRE(set.get(0).trigger_year == 4);
    REQUIRE(set.get(2).trigger_year == 6);
    REQUIRE(set.get(3).stress_multiplier == 2.0);
    REQUIRE(set.get(3).trigger_year == 4);
    REQUIRE(set.get(5).scenario_id == "Stress 6");
}

TEST_CASE("ScenarioSet paired zips stresses with trigger years", "[scenario]") {
    ScenarioSet set = ScenarioSet::paired({1.0, 1.5, 2.0, 2.5}, {4, 5, 6, 7});

    REQUIRE(set.size() == 4);
    REQUIRE(set.get(1).stress_multiplier == 1.5);
    REQUIRE(set.get(1).trigger_year == 5);
    REQUIRE(set.get(3).stress_multiplier == 2.5);
    REQUIRE(set.get(3).trigger_year == 7);

    REQUIRE_THROWS_AS(ScenarioSet::paired({1.0, 2.0}, {4}), std::invalid_argument);
}

TEST_CASE("ScenarioSet clear empties the set", "[scenario]") {
    ScenarioSet set = ScenarioSet::grid({1.0}, {4, 5});
    set.clear();
    REQUIRE(set.empty());
    set.add(2.0, 6);
    REQUIRE(set.get(0).scenario_id == "Stress 1");
}

TEST_CASE("ScenarioSet load from CSV", "[scenario][csv]") {
    SECTION("columns located by name with optional id") {
        std::istringstream csv(
            "# stress grid\n"
            "scenario_id,trigger_year,stress_multiplier\n"
            "Base,4,1.0\n"
            "Severe,6,2.0\n");

        ScenarioSet set = ScenarioSet::load_from_csv(csv);
        REQUIRE(set.size() == 2);
        REQUIRE(set.get(0).scenario_id == "Base");
        REQUIRE(set.get(1).stress_multiplier == 2.0);
        REQUIRE(set.get(1).trigger_year == 6);
    }

    SECTION("without id column scenarios are auto-labelled") {
        std::istringstream csv("stress_multiplier,trigger_year\n1.5,5\n\n2.5,7\n");

        ScenarioSet set = ScenarioSet::load_from_csv(csv);
        REQUIRE(set.size() == 2);
        REQUIRE(set.get(1).scenario_id == "Stress 2");
        REQUIRE(set.get(1).trigger_year == 7);
    }
}

TEST_CASE("ScenarioSet CSV errors", "[scenario][csv][error]") {
    SECTION("empty input") {
        std::istringstream csv("");
        REQUIRE_THROWS_AS(ScenarioSet::load_from_csv(csv), std::runtime_error);
    }

    SECTION("missing required column") {
        std::istringstream csv("stress_multiplier\n1.0\n");
        REQUIRE_THROWS_WITH(ScenarioSet::load_from_csv(csv), ContainsSubstring("trigger_year"));
    }

    SECTION("non-numeric value") {
        std::istringstream csv("stress_multiplier,trigger_year\nhigh,4\n");
        REQUIRE_THROWS_WITH(ScenarioSet::load_from_csv(csv), ContainsSubstring("non-numeric"));
    }

    SECTION("missing file") {
        REQUIRE_THROWS_AS(ScenarioSet::load_from_csv("no_such_scenarios.csv"), std::runtime_error);
    }
}

TEST_CASE("ScenarioSet loads the bundled example file", "[scenario][csv]") {
    ScenarioSet set = ScenarioSet::load_from_csv(std::string(SRTCALC_EXAMPLES_DIR) + "/scenarios.csv");
    REQUIRE(set.size() == 4);
    REQUIRE(set.get(0).scenario_id == "Base");
}
