#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <limits>
#include "deal.hpp"

using namespace srtcalc;
using Catch::Matchers::ContainsSubstring;

namespace {

DealParameters make_valid_deal() {
    DealParameters deal;
    deal.tranche_size = 50000000.0;
    deal.notional_amount = 500000000.0;
    deal.coupon_rate = 0.11;
    deal.annual_loss_rate = 0.0006;
    deal.cln_price = 45000000.0;
    deal.amortisation_rate = 0.33;
    deal.risk_free_rates = RateCurve::flat(0.01, 8);
    return deal;
}

} // anonymous namespace

TEST_CASE("DealParameters defaults", "[deal]") {
    DealParameters deal;
    REQUIRE(deal.maturity == 8);
    REQUIRE(deal.replenishment_period == 3);
    REQUIRE(deal.periods_per_year == 4);
    REQUIRE(deal.coupon_basis == CouponBasis::PostLoss);
    REQUIRE(deal.total_periods() == 32);
}

TEST_CASE("DealParameters valid deal passes validation", "[deal]") {
    REQUIRE_NOTHROW(make_valid_deal().validate());
}

TEST_CASE("DealParameters validation errors name the constraint and value", "[deal][error]") {
    DealParameters deal = make_valid_deal();

    SECTION("periods_per_year must be positive") {
        deal.periods_per_year = 0;
        REQUIRE_THROWS_WITH(deal.validate(), ContainsSubstring("periods_per_year") && ContainsSubstring("0"));
    }

    SECTION("maturity must be positive") {
        deal.maturity = -1;
        REQUIRE_THROWS_WITH(deal.validate(), ContainsSubstring("maturity") && ContainsSubstring("-1"));
    }

    SECTION("risk_free_rates must not be empty") {
        deal.risk_free_rates = RateCurve();
        REQUIRE_THROWS_AS(deal.validate(), ConfigurationError);
        REQUIRE_THROWS_WITH(deal.validate(), ContainsSubstring("risk_free_rates"));
    }

    SECTION("replenishment_period must be non-negative") {
        deal.replenishment_period = -1;
        REQUIRE_THROWS_WITH(deal.validate(), ContainsSubstring("replenishment_period"));
    }

    SECTION("replenishment_period must end before maturity") {
        deal.replenishment_period = 8;
        REQUIRE_THROWS_AS(deal.validate(), ConfigurationError);
        REQUIRE_THROWS_WITH(deal.validate(), ContainsSubstring("replenishment_period") && ContainsSubstring("8"));
    }

    SECTION("numeric fields must be finite") {
        deal.coupon_rate = std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_WITH(deal.validate(), ContainsSubstring("coupon_rate"));
    }
}

TEST_CASE("DealParameters zero replenishment period is valid", "[deal][boundary]") {
    DealParameters deal = make_valid_deal();
    deal.replenishment_period = 0;
    REQUIRE_NOTHROW(deal.validate());
}

TEST_CASE("ConfigurationError is a runtime_error", "[deal][error]") {
    DealParameters deal = make_valid_deal();
    deal.maturity = 0;
    REQUIRE_THROWS_AS(deal.validate(), std::runtime_error);
}

TEST_CASE("CouponBasis string conversion", "[deal]") {
    REQUIRE(coupon_basis_to_string(CouponBasis::PostLoss) == "post_loss");
    REQUIRE(coupon_basis_to_string(CouponBasis::PreLoss) == "pre_loss");
    REQUIRE(coupon_basis_from_string("post_loss") == CouponBasis::PostLoss);
    REQUIRE(coupon_basis_from_string("PRE-LOSS") == CouponBasis::PreLoss);
    REQUIRE_THROWS_AS(coupon_basis_from_string("mid_period"), ConfigurationError);
    REQUIRE_THROWS_AS(coupon_basis_from_string("post_loss\xC3\xA9"), ConfigurationError);
}
