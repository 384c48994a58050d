#include "deal.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace srtcalc {

namespace {

void require_finite(const char* field, double value) {
    if (!std::isfinite(value)) {
        std::ostringstream oss;
        oss << field << " must be finite, got " << value;
        throw ConfigurationError(oss.str());
    }
}

} // anonymous namespace

std::string coupon_basis_to_string(CouponBasis basis) {
    switch (basis) {
        case CouponBasis::PostLoss: return "post_loss";
        case CouponBasis::PreLoss: return "pre_loss";
    }
    return "unknown";
}

CouponBasis coupon_basis_from_string(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "post_loss" || lower == "post-loss") return CouponBasis::PostLoss;
    if (lower == "pre_loss" || lower == "pre-loss") return CouponBasis::PreLoss;
    throw ConfigurationError("coupon_basis must be 'post_loss' or 'pre_loss', got '" + value + "'");
}

DealParameters::DealParameters()
    : tranche_size(0.0),
      notional_amount(0.0),
      coupon_rate(0.0),
      annual_loss_rate(0.0),
      cln_price(0.0),
      amortisation_rate(0.0),
      maturity(8),
      replenishment_period(3),
      periods_per_year(4),
      coupon_basis(CouponBasis::PostLoss) {}

void DealParameters::validate() const {
    if (periods_per_year <= 0) {
        throw ConfigurationError("periods_per_year must be positive, got "
                                 + std::to_string(periods_per_year));
    }
    if (maturity <= 0) {
        throw ConfigurationError("maturity must be positive, got " + std::to_string(maturity));
    }
    if (replenishment_period < 0 || replenishment_period >= maturity) {
        throw ConfigurationError("replenishment_period must be in [0, maturity), got "
                                 + std::to_string(replenishment_period)
                                 + " with maturity " + std::to_string(maturity));
    }
    if (risk_free_rates.empty()) {
        throw ConfigurationError("risk_free_rates must not be empty");
    }

    require_finite("tranche_size", tranche_size);
    require_finite("notional_amount", notional_amount);
    require_finite("coupon_rate", coupon_rate);
    require_finite("annual_loss_rate", annual_loss_rate);
    require_finite("cln_price", cln_price);
    require_finite("amortisation_rate", amortisation_rate);
    for (size_t i = 0; i < risk_free_rates.size(); ++i) {
        if (!std::isfinite(risk_free_rates.rates()[i])) {
            throw ConfigurationError("risk_free_rates[" + std::to_string(i) + "] must be finite");
        }
    }
}

} // namespace srtcalc
