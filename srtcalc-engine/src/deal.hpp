#ifndef SRTCALC_DEAL_HPP
#define SRTCALC_DEAL_HPP

#include "rate_curve.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>

namespace srtcalc {

// Thrown when deal or scenario inputs violate a structural constraint.
// The message names the constraint and the offending value.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

// Exposure the quarterly coupon accrues on
enum class CouponBasis : uint8_t {
    PostLoss = 0,   // after amortisation and after the period's losses
    PreLoss = 1     // after amortisation, before the period's losses
};

std::string coupon_basis_to_string(CouponBasis basis);
CouponBasis coupon_basis_from_string(const std::string& value);

// DealParameters: economics of the first-loss tranche and the reference structure
struct DealParameters {
    double tranche_size;            // First-loss tranche notional at inception
    double notional_amount;         // Total structure notional at inception
    double coupon_rate;             // Annual coupon on outstanding tranche exposure
    double annual_loss_rate;        // Unstressed annual loss, fraction of remaining notional
    double cln_price;               // Upfront price paid by the investor
    double amortisation_rate;       // Annual amortisation, fraction of remaining notional
    int maturity;                   // Years
    int replenishment_period;       // Years with no amortisation
    int periods_per_year;           // 4 = quarterly
    RateCurve risk_free_rates;      // Annual risk-free rates by year
    CouponBasis coupon_basis;

    DealParameters();

    int total_periods() const { return maturity * periods_per_year; }

    // Throws ConfigurationError on the first violated constraint
    void validate() const;
};

} // namespace srtcalc

#endif // SRTCALC_DEAL_HPP
