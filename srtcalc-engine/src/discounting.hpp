#ifndef SRTCALC_DISCOUNTING_HPP
#define SRTCALC_DISCOUNTING_HPP

#include "rate_curve.hpp"

namespace srtcalc {

// DiscountingAccumulator: reinvests every received cash flow at the
// risk-free rate from receipt onwards (forward compounding, not PV).
//
// Each period:
//   period_rate = rate(year) / periods_per_year
//   balance     = (balance + cashflow) * (1 + period_rate)
//   risk_adjusted_pnl = balance - cln_price
class DiscountingAccumulator {
public:
    DiscountingAccumulator(const RateCurve& risk_free_rates, int periods_per_year, double cln_price);

    // Add one period's cash flow; returns the risk-adjusted PnL after compounding
    double accumulate(int year, double cashflow);

    double compounded_balance() const { return compounded_balance_; }
    double risk_adjusted_pnl() const { return compounded_balance_ - cln_price_; }

    void reset() { compounded_balance_ = 0.0; }

private:
    RateCurve risk_free_rates_;
    int periods_per_year_;
    double cln_price_;
    double compounded_balance_;
};

} // namespace srtcalc

#endif // SRTCALC_DISCOUNTING_HPP
