#include "discounting.hpp"
#include <stdexcept>

namespace srtcalc {

DiscountingAccumulator::DiscountingAccumulator(const RateCurve& risk_free_rates,
                                               int periods_per_year,
                                               double cln_price)
    : risk_free_rates_(risk_free_rates),
      periods_per_year_(periods_per_year),
      cln_price_(cln_price),
      compounded_balance_(0.0) {
    if (periods_per_year_ <= 0) {
        throw std::invalid_argument("periods_per_year must be positive");
    }
}

double DiscountingAccumulator::accumulate(int year, double cashflow) {
    double period_rate = risk_free_rates_.rate(year) / static_cast<double>(periods_per_year_);
    compounded_balance_ = (compounded_balance_ + cashflow) * (1.0 + period_rate);
    return risk_adjusted_pnl();
}

} // namespace srtcalc
