#ifndef SRTCALC_RATE_CURVE_HPP
#define SRTCALC_RATE_CURVE_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace srtcalc {

// RateCurve: annual risk-free rates by deal year (1-based)
// Years beyond the last supplied rate hold the last rate flat
class RateCurve {
public:
    RateCurve();
    explicit RateCurve(std::vector<double> rates);

    // Flat curve with the same rate for the given number of years
    static RateCurve flat(double rate, size_t years);

    void add_rate(double rate);

    // Annual rate for a deal year; year must be >= 1
    double rate(int year) const;

    // Product of (1 + rate(y)) for y = 1..year, the value of 1 unit
    // invested at the start of year 1 and rolled annually
    double compounding_factor(int year) const;

    size_t size() const { return rates_.size(); }
    bool empty() const { return rates_.empty(); }
    const std::vector<double>& rates() const { return rates_; }

    // Load from CSV: expects columns year,rate (rows sorted by year, no gaps)
    static RateCurve load_from_csv(const std::string& filepath);
    static RateCurve load_from_csv(std::istream& is);

private:
    // rates_[year-1] = rate for that year (0-indexed internally)
    std::vector<double> rates_;
};

} // namespace srtcalc

#endif // SRTCALC_RATE_CURVE_HPP
