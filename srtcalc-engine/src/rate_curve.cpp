#include "rate_curve.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace srtcalc {

RateCurve::RateCurve() = default;

RateCurve::RateCurve(std::vector<double> rates) : rates_(std::move(rates)) {}

RateCurve RateCurve::flat(double rate, size_t years) {
    return RateCurve(std::vector<double>(years, rate));
}

void RateCurve::add_rate(double rate) {
    rates_.push_back(rate);
}

double RateCurve::rate(int year) const {
    if (year < 1) {
        throw std::out_of_range("Year must be at least 1, got " + std::to_string(year));
    }
    if (rates_.empty()) {
        throw std::out_of_range("Rate curve is empty");
    }
    size_t index = std::min(static_cast<size_t>(year - 1), rates_.size() - 1);
    return rates_[index];
}

double RateCurve::compounding_factor(int year) const {
    double factor = 1.0;
    for (int y = 1; y <= year; ++y) {
        factor *= (1.0 + rate(y));
    }
    return factor;
}

RateCurve RateCurve::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open rate curve file: " + filepath);
    }
    return load_from_csv(file);
}

RateCurve RateCurve::load_from_csv(std::istream& is) {
    CsvReader reader(is);

    // Skip header row
    if (reader.has_more()) {
        reader.read_row();
    }

    RateCurve curve;
    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) continue;

        if (row.size() < 2) {
            throw std::runtime_error("Rate curve CSV requires columns: year,rate (line "
                                     + std::to_string(reader.line_number()) + ")");
        }

        int year = 0;
        double rate = 0.0;
        try {
            year = std::stoi(row[0]);
            rate = std::stod(row[1]);
        } catch (const std::logic_error& e) {
            throw std::runtime_error("Rate curve CSV has a non-numeric value (line "
                                     + std::to_string(reader.line_number()) + "): " + e.what());
        }
        if (year != static_cast<int>(curve.size()) + 1) {
            throw std::runtime_error("Rate curve CSV years must start at 1 and be contiguous, got year "
                                     + std::to_string(year));
        }
        curve.add_rate(rate);
    }

    return curve;
}

} // namespace srtcalc
