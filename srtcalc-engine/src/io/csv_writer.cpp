#include "csv_writer.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace srtcalc {
namespace io {

namespace {

// Quote ids containing the delimiter or quotes
std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

} // anonymous namespace

const std::vector<std::string>& period_record_columns() {
    static const std::vector<std::string> columns = {
        "scenario_id", "period", "year", "quarter", "trigger_year", "stress_multiplier",
        "period_losses", "remaining_notional", "tranche_exposure", "principal_payment",
        "coupon_payment", "quarterly_cashflow", "amortisation_regime",
        "cumulative_pnl", "risk_adjusted_pnl"
    };
    return columns;
}

void write_records_csv(std::ostream& os, const std::vector<PeriodRecord>& records) {
    const auto& columns = period_record_columns();
    for (size_t i = 0; i < columns.size(); ++i) {
        os << (i > 0 ? "," : "") << columns[i];
    }
    os << "\n";

    const std::ios_base::fmtflags saved_flags = os.flags();
    const std::streamsize saved_precision = os.precision();
    os << std::fixed << std::setprecision(6);
    for (const PeriodRecord& r : records) {
        os << csv_field(r.scenario_id) << ','
           << r.period << ','
           << r.year << ','
           << r.quarter << ','
           << r.trigger_year << ','
           << r.stress_multiplier << ','
           << r.period_losses << ','
           << r.remaining_notional << ','
           << r.tranche_exposure << ','
           << r.principal_payment << ','
           << r.coupon_payment << ','
           << r.quarterly_cashflow << ','
           << regime_to_string(r.amortisation_regime) << ','
           << r.cumulative_pnl << ','
           << r.risk_adjusted_pnl << '\n';
    }

    os.flags(saved_flags);
    os.precision(saved_precision);
}

void write_records_csv(const std::string& filepath, const std::vector<PeriodRecord>& records) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_records_csv(file, records);
}

} // namespace io
} // namespace srtcalc
