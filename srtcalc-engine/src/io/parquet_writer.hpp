#ifndef SRTCALC_PARQUET_WRITER_HPP
#define SRTCALC_PARQUET_WRITER_HPP

#include "../projection.hpp"
#include <string>
#include <vector>

namespace srtcalc {

class ParquetWriter {
public:
    /**
     * Write period records to a Parquet file.
     *
     * Output schema:
     *   - scenario_id: utf8
     *   - scenario_index: uint32
     *   - period, year, quarter, trigger_year: int32
     *   - stress_multiplier, period_losses, remaining_notional, tranche_exposure,
     *     principal_payment, coupon_payment, quarterly_cashflow: float64
     *   - amortisation_regime: utf8 ("Replenishment", "Pro-rata", "Sequential")
     *   - cumulative_pnl, risk_adjusted_pnl: float64
     *
     * @param records Period records in table order
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if there are no records or the file cannot be written
     */
    static void write_records(const std::vector<PeriodRecord>& records, const std::string& filepath);
};

} // namespace srtcalc

#endif // SRTCALC_PARQUET_WRITER_HPP
