#include "parquet_writer.hpp"
#include <memory>
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace srtcalc {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

std::shared_ptr<arrow::Array> finish(arrow::ArrayBuilder& builder, const std::string& column) {
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + column + " array");
    return array;
}

} // anonymous namespace

void ParquetWriter::write_records(const std::vector<PeriodRecord>& records, const std::string& filepath) {
    if (records.empty()) {
        throw std::runtime_error("No period records to write to " + filepath);
    }

    auto schema = arrow::schema({
        arrow::field("scenario_id", arrow::utf8()),
        arrow::field("scenario_index", arrow::uint32()),
        arrow::field("period", arrow::int32()),
        arrow::field("year", arrow::int32()),
        arrow::field("quarter", arrow::int32()),
        arrow::field("trigger_year", arrow::int32()),
        arrow::field("stress_multiplier", arrow::float64()),
        arrow::field("period_losses", arrow::float64()),
        arrow::field("remaining_notional", arrow::float64()),
        arrow::field("tranche_exposure", arrow::float64()),
        arrow::field("principal_payment", arrow::float64()),
        arrow::field("coupon_payment", arrow::float64()),
        arrow::field("quarterly_cashflow", arrow::float64()),
        arrow::field("amortisation_regime", arrow::utf8()),
        arrow::field("cumulative_pnl", arrow::float64()),
        arrow::field("risk_adjusted_pnl", arrow::float64())
    });

    arrow::StringBuilder scenario_id_builder;
    arrow::UInt32Builder scenario_index_builder;
    arrow::Int32Builder period_builder;
    arrow::Int32Builder year_builder;
    arrow::Int32Builder quarter_builder;
    arrow::Int32Builder trigger_year_builder;
    arrow::DoubleBuilder stress_builder;
    arrow::DoubleBuilder losses_builder;
    arrow::DoubleBuilder notional_builder;
    arrow::DoubleBuilder exposure_builder;
    arrow::DoubleBuilder principal_builder;
    arrow::DoubleBuilder coupon_builder;
    arrow::DoubleBuilder cashflow_builder;
    arrow::StringBuilder regime_builder;
    arrow::DoubleBuilder pnl_builder;
    arrow::DoubleBuilder risk_adjusted_builder;

    const int64_t rows = static_cast<int64_t>(records.size());
    check(scenario_index_builder.Reserve(rows), "reserve scenario_index column");
    check(period_builder.Reserve(rows), "reserve period column");
    check(year_builder.Reserve(rows), "reserve year column");
    check(quarter_builder.Reserve(rows), "reserve quarter column");
    check(trigger_year_builder.Reserve(rows), "reserve trigger_year column");
    check(stress_builder.Reserve(rows), "reserve stress_multiplier column");
    check(losses_builder.Reserve(rows), "reserve period_losses column");
    check(notional_builder.Reserve(rows), "reserve remaining_notional column");
    check(exposure_builder.Reserve(rows), "reserve tranche_exposure column");
    check(principal_builder.Reserve(rows), "reserve principal_payment column");
    check(coupon_builder.Reserve(rows), "reserve coupon_payment column");
    check(cashflow_builder.Reserve(rows), "reserve quarterly_cashflow column");
    check(pnl_builder.Reserve(rows), "reserve cumulative_pnl column");
    check(risk_adjusted_builder.Reserve(rows), "reserve risk_adjusted_pnl column");

    for (const PeriodRecord& r : records) {
        check(scenario_id_builder.Append(r.scenario_id), "append scenario_id");
        check(scenario_index_builder.Append(static_cast<uint32_t>(r.scenario_index)), "append scenario_index");
        check(period_builder.Append(r.period), "append period");
        check(year_builder.Append(r.year), "append year");
        check(quarter_builder.Append(r.quarter), "append quarter");
        check(trigger_year_builder.Append(r.trigger_year), "append trigger_year");
        check(stress_builder.Append(r.stress_multiplier), "append stress_multiplier");
        check(losses_builder.Append(r.period_losses), "append period_losses");
        check(notional_builder.Append(r.remaining_notional), "append remaining_notional");
        check(exposure_builder.Append(r.tranche_exposure), "append tranche_exposure");
        check(principal_builder.Append(r.principal_payment), "append principal_payment");
        check(coupon_builder.Append(r.coupon_payment), "append coupon_payment");
        check(cashflow_builder.Append(r.quarterly_cashflow), "append quarterly_cashflow");
        check(regime_builder.Append(regime_to_string(r.amortisation_regime)), "append amortisation_regime");
        check(pnl_builder.Append(r.cumulative_pnl), "append cumulative_pnl");
        check(risk_adjusted_builder.Append(r.risk_adjusted_pnl), "append risk_adjusted_pnl");
    }

    auto table = arrow::Table::Make(schema, {
        finish(scenario_id_builder, "scenario_id"),
        finish(scenario_index_builder, "scenario_index"),
        finish(period_builder, "period"),
        finish(year_builder, "year"),
        finish(quarter_builder, "quarter"),
        finish(trigger_year_builder, "trigger_year"),
        finish(stress_builder, "stress_multiplier"),
        finish(losses_builder, "period_losses"),
        finish(notional_builder, "remaining_notional"),
        finish(exposure_builder, "tranche_exposure"),
        finish(principal_builder, "principal_payment"),
        finish(coupon_builder, "coupon_payment"),
        finish(cashflow_builder, "quarterly_cashflow"),
        finish(regime_builder, "amortisation_regime"),
        finish(pnl_builder, "cumulative_pnl"),
        finish(risk_adjusted_builder, "risk_adjusted_pnl")
    });

    std::shared_ptr<arrow::io::FileOutputStream> outfile;
    auto open_result = arrow::io::FileOutputStream::Open(filepath);
    if (!open_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - "
                                 + open_result.status().ToString());
    }
    outfile = *open_result;

    // One row group per 32k rows
    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 32 * 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

void ParquetWriter::write_records(const std::vector<PeriodRecord>& /* records */,
                                  const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace srtcalc
