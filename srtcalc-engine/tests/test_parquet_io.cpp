#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <filesystem>
#include "io/parquet_writer.hpp"
#include "stress_analysis.hpp"
#include "test_fixtures.hpp"

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#endif

using namespace srtcalc;

#ifdef HAVE_ARROW

TEST_CASE("Parquet I/O - period records round-trip", "[parquet][io]") {
    srtcalc::testing::silence_logger();
    StressAnalysisResult result = run_stress_analysis(
        srtcalc::testing::make_reference_deal(), ScenarioSet::paired({1.0, 2.5}, {4, 7}));

    std::filesystem::path path = std::filesystem::temp_directory_path() / "srtcalc_test_records.parquet";
    ParquetWriter::write_records(result.records(), path.string());
    REQUIRE(std::filesystem::exists(path));

    auto open_result = arrow::io::ReadableFile::Open(path.string());
    REQUIRE(open_result.ok());
    std::shared_ptr<arrow::io::ReadableFile> infile = *open_result;

    std::unique_ptr<parquet::arrow::FileReader> reader;
    REQUIRE(parquet::arrow::OpenFile(infile, arrow::default_memory_pool(), &reader).ok());

    std::shared_ptr<arrow::Table> table;
    REQUIRE(reader->ReadTable(&table).ok());

    REQUIRE(table->num_rows() == 64);
    REQUIRE(table->num_columns() == 16);
    REQUIRE(table->schema()->field(0)->name() == "scenario_id");
    REQUIRE(table->schema()->GetFieldIndex("risk_adjusted_pnl") == 15);

    auto pnl = std::static_pointer_cast<arrow::DoubleArray>(
        table->GetColumnByName("cumulative_pnl")->chunk(0));
    REQUIRE(pnl->Value(0) == result.records()[0].cumulative_pnl);

    auto regime = std::static_pointer_cast<arrow::StringArray>(
        table->GetColumnByName("amortisation_regime")->chunk(0));
    REQUIRE(regime->GetString(12) == "Sequential");

    std::filesystem::remove(path);
}

TEST_CASE("Parquet I/O - empty record set is rejected", "[parquet][io][error]") {
    REQUIRE_THROWS_WITH(
        ParquetWriter::write_records({}, "empty.parquet"),
        Catch::Matchers::ContainsSubstring("No period records")
    );
}

#else // !HAVE_ARROW

TEST_CASE("Parquet I/O - Not available without Arrow", "[parquet]") {
    srtcalc::testing::silence_logger();
    StressAnalysisResult result = run_stress_analysis(
        srtcalc::testing::make_reference_deal(), ScenarioSet::paired({1.0}, {4}));

    REQUIRE_THROWS_WITH(
        ParquetWriter::write_records(result.records(), "records.parquet"),
        Catch::Matchers::ContainsSubstring("Apache Arrow not available")
    );
}

#endif // HAVE_ARROW
