#ifndef SRTCALC_IO_JSON_WRITER_HPP
#define SRTCALC_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../stress_analysis.hpp"

namespace srtcalc {
namespace io {

// Write a stress run to JSON.
// The output holds run metadata, per-scenario summaries, failures, the full record
// table and, when time_series_trigger_year > 0, the PnL time series for that trigger year.
void write_stress_result_json(std::ostream& os, const StressAnalysisResult& result,
                              int time_series_trigger_year = 0,
                              bool pretty_print = true);

// Write a stress run to a JSON file
void write_stress_result_json(const std::string& filepath, const StressAnalysisResult& result,
                              int time_series_trigger_year = 0,
                              bool pretty_print = true);

} // namespace io
} // namespace srtcalc

#endif // SRTCALC_IO_JSON_WRITER_HPP
