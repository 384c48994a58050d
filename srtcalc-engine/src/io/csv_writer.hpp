#ifndef SRTCALC_IO_CSV_WRITER_HPP
#define SRTCALC_IO_CSV_WRITER_HPP

#include <ostream>
#include <string>
#include <vector>
#include "../projection.hpp"

namespace srtcalc {
namespace io {

// Column names of the period-record table, in output order
const std::vector<std::string>& period_record_columns();

// Write period records as CSV with a header row
void write_records_csv(std::ostream& os, const std::vector<PeriodRecord>& records);

void write_records_csv(const std::string& filepath, const std::vector<PeriodRecord>& records);

} // namespace io
} // namespace srtcalc

#endif // SRTCALC_IO_CSV_WRITER_HPP
