#ifndef SRTCALC_CSV_READER_HPP
#define SRTCALC_CSV_READER_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace srtcalc {

// Line-oriented CSV reader for the small input tables (rate curves, scenario lists).
// Blank lines and lines starting with '#' are skipped.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    // Next non-blank, non-comment row; empty when the stream is exhausted
    std::vector<std::string> read_row();
    bool has_more();

    // 1-based line number of the last row returned by read_row()
    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    void skip_ignorable_lines();
    static std::string trim(const std::string& s);
};

} // namespace srtcalc

#endif // SRTCALC_CSV_READER_HPP
