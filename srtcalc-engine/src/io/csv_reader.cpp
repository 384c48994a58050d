#include "csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace srtcalc {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter), line_number_(0) {}

std::vector<std::string> CsvReader::read_row() {
    std::vector<std::string> row;

    skip_ignorable_lines();

    std::string line;
    if (!std::getline(is_, line)) {
        return row;
    }
    ++line_number_;

    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, delimiter_)) {
        row.push_back(trim(cell));
    }

    return row;
}

bool CsvReader::has_more() {
    skip_ignorable_lines();
    return is_.good() && is_.peek() != EOF;
}

void CsvReader::skip_ignorable_lines() {
    while (is_.good() && is_.peek() != EOF) {
        std::streampos start = is_.tellg();
        std::string line;
        if (!std::getline(is_, line)) {
            return;
        }
        std::string trimmed = trim(line);
        if (!trimmed.empty() && trimmed[0] != '#') {
            // Not ignorable: rewind so read_row() sees it
            is_.clear();
            is_.seekg(start);
            return;
        }
        ++line_number_;
    }
}

std::string CsvReader::trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

} // namespace srtcalc
