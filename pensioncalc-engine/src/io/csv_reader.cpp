#include "csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace pensioncalc {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter) {}

std::vector<std::string> CsvReader::read_row() {
    std::vector<std::string> row;
    skip_comments();

    std::string line;
    if (!std::getline(is_, line)) {
        return row;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (trim(line).empty()) {
        return row;
    }

    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, delimiter_)) {
        row.push_back(trim(cell));
    }
    return row;
}

bool CsvReader::has_more() {
    skip_comments();
    return is_.good() && is_.peek() != EOF;
}

std::map<std::string, size_t> CsvReader::read_header() {
    std::map<std::string, size_t> columns;
    auto row = read_row();
    for (size_t i = 0; i < row.size(); ++i) {
        std::string name = row[i];
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        columns[name] = i;
    }
    return columns;
}

void CsvReader::skip_comments() {
    while (is_.good() && is_.peek() == '#') {
        std::string ignored;
        std::getline(is_, ignored);
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

} // namespace pensioncalc
