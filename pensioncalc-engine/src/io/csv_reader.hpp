#ifndef PENSIONCALC_CSV_READER_HPP
#define PENSIONCALC_CSV_READER_HPP

#include <istream>
#include <map>
#include <string>
#include <vector>

namespace pensioncalc {

// Minimal delimiter-separated reader for life tables.
// Cells are trimmed; lines starting with '#' are skipped.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more();

    // Reads one row and maps each lower-cased column name to its index
    std::map<std::string, size_t> read_header();

private:
    std::istream& is_;
    char delimiter_;

    void skip_comments();
    static std::string trim(const std::string& s);
};

} // namespace pensioncalc

#endif // PENSIONCALC_CSV_READER_HPP
