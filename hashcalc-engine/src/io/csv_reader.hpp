#ifndef HASHCALC_CSV_READER_HPP
#define HASHCALC_CSV_READER_HPP

#include <istream>
#include <map>
#include <string>
#include <vector>

namespace hashcalc {

// Line-oriented CSV reader for history and ops files.
// Cells are trimmed; double-quoted cells may contain the delimiter;
// lines starting with '#' are skipped.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more();

    // Read the first row as a header and map column name -> index
    std::map<std::string, size_t> read_header();

private:
    std::istream& is_;
    char delimiter_;

    std::vector<std::string> split(const std::string& line) const;
    static std::string trim(const std::string& s);
};

} // namespace hashcalc

#endif // HASHCALC_CSV_READER_HPP
