#ifndef POOLRISK_IO_CSV_READER_HPP
#define POOLRISK_IO_CSV_READER_HPP

#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace poolrisk {
namespace io {

// Minimal RFC 4180 reader: quoted fields, doubled quotes, CRLF line endings.
// Cells are whitespace-trimmed; quoted newlines are not supported.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more() const;

    // First non-blank row; empty only when the input has no such row
    std::vector<std::string> read_header();

    // 1-based line number of the last row returned
    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    std::vector<std::string> split(const std::string& line) const;
    static std::string trim(const std::string& s);
};

// Case-insensitive lookup of a header column, nullopt if absent
std::optional<size_t> find_column(const std::vector<std::string>& header,
                                  const std::string& name);

std::string to_lower(std::string s);

} // namespace io
} // namespace poolrisk

#endif // POOLRISK_IO_CSV_READER_HPP
