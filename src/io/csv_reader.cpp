#include "csv_reader.hpp"
#include <algorithm>
#include <cctype>

namespace poolrisk {
namespace io {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter), line_number_(0) {}

std::vector<std::string> CsvReader::read_row() {
    std::string line;

    if (!std::getline(is_, line)) {
        return {};
    }
    ++line_number_;

    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    // UTF-8 byte order mark on the first line
    if (line_number_ == 1 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        line.erase(0, 3);
    }

    return split(line);
}

bool CsvReader::has_more() const {
    return is_.good() && is_.peek() != EOF;
}

std::vector<std::string> CsvReader::read_header() {
    std::vector<std::string> row;
    while (row.empty() && has_more()) {
        row = read_row();
    }
    return row;
}

std::vector<std::string> CsvReader::split(const std::string& line) const {
    std::vector<std::string> row;
    std::string cell;
    bool in_quotes = false;
    bool was_quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cell += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                cell += c;
            }
        } else if (c == '"') {
            in_quotes = true;
            was_quoted = true;
        } else if (c == delimiter_) {
            row.push_back(was_quoted ? cell : trim(cell));
            cell.clear();
            was_quoted = false;
        } else {
            cell += c;
        }
    }
    row.push_back(was_quoted ? cell : trim(cell));

    // A blank line is reported as an empty row
    if (row.size() == 1 && row[0].empty() && !was_quoted) {
        row.clear();
    }
    return row;
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

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

std::optional<size_t> find_column(const std::vector<std::string>& header,
                                  const std::string& name) {
    const std::string wanted = to_lower(name);
    for (size_t i = 0; i < header.size(); ++i) {
        if (to_lower(header[i]) == wanted) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace io
} // namespace poolrisk
