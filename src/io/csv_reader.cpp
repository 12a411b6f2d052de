#include "csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <ostream>

namespace payline {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter), at_start_(true) {}

void CsvReader::skip_bom() {
    at_start_ = false;
    static const char bom[] = {'\xEF', '\xBB', '\xBF'};

    for (size_t i = 0; i < sizeof(bom); ++i) {
        if (is_.peek() != static_cast<unsigned char>(bom[i])) {
            // Partial BOM: put back what was consumed
            for (size_t j = i; j > 0; --j) {
                is_.unget();
            }
            return;
        }
        is_.get();
    }
}

std::vector<std::string> CsvReader::read_row() {
    if (at_start_) {
        skip_bom();
    }

    std::vector<std::string> row;
    if (is_.peek() == EOF) {
        return row;
    }

    std::string cell;
    bool in_quotes = false;
    int c;

    while ((c = is_.get()) != EOF) {
        char ch = static_cast<char>(c);

        if (in_quotes) {
            if (ch == '"') {
                if (is_.peek() == '"') {
                    cell.push_back('"');
                    is_.get();
                } else {
                    in_quotes = false;
                }
            } else {
                cell.push_back(ch);
            }
            continue;
        }

        if (ch == '"') {
            in_quotes = true;
        } else if (ch == delimiter_) {
            row.push_back(trim(cell));
            cell.clear();
        } else if (ch == '\n') {
            break;
        } else if (ch == '\r') {
            if (is_.peek() == '\n') {
                is_.get();
            }
            break;
        } else {
            cell.push_back(ch);
        }
    }

    row.push_back(trim(cell));
    return row;
}

bool CsvReader::has_more() const {
    return is_.good() && is_.peek() != EOF;
}

bool CsvReader::is_blank(const std::vector<std::string>& row) {
    return std::all_of(row.begin(), row.end(), [](const std::string& cell) {
        return cell.empty();
    });
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

HeaderIndex::HeaderIndex(const std::vector<std::string>& header) {
    for (size_t i = 0; i < header.size(); ++i) {
        // Duplicate headers: the first occurrence wins
        positions_.emplace(header[i], i);
    }
}

bool HeaderIndex::has(const std::string& column) const {
    return positions_.count(column) > 0;
}

std::string HeaderIndex::get(const std::vector<std::string>& row, const std::string& column) const {
    auto it = positions_.find(column);
    if (it == positions_.end() || it->second >= row.size()) {
        return std::string();
    }
    return row[it->second];
}

std::string HeaderIndex::first_of(const std::vector<std::string>& row,
                                  std::initializer_list<const char*> columns) const {
    for (const char* column : columns) {
        std::string value = get(row, column);
        if (!value.empty()) {
            return value;
        }
    }
    return std::string();
}

CsvWriter::CsvWriter(std::ostream& os, char delimiter)
    : os_(os), delimiter_(delimiter) {}

void CsvWriter::write_row(const std::vector<std::string>& fields) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            os_ << delimiter_;
        }
        os_ << quote(fields[i], delimiter_);
    }
    os_ << '\n';
}

std::string CsvWriter::quote(const std::string& field, char delimiter) {
    bool needs_quotes = field.find_first_of(std::string(1, delimiter) + "\"\r\n") != std::string::npos;
    if (!needs_quotes) {
        return field;
    }

    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

} // namespace payline
