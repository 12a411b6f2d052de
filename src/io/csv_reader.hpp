#ifndef PAYLINE_CSV_READER_HPP
#define PAYLINE_CSV_READER_HPP

#include <initializer_list>
#include <istream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace payline {

// Thrown for tables that cannot be used at all (no header, required column missing)
class CsvFormatError : public std::runtime_error {
public:
    explicit CsvFormatError(const std::string& message)
        : std::runtime_error(message) {}
};

// RFC 4180 style reader: double-quoted fields may hold the delimiter,
// doubled quotes and line breaks. A UTF-8 byte-order mark at the start of
// the stream is skipped. Cells are trimmed.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more() const;

    // True for a row with no cells or only empty cells
    static bool is_blank(const std::vector<std::string>& row);

private:
    std::istream& is_;
    char delimiter_;
    bool at_start_;

    void skip_bom();
    static std::string trim(const std::string& s);
};

// Column lookup by header name for rows read by CsvReader
class HeaderIndex {
public:
    explicit HeaderIndex(const std::vector<std::string>& header);

    bool has(const std::string& column) const;

    // Cell under the named column; empty if the column or cell is absent
    std::string get(const std::vector<std::string>& row, const std::string& column) const;

    // First listed column that is present with a non-empty cell
    std::string first_of(const std::vector<std::string>& row,
                         std::initializer_list<const char*> columns) const;

private:
    std::map<std::string, size_t> positions_;
};

// Writes rows, quoting only fields that need it
class CsvWriter {
public:
    explicit CsvWriter(std::ostream& os, char delimiter = ',');

    void write_row(const std::vector<std::string>& fields);

    static std::string quote(const std::string& field, char delimiter = ',');

private:
    std::ostream& os_;
    char delimiter_;
};

} // namespace payline

#endif // PAYLINE_CSV_READER_HPP
