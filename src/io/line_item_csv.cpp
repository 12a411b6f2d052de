#include "line_item_csv.hpp"
#include "csv_reader.hpp"
#include "../normalizer.hpp"
#include <fstream>
#include <stdexcept>
#include <utility>

namespace payline {
namespace io {

void write_line_items_csv(std::ostream& os, const std::vector<LineItem>& items) {
    CsvWriter writer(os);
    writer.write_row(std::vector<std::string>(OUTPUT_COLUMNS.begin(), OUTPUT_COLUMNS.end()));
    for (const auto& item : items) {
        writer.write_row(to_row(item));
    }
}

void write_line_items_csv(const std::string& filepath, const std::vector<LineItem>& items) {
    std::ofstream file(filepath, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_line_items_csv(file, items);
    file.flush();
    if (!file) {
        throw std::runtime_error("Failed to write output file: " + filepath);
    }
}

std::vector<LineItem> read_line_items_csv(std::istream& is) {
    std::vector<LineItem> items;
    CsvReader reader(is);

    auto header_row = reader.read_row();
    if (CsvReader::is_blank(header_row)) {
        throw CsvFormatError("Line item CSV has no header row");
    }

    HeaderIndex header(header_row);
    for (const char* required : {"employeeid", "description", "weekending"}) {
        if (!header.has(required)) {
            throw CsvFormatError(std::string("Line item CSV missing required column: ") + required);
        }
    }

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (CsvReader::is_blank(row)) {
            continue;
        }

        LineItem item;
        item.employee_id = header.get(row, "employeeid");
        item.first_name = header.get(row, "firstname");
        item.surname = header.get(row, "surname");
        item.description = header.get(row, "description");
        item.amount = parse_decimal(header.get(row, "amount"));
        item.rate = parse_decimal(header.get(row, "rate"));
        item.week_ending = header.get(row, "weekending");
        item.category = category_from_description(item.description);

        if (!parse_unit(header.get(row, "unit"), item.unit)) {
            item.unit = item.category == Category::Expenses ? Unit::Expense : Unit::Hours;
        }

        items.push_back(std::move(item));
    }

    return items;
}

std::vector<LineItem> read_line_items_csv(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return read_line_items_csv(file);
}

} // namespace io
} // namespace payline
