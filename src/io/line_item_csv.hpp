#ifndef PAYLINE_IO_LINE_ITEM_CSV_HPP
#define PAYLINE_IO_LINE_ITEM_CSV_HPP

#include <istream>
#include <ostream>
#include <string>
#include <vector>
#include "../line_item.hpp"

namespace payline {
namespace io {

// Header row then one row per item, columns in OUTPUT_COLUMNS order
void write_line_items_csv(std::ostream& os, const std::vector<LineItem>& items);
void write_line_items_csv(const std::string& filepath, const std::vector<LineItem>& items);

// Read line items produced by any converter. Columns are found by header
// name; employeeid, description and weekending are required. Category comes
// from the description prefix. Unparseable numbers read as 0, and a missing
// or unrecognised unit falls back to the category's natural unit.
std::vector<LineItem> read_line_items_csv(std::istream& is);
std::vector<LineItem> read_line_items_csv(const std::string& filepath);

} // namespace io
} // namespace payline

#endif // PAYLINE_IO_LINE_ITEM_CSV_HPP
