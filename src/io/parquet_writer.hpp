#ifndef PAYLINE_PARQUET_WRITER_HPP
#define PAYLINE_PARQUET_WRITER_HPP

#include "../line_item.hpp"
#include <string>
#include <vector>

namespace payline {

class ParquetWriter {
public:
    /**
     * Write line items to a Parquet file.
     *
     * Output schema (all utf8, same text as the CSV output):
     *   employeeid, firstname, surname, description,
     *   amount, rate, weekending, unit
     *
     * @param items Line items in output order
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if file cannot be written, or when built without Arrow
     */
    static void write_line_items(const std::vector<LineItem>& items, const std::string& filepath);

    // True when this build links Apache Arrow
    static bool available();
};

} // namespace payline

#endif // PAYLINE_PARQUET_WRITER_HPP
