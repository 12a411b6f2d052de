#include "parquet_writer.hpp"
#include <memory>
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace payline {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

} // anonymous namespace

bool ParquetWriter::available() {
    return true;
}

void ParquetWriter::write_line_items(const std::vector<LineItem>& items, const std::string& filepath) {
    constexpr size_t column_count = OUTPUT_COLUMNS.size();

    // Build Arrow schema
    arrow::FieldVector fields;
    for (const char* name : OUTPUT_COLUMNS) {
        fields.push_back(arrow::field(name, arrow::utf8()));
    }
    auto schema = arrow::schema(fields);

    // One string builder per output column
    std::vector<std::unique_ptr<arrow::StringBuilder>> builders;
    for (size_t c = 0; c < column_count; ++c) {
        builders.push_back(std::make_unique<arrow::StringBuilder>());
        check(builders[c]->Reserve(static_cast<int64_t>(items.size())),
              std::string("reserve memory for ") + OUTPUT_COLUMNS[c] + " column");
    }

    for (const auto& item : items) {
        auto row = to_row(item);
        for (size_t c = 0; c < column_count; ++c) {
            check(builders[c]->Append(row[c]), std::string("append ") + OUTPUT_COLUMNS[c]);
        }
    }

    std::vector<std::shared_ptr<arrow::Array>> arrays(column_count);
    for (size_t c = 0; c < column_count; ++c) {
        check(builders[c]->Finish(&arrays[c]),
              std::string("finish ") + OUTPUT_COLUMNS[c] + " array");
    }

    // Create Arrow table
    auto table = arrow::Table::Make(schema, arrays);

    // Open output file
    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    // Write Parquet file
    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "write Parquet table");

    check(outfile->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

bool ParquetWriter::available() {
    return false;
}

void ParquetWriter::write_line_items(const std::vector<LineItem>& /* items */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace payline
