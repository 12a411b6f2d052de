#ifndef PAYLINE_CONVERTER_HPP
#define PAYLINE_CONVERTER_HPP

#include <string>
#include <vector>
#include "line_item.hpp"
#include "timesheet.hpp"

namespace payline {

// Rule switches for the conversion engine
struct ConversionConfig {
    // Emit an expense line for a negative expense value.
    // When false only strictly positive expenses produce a line.
    bool emit_negative_expenses;

    ConversionConfig();
};

// Why a record is skipped; empty when it converts
std::string skip_reason(const TimesheetRecord& record);

bool is_valid_record(const TimesheetRecord& record);

// One record to its line items, in order: Expenses, Std Hrs, OT1 Hrs.
// Each line needs its own driving values to be non-zero:
//   Expenses: expenses != 0            amount = 1, rate = expenses
//   Std Hrs:  std hours and std rate   amount = hours, rate = rate
//   OT1 Hrs:  OT1 hours and OT1 rate   amount = hours, rate = rate
// Invalid records produce nothing. Never throws on bad data.
std::vector<LineItem> convert(const TimesheetRecord& record,
                              const ConversionConfig& config = ConversionConfig());

// Flattened conversion of a record sequence, record order preserved
std::vector<LineItem> convert_all(const std::vector<TimesheetRecord>& records,
                                  const ConversionConfig& config = ConversionConfig());

std::vector<LineItem> convert_all(const TimesheetSet& records,
                                  const ConversionConfig& config = ConversionConfig());

struct SkippedRecord {
    size_t source_row;
    std::string employee_ref;
    std::string reason;
};

// Conversion of a whole set with bookkeeping for reporting
struct ConversionResult {
    std::vector<LineItem> lines;
    std::vector<SkippedRecord> skipped;
    size_t records_read;
    double execution_time_ms;

    ConversionResult();
};

ConversionResult run_conversion(const TimesheetSet& records,
                                const ConversionConfig& config = ConversionConfig());

} // namespace payline

#endif // PAYLINE_CONVERTER_HPP
