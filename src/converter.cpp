#include "converter.hpp"
#include "normalizer.hpp"
#include <algorithm>
#include <chrono>
#include <utility>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace payline {

namespace {

bool is_header_label(const std::string& value) {
    const std::string lowered = to_lower(value);
    const auto& labels = known_header_labels();
    return std::any_of(labels.begin(), labels.end(), [&](const std::string& label) {
        return to_lower(label) == lowered;
    });
}

LineItem make_line(const TimesheetRecord& record, Category category, Unit unit,
                   const Decimal& amount, const Decimal& rate) {
    LineItem item;
    item.employee_id = normalize_spaces(record.employee_ref);
    item.first_name = normalize_spaces(record.first_name);
    item.surname = normalize_spaces(record.last_name);
    item.description = format_description(category_label(category),
                                          record.client_name, record.job_title);
    item.amount = amount;
    item.rate = rate;
    item.week_ending = parse_week_ending(record.week_ending);
    item.unit = unit;
    item.category = category;
    return item;
}

} // anonymous namespace

ConversionConfig::ConversionConfig()
    : emit_negative_expenses(true) {}

std::string skip_reason(const TimesheetRecord& record) {
    const std::string employee_ref = normalize_spaces(record.employee_ref);

    if (employee_ref.empty()) {
        return "missing employee reference";
    }
    if (normalize_spaces(record.first_name).empty()) {
        return "missing forename";
    }
    if (normalize_spaces(record.last_name).empty()) {
        return "missing surname";
    }
    if (parse_week_ending(record.week_ending).empty()) {
        return "missing week ending";
    }
    // A header row repeated inside the data
    if (is_header_label(employee_ref)) {
        return "header row in data";
    }
    return std::string();
}

bool is_valid_record(const TimesheetRecord& record) {
    return skip_reason(record).empty();
}

std::vector<LineItem> convert(const TimesheetRecord& record, const ConversionConfig& config) {
    std::vector<LineItem> lines;
    if (!is_valid_record(record)) {
        return lines;
    }

    bool emit_expenses = config.emit_negative_expenses
        ? !record.expenses.is_zero()
        : record.expenses.is_positive();
    if (emit_expenses) {
        lines.push_back(make_line(record, Category::Expenses, Unit::Expense,
                                  Decimal(1), record.expenses));
    }

    if (!record.standard_hours.is_zero() && !record.standard_rate.is_zero()) {
        lines.push_back(make_line(record, Category::StdHrs, Unit::Hours,
                                  record.standard_hours, record.standard_rate));
    }

    if (!record.overtime_hours.is_zero() && !record.overtime_rate.is_zero()) {
        lines.push_back(make_line(record, Category::OT1Hrs, Unit::Hours,
                                  record.overtime_hours, record.overtime_rate));
    }

    return lines;
}

std::vector<LineItem> convert_all(const std::vector<TimesheetRecord>& records,
                                  const ConversionConfig& config) {
    // One slot per record so the parallel path keeps record order
    std::vector<std::vector<LineItem>> per_record(records.size());

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic, 256)
    for (long long i = 0; i < static_cast<long long>(records.size()); ++i) {
        per_record[static_cast<size_t>(i)] = convert(records[static_cast<size_t>(i)], config);
    }
#else
    for (size_t i = 0; i < records.size(); ++i) {
        per_record[i] = convert(records[i], config);
    }
#endif

    std::vector<LineItem> lines;
    for (auto& record_lines : per_record) {
        for (auto& line : record_lines) {
            lines.push_back(std::move(line));
        }
    }
    return lines;
}

std::vector<LineItem> convert_all(const TimesheetSet& records, const ConversionConfig& config) {
    return convert_all(records.records(), config);
}

ConversionResult::ConversionResult()
    : records_read(0), execution_time_ms(0.0) {}

ConversionResult run_conversion(const TimesheetSet& records, const ConversionConfig& config) {
    auto start = std::chrono::high_resolution_clock::now();

    ConversionResult result;
    result.records_read = records.size();
    result.lines = convert_all(records, config);

    for (const auto& record : records.records()) {
        std::string reason = skip_reason(record);
        if (!reason.empty()) {
            result.skipped.push_back(SkippedRecord{record.source_row, record.employee_ref, reason});
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return result;
}

} // namespace payline
