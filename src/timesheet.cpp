#include "timesheet.hpp"
#include "io/csv_reader.hpp"
#include "normalizer.hpp"
#include <fstream>
#include <stdexcept>
#include <utility>

namespace payline {

const std::vector<std::string>& known_header_labels() {
    static const std::vector<std::string> labels = {
        columns::CANDIDATE_REF, columns::CLIENT_NAME, columns::JOB_TITLE,
        columns::FORENAME,      columns::SURNAME,     columns::WEEK_ENDING,
        columns::STD_HOURS,     columns::OT1_HOURS,   columns::STD_RATE,
        columns::OT1_RATE,      columns::EXPENSES,    columns::NET_PAY,
        columns::DATE_OF_BIRTH, columns::STD_HOURS_ALT, columns::OT1_HOURS_ALT,
        columns::STD_RATE_ALT
    };
    return labels;
}

TimesheetRecord::TimesheetRecord() : source_row(0) {}

TimesheetRecord TimesheetRecord::from_row(const HeaderIndex& header,
                                          const std::vector<std::string>& row,
                                          size_t source_row) {
    TimesheetRecord r;
    r.source_row = source_row;
    r.employee_ref = header.get(row, columns::CANDIDATE_REF);
    r.client_name = header.get(row, columns::CLIENT_NAME);
    r.job_title = header.get(row, columns::JOB_TITLE);
    r.first_name = header.get(row, columns::FORENAME);
    r.last_name = header.get(row, columns::SURNAME);
    r.week_ending = header.get(row, columns::WEEK_ENDING);
    r.date_of_birth = header.get(row, columns::DATE_OF_BIRTH);

    r.standard_hours = parse_decimal(header.first_of(row, {columns::STD_HOURS, columns::STD_HOURS_ALT}));
    r.overtime_hours = parse_decimal(header.first_of(row, {columns::OT1_HOURS, columns::OT1_HOURS_ALT}));
    r.standard_rate = parse_decimal(header.first_of(row, {columns::STD_RATE, columns::STD_RATE_ALT}));
    r.overtime_rate = parse_decimal(header.get(row, columns::OT1_RATE));
    r.expenses = parse_decimal(header.get(row, columns::EXPENSES));
    r.net_pay = parse_decimal(header.get(row, columns::NET_PAY));
    return r;
}

void TimesheetSet::add(const TimesheetRecord& record) {
    records_.push_back(record);
}

void TimesheetSet::add(TimesheetRecord&& record) {
    records_.push_back(std::move(record));
}

const TimesheetRecord& TimesheetSet::get(size_t index) const {
    if (index >= records_.size()) {
        throw std::out_of_range("Timesheet record index out of range");
    }
    return records_[index];
}

size_t TimesheetSet::size() const {
    return records_.size();
}

bool TimesheetSet::empty() const {
    return records_.empty();
}

void TimesheetSet::reserve(size_t count) {
    records_.reserve(count);
}

void TimesheetSet::clear() {
    records_.clear();
}

TimesheetSet TimesheetSet::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return load_from_csv(file);
}

TimesheetSet TimesheetSet::load_from_csv(std::istream& is) {
    TimesheetSet ts;
    CsvReader reader(is);

    auto header_row = reader.read_row();
    if (CsvReader::is_blank(header_row)) {
        throw CsvFormatError("Timesheet CSV has no header row");
    }

    HeaderIndex header(header_row);
    for (const char* required : {columns::CANDIDATE_REF, columns::WEEK_ENDING}) {
        if (!header.has(required)) {
            throw CsvFormatError(std::string("Timesheet CSV missing required column: ") + required);
        }
    }

    // Data rows are numbered from 2, counting only non-blank rows
    size_t source_row = 2;
    while (reader.has_more()) {
        auto row = reader.read_row();
        if (CsvReader::is_blank(row)) {
            continue;
        }
        ts.add(TimesheetRecord::from_row(header, row, source_row++));
    }

    return ts;
}

} // namespace payline
