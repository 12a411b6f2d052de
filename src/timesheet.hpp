#ifndef PAYLINE_TIMESHEET_HPP
#define PAYLINE_TIMESHEET_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <vector>
#include "decimal.hpp"

namespace payline {

class HeaderIndex;

// Source column names. Numeric fields list their alternates in lookup order.
namespace columns {
constexpr const char* CANDIDATE_REF = "Candidate RefNo";
constexpr const char* CLIENT_NAME = "Client Name";
constexpr const char* JOB_TITLE = "Contract JobTitle";
constexpr const char* FORENAME = "Candidate Forename";
constexpr const char* SURNAME = "Candidate Surname";
constexpr const char* WEEK_ENDING = "Weekending";
constexpr const char* STD_HOURS = "Std1 Hrs";
constexpr const char* STD_HOURS_ALT = "Std Hrs";
constexpr const char* OT1_HOURS = "OT1 Hrs";
constexpr const char* OT1_HOURS_ALT = "OT1 HR";
constexpr const char* STD_RATE = "Std Rate";
constexpr const char* STD_RATE_ALT = "Rate";
constexpr const char* OT1_RATE = "OT1 Rate";
constexpr const char* EXPENSES = "Expenses";
constexpr const char* NET_PAY = "Net Pay";
constexpr const char* DATE_OF_BIRTH = "Candidate DOB";
} // namespace columns

// Every recognised input column name, primary names first
const std::vector<std::string>& known_header_labels();

// One timesheet row (candidate / contract / week)
struct TimesheetRecord {
    size_t source_row;              // 1-based table row, header is row 1
    std::string employee_ref;
    std::string client_name;
    std::string job_title;
    std::string first_name;
    std::string last_name;
    std::string week_ending;        // as written in the source
    std::string date_of_birth;      // as written in the source
    Decimal standard_hours;
    Decimal overtime_hours;
    Decimal standard_rate;
    Decimal overtime_rate;
    Decimal expenses;               // signed
    Decimal net_pay;                // informational only

    TimesheetRecord();

    // Build from one table row. Numeric cells that do not parse become 0.
    static TimesheetRecord from_row(const HeaderIndex& header,
                                    const std::vector<std::string>& row,
                                    size_t source_row);
};

class TimesheetSet {
public:
    void add(const TimesheetRecord& record);
    void add(TimesheetRecord&& record);

    const TimesheetRecord& get(size_t index) const;
    size_t size() const;
    bool empty() const;

    const std::vector<TimesheetRecord>& records() const { return records_; }

    void reserve(size_t count);
    void clear();

    // Throws CsvFormatError when the header row is missing or lacks
    // Candidate RefNo / Weekending. Blank rows are ignored.
    static TimesheetSet load_from_csv(const std::string& filepath);
    static TimesheetSet load_from_csv(std::istream& is);

private:
    std::vector<TimesheetRecord> records_;
};

} // namespace payline

#endif // PAYLINE_TIMESHEET_HPP
