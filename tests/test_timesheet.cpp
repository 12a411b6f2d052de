#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <stdexcept>
#include "timesheet.hpp"
#include "io/csv_reader.hpp"

using namespace payline;

namespace {

const char* HEADER =
    "Candidate RefNo,Client Name,Contract JobTitle,Candidate Forename,Candidate Surname,"
    "Weekending,Std1 Hrs,OT1 Hrs,Std Rate,OT1 Rate,Expenses,Net Pay,Candidate DOB\n";

} // anonymous namespace

TEST_CASE("TimesheetSet loads records from CSV", "[timesheet]") {
    std::istringstream is(std::string(HEADER) +
        "C001,Acme Ltd,Driver,Jane,Smith,05/03/25,37.5,2,12,18,\"1,025.50\",475.5,14/07/1990\n");

    TimesheetSet ts = TimesheetSet::load_from_csv(is);
    REQUIRE(ts.size() == 1);

    const TimesheetRecord& r = ts.get(0);
    REQUIRE(r.source_row == 2);
    REQUIRE(r.employee_ref == "C001");
    REQUIRE(r.client_name == "Acme Ltd");
    REQUIRE(r.job_title == "Driver");
    REQUIRE(r.first_name == "Jane");
    REQUIRE(r.last_name == "Smith");
    REQUIRE(r.week_ending == "05/03/25");
    REQUIRE(r.date_of_birth == "14/07/1990");
    REQUIRE(r.standard_hours.to_string() == "37.5");
    REQUIRE(r.overtime_hours == Decimal(2));
    REQUIRE(r.standard_rate == Decimal(12));
    REQUIRE(r.overtime_rate == Decimal(18));
    REQUIRE(r.expenses.to_string() == "1025.5");
    REQUIRE(r.net_pay.to_string() == "475.5");
}

TEST_CASE("TimesheetRecord falls back to alternate columns", "[timesheet]") {
    std::istringstream is(
        "Candidate RefNo,Candidate Forename,Candidate Surname,Weekending,Std Hrs,OT1 HR,Rate,OT1 Rate\n"
        "C002,John,Doe,2025-03-05,40,3,11.5,17\n");

    TimesheetSet ts = TimesheetSet::load_from_csv(is);
    const TimesheetRecord& r = ts.get(0);
    REQUIRE(r.standard_hours == Decimal(40));
    REQUIRE(r.overtime_hours == Decimal(3));
    REQUIRE(r.standard_rate.to_string() == "11.5");
    REQUIRE(r.overtime_rate == Decimal(17));
    REQUIRE(r.expenses.is_zero());
}

TEST_CASE("TimesheetRecord prefers the primary column when both are present", "[timesheet]") {
    std::istringstream is(
        "Candidate RefNo,Weekending,Std1 Hrs,Std Hrs,Std Rate,Rate\n"
        "C1,2025-03-05,10,99,12,99\n"
        "C2,2025-03-05,,20,,13\n");

    TimesheetSet ts = TimesheetSet::load_from_csv(is);
    REQUIRE(ts.get(0).standard_hours == Decimal(10));
    REQUIRE(ts.get(0).standard_rate == Decimal(12));
    REQUIRE(ts.get(1).standard_hours == Decimal(20));
    REQUIRE(ts.get(1).standard_rate == Decimal(13));
}

TEST_CASE("TimesheetRecord degrades unparseable numbers to zero", "[timesheet]") {
    std::istringstream is(std::string(HEADER) +
        "C001,Acme,Driver,Jane,Smith,05/03/25,n/a,,abc,?,,,\n");

    TimesheetSet ts = TimesheetSet::load_from_csv(is);
    const TimesheetRecord& r = ts.get(0);
    REQUIRE(r.standard_hours.is_zero());
    REQUIRE(r.overtime_hours.is_zero());
    REQUIRE(r.standard_rate.is_zero());
    REQUIRE(r.overtime_rate.is_zero());
    REQUIRE(r.expenses.is_zero());
}

TEST_CASE("TimesheetSet skips blank rows and numbers the rest", "[timesheet]") {
    std::istringstream is(std::string(HEADER) +
        "C001,Acme,Driver,Jane,Smith,05/03/25,1,0,1,0,0,0,\n"
        "\n"
        ",,,,,,,,,,,,\n"
        "C002,Acme,Driver,John,Doe,05/03/25,1,0,1,0,0,0,\n");

    TimesheetSet ts = TimesheetSet::load_from_csv(is);
    REQUIRE(ts.size() == 2);
    REQUIRE(ts.get(0).source_row == 2);
    REQUIRE(ts.get(1).source_row == 3);
    REQUIRE(ts.get(1).employee_ref == "C002");
}

TEST_CASE("TimesheetSet rejects unusable tables", "[timesheet]") {
    SECTION("Empty input") {
        std::istringstream is("");
        REQUIRE_THROWS_AS(TimesheetSet::load_from_csv(is), CsvFormatError);
    }

    SECTION("Missing Candidate RefNo") {
        std::istringstream is("Weekending,Std Hrs\n05/03/25,1\n");
        REQUIRE_THROWS_AS(TimesheetSet::load_from_csv(is), CsvFormatError);
    }

    SECTION("Missing Weekending") {
        std::istringstream is("Candidate RefNo,Std Hrs\nC1,1\n");
        REQUIRE_THROWS_AS(TimesheetSet::load_from_csv(is), CsvFormatError);
    }

    SECTION("Unreadable file") {
        REQUIRE_THROWS_AS(TimesheetSet::load_from_csv(std::string("/nonexistent/timesheet.csv")),
                          std::runtime_error);
    }
}

TEST_CASE("TimesheetSet accessors", "[timesheet]") {
    TimesheetSet ts;
    REQUIRE(ts.empty());

    TimesheetRecord r;
    r.employee_ref = "C1";
    ts.add(r);
    ts.add(TimesheetRecord());
    REQUIRE(ts.size() == 2);
    REQUIRE(ts.get(0).employee_ref == "C1");
    REQUIRE_THROWS_AS(ts.get(2), std::out_of_range);

    ts.clear();
    REQUIRE(ts.empty());
}

TEST_CASE("known_header_labels lists every recognised column", "[timesheet]") {
    const auto& labels = known_header_labels();
    REQUIRE(labels.size() == 16);
    REQUIRE(labels.front() == "Candidate RefNo");
}
