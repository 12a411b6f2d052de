#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include "io/report_writer.hpp"
#include "normalizer.hpp"

using namespace payline;
using json = nlohmann::json;

namespace {

ReconcileResult sample_result() {
    TimesheetSet ts;
    TimesheetRecord r;
    r.source_row = 2;
    r.employee_ref = "C004";
    r.client_name = "Acme Ltd";
    r.job_title = "Cleaner";
    r.first_name = "Sam";
    r.last_name = "Brown";
    r.week_ending = "12/03/25";
    r.date_of_birth = "03/04/1992";
    r.standard_hours = Decimal(20);
    r.standard_rate = Decimal(10);
    r.overtime_rate = parse_decimal("15.5");
    ts.add(r);

    std::vector<LineItem> actual = convert_all(ts);
    actual[0].week_ending = "2025-04-03";
    return run_reconciliation(ts, actual);
}

} // anonymous namespace

TEST_CASE("Reconcile report JSON layout", "[report]") {
    ReconcileResult result = sample_result();

    std::ostringstream os;
    io::write_reconcile_report_json(os, result);
    json report = json::parse(os.str());

    const json& summary = report["summary"];
    REQUIRE(summary["input_records"] == 1);
    REQUIRE(summary["valid_records"] == 1);
    REQUIRE(summary["expected_lines"] == 1);
    REQUIRE(summary["actual_lines"] == 1);
    REQUIRE(summary["input_risks"] == 1);
    REQUIRE(summary["anomaly_count"] == 3);
    REQUIRE(summary["anomalies_by_kind"]["EXTRA_LINE"] == 1);
    REQUIRE(summary["anomalies_by_kind"]["MISSING_LINE"] == 1);
    REQUIRE(summary["anomalies_by_kind"]["MISMATCHED_DATE"] == 1);
    REQUIRE(summary["anomalies_by_kind"]["SWAPPED_AMOUNT_RATE"] == 0);
    REQUIRE(report.contains("execution_time_ms"));

    REQUIRE(report["input_risks"].size() == 1);
    REQUIRE(report["input_risks"][0]["employee_id"] == "C004");
    REQUIRE(report["input_risks"][0]["name"] == "Sam Brown");

    const json& anomalies = report["anomalies"];
    REQUIRE(anomalies.size() == 3);
    REQUIRE(anomalies[0]["kind"] == "EXTRA_LINE");
    REQUIRE(anomalies[0]["category"] == "StdHrs");
    REQUIRE(anomalies[0]["amount"] == "20");
    REQUIRE(anomalies[0]["rate"] == "10");
    REQUIRE_FALSE(anomalies[0].contains("source_row"));
    REQUIRE_FALSE(anomalies[0].contains("expected_week_ending"));

    const json& mismatch = anomalies[2];
    REQUIRE(mismatch["kind"] == "MISMATCHED_DATE");
    REQUIRE(mismatch["week_ending"] == "2025-04-03");
    REQUIRE(mismatch["expected_week_ending"] == "2025-03-12");
    REQUIRE(mismatch["date_of_birth"] == "03/04/1992");
    REQUIRE(mismatch["source_row"] == 2);
}

TEST_CASE("Compact report is a single line", "[report]") {
    std::ostringstream os;
    io::write_reconcile_report_json(os, sample_result(), false);

    std::string text = os.str();
    REQUIRE(text.find('\n') == text.size() - 1);
    REQUIRE_NOTHROW(json::parse(text));
}

TEST_CASE("Clean reconciliation has an empty anomaly list", "[report]") {
    ReconcileResult result;
    std::ostringstream os;
    io::write_reconcile_report_json(os, result);

    json report = json::parse(os.str());
    REQUIRE(report["anomalies"].is_array());
    REQUIRE(report["anomalies"].empty());
    REQUIRE(report["summary"]["anomaly_count"] == 0);
}

TEST_CASE("Report file errors are raised", "[report]") {
    ReconcileResult result = sample_result();

    SECTION("Unopenable path") {
        REQUIRE_THROWS_AS(io::write_reconcile_report_json("/nonexistent/dir/report.json", result),
                          std::runtime_error);
    }

    SECTION("Device with no space left") {
        if (std::filesystem::exists("/dev/full")) {
            REQUIRE_THROWS_AS(io::write_reconcile_report_json("/dev/full", result),
                              std::runtime_error);
        }
    }

    SECTION("Writable path") {
        std::string path = "/tmp/payline_test_report_writer.json";
        io::write_reconcile_report_json(path, result);
        REQUIRE(std::filesystem::file_size(path) > 0);
        std::filesystem::remove(path);
    }
}

TEST_CASE("Summary text lists counts and findings", "[report]") {
    std::ostringstream os;
    io::write_reconcile_summary_text(os, sample_result());
    std::string text = os.str();

    REQUIRE(text.find("Anomalies: 3") != std::string::npos);
    REQUIRE(text.find("MISMATCHED_DATE") != std::string::npos);
    REQUIRE(text.find("Row 2: C004 (Sam Brown)") != std::string::npos);
    REQUIRE(text.find("appears to use DOB") != std::string::npos);
}
