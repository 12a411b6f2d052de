#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/wait.h>

using json = nlohmann::json;

namespace {

// Helper to run CLI command and capture output
struct CommandResult {
    int exit_code;
    std::string stdout_output;
    std::string stderr_output;
};

std::string read_file(const std::string& path) {
    std::ifstream stream(path);
    std::ostringstream ss;
    if (stream) {
        ss << stream.rdbuf();
    }
    return ss.str();
}

CommandResult run_command(const std::string& args) {
    CommandResult result;

    // Create temp files for output
    std::string stdout_file = "/tmp/payline_test_stdout.txt";
    std::string stderr_file = "/tmp/payline_test_stderr.txt";

    // Run command with output redirection
    std::string full_cmd = std::string(PAYLINE_CLI_PATH) + " " + args +
                           " >" + stdout_file + " 2>" + stderr_file;
    int status = std::system(full_cmd.c_str());

    result.stdout_output = read_file(stdout_file);
    result.stderr_output = read_file(stderr_file);

    // Normalize exit code (system() returns a wait status)
    result.exit_code = WEXITSTATUS(status);

    return result;
}

std::string data(const std::string& name) {
    return std::string(PAYLINE_TEST_DATA_DIR) + "/" + name;
}

const std::string TIMESHEET = data("timesheet_sample.csv");
const std::string ACTUAL_WITH_ERRORS = data("actual_with_errors.csv");

} // anonymous namespace

TEST_CASE("CLI help shows usage", "[cli]") {
    auto result = run_command("--help");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Usage:") != std::string::npos);
    REQUIRE(result.stderr_output.find("convert") != std::string::npos);
    REQUIRE(result.stderr_output.find("reconcile") != std::string::npos);
    REQUIRE(result.stderr_output.find("--input") != std::string::npos);
    REQUIRE(result.stderr_output.find("--actual") != std::string::npos);
    REQUIRE(result.stderr_output.find("--fail-on-anomaly") != std::string::npos);
}

TEST_CASE("CLI no args shows usage", "[cli]") {
    auto result = run_command("");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Usage:") != std::string::npos);
}

TEST_CASE("CLI argument errors", "[cli]") {
    SECTION("Unknown option") {
        auto result = run_command("convert --unknown-option");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Unknown option") != std::string::npos);
    }

    SECTION("Unknown command") {
        auto result = run_command("transmogrify --input " + TIMESHEET);
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Unknown command") != std::string::npos);
    }

    SECTION("Missing input") {
        auto result = run_command("convert");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("--input is required") != std::string::npos);
    }

    SECTION("Missing actual for reconcile") {
        auto result = run_command("reconcile --input " + TIMESHEET);
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("--actual is required") != std::string::npos);
    }

    SECTION("Input file not found") {
        auto result = run_command("convert --input nonexistent.csv");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("not found") != std::string::npos);
    }

    SECTION("Bad log level") {
        auto result = run_command("convert --input " + TIMESHEET + " --log-level LOUD");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("--log-level") != std::string::npos);
    }

    SECTION("Reconcile option on convert") {
        auto result = run_command("convert --input " + TIMESHEET + " --fail-on-anomaly");
        REQUIRE(result.exit_code == 1);
    }
}

TEST_CASE("CLI convert writes line items to stdout", "[cli][integration]") {
    auto result = run_command("convert --input " + TIMESHEET);
    REQUIRE(result.exit_code == 0);

    const std::string& out = result.stdout_output;
    REQUIRE(out.find("employeeid,firstname,surname,description,amount,rate,weekending,unit\n") == 0);
    REQUIRE(out.find("C001,Jane,Smith,Expenses - Acme Ltd - Warehouse Operative,1,25.5,2025-03-05,expense")
            != std::string::npos);
    REQUIRE(out.find("C001,Jane,Smith,Std Hrs - Acme Ltd - Warehouse Operative,37.5,12,2025-03-05,hours")
            != std::string::npos);
    REQUIRE(out.find("C002,John,Doe,OT1 Hrs - Beta Corp - Driver,4,17.25,2025-03-05,hours")
            != std::string::npos);
    REQUIRE(out.find("C004,Sam,Brown,Expenses - Acme Ltd - Cleaner,1,-5,2025-03-12,expense")
            != std::string::npos);
    REQUIRE(out.find("C003") == std::string::npos);

    // Header plus seven lines
    size_t rows = 0;
    for (char c : out) {
        if (c == '\n') ++rows;
    }
    REQUIRE(rows == 8);

    // Plain-text log lines on stderr
    REQUIRE(result.stderr_output.find("[INFO] Conversion completed") != std::string::npos);
    REQUIRE(result.stderr_output.find("event=conversion_complete") != std::string::npos);
}

TEST_CASE("CLI convert honours the configuration", "[cli][integration]") {
    std::string output = "/tmp/payline_test_convert.csv";
    auto result = run_command("convert --input " + TIMESHEET + " --output " + output +
                              " --config " + data("config_sample.json"));
    REQUIRE(result.exit_code == 0);

    std::string csv = read_file(output);
    REQUIRE(csv.find("C004,Sam,Brown,Std Hrs") != std::string::npos);
    REQUIRE(csv.find(",-5,") == std::string::npos);
    // WARN level with JSON: INFO events are filtered out
    REQUIRE(result.stderr_output.find("\"event\":\"conversion_complete\"") == std::string::npos);
    std::remove(output.c_str());
}

TEST_CASE("CLI convert JSON logging", "[cli][integration]") {
    auto result = run_command("convert --input " + TIMESHEET +
                              " --output /tmp/payline_test_convert_log.csv --log-json --log-level DEBUG");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("\"event\":\"run_start\"") != std::string::npos);
    REQUIRE(result.stderr_output.find("\"event\":\"record_skipped\"") != std::string::npos);
    REQUIRE(result.stderr_output.find("\"event\":\"output_written\"") != std::string::npos);
    std::remove("/tmp/payline_test_convert_log.csv");
}

TEST_CASE("CLI reconcile of its own conversion is clean", "[cli][integration]") {
    std::string converted = "/tmp/payline_test_clean.csv";
    REQUIRE(run_command("convert --input " + TIMESHEET + " --output " + converted).exit_code == 0);

    auto result = run_command("reconcile --input " + TIMESHEET + " --actual " + converted +
                              " --fail-on-anomaly");
    REQUIRE(result.exit_code == 0);

    json report = json::parse(result.stdout_output);
    REQUIRE(report["summary"]["anomaly_count"] == 0);
    REQUIRE(report["summary"]["expected_lines"] == 7);
    REQUIRE(report["summary"]["input_risks"] == 1);
    std::remove(converted.c_str());
}

TEST_CASE("CLI reconcile reports every anomaly kind", "[cli][integration]") {
    std::string report_path = "/tmp/payline_test_report.json";
    std::string expected_path = "/tmp/payline_test_expected.csv";
    auto result = run_command("reconcile --input " + TIMESHEET + " --actual " + ACTUAL_WITH_ERRORS +
                              " --report " + report_path + " --expected " + expected_path);
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Anomalies: 10") != std::string::npos);

    json report = json::parse(read_file(report_path));
    const json& by_kind = report["summary"]["anomalies_by_kind"];
    REQUIRE(by_kind["EXTRA_LINE"] == 3);
    REQUIRE(by_kind["MISSING_LINE"] == 3);
    REQUIRE(by_kind["ZERO_DRIVER_LINE"] == 1);
    REQUIRE(by_kind["SWAPPED_AMOUNT_RATE"] == 1);
    REQUIRE(by_kind["MISMATCHED_DATE"] == 2);
    REQUIRE(report["anomalies"].size() == 10);

    std::string expected_csv = read_file(expected_path);
    REQUIRE(expected_csv.find("C004,Sam,Brown,OT1 Hrs - Acme Ltd - Cleaner,2,15,2025-03-12,hours")
            != std::string::npos);

    std::remove(report_path.c_str());
    std::remove(expected_path.c_str());
}

TEST_CASE("CLI reconcile can fail on anomalies", "[cli][integration]") {
    auto result = run_command("reconcile --input " + TIMESHEET + " --actual " + ACTUAL_WITH_ERRORS +
                              " --fail-on-anomaly");
    REQUIRE(result.exit_code == 2);
    REQUIRE_NOTHROW(json::parse(result.stdout_output));
}

TEST_CASE("CLI warns about data-quality problems", "[cli][integration]") {
    std::string input = "/tmp/payline_test_warn.csv";

    SECTION("Week ending that is not a date") {
        {
            std::ofstream file(input);
            file << "Candidate RefNo,Candidate Forename,Candidate Surname,Weekending,Std Hrs,Rate\n"
                    "C1,Jane,Smith,week 10,8,10\n"
                    "C2,John,Doe,05/03/25,8,10\n";
        }

        auto result = run_command("convert --input " + input);
        REQUIRE(result.exit_code == 0);
        REQUIRE(result.stdout_output.find("C1,Jane,Smith,Std Hrs -  - ,8,10,week 10,hours") !=
                std::string::npos);
        REQUIRE(result.stderr_output.find("[WARN] Row 2: week ending 'week 10' is not a recognised date") !=
                std::string::npos);
        REQUIRE(result.stderr_output.find("Row 3: week ending") == std::string::npos);
    }

    SECTION("Nothing to convert") {
        {
            std::ofstream file(input);
            file << "Candidate RefNo,Candidate Forename,Candidate Surname,Weekending,Std Hrs,Rate\n"
                    "C1,Jane,Smith,05/03/25,0,10\n";
        }

        auto result = run_command("convert --input " + input);
        REQUIRE(result.exit_code == 0);
        REQUIRE(result.stderr_output.find("[WARN] No line items produced") != std::string::npos);
    }

    std::remove(input.c_str());
}

TEST_CASE("CLI reports unusable input as an error", "[cli][integration]") {
    std::string bad = "/tmp/payline_test_bad.csv";
    {
        std::ofstream file(bad);
        file << "Name,Hours\nJane,8\n";
    }

    auto result = run_command("convert --input " + bad);
    REQUIRE(result.exit_code == 1);
    REQUIRE(result.stderr_output.find("missing required column") != std::string::npos);
    std::remove(bad.c_str());
}
