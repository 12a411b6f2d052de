#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <map>
#include "timesheet.hpp"
#include "converter.hpp"
#include "reconciler.hpp"
#include "logger.hpp"
#include "normalizer.hpp"
#include "config_parser.hpp"
#include "io/line_item_csv.hpp"
#include "io/parquet_writer.hpp"
#include "io/report_writer.hpp"

namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_ANOMALIES = 2;

struct CLIArgs {
    std::string command;            // "convert" or "reconcile"
    std::string input_path;         // timesheet CSV
    std::string actual_path;        // line items to verify (reconcile)
    std::string output_path;        // converted CSV (convert, default stdout)
    std::string parquet_path;       // optional Parquet copy (convert)
    std::string report_path;        // JSON report (reconcile, default stdout)
    std::string expected_path;      // expected derivation CSV (reconcile)
    std::string config_path;
    std::string log_level;
    std::string log_file;
    int log_json = -1;              // -1 unset, 0 text, 1 json
    int emit_negative_expenses = -1;
    bool fail_on_anomaly = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "payline v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " <command> [options]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  convert                     Convert a timesheet CSV into payroll line items\n";
    std::cerr << "  reconcile                   Check line items from another producer against a timesheet\n\n";
    std::cerr << "Common options:\n";
    std::cerr << "  --input <path>              Timesheet CSV (required)\n";
    std::cerr << "  --config <path>             JSON configuration file\n";
    std::cerr << "  --negative-expenses <y|n>   Emit lines for negative expenses (default: y)\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-json                  Log as JSON lines\n";
    std::cerr << "  --log-text                  Log as plain text (default)\n";
    std::cerr << "  --log-file <path>           Also append log lines to a file\n\n";
    std::cerr << "convert options:\n";
    std::cerr << "  --output <path>             Line item CSV (default: stdout)\n";
    std::cerr << "  --parquet <path>            Also write line items as Parquet\n\n";
    std::cerr << "reconcile options:\n";
    std::cerr << "  --actual <path>             Line item CSV to verify (required)\n";
    std::cerr << "  --report <path>             JSON report (default: stdout)\n";
    std::cerr << "  --expected <path>           Write the expected line items as CSV\n";
    std::cerr << "  --fail-on-anomaly           Exit with status 2 when anomalies are found\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  " << program_name << " convert --input timesheet.csv --output payroll.csv\n";
    std::cerr << "  " << program_name << " reconcile --input timesheet.csv --actual payroll.csv \\\n";
    std::cerr << "      --report report.json --fail-on-anomaly\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_yes_no(const std::string& value, int& out) {
    if (value == "y" || value == "yes" || value == "true" || value == "1") {
        out = 1;
        return true;
    }
    if (value == "n" || value == "no" || value == "false" || value == "0") {
        out = 0;
        return true;
    }
    return false;
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    int i = 1;
    if (i < argc && argv[i][0] != '-') {
        args.command = argv[i++];
    }

    for (; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--input" && i + 1 < argc) {
            args.input_path = argv[++i];
        } else if (arg == "--actual" && i + 1 < argc) {
            args.actual_path = argv[++i];
        } else if ((arg == "--output" || arg == "-o") && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--parquet" && i + 1 < argc) {
            args.parquet_path = argv[++i];
        } else if (arg == "--report" && i + 1 < argc) {
            args.report_path = argv[++i];
        } else if (arg == "--expected" && i + 1 < argc) {
            args.expected_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--negative-expenses" && i + 1 < argc) {
            std::string value = argv[++i];
            if (!parse_yes_no(value, args.emit_negative_expenses)) {
                std::cerr << "Error: --negative-expenses expects y or n, got: " << value << "\n\n";
                return false;
            }
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else if (arg == "--log-json") {
            args.log_json = 1;
        } else if (arg == "--log-text") {
            args.log_json = 0;
        } else if (arg == "--fail-on-anomaly") {
            args.fail_on_anomaly = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.command != "convert" && args.command != "reconcile") {
        if (args.command.empty()) {
            std::cerr << "Error: a command is required (convert or reconcile)\n";
        } else {
            std::cerr << "Error: Unknown command: " << args.command << "\n";
        }
        return false;
    }

    if (args.input_path.empty()) {
        std::cerr << "Error: --input is required\n";
        valid = false;
    } else if (!file_exists(args.input_path)) {
        std::cerr << "Error: Input file not found: " << args.input_path << "\n";
        valid = false;
    }

    if (args.command == "reconcile") {
        if (args.actual_path.empty()) {
            std::cerr << "Error: --actual is required for reconcile\n";
            valid = false;
        } else if (!file_exists(args.actual_path)) {
            std::cerr << "Error: Actual file not found: " << args.actual_path << "\n";
            valid = false;
        }
        if (!args.output_path.empty() || !args.parquet_path.empty()) {
            std::cerr << "Error: --output and --parquet apply to convert only\n";
            valid = false;
        }
    } else {
        if (!args.actual_path.empty() || !args.report_path.empty() ||
            !args.expected_path.empty() || args.fail_on_anomaly) {
            std::cerr << "Error: --actual, --report, --expected and --fail-on-anomaly apply to reconcile only\n";
            valid = false;
        }
    }

    if (!args.config_path.empty() && !file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }

    payline::LogLevel level;
    if (!args.log_level.empty() && !payline::parse_level(args.log_level, level)) {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    return valid;
}

// Config file first, then command-line overrides
payline::PaylineConfig load_config(const CLIArgs& args) {
    payline::PaylineConfig config;
    if (!args.config_path.empty()) {
        config = payline::parse_config_from_file(args.config_path);
    }

    if (args.emit_negative_expenses >= 0) {
        config.reconcile.conversion.emit_negative_expenses = args.emit_negative_expenses == 1;
    }
    if (!args.log_level.empty()) {
        config.logging.min_level = payline::string_to_level(args.log_level);
    }
    if (args.log_json >= 0) {
        config.logging.enable_json = args.log_json == 1;
    }
    if (!args.log_file.empty()) {
        config.logging.enable_file = true;
        config.logging.log_file_path = args.log_file;
    }
    return config;
}

std::map<std::string, std::string> run_settings(const CLIArgs& args,
                                                const payline::PaylineConfig& config) {
    const payline::ReconcileConfig& rc = config.reconcile;
    std::map<std::string, std::string> settings;
    settings["emit_negative_expenses"] = rc.conversion.emit_negative_expenses ? "true" : "false";
    if (args.command == "reconcile") {
        settings["actual"] = args.actual_path;
        settings["swap_amount_threshold"] = rc.swap_amount_threshold.to_string();
        settings["swap_rate_threshold"] = rc.swap_rate_threshold.to_string();
        settings["dob_confusion_year"] = std::to_string(rc.dob_confusion_year);
    }
    if (!args.config_path.empty()) {
        settings["config"] = args.config_path;
    }
    return settings;
}

// Rows that will convert but whose week ending is not a date pass their
// text through unchanged; flag them so the output can be checked
void warn_unparsed_week_endings(const payline::TimesheetSet& records,
                                const payline::RunContext& ctx) {
    payline::Logger& logger = payline::Logger::get_instance();
    for (const auto& record : records.records()) {
        if (!payline::is_valid_record(record)) continue;
        std::string week = payline::parse_week_ending(record.week_ending);
        if (!payline::is_iso_date(week)) {
            logger.log_warning(ctx, "Row " + std::to_string(record.source_row) +
                               ": week ending '" + week + "' is not a recognised date");
        }
    }
}

int run_convert(const CLIArgs& args, const payline::PaylineConfig& config,
                const payline::RunContext& ctx) {
    payline::Logger& logger = payline::Logger::get_instance();

    payline::TimesheetSet records = payline::TimesheetSet::load_from_csv(args.input_path);
    logger.log_input_loaded(ctx, args.input_path, records.size());
    warn_unparsed_week_endings(records, ctx);

    payline::ConversionResult result =
        payline::run_conversion(records, config.reconcile.conversion);
    for (const auto& skipped : result.skipped) {
        logger.log_record_skipped(ctx, skipped);
    }
    logger.log_conversion_complete(ctx, result);
    if (result.lines.empty()) {
        logger.log_warning(ctx, "No line items produced from " + args.input_path);
    }

    if (args.output_path.empty()) {
        payline::io::write_line_items_csv(std::cout, result.lines);
        std::cout.flush();
    } else {
        payline::io::write_line_items_csv(args.output_path, result.lines);
        logger.log_output_written(ctx, args.output_path, "csv", result.lines.size());
    }

    if (!args.parquet_path.empty()) {
        payline::ParquetWriter::write_line_items(result.lines, args.parquet_path);
        logger.log_output_written(ctx, args.parquet_path, "parquet", result.lines.size());
    }

    return 0;
}

int run_reconcile(const CLIArgs& args, const payline::PaylineConfig& config,
                  const payline::RunContext& ctx) {
    payline::Logger& logger = payline::Logger::get_instance();

    payline::TimesheetSet records = payline::TimesheetSet::load_from_csv(args.input_path);
    logger.log_input_loaded(ctx, args.input_path, records.size());
    warn_unparsed_week_endings(records, ctx);

    std::vector<payline::LineItem> actual = payline::io::read_line_items_csv(args.actual_path);
    logger.log_input_loaded(ctx, args.actual_path, actual.size());

    payline::ReconcileResult result =
        payline::run_reconciliation(records, actual, config.reconcile);

    for (const auto& risk : result.risks) {
        logger.log_input_risk(ctx, risk);
    }
    for (const auto& anomaly : result.anomalies) {
        logger.log_anomaly(ctx, anomaly);
    }
    logger.log_reconcile_complete(ctx, result);

    std::cerr << "\n";
    payline::io::write_reconcile_summary_text(std::cerr, result);
    std::cerr << "\n";

    if (!args.expected_path.empty()) {
        payline::io::write_line_items_csv(args.expected_path, result.expected);
        logger.log_output_written(ctx, args.expected_path, "csv", result.expected.size());
    }

    if (args.report_path.empty()) {
        payline::io::write_reconcile_report_json(std::cout, result);
        std::cout.flush();
    } else {
        payline::io::write_reconcile_report_json(args.report_path, result);
        logger.log_output_written(ctx, args.report_path, "json", result.anomalies.size());
    }

    if (args.fail_on_anomaly && !result.anomalies.empty()) {
        return EXIT_ANOMALIES;
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    // Parse arguments
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    // Handle help, or no arguments at all
    if (args.help || argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    // Validate arguments
    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return EXIT_USAGE;
    }

    payline::Logger& logger = payline::Logger::get_instance();
    payline::RunContext ctx(args.command, args.input_path);

    try {
        payline::PaylineConfig config = load_config(args);
        logger.configure(config.logging);
        logger.log_run_start(ctx, run_settings(args, config));

        int status = args.command == "convert"
            ? run_convert(args, config, ctx)
            : run_reconcile(args, config, ctx);

        logger.flush();
        return status;
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        logger.flush();
        return EXIT_USAGE;
    }
}
