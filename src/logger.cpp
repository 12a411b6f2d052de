/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include "normalizer.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace payline {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    // Default configuration
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    config_ = config;
    file_stream_.reset();

    // Open log file if enabled
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

std::map<std::string, std::string> Logger::context_fields(const RunContext& ctx,
                                                          const std::string& event) const {
    std::map<std::string, std::string> fields;
    fields["event"] = event;
    if (!ctx.command.empty()) {
        fields["command"] = ctx.command;
    }
    if (!ctx.input_path.empty()) {
        fields["input"] = ctx.input_path;
    }
    return fields;
}

void Logger::log_run_start(
    const RunContext& ctx,
    const std::map<std::string, std::string>& settings
) {
    auto fields = context_fields(ctx, "run_start");
    for (const auto& [key, value] : settings) {
        fields["setting." + key] = value;
    }

    log(LogLevel::INFO, "Run started", fields);
}

void Logger::log_input_loaded(
    const RunContext& ctx,
    const std::string& path,
    size_t rows
) {
    auto fields = context_fields(ctx, "input_loaded");
    fields["path"] = path;
    fields["rows"] = std::to_string(rows);

    log(LogLevel::INFO, "Loaded " + path, fields);
}

void Logger::log_record_skipped(
    const RunContext& ctx,
    const SkippedRecord& skipped
) {
    auto fields = context_fields(ctx, "record_skipped");
    fields["row"] = std::to_string(skipped.source_row);
    fields["employee_ref"] = skipped.employee_ref;
    fields["reason"] = skipped.reason;

    log(LogLevel::DEBUG, "Skipped row " + std::to_string(skipped.source_row), fields);
}

void Logger::log_conversion_complete(
    const RunContext& ctx,
    const ConversionResult& result
) {
    auto fields = context_fields(ctx, "conversion_complete");
    fields["records_read"] = std::to_string(result.records_read);
    fields["records_skipped"] = std::to_string(result.skipped.size());
    fields["lines_generated"] = std::to_string(result.lines.size());
    fields["execution_time_ms"] = std::to_string(result.execution_time_ms);

    log(LogLevel::INFO, "Conversion completed", fields);
}

void Logger::log_input_risk(
    const RunContext& ctx,
    const InputRisk& risk
) {
    auto fields = context_fields(ctx, "input_risk");
    fields["row"] = std::to_string(risk.source_row);
    fields["employee_id"] = risk.employee_id;
    fields["name"] = risk.name;

    log(LogLevel::WARN, risk.explanation, fields);
}

void Logger::log_anomaly(
    const RunContext& ctx,
    const Anomaly& anomaly
) {
    auto fields = context_fields(ctx, "anomaly");
    fields["kind"] = anomaly_kind_name(anomaly.kind);
    fields["employee_id"] = anomaly.employee_id;
    fields["week_ending"] = anomaly.week_ending;
    fields["category"] = category_name(anomaly.category);
    fields["amount"] = format_decimal(anomaly.amount);
    fields["rate"] = format_decimal(anomaly.rate);
    if (anomaly.source_row > 0) {
        fields["row"] = std::to_string(anomaly.source_row);
    }

    log(LogLevel::WARN, anomaly.explanation, fields);
}

void Logger::log_reconcile_complete(
    const RunContext& ctx,
    const ReconcileResult& result
) {
    const ReconcileSummary& summary = result.summary;

    auto fields = context_fields(ctx, "reconcile_complete");
    fields["input_records"] = std::to_string(summary.input_records);
    fields["expected_lines"] = std::to_string(summary.expected_lines);
    fields["actual_lines"] = std::to_string(summary.actual_lines);
    fields["input_risks"] = std::to_string(summary.input_risks);
    fields["anomaly_count"] = std::to_string(summary.total_anomalies());
    for (size_t k = 0; k < ANOMALY_KIND_COUNT; ++k) {
        fields[std::string("anomalies.") + anomaly_kind_name(static_cast<AnomalyKind>(k))] =
            std::to_string(summary.anomalies_by_kind[k]);
    }
    fields["execution_time_ms"] = std::to_string(result.execution_time_ms);

    log(summary.total_anomalies() == 0 ? LogLevel::INFO : LogLevel::WARN,
        "Reconciliation completed", fields);
}

void Logger::log_output_written(
    const RunContext& ctx,
    const std::string& path,
    const std::string& format,
    size_t rows
) {
    auto fields = context_fields(ctx, "output_written");
    fields["path"] = path;
    fields["format"] = format;
    fields["rows"] = std::to_string(rows);

    log(LogLevel::INFO, "Wrote " + path, fields);
}

void Logger::log_error(
    const RunContext& ctx,
    const std::string& error_message
) {
    auto fields = context_fields(ctx, "error");
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, error_message, fields);
}

void Logger::log_warning(
    const RunContext& ctx,
    const std::string& warning_message
) {
    auto fields = context_fields(ctx, "warning");
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    // Escape control characters
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                        << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace payline
