#include "report_writer.hpp"
#include "../normalizer.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace payline {
namespace io {

namespace {

json summary_to_json(const ReconcileSummary& summary) {
    json by_kind = json::object();
    for (size_t k = 0; k < ANOMALY_KIND_COUNT; ++k) {
        by_kind[anomaly_kind_name(static_cast<AnomalyKind>(k))] = summary.anomalies_by_kind[k];
    }

    return json{
        {"input_records", summary.input_records},
        {"valid_records", summary.valid_records},
        {"expected_lines", summary.expected_lines},
        {"actual_lines", summary.actual_lines},
        {"input_risks", summary.input_risks},
        {"anomaly_count", summary.total_anomalies()},
        {"anomalies_by_kind", by_kind}
    };
}

json anomaly_to_json(const Anomaly& anomaly) {
    json j{
        {"kind", anomaly_kind_name(anomaly.kind)},
        {"employee_id", anomaly.employee_id},
        {"week_ending", anomaly.week_ending},
        {"category", category_name(anomaly.category)},
        {"description", anomaly.description},
        {"amount", format_decimal(anomaly.amount)},
        {"rate", format_decimal(anomaly.rate)},
        {"explanation", anomaly.explanation}
    };
    if (anomaly.source_row > 0) {
        j["source_row"] = anomaly.source_row;
    }
    if (anomaly.kind == AnomalyKind::MismatchedDate) {
        j["expected_week_ending"] = anomaly.expected_week_ending;
        j["date_of_birth"] = anomaly.date_of_birth;
    }
    return j;
}

json risk_to_json(const InputRisk& risk) {
    return json{
        {"source_row", risk.source_row},
        {"employee_id", risk.employee_id},
        {"name", risk.name},
        {"explanation", risk.explanation}
    };
}

} // anonymous namespace

void write_reconcile_report_json(std::ostream& os, const ReconcileResult& result,
                                 bool pretty_print) {
    json report;
    report["summary"] = summary_to_json(result.summary);
    report["execution_time_ms"] = result.execution_time_ms;

    json risks = json::array();
    for (const auto& risk : result.risks) {
        risks.push_back(risk_to_json(risk));
    }
    report["input_risks"] = risks;

    json anomalies = json::array();
    for (const auto& anomaly : result.anomalies) {
        anomalies.push_back(anomaly_to_json(anomaly));
    }
    report["anomalies"] = anomalies;

    os << report.dump(pretty_print ? 2 : -1) << "\n";
}

void write_reconcile_report_json(const std::string& filepath, const ReconcileResult& result,
                                 bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_reconcile_report_json(file, result, pretty_print);
    file.flush();
    if (!file) {
        throw std::runtime_error("Failed to write output file: " + filepath);
    }
}

void write_reconcile_summary_text(std::ostream& os, const ReconcileResult& result) {
    const ReconcileSummary& s = result.summary;

    os << "Input:\n";
    os << "  Rows:            " << s.input_records << "\n";
    os << "  Valid rows:      " << s.valid_records << "\n";
    os << "  Expected lines:  " << s.expected_lines << "\n";
    os << "  Actual lines:    " << s.actual_lines << "\n";

    if (!result.risks.empty()) {
        os << "\nPotential problem rows (OT1 Rate without OT1 Hrs):\n";
        for (const auto& risk : result.risks) {
            os << "  Row " << risk.source_row << ": " << risk.employee_id
               << " (" << risk.name << ")\n";
            os << "    - " << risk.explanation << "\n";
        }
    }

    os << "\nAnomalies: " << s.total_anomalies() << "\n";
    for (size_t k = 0; k < ANOMALY_KIND_COUNT; ++k) {
        os << "  " << std::left << std::setw(20)
           << anomaly_kind_name(static_cast<AnomalyKind>(k)) << s.anomalies_by_kind[k] << "\n";
    }

    for (const auto& anomaly : result.anomalies) {
        os << "\n  [" << anomaly_kind_name(anomaly.kind) << "] " << anomaly.employee_id
           << " " << anomaly.week_ending << " " << category_label(anomaly.category) << "\n";
        os << "    Issue:  " << anomaly.explanation << "\n";
        os << "    Line:   " << anomaly.description << ", amount=" << format_decimal(anomaly.amount)
           << ", rate=" << format_decimal(anomaly.rate) << "\n";
    }
}

} // namespace io
} // namespace payline
