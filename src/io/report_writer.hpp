#ifndef PAYLINE_IO_REPORT_WRITER_HPP
#define PAYLINE_IO_REPORT_WRITER_HPP

#include <ostream>
#include <string>
#include "../reconciler.hpp"

namespace payline {
namespace io {

// Write a reconciliation result as JSON:
//   { "summary": {...}, "input_risks": [...], "anomalies": [...] }
// amount and rate are written as decimal strings so no precision is lost.
void write_reconcile_report_json(std::ostream& os, const ReconcileResult& result,
                                 bool pretty_print = true);

void write_reconcile_report_json(const std::string& filepath, const ReconcileResult& result,
                                 bool pretty_print = true);

// Human-readable summary for the console
void write_reconcile_summary_text(std::ostream& os, const ReconcileResult& result);

} // namespace io
} // namespace payline

#endif // PAYLINE_IO_REPORT_WRITER_HPP
