#include "reconciler.hpp"
#include "normalizer.hpp"
#include <chrono>
#include <numeric>
#include <utility>

namespace payline {

// ============================================================================
// Types
// ============================================================================

const char* anomaly_kind_name(AnomalyKind kind) {
    switch (kind) {
        case AnomalyKind::ExtraLine: return "EXTRA_LINE";
        case AnomalyKind::MissingLine: return "MISSING_LINE";
        case AnomalyKind::ZeroDriverLine: return "ZERO_DRIVER_LINE";
        case AnomalyKind::SwappedAmountRate: return "SWAPPED_AMOUNT_RATE";
        case AnomalyKind::MismatchedDate: return "MISMATCHED_DATE";
    }
    return "UNKNOWN";
}

Anomaly::Anomaly()
    : kind(AnomalyKind::ExtraLine), category(Category::Unknown), source_row(0) {}

ReconcileConfig::ReconcileConfig()
    : swap_amount_threshold(100),
      swap_rate_threshold(10),
      dob_confusion_year(2025) {}

ReconcileSummary::ReconcileSummary()
    : input_records(0), valid_records(0), expected_lines(0), actual_lines(0),
      input_risks(0), anomalies_by_kind{} {}

size_t ReconcileSummary::total_anomalies() const {
    return std::accumulate(anomalies_by_kind.begin(), anomalies_by_kind.end(), size_t(0));
}

ReconcileResult::ReconcileResult() : execution_time_ms(0.0) {}

// ============================================================================
// Grouping
// ============================================================================

void LineGroups::add(const LineItem& item) {
    LineKey key = key_of(item);
    auto it = groups_.find(key);
    if (it == groups_.end()) {
        order_.push_back(key);
        groups_.emplace(std::move(key), std::vector<LineItem>{item});
    } else {
        it->second.push_back(item);
    }
}

const std::vector<LineItem>* LineGroups::find(const LineKey& key) const {
    auto it = groups_.find(key);
    return it == groups_.end() ? nullptr : &it->second;
}

bool LineGroups::contains(const LineKey& key) const {
    return groups_.count(key) > 0;
}

LineGroups group_by_key(const std::vector<LineItem>& items) {
    LineGroups groups;
    for (const auto& item : items) {
        groups.add(item);
    }
    return groups;
}

// ============================================================================
// Heuristic predicates
// ============================================================================

bool is_probable_swap(const LineItem& actual, const ReconcileConfig& config) {
    return is_hours_category(actual.category) &&
           actual.amount > config.swap_amount_threshold &&
           actual.rate <= config.swap_rate_threshold;
}

bool is_fabricated_overtime(const LineItem& actual, const TimesheetRecord& input) {
    return actual.category == Category::OT1Hrs && input.overtime_hours.is_zero();
}

bool is_fabricated_expense(const LineItem& actual, const TimesheetRecord& input) {
    return actual.category == Category::Expenses && input.expenses.is_zero();
}

bool is_dob_confusion(const std::string& actual_week_ending, const std::string& date_of_birth,
                      int year) {
    if (trim(date_of_birth).empty()) {
        return false;
    }
    auto candidate = date_of_birth_as_week_ending(date_of_birth, year);
    return candidate && *candidate == actual_week_ending;
}

// ============================================================================
// Reconciliation
// ============================================================================

namespace {

using RecordRefs = std::vector<const TimesheetRecord*>;

Anomaly anomaly_for(AnomalyKind kind, const LineItem& line, std::string explanation) {
    Anomaly a;
    a.kind = kind;
    a.employee_id = line.employee_id;
    a.week_ending = line.week_ending;
    a.category = line.category;
    a.description = line.description;
    a.amount = line.amount;
    a.rate = line.rate;
    a.explanation = std::move(explanation);
    return a;
}

Anomaly extra_line(const LineItem& line, bool key_expected) {
    return anomaly_for(AnomalyKind::ExtraLine, line, key_expected
        ? "Duplicate line: more actual lines than the input supports for this key"
        : "Line exists in actual output but is not derivable from the input");
}

Anomaly missing_line(const LineItem& line, bool key_present) {
    return anomaly_for(AnomalyKind::MissingLine, line, key_present
        ? "Fewer actual lines than the input supports for this key"
        : "Line expected from the input is absent from actual output");
}

// Pair expected and actual lines of one key. Lines with equal amount and
// rate pair first; the rest pair in order. Leftovers are the surplus.
void compare_group(const std::vector<LineItem>& expected, const std::vector<LineItem>& actual,
                   std::vector<Anomaly>& anomalies) {
    std::vector<bool> actual_used(actual.size(), false);
    std::vector<bool> expected_used(expected.size(), false);

    for (size_t e = 0; e < expected.size(); ++e) {
        for (size_t a = 0; a < actual.size(); ++a) {
            if (!actual_used[a] && actual[a].amount == expected[e].amount &&
                actual[a].rate == expected[e].rate) {
                actual_used[a] = true;
                expected_used[e] = true;
                break;
            }
        }
    }

    size_t a = 0;
    for (size_t e = 0; e < expected.size(); ++e) {
        if (expected_used[e]) continue;
        while (a < actual.size() && actual_used[a]) ++a;
        if (a == actual.size()) break;
        actual_used[a] = true;
        expected_used[e] = true;
    }

    for (size_t i = 0; i < actual.size(); ++i) {
        if (!actual_used[i]) {
            anomalies.push_back(extra_line(actual[i], true));
        }
    }
    for (size_t i = 0; i < expected.size(); ++i) {
        if (!expected_used[i]) {
            anomalies.push_back(missing_line(expected[i], true));
        }
    }
}

std::string employee_key(const TimesheetRecord& record) {
    return normalize_spaces(record.employee_ref);
}

} // anonymous namespace

std::vector<Anomaly> reconcile(const std::vector<TimesheetRecord>& records,
                               const std::vector<LineItem>& actual,
                               const ReconcileConfig& config) {
    return reconcile(records, convert_all(records, config.conversion), actual, config);
}

std::vector<Anomaly> reconcile(const std::vector<TimesheetRecord>& records,
                               const std::vector<LineItem>& expected,
                               const std::vector<LineItem>& actual,
                               const ReconcileConfig& config) {
    std::vector<Anomaly> anomalies;

    LineGroups expected_groups = group_by_key(expected);
    LineGroups actual_groups = group_by_key(actual);

    // Keys present in the actual output
    for (const auto& key : actual_groups.keys()) {
        const auto& actual_lines = *actual_groups.find(key);
        const auto* expected_lines = expected_groups.find(key);

        if (!expected_lines) {
            for (const auto& line : actual_lines) {
                anomalies.push_back(extra_line(line, false));
            }
        } else {
            compare_group(*expected_lines, actual_lines, anomalies);
        }
    }

    // Keys only in the expectation
    for (const auto& key : expected_groups.keys()) {
        if (actual_groups.contains(key)) continue;
        for (const auto& line : *expected_groups.find(key)) {
            anomalies.push_back(missing_line(line, false));
        }
    }

    // Input rows by (employee, ISO week ending) and by employee
    std::map<std::pair<std::string, std::string>, RecordRefs> by_week;
    std::map<std::string, RecordRefs> by_employee;
    for (const auto& record : records) {
        std::string employee = employee_key(record);
        by_week[{employee, parse_week_ending(record.week_ending)}].push_back(&record);
        by_employee[employee].push_back(&record);
    }

    for (const auto& line : actual) {
        auto week_it = by_week.find({line.employee_id, line.week_ending});

        if (week_it != by_week.end()) {
            for (const TimesheetRecord* input : week_it->second) {
                if (is_fabricated_overtime(line, *input)) {
                    Anomaly a = anomaly_for(AnomalyKind::ZeroDriverLine, line,
                        "OT1 line created but input OT1 Hrs = 0 (OT1 Rate = " +
                        format_decimal(input->overtime_rate) + ")");
                    a.source_row = input->source_row;
                    anomalies.push_back(std::move(a));
                }
                if (is_fabricated_expense(line, *input)) {
                    Anomaly a = anomaly_for(AnomalyKind::ZeroDriverLine, line,
                        "Expenses line created but input Expenses = 0 (OT1 Rate = " +
                        format_decimal(input->overtime_rate) + " may have been confused)");
                    a.source_row = input->source_row;
                    anomalies.push_back(std::move(a));
                }
            }
        }

        if (is_probable_swap(line, config)) {
            anomalies.push_back(anomaly_for(AnomalyKind::SwappedAmountRate, line,
                "Amount (" + format_decimal(line.amount) + ") and Rate (" +
                format_decimal(line.rate) + ") appear to be swapped"));
        }

        // Week ending unknown for this employee: was the birth date used?
        auto employee_it = by_employee.find(line.employee_id);
        if (week_it == by_week.end() && employee_it != by_employee.end()) {
            for (const TimesheetRecord* input : employee_it->second) {
                if (!is_dob_confusion(line.week_ending, input->date_of_birth,
                                      config.dob_confusion_year)) {
                    continue;
                }
                Anomaly a = anomaly_for(AnomalyKind::MismatchedDate, line,
                    "Date " + line.week_ending + " appears to use DOB (" +
                    trim(input->date_of_birth) + ") instead of Weekending (" +
                    parse_week_ending(input->week_ending) + ")");
                a.expected_week_ending = parse_week_ending(input->week_ending);
                a.date_of_birth = trim(input->date_of_birth);
                a.source_row = input->source_row;
                anomalies.push_back(std::move(a));
                break;
            }
        }
    }

    return anomalies;
}

std::vector<InputRisk> scan_input_risks(const std::vector<TimesheetRecord>& records) {
    std::vector<InputRisk> risks;
    for (const auto& record : records) {
        if (!is_valid_record(record)) continue;
        if (record.overtime_rate.is_zero() || !record.overtime_hours.is_zero()) continue;

        InputRisk risk;
        risk.source_row = record.source_row;
        risk.employee_id = employee_key(record);
        risk.name = normalize_spaces(record.first_name) + " " + normalize_spaces(record.last_name);
        risk.explanation = "OT1 Rate = " + format_decimal(record.overtime_rate) +
                           " but OT1 Hrs = 0. A converter might create an overtime line.";
        risks.push_back(std::move(risk));
    }
    return risks;
}

ReconcileSummary summarize(const std::vector<TimesheetRecord>& records,
                           const std::vector<LineItem>& expected,
                           const std::vector<LineItem>& actual,
                           const std::vector<Anomaly>& anomalies,
                           const std::vector<InputRisk>& risks) {
    ReconcileSummary summary;
    summary.input_records = records.size();
    for (const auto& record : records) {
        if (is_valid_record(record)) {
            ++summary.valid_records;
        }
    }
    summary.expected_lines = expected.size();
    summary.actual_lines = actual.size();
    summary.input_risks = risks.size();
    for (const auto& anomaly : anomalies) {
        ++summary.anomalies_by_kind[static_cast<size_t>(anomaly.kind)];
    }
    return summary;
}

ReconcileResult run_reconciliation(const TimesheetSet& records,
                                   const std::vector<LineItem>& actual,
                                   const ReconcileConfig& config) {
    auto start = std::chrono::high_resolution_clock::now();

    ReconcileResult result;
    result.expected = convert_all(records, config.conversion);
    result.anomalies = reconcile(records.records(), result.expected, actual, config);
    result.risks = scan_input_risks(records.records());
    result.summary = summarize(records.records(), result.expected, actual,
                               result.anomalies, result.risks);

    auto end = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return result;
}

} // namespace payline
