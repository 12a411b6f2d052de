#ifndef PAYLINE_RECONCILER_HPP
#define PAYLINE_RECONCILER_HPP

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "converter.hpp"
#include "decimal.hpp"
#include "line_item.hpp"
#include "timesheet.hpp"

namespace payline {

enum class AnomalyKind : uint8_t {
    ExtraLine = 0,
    MissingLine = 1,
    ZeroDriverLine = 2,
    SwappedAmountRate = 3,
    MismatchedDate = 4
};

constexpr size_t ANOMALY_KIND_COUNT = 5;

// "EXTRA_LINE", "MISSING_LINE", ...
const char* anomaly_kind_name(AnomalyKind kind);

// One discrepancy between the expected and the actual line items
struct Anomaly {
    AnomalyKind kind;
    std::string employee_id;
    std::string week_ending;
    Category category;

    // Evidence from the offending line
    std::string description;
    Decimal amount;
    Decimal rate;

    // MismatchedDate only
    std::string expected_week_ending;
    std::string date_of_birth;

    size_t source_row;              // input row involved, 0 when none
    std::string explanation;

    Anomaly();
};

// Input row that invites a fabricated line: OT1 rate set, OT1 hours zero
struct InputRisk {
    size_t source_row;
    std::string employee_id;
    std::string name;
    std::string explanation;
};

// Tunable thresholds for the heuristic checks
struct ReconcileConfig {
    ConversionConfig conversion;

    // An hours line with amount above this and rate at or below
    // swap_rate_threshold is reported as swapped
    Decimal swap_amount_threshold;
    Decimal swap_rate_threshold;

    // Year used to turn a date of birth into a candidate week-ending
    int dob_confusion_year;

    ReconcileConfig();
};

// Line items grouped by (employee, week ending, category).
// Keys keep first-appearance order; items keep input order.
class LineGroups {
public:
    void add(const LineItem& item);

    const std::vector<LineKey>& keys() const { return order_; }

    // nullptr when the key is absent
    const std::vector<LineItem>* find(const LineKey& key) const;

    bool contains(const LineKey& key) const;
    size_t size() const { return order_.size(); }

private:
    std::map<LineKey, std::vector<LineItem>> groups_;
    std::vector<LineKey> order_;
};

LineGroups group_by_key(const std::vector<LineItem>& items);

// Heuristic predicates
bool is_probable_swap(const LineItem& actual, const ReconcileConfig& config);
bool is_fabricated_overtime(const LineItem& actual, const TimesheetRecord& input);
bool is_fabricated_expense(const LineItem& actual, const TimesheetRecord& input);
bool is_dob_confusion(const std::string& actual_week_ending, const std::string& date_of_birth,
                      int year);

// Compare actual lines against the expectation derived from records.
// Anomaly order: per actual key (extra / missing surplus), then keys only
// in the expectation, then per actual line the heuristic checks.
std::vector<Anomaly> reconcile(const std::vector<TimesheetRecord>& records,
                               const std::vector<LineItem>& actual,
                               const ReconcileConfig& config = ReconcileConfig());

// Same, with the expected lines supplied by the caller
std::vector<Anomaly> reconcile(const std::vector<TimesheetRecord>& records,
                               const std::vector<LineItem>& expected,
                               const std::vector<LineItem>& actual,
                               const ReconcileConfig& config = ReconcileConfig());

std::vector<InputRisk> scan_input_risks(const std::vector<TimesheetRecord>& records);

struct ReconcileSummary {
    size_t input_records;
    size_t valid_records;
    size_t expected_lines;
    size_t actual_lines;
    size_t input_risks;
    std::array<size_t, ANOMALY_KIND_COUNT> anomalies_by_kind;

    size_t count(AnomalyKind kind) const {
        return anomalies_by_kind[static_cast<size_t>(kind)];
    }
    size_t total_anomalies() const;

    ReconcileSummary();
};

ReconcileSummary summarize(const std::vector<TimesheetRecord>& records,
                           const std::vector<LineItem>& expected,
                           const std::vector<LineItem>& actual,
                           const std::vector<Anomaly>& anomalies,
                           const std::vector<InputRisk>& risks);

struct ReconcileResult {
    std::vector<LineItem> expected;
    std::vector<Anomaly> anomalies;
    std::vector<InputRisk> risks;
    ReconcileSummary summary;
    double execution_time_ms;

    ReconcileResult();
};

// Derive, compare, scan and summarize in one pass
ReconcileResult run_reconciliation(const TimesheetSet& records,
                                   const std::vector<LineItem>& actual,
                                   const ReconcileConfig& config = ReconcileConfig());

} // namespace payline

#endif // PAYLINE_RECONCILER_HPP
