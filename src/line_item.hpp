#ifndef PAYLINE_LINE_ITEM_HPP
#define PAYLINE_LINE_ITEM_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include "decimal.hpp"

namespace payline {

// Pay component of a line. The converter emits Expenses, StdHrs and
// OT1Hrs; OT2Hrs/OT3Hrs and Unknown only appear on lines read from
// other producers.
enum class Category : uint8_t {
    Expenses = 0,
    StdHrs = 1,
    OT1Hrs = 2,
    OT2Hrs = 3,
    OT3Hrs = 4,
    Unknown = 5
};

enum class Unit : uint8_t {
    Hours = 0,
    Expense = 1
};

// Description prefix, e.g. "Std Hrs"
const char* category_label(Category category);

// Stable identifier, e.g. "StdHrs"
const char* category_name(Category category);

bool is_hours_category(Category category);

// Classify by description prefix. Prefixes are tried in a fixed order:
// Std Hrs, OT1 Hrs, OT2 Hrs, OT3 Hrs, Expenses.
Category category_from_description(const std::string& description);

const char* unit_label(Unit unit);

// "hours" / "expense" (case-insensitive). Returns false otherwise.
bool parse_unit(const std::string& text, Unit& unit);

struct LineItem {
    std::string employee_id;
    std::string first_name;
    std::string surname;
    std::string description;
    Decimal amount;          // hours, or 1 for an expense
    Decimal rate;            // hourly rate, or the expense value
    std::string week_ending; // YYYY-MM-DD for generated lines
    Unit unit;
    Category category;

    LineItem();

    bool operator==(const LineItem& other) const;
    bool operator!=(const LineItem& other) const { return !(*this == other); }
};

// Reconciliation key: (employee id, week ending, category)
struct LineKey {
    std::string employee_id;
    std::string week_ending;
    Category category;

    bool operator==(const LineKey& other) const;
    bool operator<(const LineKey& other) const;
};

LineKey key_of(const LineItem& item);

// Output table columns in their fixed order
constexpr std::array<const char*, 8> OUTPUT_COLUMNS = {
    "employeeid", "firstname", "surname", "description",
    "amount", "rate", "weekending", "unit"
};

// Cells in OUTPUT_COLUMNS order
std::vector<std::string> to_row(const LineItem& item);

} // namespace payline

#endif // PAYLINE_LINE_ITEM_HPP
