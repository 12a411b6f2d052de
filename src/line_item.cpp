#include "line_item.hpp"
#include "normalizer.hpp"
#include <tuple>

namespace payline {

const char* category_label(Category category) {
    switch (category) {
        case Category::Expenses: return "Expenses";
        case Category::StdHrs: return "Std Hrs";
        case Category::OT1Hrs: return "OT1 Hrs";
        case Category::OT2Hrs: return "OT2 Hrs";
        case Category::OT3Hrs: return "OT3 Hrs";
        case Category::Unknown: return "Unknown";
    }
    return "Unknown";
}

const char* category_name(Category category) {
    switch (category) {
        case Category::Expenses: return "Expenses";
        case Category::StdHrs: return "StdHrs";
        case Category::OT1Hrs: return "OT1Hrs";
        case Category::OT2Hrs: return "OT2Hrs";
        case Category::OT3Hrs: return "OT3Hrs";
        case Category::Unknown: return "Unknown";
    }
    return "Unknown";
}

bool is_hours_category(Category category) {
    switch (category) {
        case Category::StdHrs:
        case Category::OT1Hrs:
        case Category::OT2Hrs:
        case Category::OT3Hrs:
            return true;
        case Category::Expenses:
        case Category::Unknown:
            return false;
    }
    return false;
}

Category category_from_description(const std::string& description) {
    static const Category prefix_order[] = {
        Category::StdHrs, Category::OT1Hrs, Category::OT2Hrs, Category::OT3Hrs, Category::Expenses
    };

    for (Category category : prefix_order) {
        const std::string prefix = category_label(category);
        if (description.compare(0, prefix.size(), prefix) == 0) {
            return category;
        }
    }
    return Category::Unknown;
}

const char* unit_label(Unit unit) {
    switch (unit) {
        case Unit::Hours: return "hours";
        case Unit::Expense: return "expense";
    }
    return "hours";
}

bool parse_unit(const std::string& text, Unit& unit) {
    std::string lowered = to_lower(trim(text));
    if (lowered == "hours") {
        unit = Unit::Hours;
        return true;
    }
    if (lowered == "expense") {
        unit = Unit::Expense;
        return true;
    }
    return false;
}

LineItem::LineItem() : unit(Unit::Hours), category(Category::Unknown) {}

bool LineItem::operator==(const LineItem& other) const {
    return employee_id == other.employee_id &&
           first_name == other.first_name &&
           surname == other.surname &&
           description == other.description &&
           amount == other.amount &&
           rate == other.rate &&
           week_ending == other.week_ending &&
           unit == other.unit &&
           category == other.category;
}

bool LineKey::operator==(const LineKey& other) const {
    return employee_id == other.employee_id &&
           week_ending == other.week_ending &&
           category == other.category;
}

bool LineKey::operator<(const LineKey& other) const {
    return std::tie(employee_id, week_ending, category) <
           std::tie(other.employee_id, other.week_ending, other.category);
}

LineKey key_of(const LineItem& item) {
    return LineKey{item.employee_id, item.week_ending, item.category};
}

std::vector<std::string> to_row(const LineItem& item) {
    return {
        item.employee_id,
        item.first_name,
        item.surname,
        item.description,
        format_decimal(item.amount),
        format_decimal(item.rate),
        item.week_ending,
        unit_label(item.unit)
    };
}

} // namespace payline
