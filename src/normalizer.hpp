#ifndef PAYLINE_NORMALIZER_HPP
#define PAYLINE_NORMALIZER_HPP

#include <optional>
#include <string>
#include "decimal.hpp"

namespace payline {

// Trim and collapse every whitespace run to a single space
std::string normalize_spaces(const std::string& text);

// Strip leading and trailing whitespace only
std::string trim(const std::string& text);

// Lower-case ASCII copy, used for header label comparison
std::string to_lower(const std::string& text);

// Lenient decimal parse: strips surrounding whitespace and ',' thousands
// separators. Empty or unparseable text yields 0; never throws.
Decimal parse_decimal(const std::string& text);

// Plain decimal text without exponent or trailing zeros ("0" for zero)
std::string format_decimal(const Decimal& value);

// Week-ending date to ISO form. Tried in order:
//   D/M/YYYY, D/M/YY (year becomes 20YY), YYYY-MM-DD passthrough.
// Day and month take one or two digits and must name a real date.
// Anything else comes back as the trimmed input; empty stays empty.
std::string parse_week_ending(const std::string& text);

// True for a valid calendar date written exactly as YYYY-MM-DD
bool is_iso_date(const std::string& text);

// "<label> - <client> - <job title>", each segment space-normalized
std::string format_description(const std::string& label,
                               const std::string& client,
                               const std::string& job_title);

// Day and month of a D/M/... birth date placed in the given year, as
// "YYYY-MM-DD". Used to spot week-endings taken from the wrong column.
// No value when the text has fewer than two '/'-separated parts.
std::optional<std::string> date_of_birth_as_week_ending(const std::string& dob, int year);

} // namespace payline

#endif // PAYLINE_NORMALIZER_HPP
