#include "normalizer.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>
#include <vector>

namespace payline {

namespace {

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c);
    });
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

bool is_valid_date(int year, int month, int day) {
    static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

    if (year < 1 || month < 1 || month > 12 || day < 1) {
        return false;
    }
    int max_day = days_in_month[month - 1];
    if (month == 2 && is_leap_year(year)) {
        max_day = 29;
    }
    return day <= max_day;
}

std::string iso_date(int year, int month, int day) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return std::string(buf);
}

std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, delimiter)) {
        parts.push_back(part);
    }
    // getline drops a trailing empty field
    if (!text.empty() && text.back() == delimiter) {
        parts.emplace_back();
    }
    return parts;
}

std::string zero_pad2(const std::string& s) {
    return s.size() >= 2 ? s : std::string(2 - s.size(), '0') + s;
}

// D/M/Y with the year exactly year_digits long
bool parse_day_month_year(const std::string& text, size_t year_digits, std::string& iso) {
    auto parts = split(text, '/');
    if (parts.size() != 3) {
        return false;
    }
    const std::string& day = parts[0];
    const std::string& month = parts[1];
    const std::string& year = parts[2];

    if (!all_digits(day) || day.size() > 2 ||
        !all_digits(month) || month.size() > 2 ||
        !all_digits(year) || year.size() != year_digits) {
        return false;
    }

    int y = std::stoi(year);
    if (year_digits == 2) {
        y += 2000;
    }
    int m = std::stoi(month);
    int d = std::stoi(day);
    if (!is_valid_date(y, m, d)) {
        return false;
    }

    iso = iso_date(y, m, d);
    return true;
}

} // anonymous namespace

std::string normalize_spaces(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    bool pending_space = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result.push_back(' ');
            pending_space = false;
        }
        result.push_back(static_cast<char>(c));
    }
    return result;
}

std::string trim(const std::string& text) {
    auto start = std::find_if_not(text.begin(), text.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

std::string to_lower(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

Decimal parse_decimal(const std::string& text) {
    std::string cleaned;
    cleaned.reserve(text.size());
    for (char c : trim(text)) {
        if (c != ',') {
            cleaned.push_back(c);
        }
    }
    if (cleaned.empty()) {
        return Decimal();
    }

    Decimal value;
    if (!Decimal::try_parse(cleaned, value)) {
        return Decimal();
    }
    return value;
}

std::string format_decimal(const Decimal& value) {
    return value.to_string();
}

bool is_iso_date(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return false;
    }
    std::string year = text.substr(0, 4);
    std::string month = text.substr(5, 2);
    std::string day = text.substr(8, 2);
    if (!all_digits(year) || !all_digits(month) || !all_digits(day)) {
        return false;
    }
    return is_valid_date(std::stoi(year), std::stoi(month), std::stoi(day));
}

std::string parse_week_ending(const std::string& text) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) {
        return trimmed;
    }

    std::string iso;
    if (parse_day_month_year(trimmed, 4, iso)) {
        return iso;
    }
    if (parse_day_month_year(trimmed, 2, iso)) {
        return iso;
    }
    // Already ISO, or unrecognised: either way the text passes through
    return trimmed;
}

std::string format_description(const std::string& label,
                               const std::string& client,
                               const std::string& job_title) {
    return normalize_spaces(label) + " - " + normalize_spaces(client) + " - " +
           normalize_spaces(job_title);
}

std::optional<std::string> date_of_birth_as_week_ending(const std::string& dob, int year) {
    auto parts = split(trim(dob), '/');
    if (parts.size() < 2) {
        return std::nullopt;
    }

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d", year);
    return std::string(buf) + "-" + zero_pad2(parts[1]) + "-" + zero_pad2(parts[0]);
}

} // namespace payline
