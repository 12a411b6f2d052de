#include "decimal.hpp"
#include <cctype>
#include <limits>

namespace payline {

namespace {

bool multiply_by_ten(int64_t& value) {
    if (value > std::numeric_limits<int64_t>::max() / 10 ||
        value < std::numeric_limits<int64_t>::min() / 10) {
        return false;
    }
    value *= 10;
    return true;
}

} // anonymous namespace

Decimal::Decimal() : coefficient_(0), scale_(0) {}

Decimal::Decimal(int64_t integer) : coefficient_(integer), scale_(0) {}

bool Decimal::from_parts(int64_t coefficient, int scale, Decimal& out) {
    while (scale > 0 && coefficient != 0 && coefficient % 10 == 0) {
        coefficient /= 10;
        --scale;
    }
    if (coefficient == 0) {
        scale = 0;
    }
    while (scale < 0) {
        if (!multiply_by_ten(coefficient)) {
            return false;
        }
        ++scale;
    }
    if (scale > MAX_SCALE) {
        return false;
    }
    // Same digit budget however the value was spelled
    constexpr int64_t limit = 1000000000000000000;  // 10^MAX_DIGITS
    if (coefficient >= limit || coefficient <= -limit) {
        return false;
    }

    out.coefficient_ = coefficient;
    out.scale_ = scale;
    return true;
}

bool Decimal::try_parse(const std::string& text, Decimal& out) {
    size_t pos = 0;
    bool negative = false;

    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
    }

    std::string digits;
    int fraction_digits = 0;
    bool seen_digit = false;

    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        digits.push_back(text[pos++]);
        seen_digit = true;
    }
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            digits.push_back(text[pos++]);
            ++fraction_digits;
            seen_digit = true;
        }
    }
    if (!seen_digit) {
        return false;
    }

    int exponent = 0;
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        bool exp_negative = false;
        if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            exp_negative = text[pos] == '-';
            ++pos;
        }
        size_t exp_start = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (exponent > 9999) {
                return false;
            }
            exponent = exponent * 10 + (text[pos] - '0');
            ++pos;
        }
        if (pos == exp_start) {
            return false;
        }
        if (exp_negative) {
            exponent = -exponent;
        }
    }
    if (pos != text.size()) {
        return false;
    }

    // Leading zeros carry no value; trailing fractional zeros are dropped
    // before the digit budget is checked so "1.500000000000000000000" parses.
    size_t first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
        out = Decimal();
        return true;
    }
    digits.erase(0, first);

    int scale = fraction_digits - exponent;
    while (scale > 0 && digits.back() == '0') {
        digits.pop_back();
        --scale;
    }
    if (static_cast<int>(digits.size()) > MAX_DIGITS) {
        return false;
    }

    int64_t coefficient = 0;
    for (char c : digits) {
        coefficient = coefficient * 10 + (c - '0');
    }
    if (negative) {
        coefficient = -coefficient;
    }

    return from_parts(coefficient, scale, out);
}

std::string Decimal::to_string() const {
    if (coefficient_ == 0) {
        return "0";
    }

    uint64_t magnitude = coefficient_ < 0
        ? static_cast<uint64_t>(-(coefficient_ + 1)) + 1
        : static_cast<uint64_t>(coefficient_);
    std::string digits = std::to_string(magnitude);

    if (scale_ > 0) {
        size_t scale = static_cast<size_t>(scale_);
        if (digits.size() <= scale) {
            digits.insert(0, scale - digits.size() + 1, '0');
        }
        digits.insert(digits.size() - scale, 1, '.');
    }

    return coefficient_ < 0 ? "-" + digits : digits;
}

int Decimal::compare(const Decimal& other) const {
    if (is_negative() != other.is_negative()) {
        return is_negative() ? -1 : 1;
    }

    int64_t a = coefficient_;
    int64_t b = other.coefficient_;
    int scale_a = scale_;
    int scale_b = other.scale_;

    // Bring both to the larger scale. If scaling overflows, the scaled side
    // has the larger magnitude, and both sides share a sign.
    while (scale_a < scale_b) {
        if (!multiply_by_ten(a)) {
            return a < 0 ? -1 : 1;
        }
        ++scale_a;
    }
    while (scale_b < scale_a) {
        if (!multiply_by_ten(b)) {
            return b < 0 ? 1 : -1;
        }
        ++scale_b;
    }

    if (a < b) return -1;
    if (a > b) return 1;
    return 0;
}

std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.to_string();
}

} // namespace payline
