#ifndef PAYLINE_DECIMAL_HPP
#define PAYLINE_DECIMAL_HPP

#include <cstdint>
#include <ostream>
#include <string>

namespace payline {

// Decimal: exact base-10 number stored as coefficient * 10^-scale
// Hours, rates and money are compared for exact equality downstream,
// so binary floating point is never used for them.
//
// Values are kept normalized: no trailing zeros in the fractional part,
// so 1.50 and 1.5 have the same representation.
class Decimal {
public:
    static constexpr int MAX_DIGITS = 18;   // |coefficient| < 10^18
    static constexpr int MAX_SCALE = 18;

    Decimal();
    Decimal(int64_t integer);  // implicit: Decimal d = 0;

    // Builds coefficient * 10^-scale. Returns false if the value does not fit.
    static bool from_parts(int64_t coefficient, int scale, Decimal& out);

    // Strict parse of [+-]digits[.digits][(e|E)[+-]digits].
    // No whitespace, separators or special values are accepted.
    static bool try_parse(const std::string& text, Decimal& out);

    int64_t coefficient() const { return coefficient_; }
    int scale() const { return scale_; }

    bool is_zero() const { return coefficient_ == 0; }
    bool is_negative() const { return coefficient_ < 0; }
    bool is_positive() const { return coefficient_ > 0; }

    // Plain notation: no exponent, no trailing fractional zeros, "0" for zero
    std::string to_string() const;

    // -1, 0, 1
    int compare(const Decimal& other) const;

    bool operator==(const Decimal& other) const { return compare(other) == 0; }
    bool operator!=(const Decimal& other) const { return compare(other) != 0; }
    bool operator<(const Decimal& other) const { return compare(other) < 0; }
    bool operator<=(const Decimal& other) const { return compare(other) <= 0; }
    bool operator>(const Decimal& other) const { return compare(other) > 0; }
    bool operator>=(const Decimal& other) const { return compare(other) >= 0; }

private:
    int64_t coefficient_;
    int32_t scale_;
};

std::ostream& operator<<(std::ostream& os, const Decimal& value);

} // namespace payline

#endif // PAYLINE_DECIMAL_HPP
