#ifndef HOUSESCOPE_DECIMAL_HPP
#define HOUSESCOPE_DECIMAL_HPP

#include <cstdint>
#include <ostream>
#include <string>

namespace housescope {

// Exact fixed-point decimal with 9 fractional digits.
// The value is stored as a signed count of 10^-9 units, so sums of money
// amounts never drift. Multiplication and division use a 128-bit
// intermediate and round half-to-even back to 9 places.
//
// Representable range is roughly +/- 9.2 billion; results outside it
// throw std::overflow_error.
class Decimal {
public:
    static constexpr int PRECISION = 9;
    static constexpr int64_t SCALE = 1000000000;

    Decimal() : raw_(0) {}
    Decimal(int value);
    Decimal(long value);
    Decimal(long long value);
    Decimal(double) = delete;

    static Decimal from_raw(int64_t raw);

    // Parses "123", "-45.67", "+0.005". Throws std::invalid_argument on
    // malformed text or more than 9 fractional digits.
    static Decimal from_string(const std::string& text);

    // Rounds to the nearest 10^-9. Intended for rates and amounts coming from
    // JSON or the command line, where the source is already a double.
    static Decimal from_double(double value);

    int64_t raw() const { return raw_; }
    double to_double() const;

    // Fixed notation with exactly `places` fractional digits (half-even).
    std::string to_string(int places = PRECISION) const;

    // Half-even rounding to `places` fractional digits (0..9).
    Decimal rounded(int places) const;

    Decimal abs() const;
    bool is_zero() const { return raw_ == 0; }
    bool is_negative() const { return raw_ < 0; }
    bool is_positive() const { return raw_ > 0; }

    // base^exponent by repeated squaring, rounding after each product.
    static Decimal pow(const Decimal& base, unsigned exponent);

    Decimal operator-() const;
    Decimal& operator+=(const Decimal& other);
    Decimal& operator-=(const Decimal& other);
    Decimal& operator*=(const Decimal& other);
    Decimal& operator/=(const Decimal& other);

    friend Decimal operator+(Decimal lhs, const Decimal& rhs) { return lhs += rhs; }
    friend Decimal operator-(Decimal lhs, const Decimal& rhs) { return lhs -= rhs; }
    friend Decimal operator*(Decimal lhs, const Decimal& rhs) { return lhs *= rhs; }
    friend Decimal operator/(Decimal lhs, const Decimal& rhs) { return lhs /= rhs; }

    friend bool operator==(const Decimal& a, const Decimal& b) { return a.raw_ == b.raw_; }
    friend bool operator!=(const Decimal& a, const Decimal& b) { return a.raw_ != b.raw_; }
    friend bool operator<(const Decimal& a, const Decimal& b) { return a.raw_ < b.raw_; }
    friend bool operator>(const Decimal& a, const Decimal& b) { return a.raw_ > b.raw_; }
    friend bool operator<=(const Decimal& a, const Decimal& b) { return a.raw_ <= b.raw_; }
    friend bool operator>=(const Decimal& a, const Decimal& b) { return a.raw_ >= b.raw_; }

private:
    explicit Decimal(int64_t raw, bool /*tag*/) : raw_(raw) {}

    int64_t raw_;
};

std::ostream& operator<<(std::ostream& os, const Decimal& value);

inline Decimal max(const Decimal& a, const Decimal& b) { return a < b ? b : a; }
inline Decimal min(const Decimal& a, const Decimal& b) { return b < a ? b : a; }

} // namespace housescope

#endif // HOUSESCOPE_DECIMAL_HPP
