#include "decimal.hpp"
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace housescope {

namespace {

using wide_t = __int128;

constexpr int64_t RAW_MAX = std::numeric_limits<int64_t>::max();
constexpr int64_t RAW_MIN = std::numeric_limits<int64_t>::min();

int64_t narrow(wide_t value, const char* operation) {
    if (value > static_cast<wide_t>(RAW_MAX) || value < static_cast<wide_t>(RAW_MIN)) {
        throw std::overflow_error(std::string("Decimal overflow in ") + operation);
    }
    return static_cast<int64_t>(value);
}

// Integer division rounding half-to-even. den must be non-zero.
wide_t divide_half_even(wide_t num, wide_t den) {
    bool negative = (num < 0) != (den < 0);
    wide_t n = num < 0 ? -num : num;
    wide_t d = den < 0 ? -den : den;

    wide_t q = n / d;
    wide_t r = n % d;
    wide_t twice = r * 2;
    if (twice > d || (twice == d && (q % 2) != 0)) {
        ++q;
    }
    return negative ? -q : q;
}

int64_t power_of_ten(int exponent) {
    int64_t result = 1;
    for (int i = 0; i < exponent; ++i) {
        result *= 10;
    }
    return result;
}

int64_t from_whole(long long value) {
    return narrow(static_cast<wide_t>(value) * Decimal::SCALE, "construction");
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

Decimal::Decimal(int value) : raw_(from_whole(value)) {}

Decimal::Decimal(long value) : raw_(from_whole(value)) {}

Decimal::Decimal(long long value) : raw_(from_whole(value)) {}

Decimal Decimal::from_raw(int64_t raw) {
    return Decimal(raw, true);
}

Decimal Decimal::from_string(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("Cannot parse empty string as decimal");
    }

    size_t pos = 0;
    bool negative = false;
    if (text[pos] == '+' || text[pos] == '-') {
        negative = text[pos] == '-';
        ++pos;
    }

    wide_t whole = 0;
    size_t whole_digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        whole = whole * 10 + (text[pos] - '0');
        if (whole > static_cast<wide_t>(RAW_MAX)) {
            throw std::invalid_argument("Decimal value out of range: " + text);
        }
        ++whole_digits;
        ++pos;
    }

    wide_t fraction = 0;
    size_t fraction_digits = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (fraction_digits == static_cast<size_t>(PRECISION)) {
                throw std::invalid_argument("Too many fractional digits in decimal: " + text);
            }
            fraction = fraction * 10 + (text[pos] - '0');
            ++fraction_digits;
            ++pos;
        }
    }

    if (pos != text.size() || (whole_digits == 0 && fraction_digits == 0)) {
        throw std::invalid_argument("Invalid decimal: " + text);
    }

    fraction *= power_of_ten(PRECISION - static_cast<int>(fraction_digits));
    wide_t raw = whole * SCALE + fraction;
    if (negative) {
        raw = -raw;
    }
    try {
        return Decimal(narrow(raw, "parse"), true);
    } catch (const std::overflow_error&) {
        throw std::invalid_argument("Decimal value out of range: " + text);
    }
}

Decimal Decimal::from_double(double value) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("Cannot convert non-finite value to decimal");
    }
    double scaled = std::round(value * static_cast<double>(SCALE));
    if (scaled >= 9.2e18 || scaled <= -9.2e18) {
        throw std::overflow_error("Decimal overflow converting " + std::to_string(value));
    }
    return Decimal(static_cast<int64_t>(scaled), true);
}

// ============================================================================
// Conversion
// ============================================================================

double Decimal::to_double() const {
    return static_cast<double>(raw_) / static_cast<double>(SCALE);
}

std::string Decimal::to_string(int places) const {
    int64_t raw = rounded(places).raw_;
    bool negative = raw < 0;
    // Magnitude in unsigned space so RAW_MIN does not overflow
    uint64_t magnitude = negative ? static_cast<uint64_t>(-(raw + 1)) + 1 : static_cast<uint64_t>(raw);

    uint64_t whole = magnitude / SCALE;
    uint64_t fraction = magnitude % SCALE;

    std::string result = negative ? "-" : "";
    result += std::to_string(whole);
    if (places > 0) {
        std::string digits = std::to_string(fraction);
        digits.insert(0, PRECISION - digits.size(), '0');
        result += ".";
        result += digits.substr(0, static_cast<size_t>(places));
    }
    return result;
}

Decimal Decimal::rounded(int places) const {
    if (places < 0 || places > PRECISION) {
        throw std::invalid_argument("Rounding places must be between 0 and " + std::to_string(PRECISION));
    }
    if (places == PRECISION) {
        return *this;
    }
    int64_t factor = power_of_ten(PRECISION - places);
    wide_t units = divide_half_even(raw_, factor);
    return Decimal(narrow(units * factor, "rounding"), true);
}

Decimal Decimal::abs() const {
    if (raw_ == RAW_MIN) {
        throw std::overflow_error("Decimal overflow in abs");
    }
    return Decimal(raw_ < 0 ? -raw_ : raw_, true);
}

// ============================================================================
// Arithmetic
// ============================================================================

Decimal Decimal::operator-() const {
    if (raw_ == RAW_MIN) {
        throw std::overflow_error("Decimal overflow in negation");
    }
    return Decimal(-raw_, true);
}

Decimal& Decimal::operator+=(const Decimal& other) {
    raw_ = narrow(static_cast<wide_t>(raw_) + other.raw_, "addition");
    return *this;
}

Decimal& Decimal::operator-=(const Decimal& other) {
    raw_ = narrow(static_cast<wide_t>(raw_) - other.raw_, "subtraction");
    return *this;
}

Decimal& Decimal::operator*=(const Decimal& other) {
    wide_t product = static_cast<wide_t>(raw_) * other.raw_;
    raw_ = narrow(divide_half_even(product, SCALE), "multiplication");
    return *this;
}

Decimal& Decimal::operator/=(const Decimal& other) {
    if (other.raw_ == 0) {
        throw std::domain_error("Decimal division by zero");
    }
    wide_t numerator = static_cast<wide_t>(raw_) * SCALE;
    raw_ = narrow(divide_half_even(numerator, other.raw_), "division");
    return *this;
}

Decimal Decimal::pow(const Decimal& base, unsigned exponent) {
    Decimal result(1);
    Decimal square = base;
    while (exponent > 0) {
        if (exponent & 1u) {
            result *= square;
        }
        exponent >>= 1;
        if (exponent > 0) {
            square *= square;
        }
    }
    return result;
}

std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.to_string();
}

} // namespace housescope
