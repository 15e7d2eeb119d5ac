#ifndef HOUSESCOPE_DATE_HPP
#define HOUSESCOPE_DATE_HPP

#include <cstdint>
#include <string>

namespace housescope {

// Calendar date (proleptic Gregorian), no time-of-day or zone.
struct Date {
    int year;
    unsigned month;  // 1-12
    unsigned day;    // 1-31

    Date();
    Date(int y, unsigned m, unsigned d);

    // Parses ISO "YYYY-MM-DD". Throws std::invalid_argument on bad input.
    static Date from_string(const std::string& text);

    // Inverse of to_days()
    static Date from_days(int64_t days);

    // Days since 1970-01-01
    int64_t to_days() const;

    Date add_days(int64_t days) const;

    std::string to_string() const;

    bool operator==(const Date& other) const;
    bool operator!=(const Date& other) const { return !(*this == other); }
    bool operator<(const Date& other) const;
    bool operator<=(const Date& other) const { return !(other < *this); }
    bool operator>(const Date& other) const { return other < *this; }
    bool operator>=(const Date& other) const { return !(*this < other); }
};

// First day of a trailing window of `months` months ending at `as_of`,
// counting each month as `days_per_month` days.
Date window_start(const Date& as_of, int months, int days_per_month = 30);

// True when window_start(as_of, months) <= date <= as_of
bool in_trailing_window(const Date& date, const Date& as_of, int months, int days_per_month = 30);

} // namespace housescope

#endif // HOUSESCOPE_DATE_HPP
