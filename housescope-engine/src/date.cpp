#include "date.hpp"
#include <cstdio>
#include <stdexcept>

namespace housescope {

namespace {

bool is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(int y, unsigned m) {
    static const unsigned DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap_year(y)) {
        return 29;
    }
    return DAYS[m - 1];
}

} // anonymous namespace

Date::Date() : year(1970), month(1), day(1) {}

Date::Date(int y, unsigned m, unsigned d) : year(y), month(m), day(d) {
    if (m < 1 || m > 12) {
        throw std::invalid_argument("Month " + std::to_string(m) + " must be between 1 and 12");
    }
    if (d < 1 || d > days_in_month(y, m)) {
        throw std::invalid_argument("Day " + std::to_string(d) + " is not valid for " +
                                    std::to_string(y) + "-" + std::to_string(m));
    }
}

Date Date::from_string(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        throw std::invalid_argument("Invalid date (expected YYYY-MM-DD): " + text);
    }
    for (size_t i = 0; i < text.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (text[i] < '0' || text[i] > '9') {
            throw std::invalid_argument("Invalid date (expected YYYY-MM-DD): " + text);
        }
    }
    int y = std::stoi(text.substr(0, 4));
    unsigned m = static_cast<unsigned>(std::stoi(text.substr(5, 2)));
    unsigned d = static_cast<unsigned>(std::stoi(text.substr(8, 2)));
    return Date(y, m, d);
}

// Civil-from-days / days-from-civil after Howard Hinnant's date algorithms
int64_t Date::to_days() const {
    int64_t y = static_cast<int64_t>(year) - (month <= 2 ? 1 : 0);
    int64_t era = (y >= 0 ? y : y - 399) / 400;
    int64_t yoe = y - era * 400;
    int64_t mp = (static_cast<int64_t>(month) + 9) % 12;
    int64_t doy = (153 * mp + 2) / 5 + static_cast<int64_t>(day) - 1;
    int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Date Date::from_days(int64_t days) {
    int64_t z = days + 719468;
    int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    int64_t doe = z - era * 146097;
    int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int64_t y = yoe + era * 400;
    int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    int64_t mp = (5 * doy + 2) / 153;
    int64_t d = doy - (153 * mp + 2) / 5 + 1;
    int64_t m = mp < 10 ? mp + 3 : mp - 9;
    return Date(static_cast<int>(y + (m <= 2 ? 1 : 0)),
                static_cast<unsigned>(m), static_cast<unsigned>(d));
}

Date Date::add_days(int64_t days) const {
    return from_days(to_days() + days);
}

std::string Date::to_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, day);
    return std::string(buf);
}

bool Date::operator==(const Date& other) const {
    return year == other.year && month == other.month && day == other.day;
}

bool Date::operator<(const Date& other) const {
    if (year != other.year) return year < other.year;
    if (month != other.month) return month < other.month;
    return day < other.day;
}

Date window_start(const Date& as_of, int months, int days_per_month) {
    return as_of.add_days(-static_cast<int64_t>(months) * days_per_month);
}

bool in_trailing_window(const Date& date, const Date& as_of, int months, int days_per_month) {
    return date >= window_start(as_of, months, days_per_month) && date <= as_of;
}

} // namespace housescope
