#include <lastgood/date.hpp>
#include <cctype>
#include <cstdio>

namespace lastgood {

static bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

static int days_in_month(int y, int m) {
    static const int table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y)) return 29;
    return table[m - 1];
}

// Parse exactly `width` ASCII digits starting at `pos`
static bool parse_digits(const std::string& s, size_t pos, size_t width, int& out) {
    if (pos + width > s.size()) return false;
    int v = 0;
    for (size_t i = pos; i < pos + width; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        v = v * 10 + (s[i] - '0');
    }
    out = v;
    return true;
}

Result<Date> Date::parse(const std::string& s) {
    Date d;
    if (s.size() != 10 || s[4] != '-' || s[7] != '-' ||
        !parse_digits(s, 0, 4, d.year) ||
        !parse_digits(s, 5, 2, d.month) ||
        !parse_digits(s, 8, 2, d.day)) {
        return LastgoodError{LastgoodError::Parse,
            "invalid date '" + s + "'",
            "expected format: YYYY-MM-DD"};
    }
    if (d.month < 1 || d.month > 12 ||
        d.day < 1 || d.day > days_in_month(d.year, d.month)) {
        return LastgoodError{LastgoodError::Parse,
            "date out of range: '" + s + "'"};
    }
    return Result<Date>::ok(d);
}

// Civil-from-days / days-from-civil over 400-year eras.
// Day 0 is 1970-01-01.

int64_t Date::days_since_epoch() const {
    int64_t y = year - (month <= 2 ? 1 : 0);
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t mp = (month + 9) % 12;
    const int64_t doy = (153 * mp + 2) / 5 + day - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Date Date::from_days(int64_t days) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const int64_t doe = days - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;

    Date d;
    d.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    d.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    d.year = static_cast<int>(yoe + era * 400 + (d.month <= 2 ? 1 : 0));
    return d;
}

Date Date::minus_days(int64_t n) const {
    return from_days(days_since_epoch() - n);
}

std::string Date::to_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

bool Date::operator==(const Date& o) const {
    return year == o.year && month == o.month && day == o.day;
}

bool Date::operator!=(const Date& o) const { return !(*this == o); }

} // namespace lastgood
