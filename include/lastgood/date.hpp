#pragma once

#include <lastgood/result.hpp>
#include <cstdint>
#include <string>

namespace lastgood {

// Proleptic Gregorian calendar date, no time zone
struct Date {
    int year = 1970;
    int month = 1;   // 1..12
    int day = 1;     // 1..31

    // Strict ISO 8601 calendar form: YYYY-MM-DD
    static Result<Date> parse(const std::string& s);

    static Date from_days(int64_t days_since_epoch);
    int64_t days_since_epoch() const;

    Date minus_days(int64_t n) const;
    std::string to_string() const;

    bool operator==(const Date& o) const;
    bool operator!=(const Date& o) const;
};

} // namespace lastgood
