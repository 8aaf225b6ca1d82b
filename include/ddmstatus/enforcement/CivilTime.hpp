#pragma once
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

namespace ddmstatus::enforcement {

// Calendar date-time with no timezone attached. Both the enforcement
// deadline and "now" are expressed in local wall-clock terms.
struct CivilTime {
    int year{1970};
    int month{1};
    int day{1};
    int hour{0};
    int minute{0};
    int second{0};
};

bool operator==(const CivilTime& a, const CivilTime& b);
bool operator!=(const CivilTime& a, const CivilTime& b);

bool isLeapYear(int year);
int daysInMonth(int year, int month);

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t daysFromCivil(int year, int month, int day);

// Whole calendar days from `from` to `to`, counted on date boundaries.
// Negative when `to` is earlier.
int64_t calendarDaysBetween(const CivilTime& from, const CivilTime& to);

// Strict "YYYY-MM-DDTHH:MM:SS". Offsets, fractions and surrounding
// whitespace are rejected.
std::optional<CivilTime> parseIsoLocal(const std::string& text);

std::string formatIsoLocal(const CivilTime& t);

// "March 13, 2026 at 12:00"
std::string formatLong(const CivilTime& t);

CivilTime fromLocalTime(std::time_t t);

}
