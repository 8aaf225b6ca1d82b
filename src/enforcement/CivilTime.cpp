#include "ddmstatus/enforcement/CivilTime.hpp"
#include <cstdio>

namespace ddmstatus::enforcement {

static const char* const kMonthNames[12] = {
    "January", "February", "March", "April", "May", "June",
    "July", "August", "September", "October", "November", "December"
};

bool operator==(const CivilTime& a, const CivilTime& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day &&
           a.hour == b.hour && a.minute == b.minute && a.second == b.second;
}

bool operator!=(const CivilTime& a, const CivilTime& b) {
    return !(a == b);
}

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int days[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && isLeapYear(year)) return 29;
    return days[month - 1];
}

int64_t daysFromCivil(int year, int month, int day) {
    int64_t y = year - (month <= 2 ? 1 : 0);
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t mp  = month > 2 ? month - 3 : month + 9;
    const int64_t doy = (153 * mp + 2) / 5 + day - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

int64_t calendarDaysBetween(const CivilTime& from, const CivilTime& to) {
    return daysFromCivil(to.year, to.month, to.day) -
           daysFromCivil(from.year, from.month, from.day);
}

static bool readDigits(const std::string& s, size_t pos, size_t count, int& out) {
    int v = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        char c = s[i];
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

std::optional<CivilTime> parseIsoLocal(const std::string& text) {
    // 0123456789012345678
    // YYYY-MM-DDTHH:MM:SS
    if (text.size() != 19) return std::nullopt;
    if (text[4] != '-' || text[7] != '-' || text[10] != 'T' ||
        text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }

    CivilTime t;
    if (!readDigits(text, 0, 4, t.year) ||
        !readDigits(text, 5, 2, t.month) ||
        !readDigits(text, 8, 2, t.day) ||
        !readDigits(text, 11, 2, t.hour) ||
        !readDigits(text, 14, 2, t.minute) ||
        !readDigits(text, 17, 2, t.second)) {
        return std::nullopt;
    }

    if (t.month < 1 || t.month > 12) return std::nullopt;
    if (t.day < 1 || t.day > daysInMonth(t.year, t.month)) return std::nullopt;
    if (t.hour > 23 || t.minute > 59 || t.second > 59) return std::nullopt;
    return t;
}

std::string formatIsoLocal(const CivilTime& t) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d",
                  t.year, t.month, t.day, t.hour, t.minute, t.second);
    return buf;
}

std::string formatLong(const CivilTime& t) {
    const char* month = (t.month >= 1 && t.month <= 12) ? kMonthNames[t.month - 1] : "?";
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s %d, %04d at %02d:%02d",
                  month, t.day, t.year, t.hour, t.minute);
    return buf;
}

CivilTime fromLocalTime(std::time_t t) {
    std::tm tm{};
    localtime_r(&t, &tm);

    CivilTime out;
    out.year   = tm.tm_year + 1900;
    out.month  = tm.tm_mon + 1;
    out.day    = tm.tm_mday;
    out.hour   = tm.tm_hour;
    out.minute = tm.tm_min;
    out.second = tm.tm_sec;
    return out;
}

}
