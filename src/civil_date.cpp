#include "civil_date.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>

namespace tokenwarden {

bool is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(int y, unsigned m) {
    static const unsigned table[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m < 1 || m > 12) return 0;
    if (m == 2 && is_leap_year(y)) return 29;
    return table[m - 1];
}

std::optional<CivilDate> CivilDate::parse(const std::string& s) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
    for (size_t i = 0; i < s.size(); i++) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return std::nullopt;
    }

    CivilDate d;
    d.year = std::stoi(s.substr(0, 4));
    d.month = static_cast<unsigned>(std::stoi(s.substr(5, 2)));
    d.day = static_cast<unsigned>(std::stoi(s.substr(8, 2)));

    if (d.month < 1 || d.month > 12) return std::nullopt;
    if (d.day < 1 || d.day > days_in_month(d.year, d.month)) return std::nullopt;
    return d;
}

// Proleptic Gregorian day count, after H. Hinnant's days_from_civil.
int64_t CivilDate::to_days() const {
    int64_t y = year - (month <= 2 ? 1 : 0);
    int64_t era = (y >= 0 ? y : y - 399) / 400;
    int64_t yoe = y - era * 400;
    int64_t mp = (month + 9) % 12;
    int64_t doy = (153 * mp + 2) / 5 + day - 1;
    int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CivilDate CivilDate::from_days(int64_t z) {
    z += 719468;
    int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    int64_t doe = z - era * 146097;
    int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    int64_t mp = (5 * doy + 2) / 153;

    CivilDate d;
    d.day = static_cast<unsigned>(doy - (153 * mp + 2) / 5 + 1);
    d.month = static_cast<unsigned>(mp < 10 ? mp + 3 : mp - 9);
    d.year = static_cast<int>(yoe + era * 400 + (d.month <= 2 ? 1 : 0));
    return d;
}

std::string CivilDate::to_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, day);
    return buf;
}

CivilDate CivilDate::local(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    CivilDate d;
    d.year = tm.tm_year + 1900;
    d.month = static_cast<unsigned>(tm.tm_mon + 1);
    d.day = static_cast<unsigned>(tm.tm_mday);
    return d;
}

} // namespace tokenwarden
