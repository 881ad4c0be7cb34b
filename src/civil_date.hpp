#pragma once
#include <string>
#include <chrono>
#include <cstdint>
#include <optional>

namespace tokenwarden {

// A calendar date with no time of day and no time zone.
struct CivilDate {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;

    // Strict YYYY-MM-DD. Returns nullopt for anything else, including
    // well-formed strings naming a day that does not exist (2023-02-29).
    static std::optional<CivilDate> parse(const std::string& s);

    // Days since 1970-01-01 (negative before it).
    int64_t to_days() const;
    static CivilDate from_days(int64_t days);

    CivilDate add_days(int64_t n) const { return from_days(to_days() + n); }
    std::string to_string() const;

    // Local calendar date of the given instant.
    static CivilDate local(std::chrono::system_clock::time_point tp);
    static CivilDate today() { return local(std::chrono::system_clock::now()); }
};

inline bool operator==(const CivilDate& a, const CivilDate& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}
inline bool operator!=(const CivilDate& a, const CivilDate& b) { return !(a == b); }
inline bool operator<(const CivilDate& a, const CivilDate& b) { return a.to_days() < b.to_days(); }
inline bool operator<=(const CivilDate& a, const CivilDate& b) { return a.to_days() <= b.to_days(); }

// b - a in whole days.
inline int64_t days_between(const CivilDate& a, const CivilDate& b) {
    return b.to_days() - a.to_days();
}

bool is_leap_year(int y);
unsigned days_in_month(int y, unsigned m);

} // namespace tokenwarden
