#pragma once
#include "civil_date.hpp"
#include <string>
#include <cstdint>

namespace tokenwarden {

inline int64_t days_remaining(const CivilDate& expires_at, const CivilDate& today) {
    return days_between(today, expires_at);
}

// Due when expires_at <= today + threshold_days, boundary day included.
inline bool is_due(const CivilDate& expires_at, const CivilDate& today, int64_t threshold_days) {
    return expires_at <= today.add_days(threshold_days);
}

// EXPIRED for days <= 0, otherwise "will expire in N day(s)".
std::string format_expiry_message(const std::string& name, int64_t days);

} // namespace tokenwarden
