#include "expiry.hpp"

namespace tokenwarden {

std::string format_expiry_message(const std::string& name, int64_t days) {
    if (days <= 0) {
        return "\xF0\x9F\x9A\xA8 Token '" + name + "' has EXPIRED!";
    }
    return "\xE2\x9A\xA0\xEF\xB8\x8F Token '" + name + "' will expire in " +
           std::to_string(days) + (days == 1 ? " day!" : " days!");
}

} // namespace tokenwarden
