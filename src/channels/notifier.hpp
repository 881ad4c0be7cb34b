#pragma once
#include <string>

namespace tokenwarden {

// Outbound notification channel. send() makes one synchronous attempt and
// throws NotificationDeliveryError if it fails.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual std::string name() const = 0;
    virtual void send(const std::string& destination, const std::string& text) = 0;
};

} // namespace tokenwarden
