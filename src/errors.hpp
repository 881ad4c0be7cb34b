#pragma once
#include <stdexcept>
#include <string>

namespace tokenwarden {

// Malformed user input, e.g. an expiry date that is not YYYY-MM-DD.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

// Missing or malformed configuration value.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// Any failure reported by SQLite.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

// Outbound notification could not be delivered. Never fatal.
class NotificationDeliveryError : public std::runtime_error {
public:
    explicit NotificationDeliveryError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace tokenwarden
