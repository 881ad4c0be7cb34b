#include "config.hpp"
#include "errors.hpp"
#include <fstream>
#include <iostream>
#include <cstdint>
#include <cstdlib>

namespace tokenwarden {

static int64_t parse_int_setting(const char* key, const std::string& value) {
    try {
        size_t pos = 0;
        long long v = std::stoll(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw ConfigurationError(std::string(key) + " must be a number, got '" + value + "'");
    }
}

// Integer setting from the JSON file; floats and strings are rejected.
static int64_t json_int_setting(const nlohmann::json& j, const char* key, int64_t fallback) {
    if (!j.contains(key)) return fallback;
    auto& v = j[key];
    if (!v.is_number_integer() ||
        (v.is_number_unsigned() && v.get<uint64_t>() > static_cast<uint64_t>(INT64_MAX))) {
        throw ConfigurationError(std::string(key) + " must be an integer, got " + v.dump());
    }
    return v.get<int64_t>();
}

static const char* env_or_null(const char* key) {
    const char* v = std::getenv(key);
    return (v && *v) ? v : nullptr;
}

void Config::require_messaging() const {
    if (telegram.bot_token.empty()) {
        throw ConfigurationError("TELEGRAM_BOT_TOKEN environment variable not set");
    }
    if (telegram.chat_id.empty()) {
        throw ConfigurationError("TELEGRAM_CHAT_ID environment variable not set");
    }
}

void Config::validate() const {
    if (notification_threshold_days < 0) {
        throw ConfigurationError("NOTIFICATION_THRESHOLD_DAYS must not be negative");
    }
    if (notification_threshold_days > kMaxThresholdDays) {
        throw ConfigurationError("NOTIFICATION_THRESHOLD_DAYS must be at most " +
                                 std::to_string(kMaxThresholdDays));
    }
    if (check_interval_seconds <= 0) {
        throw ConfigurationError("CHECK_INTERVAL_SECONDS must be positive");
    }
    if (database.empty()) {
        throw ConfigurationError("database path is empty");
    }
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;
    try {
        c.database = j.value("database", c.database);
        c.notification_threshold_days = json_int_setting(j, "notification_threshold_days", c.notification_threshold_days);
        c.check_interval_seconds = json_int_setting(j, "check_interval_seconds", c.check_interval_seconds);

        if (j.contains("telegram")) {
            auto& tg = j["telegram"];
            c.telegram.bot_token = tg.value("bot_token", "");
            c.telegram.chat_id = tg.value("chat_id", "");
            c.telegram.api_base = tg.value("api_base", c.telegram.api_base);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("Invalid config value: ") + e.what());
    }
    return c;
}

void Config::apply_env() {
    if (auto v = env_or_null("TELEGRAM_BOT_TOKEN")) telegram.bot_token = v;
    if (auto v = env_or_null("TELEGRAM_CHAT_ID")) telegram.chat_id = v;
    if (auto v = env_or_null("TELEGRAM_API_BASE")) telegram.api_base = v;
    if (auto v = env_or_null("TOKENWARDEN_DB")) database = v;
    if (auto v = env_or_null("NOTIFICATION_THRESHOLD_DAYS")) {
        notification_threshold_days = parse_int_setting("NOTIFICATION_THRESHOLD_DAYS", v);
    }
    if (auto v = env_or_null("CHECK_INTERVAL_SECONDS")) {
        check_interval_seconds = parse_int_setting("CHECK_INTERVAL_SECONDS", v);
    }
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (f) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(f);
        } catch (const std::exception& e) {
            throw ConfigurationError("Failed to parse config " + path + ": " + e.what());
        }
        cfg = from_json(j);
    }

    load_dotenv(".env");
    cfg.apply_env();
    cfg.validate();
    return cfg;
}

void load_dotenv(const std::string& path) {
    std::ifstream f(path);
    if (!f) return;

    std::string line;
    int lineno = 0;
    while (std::getline(f, line)) {
        lineno++;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) line = trim(line.substr(7));

        size_t eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            std::cerr << "[config] Ignoring malformed line " << lineno << " in " << path << "\n";
            continue;
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }
        setenv(key.c_str(), value.c_str(), 0);
    }
}

} // namespace tokenwarden
