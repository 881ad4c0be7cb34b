#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace tokenwarden {

struct TelegramConfig {
    std::string bot_token;
    std::string chat_id;
    std::string api_base = "https://api.telegram.org";
};

// Keeps today + threshold inside four-digit years.
constexpr int64_t kMaxThresholdDays = 36500;

struct Config {
    std::string database = default_db_path();
    int64_t notification_threshold_days = 1;
    int64_t check_interval_seconds = 3600;
    TelegramConfig telegram;

    std::string database_path() const {
        return expand_path(database);
    }

    // Throws ConfigurationError when bot token or chat id is missing.
    // Only the notifying commands need them.
    void require_messaging() const;

    // Throws ConfigurationError on out-of-range numbers, including a
    // threshold above kMaxThresholdDays.
    void validate() const;

    // Defaults, then the JSON file at path (if present), then .env in the
    // working directory, then the process environment.
    static Config load(const std::string& path);

    static Config from_json(const nlohmann::json& j);

    // Overlay TELEGRAM_BOT_TOKEN, TELEGRAM_CHAT_ID, TELEGRAM_API_BASE,
    // NOTIFICATION_THRESHOLD_DAYS, CHECK_INTERVAL_SECONDS and TOKENWARDEN_DB.
    void apply_env();
};

// Export KEY=VALUE lines from a dotenv file without overriding variables
// that are already set. Missing file is not an error.
void load_dotenv(const std::string& path);

} // namespace tokenwarden
